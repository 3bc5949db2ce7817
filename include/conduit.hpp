#pragma once

#include "conduit_result.hpp"
#include "conduit_error.hpp"
#include "conduit_config.hpp"
#include "conduit_task.hpp"
#include "conduit_channel.hpp"
#include "conduit_model.hpp"
#include "conduit_process_result.hpp"
#include "conduit_runtime.hpp"
#include "conduit_registry.hpp"
#include "conduit_typed_runtime.hpp"
#include "conduit_factory.hpp"
#include "conduit_root_control.hpp"
#include "task_policies/conduit_task_policy_base.hpp"
#include "conduit_utils.hpp"
