#pragma once

#include <chrono>
#include <cstddef>

namespace conduit {

    // Capacity used for output channels when a factory is given none.
    #ifndef CONDUIT_DEFAULT_CHANNEL_CAPACITY
    #define CONDUIT_DEFAULT_CHANNEL_CAPACITY (64)
    #endif

    struct RuntimeConfig {
        int default_channel_capacity = CONDUIT_DEFAULT_CHANNEL_CAPACITY;

        // Upper bound on how long a paused node takes to notice resume() or stop()
        std::chrono::milliseconds pause_poll_interval{10};

        // When false, ControlConfig::speed_attenuation is recorded but not slept on
        bool apply_speed_attenuation = true;
    };

} // namespace conduit
