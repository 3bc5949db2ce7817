#pragma once

#include "conduit_config.hpp"

namespace conduit {

namespace runtime_config {

    // Reacts to resume()/stop() of paused nodes within a millisecond
    inline RuntimeConfig low_latency() {
        RuntimeConfig config;
        config.pause_poll_interval = std::chrono::milliseconds(1);
        return config;
    }

    // Every output applies backpressure after `capacity` values
    inline RuntimeConfig bounded(int capacity) {
        RuntimeConfig config;
        config.default_channel_capacity = capacity;
        return config;
    }

    // Handoff-only channels, useful when producer and consumer must stay in lockstep
    inline RuntimeConfig rendezvous() {
        RuntimeConfig config;
        config.default_channel_capacity = 0;
        return config;
    }

    // Runs flows as fast as possible, ignoring speed_attenuation of every node
    inline RuntimeConfig unthrottled() {
        RuntimeConfig config;
        config.apply_speed_attenuation = false;
        return config;
    }

} // namespace runtime_config

} // namespace conduit
