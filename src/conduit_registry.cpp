#include "conduit_registry.hpp"
#include "conduit_runtime.hpp"
#include "zf_log.h"

namespace conduit {

void RuntimeRegistry::register_runtime(NodeRuntime& runtime) {
    std::lock_guard<std::mutex> lock(_mutex);
    _runtimes[runtime.id()] = &runtime;
}

void RuntimeRegistry::unregister_runtime(NodeRuntime& runtime) {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _runtimes.find(runtime.id());
    if (it != _runtimes.end() && it->second == &runtime) {
        _runtimes.erase(it);
    }
}

std::vector<NodeRuntime*> RuntimeRegistry::controllable_snapshot() const {
    std::vector<NodeRuntime*> out;
    std::lock_guard<std::mutex> lock(_mutex);
    out.reserve(_runtimes.size());
    for (const auto& entry : _runtimes) {
        if (!entry.second->control_config().independent_control) {
            out.push_back(entry.second);
        }
    }
    return out;
}

void RuntimeRegistry::pause_all() {
    std::lock_guard<std::mutex> lock(_mutex);
    size_t count = 0;
    for (const auto& entry : _runtimes) {
        if (entry.second->control_config().independent_control) continue;
        entry.second->pause();
        ++count;
    }
    ZF_LOGD("paused %zu runtimes", count);
}

void RuntimeRegistry::resume_all() {
    std::lock_guard<std::mutex> lock(_mutex);
    size_t count = 0;
    for (const auto& entry : _runtimes) {
        if (entry.second->control_config().independent_control) continue;
        entry.second->resume();
        ++count;
    }
    ZF_LOGD("resumed %zu runtimes", count);
}

void RuntimeRegistry::stop_all() {
    // stop() unregisters and joins, so it runs outside the lock
    auto runtimes = controllable_snapshot();
    ZF_LOGD("stopping %zu runtimes", runtimes.size());
    for (NodeRuntime* runtime : runtimes) {
        runtime->stop();
    }
    clear();
}

size_t RuntimeRegistry::count() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _runtimes.size();
}

bool RuntimeRegistry::is_registered(const std::string& node_id) const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _runtimes.count(node_id) > 0;
}

NodeRuntime* RuntimeRegistry::get(const std::string& node_id) const {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _runtimes.find(node_id);
    return it == _runtimes.end() ? nullptr : it->second;
}

std::vector<NodeRuntime*> RuntimeRegistry::snapshot() const {
    std::vector<NodeRuntime*> out;
    std::lock_guard<std::mutex> lock(_mutex);
    out.reserve(_runtimes.size());
    for (const auto& entry : _runtimes) {
        out.push_back(entry.second);
    }
    return out;
}

void RuntimeRegistry::clear() {
    std::lock_guard<std::mutex> lock(_mutex);
    _runtimes.clear();
}

} // namespace conduit
