#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace conduit {

    class NodeRuntime;

    // Live index of scheduled runtimes for one flow, keyed by node id.
    // Bulk operations skip runtimes whose node has independent_control set.
    // Runtimes register themselves on start() and unregister on stop(), on
    // destruction and when their task exits, so the registry must outlive them.
    //
    // pause_all() and resume_all() dispatch under the registry lock, which
    // serializes them with unregistration. stop_all() dispatches on a snapshot
    // taken under the lock, so runtimes must not be destroyed concurrently
    // with stop_all().
    class RuntimeRegistry {
    public:
        RuntimeRegistry() = default;
        RuntimeRegistry(const RuntimeRegistry&) = delete;
        RuntimeRegistry& operator=(const RuntimeRegistry&) = delete;

        void register_runtime(NodeRuntime& runtime);
        // No-op unless `runtime` is the instance currently registered under its id
        void unregister_runtime(NodeRuntime& runtime);

        void pause_all();
        void resume_all();
        void stop_all();

        size_t count() const;
        bool is_registered(const std::string& node_id) const;
        NodeRuntime* get(const std::string& node_id) const;
        std::vector<NodeRuntime*> snapshot() const;
        void clear();

    private:
        std::vector<NodeRuntime*> controllable_snapshot() const;

        mutable std::mutex _mutex;
        std::unordered_map<std::string, NodeRuntime*> _runtimes;
    };

} // namespace conduit
