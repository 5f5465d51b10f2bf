#pragma once
#include "task.hpp"
#include <deque>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace rtsim {

struct Resource {
    ResourceId id{};
    std::string name;
    std::optional<JobIndex> holder{};
    std::deque<JobIndex> waiters{};
};

// Mutual-exclusion resources shared by tasks. At most one holder each;
// waiters are served in FIFO order when the holder releases.
class ResourceGraph {
public:
    bool add_resource(ResourceId id, std::string name = {});
    bool contains(ResourceId id) const { return index_.count(id) != 0; }
    Resource* find(ResourceId id);
    const Resource* find(ResourceId id) const;
    const std::vector<Resource>& resources() const { return resources_; }
    std::size_t size() const { return resources_.size(); }

    bool try_acquire(ResourceId id, JobIndex who);
    void wait(ResourceId id, JobIndex who);
    // Returns the waiter the resource was handed to, if any.
    std::optional<JobIndex> release(ResourceId id, JobIndex who);
    void cancel_wait(JobIndex who);
    std::optional<ResourceId> waiting_on(JobIndex who) const;
    std::vector<ResourceId> held_by(JobIndex who) const;
    void reset();

private:
    std::vector<Resource> resources_;
    std::unordered_map<ResourceId, std::size_t> index_;
};

} // namespace rtsim
