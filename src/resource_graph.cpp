#include "rtsim/resource_graph.hpp"
#include <algorithm>
#include <utility>

namespace rtsim {

bool ResourceGraph::add_resource(ResourceId id, std::string name) {
    if (contains(id)) return false;
    index_[id] = resources_.size();
    Resource r;
    r.id = id;
    r.name = name.empty() ? "R" + std::to_string(id) : std::move(name);
    resources_.push_back(std::move(r));
    return true;
}

Resource* ResourceGraph::find(ResourceId id) {
    auto it = index_.find(id);
    if (it == index_.end()) return nullptr;
    return &resources_[it->second];
}

const Resource* ResourceGraph::find(ResourceId id) const {
    auto it = index_.find(id);
    if (it == index_.end()) return nullptr;
    return &resources_[it->second];
}

bool ResourceGraph::try_acquire(ResourceId id, JobIndex who) {
    auto* r = find(id);
    if (!r) return false;
    if (!r->holder) {
        r->holder = who;
        return true;
    }
    return *r->holder == who;
}

void ResourceGraph::wait(ResourceId id, JobIndex who) {
    auto* r = find(id);
    if (!r) return;
    if (std::find(r->waiters.begin(), r->waiters.end(), who) == r->waiters.end())
        r->waiters.push_back(who);
}

std::optional<JobIndex> ResourceGraph::release(ResourceId id, JobIndex who) {
    auto* r = find(id);
    if (!r || !r->holder || *r->holder != who) return std::nullopt;
    r->holder.reset();
    if (r->waiters.empty()) return std::nullopt;
    auto next = r->waiters.front();
    r->waiters.pop_front();
    r->holder = next;
    return next;
}

void ResourceGraph::cancel_wait(JobIndex who) {
    for (auto& r : resources_) {
        r.waiters.erase(std::remove(r.waiters.begin(), r.waiters.end(), who), r.waiters.end());
    }
}

std::optional<ResourceId> ResourceGraph::waiting_on(JobIndex who) const {
    for (const auto& r : resources_) {
        if (std::find(r.waiters.begin(), r.waiters.end(), who) != r.waiters.end()) return r.id;
    }
    return std::nullopt;
}

std::vector<ResourceId> ResourceGraph::held_by(JobIndex who) const {
    std::vector<ResourceId> out;
    for (const auto& r : resources_) {
        if (r.holder && *r.holder == who) out.push_back(r.id);
    }
    return out;
}

void ResourceGraph::reset() {
    for (auto& r : resources_) {
        r.holder.reset();
        r.waiters.clear();
    }
}

} // namespace rtsim
