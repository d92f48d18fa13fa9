#include "storage/MemoryEventStore.hpp"
#include "types/Event.hpp"

#include <algorithm>
#include <fmt/format.h>

using namespace gp::storage;
using namespace gp::types;

std::string MemoryEventStore::makeId() {
    return fmt::format("{:024x}", nextId_++);
}

std::string MemoryEventStore::insert(const Event& event) {
    std::lock_guard lock(mutex_);
    auto id = makeId();
    events_.emplace_back(id, event);
    return id;
}

std::vector<StoredEvent> MemoryEventStore::listLatest(const std::size_t limit) const {
    std::lock_guard lock(mutex_);

    // newest insert first, so equal timestamps keep reverse insertion order
    std::vector<StoredEvent> out(events_.rbegin(), events_.rend());
    std::stable_sort(out.begin(), out.end(), [](const StoredEvent& a, const StoredEvent& b) {
        return a.timestamp > b.timestamp;
    });

    if (out.size() > limit) out.resize(limit);
    return out;
}

std::optional<StoredEvent> MemoryEventStore::getById(const std::string& id) const {
    std::lock_guard lock(mutex_);
    const auto it = std::find_if(events_.begin(), events_.end(),
                                 [&id](const StoredEvent& e) { return e.id == id; });
    if (it == events_.end()) return std::nullopt;
    return *it;
}

std::size_t MemoryEventStore::deleteAll() {
    std::lock_guard lock(mutex_);
    const auto count = events_.size();
    events_.clear();
    return count;
}

std::size_t MemoryEventStore::size() const {
    std::lock_guard lock(mutex_);
    return events_.size();
}
