#pragma once

#include "storage/EventStore.hpp"

#include <cstdint>
#include <mutex>

namespace gp::storage {

class MemoryEventStore final : public EventStore {
public:
    std::string insert(const types::Event& event) override;
    [[nodiscard]] std::vector<types::StoredEvent> listLatest(std::size_t limit) const override;
    [[nodiscard]] std::optional<types::StoredEvent> getById(const std::string& id) const override;
    std::size_t deleteAll() override;

    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<types::StoredEvent> events_;   // insertion order
    uint64_t nextId_{1};

    [[nodiscard]] std::string makeId();
};

}
