#pragma once

#include "types/StoredEvent.hpp"

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace gp::types { struct Event; }

namespace gp::storage {

class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Persistence collaborator for events.
 *
 * Only insert() reports failure (StoreError); the read side and delete_all()
 * degrade to empty / not-found / 0 when the backing store is unavailable.
 */
class EventStore {
public:
    virtual ~EventStore() = default;

    // Returns the store-assigned id. Throws StoreError.
    virtual std::string insert(const types::Event& event) = 0;

    // Newest first by timestamp, at most `limit` entries.
    [[nodiscard]] virtual std::vector<types::StoredEvent> listLatest(std::size_t limit) const = 0;

    [[nodiscard]] virtual std::optional<types::StoredEvent> getById(const std::string& id) const = 0;

    virtual std::size_t deleteAll() = 0;
};

}
