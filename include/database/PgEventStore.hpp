#pragma once

#include "storage/EventStore.hpp"

#include <memory>

namespace gp::config { struct DatabaseConfig; }

namespace gp::database {

class Transactions;

/**
 * EventStore backed by the github_events table.
 *
 * A store built without a pool is "disconnected": reads come back empty and
 * insert() throws StoreError, so the HTTP side keeps serving.
 */
class PgEventStore final : public storage::EventStore {
public:
    explicit PgEventStore(std::shared_ptr<Transactions> tx);
    ~PgEventStore() override;

    // Builds the pool, bootstraps the schema and prepares statements. Never throws;
    // a failed connection is logged and yields a disconnected store.
    static std::shared_ptr<PgEventStore> connect(const config::DatabaseConfig& cfg);

    std::string insert(const types::Event& event) override;
    [[nodiscard]] std::vector<types::StoredEvent> listLatest(std::size_t limit) const override;
    [[nodiscard]] std::optional<types::StoredEvent> getById(const std::string& id) const override;
    std::size_t deleteAll() override;

    [[nodiscard]] bool isConnected() const { return tx_ != nullptr; }

private:
    std::shared_ptr<Transactions> tx_;
};

}
