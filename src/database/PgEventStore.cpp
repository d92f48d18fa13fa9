#include "database/PgEventStore.hpp"
#include "database/Transactions.hpp"
#include "database/schema.hpp"
#include "config/Config.hpp"
#include "types/Event.hpp"
#include "log/Registry.hpp"

#include <charconv>
#include <cstdint>

using namespace gp::database;
using namespace gp::storage;
using namespace gp::types;
using namespace gp::log;

static constexpr const auto* NOT_CONNECTED = "Database connection not available";

static std::optional<int64_t> parseEventId(const std::string& id) {
    int64_t value = 0;
    const auto* end = id.data() + id.size();
    const auto [ptr, ec] = std::from_chars(id.data(), end, value);
    if (ec != std::errc() || ptr != end || value <= 0) return std::nullopt;
    return value;
}

PgEventStore::PgEventStore(std::shared_ptr<Transactions> tx) : tx_(std::move(tx)) {}

PgEventStore::~PgEventStore() = default;

std::shared_ptr<PgEventStore> PgEventStore::connect(const config::DatabaseConfig& cfg) {
    try {
        auto pool = std::make_shared<DBPool>(cfg.connectionString(), cfg.pool_size == 0 ? 1u : cfg.pool_size);
        auto tx = std::make_shared<Transactions>(pool);
        initSchema(*tx);
        pool->initPreparedStatements();
        Registry::db()->info("[PgEventStore] Connected to database '{}' with {} connection(s)", cfg.name, pool->capacity());
        return std::make_shared<PgEventStore>(std::move(tx));
    } catch (const std::exception& e) {
        Registry::db()->error("[PgEventStore] Failed to connect to database: {}", e.what());
        Registry::gitping()->warn("[PgEventStore] Running without a database; events will not be persisted");
        return std::make_shared<PgEventStore>(nullptr);
    }
}

std::string PgEventStore::insert(const Event& event) {
    if (!tx_) throw StoreError(NOT_CONNECTED);

    const pqxx::params p{
        event.request_id,
        event.author,
        to_string(event.action),
        event.from_branch,
        event.to_branch,
        event.timestamp
    };

    try {
        return tx_->exec("PgEventStore::insert", [&](pqxx::work& txn) {
            const auto res = txn.exec(pqxx::prepped{"github_events.insert"}, p);
            if (res.empty()) throw StoreError("Insert returned no id");
            return res.one_row()["id"].as<std::string>();
        });
    } catch (const StoreError&) {
        throw;
    } catch (const std::exception& e) {
        throw StoreError(std::string("Error saving event: ") + e.what());
    }
}

std::vector<StoredEvent> PgEventStore::listLatest(const std::size_t limit) const {
    if (!tx_) {
        Registry::db()->error("[PgEventStore] listLatest: {}", NOT_CONNECTED);
        return {};
    }

    try {
        return tx_->exec("PgEventStore::listLatest", [&](pqxx::work& txn) {
            const auto res = txn.exec(pqxx::prepped{"github_events.list_latest"},
                                      pqxx::params{static_cast<int64_t>(limit)});
            std::vector<StoredEvent> events;
            events.reserve(res.size());
            for (const auto& row : res) events.emplace_back(row);
            return events;
        });
    } catch (const std::exception& e) {
        Registry::db()->error("[PgEventStore] Error fetching events: {}", e.what());
        return {};
    }
}

std::optional<StoredEvent> PgEventStore::getById(const std::string& id) const {
    if (!tx_) {
        Registry::db()->error("[PgEventStore] getById: {}", NOT_CONNECTED);
        return std::nullopt;
    }

    const auto key = parseEventId(id);
    if (!key) {
        Registry::db()->debug("[PgEventStore] Malformed event id '{}'", id);
        return std::nullopt;
    }

    try {
        return tx_->exec("PgEventStore::getById", [&](pqxx::work& txn) -> std::optional<StoredEvent> {
            const auto res = txn.exec(pqxx::prepped{"github_events.get_by_id"}, pqxx::params{*key});
            if (res.empty()) return std::nullopt;
            return StoredEvent(res.one_row());
        });
    } catch (const std::exception& e) {
        Registry::db()->error("[PgEventStore] Error fetching event by id: {}", e.what());
        return std::nullopt;
    }
}

std::size_t PgEventStore::deleteAll() {
    if (!tx_) {
        Registry::db()->error("[PgEventStore] deleteAll: {}", NOT_CONNECTED);
        return 0;
    }

    try {
        return tx_->exec("PgEventStore::deleteAll", [&](pqxx::work& txn) {
            const auto res = txn.exec(pqxx::prepped{"github_events.delete_all"});
            return static_cast<std::size_t>(res.affected_rows());
        });
    } catch (const std::exception& e) {
        Registry::db()->error("[PgEventStore] Error deleting events: {}", e.what());
        return 0;
    }
}
