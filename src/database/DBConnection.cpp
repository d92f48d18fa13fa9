#include "database/DBConnection.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace gp::log;

namespace gp::database {

DBConnection::DBConnection(std::string connectionString)
    : connectionString_(std::move(connectionString)),
      conn_(std::make_unique<pqxx::connection>(connectionString_)) {
    Registry::db()->debug("[DBConnection] Connected to {}", conn_->dbname());
}

DBConnection::~DBConnection() { if (conn_ && conn_->is_open()) conn_->close(); }

pqxx::connection& DBConnection::get() const { return *conn_; }

void DBConnection::initPrepared() {
    if (!conn_ || !conn_->is_open()) throw std::runtime_error("Database connection is not open");

    initPreparedEvents();
    prepared_ = true;
}

void DBConnection::reconnect() {
    Registry::db()->warn("[DBConnection] Connection lost, reconnecting");
    conn_ = std::make_unique<pqxx::connection>(connectionString_);
    if (prepared_) initPreparedEvents();
}

} // namespace gp::database
