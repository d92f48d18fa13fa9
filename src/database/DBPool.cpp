#include "database/DBPool.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace gp::log;

namespace gp::database {

DBPool::DBPool(const std::string& connectionString, const std::size_t size) : capacity_(size) {
    if (size == 0) throw std::invalid_argument("DBPool size must be at least 1");

    for (std::size_t i = 0; i < size; ++i) idle_.push(std::make_unique<DBConnection>(connectionString));
    Registry::db()->info("[DBPool] Opened {} connection(s)", size);
}

std::unique_ptr<DBConnection> DBPool::acquire() {
    std::unique_lock lock(mtx_);
    cv_.wait(lock, [&] { return !idle_.empty(); });
    auto conn = std::move(idle_.front());
    idle_.pop();
    return conn;
}

void DBPool::release(std::unique_ptr<DBConnection> conn) {
    if (!conn) return;
    {
        std::lock_guard lock(mtx_);
        idle_.push(std::move(conn));
    }
    cv_.notify_one();
}

void DBPool::initPreparedStatements() {
    std::lock_guard lock(mtx_);
    for (std::size_t i = 0; i < idle_.size(); ++i) {
        auto conn = std::move(idle_.front());
        idle_.pop();
        conn->initPrepared();
        idle_.push(std::move(conn));
    }
    Registry::db()->debug("[DBPool] Prepared statements on {} connection(s)", idle_.size());
}

} // namespace gp::database
