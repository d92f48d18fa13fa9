#pragma once

#include "DBConnection.hpp"
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>

namespace gp::database {

// Fixed-size set of connections opened eagerly. acquire() blocks until one is free.
class DBPool {
  public:
    DBPool(const std::string& connectionString, std::size_t size);

    std::unique_ptr<DBConnection> acquire();
    void release(std::unique_ptr<DBConnection> conn);

    // Prepares the event statements on every idle connection.
    void initPreparedStatements();

    [[nodiscard]] std::size_t capacity() const { return capacity_; }

  private:
    std::queue<std::unique_ptr<DBConnection>> idle_;
    std::size_t capacity_;
    std::mutex mtx_;
    std::condition_variable cv_;
};

} // namespace gp::database
