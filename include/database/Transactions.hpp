#pragma once

#include "DBPool.hpp"
#include "log/Registry.hpp"

#include <memory>
#include <pqxx/pqxx>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace gp::database {

class Transactions {
  public:
    explicit Transactions(std::shared_ptr<DBPool> pool) : dbPool_(std::move(pool)) {
        if (!dbPool_) throw std::invalid_argument("Transactions requires a connection pool");
    }

    template <typename Func>
    auto exec(const std::string& ctx, Func&& func) const -> decltype(func(std::declval<pqxx::work&>())) {
        using Result = decltype(func(std::declval<pqxx::work&>()));

        log::Registry::db()->trace("[Transactions::exec] Starting transaction: {}", ctx);
        auto conn = dbPool_->acquire();

        try {
            if (!conn->get().is_open()) conn->reconnect();

            // txn must be gone before the connection goes back to the pool
            if constexpr (std::is_void_v<Result>) {
                {
                    pqxx::work txn(conn->get());
                    func(txn);
                    txn.commit();
                }
                log::Registry::db()->trace("[Transactions::exec] Transaction committed: {}", ctx);
                dbPool_->release(std::move(conn));
            } else {
                auto result = [&] {
                    pqxx::work txn(conn->get());
                    auto r = func(txn);
                    txn.commit();
                    return r;
                }();
                log::Registry::db()->trace("[Transactions::exec] Transaction committed: {}", ctx);
                dbPool_->release(std::move(conn));
                return result;
            }
        } catch (const std::exception& e) {
            log::Registry::db()->error("[Transactions::exec] Exception in transaction context '{}', rolling back: {}",
                                       ctx, e.what());
            dbPool_->release(std::move(conn));
            throw;
        }

        if constexpr (!std::is_void_v<Result>) {
            // Compiler satisfaction token
            throw std::logic_error("Unreachable path in Transactions::exec");
        }
    }

  private:
    std::shared_ptr<DBPool> dbPool_;
};

} // namespace gp::database
