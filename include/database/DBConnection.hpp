#pragma once

#include <memory>
#include <string>
#include <pqxx/connection>

namespace gp::database {

class DBConnection {
  public:
    explicit DBConnection(std::string connectionString);
    ~DBConnection();

    [[nodiscard]] pqxx::connection& get() const;

    // Must run after the schema exists; PREPARE is validated server-side.
    void initPrepared();

    // Re-open a dropped connection, restoring prepared statements if they were set up.
    void reconnect();

  private:
    std::string connectionString_;
    std::unique_ptr<pqxx::connection> conn_;
    bool prepared_{false};

    void initPreparedEvents() const;
};

} // namespace gp::database
