#include "database/schema.hpp"
#include "database/Transactions.hpp"

namespace gp::database {

void initSchema(const Transactions& tx) {
    tx.exec("schema::initSchema", [&](pqxx::work& txn) {
        txn.exec(R"(
CREATE TABLE IF NOT EXISTS github_events
(
    id           BIGSERIAL    PRIMARY KEY,
    request_id   TEXT         NOT NULL,
    author       TEXT         NOT NULL,
    action       VARCHAR(32)  NOT NULL,
    from_branch  TEXT,
    to_branch    TEXT         NOT NULL,
    timestamp    TEXT         NOT NULL
);
        )");

        txn.exec("CREATE INDEX IF NOT EXISTS idx_github_events_timestamp ON github_events (timestamp DESC)");
    });
}

}
