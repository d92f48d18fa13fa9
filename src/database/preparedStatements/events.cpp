#include "database/DBConnection.hpp"

using namespace gp::database;

void DBConnection::initPreparedEvents() const {
    conn_->prepare("github_events.insert",
                   "INSERT INTO github_events (request_id, author, action, from_branch, to_branch, timestamp) "
                   "VALUES ($1, $2, $3, $4, $5, $6) RETURNING id");

    conn_->prepare("github_events.list_latest",
                   "SELECT id, request_id, author, action, from_branch, to_branch, timestamp "
                   "FROM github_events ORDER BY timestamp DESC, id DESC LIMIT $1");

    conn_->prepare("github_events.get_by_id",
                   "SELECT id, request_id, author, action, from_branch, to_branch, timestamp "
                   "FROM github_events WHERE id = $1");

    conn_->prepare("github_events.delete_all", "DELETE FROM github_events");
}
