#include "webhook/payload/Push.hpp"
#include "webhook/payload/fields.hpp"

namespace gp::webhook::payload {

void from_json(const json& j, Commit& c) {
    if (!j.is_object()) throw ParseFailure("commit entries must be objects");
    c.id = optionalString(j, "id");
}

void from_json(const json& j, Pusher& p) {
    p.name = optionalString(j, "name");
}

void from_json(const json& j, Push& p) {
    p.latest_commit.reset();
    if (const auto* commits = field(j, "commits")) {
        if (!commits->is_array()) throw ParseFailure("'commits' must be an array");
        if (!commits->empty()) p.latest_commit = commits->back().get<Commit>();
    }
    p.ref = optionalString(j, "ref");
    p.pusher = optionalObject<Pusher>(j, "pusher");
}

}
