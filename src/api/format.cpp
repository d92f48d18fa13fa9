#include "api/format.hpp"
#include "types/StoredEvent.hpp"
#include "util/timestamp.hpp"
#include "log/Registry.hpp"

#include <iomanip>
#include <locale>
#include <sstream>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace gp::api {

std::string formatTimestamp(const std::string& iso) {
    const auto tm = util::parseIsoTimestamp(iso);
    if (!tm) {
        log::Registry::api()->debug("[format] Unparseable timestamp '{}', using it verbatim", iso);
        return iso;
    }

    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::put_time(&*tm, "%d %B %Y - %I:%M %p UTC");
    return oss.str();
}

std::string formatMessage(const types::StoredEvent& event) {
    const auto ts = formatTimestamp(event.timestamp);
    const auto from = event.from_branch.value_or("");

    if (event.action == "PUSH")
        return fmt::format(R"("{}" pushed to "{}" on {})", event.author, event.to_branch, ts);
    if (event.action == "PULL_REQUEST")
        return fmt::format(R"("{}" submitted a pull request from "{}" to "{}" on {})",
                           event.author, from, event.to_branch, ts);
    if (event.action == "MERGE")
        return fmt::format(R"("{}" merged branch "{}" to "{}" on {})", event.author, from, event.to_branch, ts);

    return fmt::format(R"("{}" performed {} on {})", event.author, event.action, ts);
}

nlohmann::json toDisplayJson(const types::StoredEvent& event) {
    nlohmann::json j = event;
    j["formatted_timestamp"] = formatTimestamp(event.timestamp);
    j["message"] = formatMessage(event);
    return j;
}

}
