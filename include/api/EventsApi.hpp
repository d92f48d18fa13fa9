#pragma once

#include "api/Response.hpp"
#include "config/Config.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace gp::storage { class EventStore; }

namespace gp::api {

inline constexpr const char* SERVICE_NAME = "Git Ping API";
inline constexpr const char* SERVICE_VERSION = "1.0.0";

// Read side of the service plus the sample-data reset.
class EventsApi {
public:
    explicit EventsApi(std::shared_ptr<storage::EventStore> store, config::ApiConfig cfg = {});

    // nullopt means "not given / not a number" and falls back to the default limit.
    [[nodiscard]] Response listEvents(std::optional<long long> requestedLimit = std::nullopt) const;
    [[nodiscard]] Response getEvent(const std::string& id) const;

    // Wipes the store and inserts one PUSH, one PULL_REQUEST and one MERGE.
    [[nodiscard]] Response createSampleEvents() const;

    [[nodiscard]] static Response health();
    [[nodiscard]] static Response info();

    [[nodiscard]] std::size_t clampLimit(std::optional<long long> requested) const;

private:
    std::shared_ptr<storage::EventStore> store_;
    config::ApiConfig cfg_;
};

}
