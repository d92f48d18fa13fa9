#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace gp::api {

using json = nlohmann::json;

// Every outcome the API can report; the HTTP layer maps these to status codes.
enum class Status { OK, IGNORED, NOT_FOUND, BAD_REQUEST, ERROR };

struct Response {
    Status status = Status::OK;
    json body{};

    static Response SUCCESS(json&& body);

    static Response IGNORED(std::string&& message);

    static Response NOT_FOUND(std::string&& error);

    static Response BAD_REQUEST(std::string&& error);

    static Response ERROR(std::string&& error);
};

std::string to_string(const Status& status);

}
