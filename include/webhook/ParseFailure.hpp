#pragma once

#include <stdexcept>

namespace gp::webhook {

// Payload shape did not match what a parser expects. Never leaves the parsers.
class ParseFailure : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}
