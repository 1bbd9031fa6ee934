// -----------------------------------------------------------------------------
// @file error.cpp
// @brief Names and messages for escrle::Error.
//
// The names are part of the CLI's machine-readable output (status lines and
// JSON), so they must stay stable once published.
// -----------------------------------------------------------------------------
#include "escrle/error.hpp"

namespace escrle {

namespace {

struct ErrorInfo {
    Error       code;
    const char* name;
    const char* message;
};

// Single table so names, messages and the reverse lookup cannot drift apart.
const ErrorInfo kErrors[] = {
    { Error::None,             "none",               "No error" },
    { Error::InvalidInputType, "invalid_input_type", "Input must be valid UTF-8 text" },
    { Error::EmptyInput,       "empty_input",        "Input must be non-empty" },
    { Error::MissingHeader,    "missing_header",     "Encoded input must begin with the '##00' header" },
    { Error::EmptyBody,        "empty_body",         "Encoded input has no tokens after the '##00' header" },
    { Error::DanglingEscape,   "dangling_escape",    "Dangling escape '#' at end of encoded string" },
    { Error::InvalidEscape,    "invalid_escape",     "Invalid escape sequence: '#' must be followed by '#' or a digit" },
    { Error::MalformedCount,   "malformed_count",    "Run count must be a positive integer without leading zeros, following a literal" },
    { Error::CountOverflow,    "count_overflow",     "Run count is too large to decode" },
    { Error::OutputOverflow,   "output_overflow",    "Result does not fit the output buffer" },
    { Error::NonAlphabetic,    "non_alphabetic",     "Input must contain alphabetic characters only (A-Z or a-z)" },
    { Error::InvalidLiteral,   "invalid_literal",    "Expected a letter where a run begins" },
};

const ErrorInfo* find(Error e) {
    for (const auto& info : kErrors) {
        if (info.code == e) return &info;
    }
    return nullptr;
}

} // namespace

const char* error_name(Error e) {
    const ErrorInfo* info = find(e);
    return info ? info->name : "unknown";
}

const char* error_message(Error e) {
    const ErrorInfo* info = find(e);
    return info ? info->message : "Unknown error";
}

bool parse_error_name(const std::string& name, Error& out) {
    for (const auto& info : kErrors) {
        if (name == info.name) {
            out = info.code;
            return true;
        }
    }
    return false;
}

} // namespace escrle
