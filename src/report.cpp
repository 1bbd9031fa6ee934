/**
 * @file report.cpp
 * @brief JSON serialization of codec results for scripts and the CLI.
 * @details
 *   Builds nlohmann::json objects and dumps them. Inputs that failed with
 *   Error::InvalidInputType are not valid UTF-8, and nlohmann::json's strict dump
 *   throws on such strings, so every dump here uses the `replace` error handler:
 *   malformed bytes become U+FFFD in the report instead of aborting it.
 */
#include "escrle/report.hpp"

#include "nlohmann/json.hpp"

using nlohmann::json;

namespace escrle {
namespace report {

namespace {

std::string dump(const json& j, int indent) {
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

json token_object(const Token& t) {
    json j;
    j["literal"] = t.literal_str();
    j["text"]    = to_text(t);
    j["escaped"] = t.escaped;
    j["count"]   = t.count;
    j["offset"]  = t.offset;
    return j;
}

json token_array(const std::vector<Token>& tokens) {
    json a = json::array();
    for (const auto& t : tokens) a.push_back(token_object(t));
    return a;
}

} // namespace

std::string result_json(const std::string& op,
                        const std::string& scheme,
                        const std::string& input,
                        const std::string& output,
                        const std::vector<Token>* tokens,
                        int indent) {
    json j;
    j["op"]        = op;
    j["scheme"]    = scheme;
    j["input"]     = input;
    j["output"]    = output;
    j["in_bytes"]  = input.size();
    j["out_bytes"] = output.size();
    if (tokens) j["tokens"] = token_array(*tokens);
    return dump(j, indent);
}

std::string fault_json(const std::string& op,
                       const std::string& scheme,
                       const std::string& input,
                       const Fault& fault,
                       int indent) {
    json err;
    err["code"]    = error_name(fault.code);
    err["message"] = error_message(fault.code);
    err["offset"]  = fault.offset;

    json j;
    j["op"]     = op;
    j["scheme"] = scheme;
    j["input"]  = input;
    j["error"]  = err;
    return dump(j, indent);
}

std::string tokens_json(const std::vector<Token>& tokens, int indent) {
    return dump(token_array(tokens), indent);
}

} // namespace report
} // namespace escrle
