#pragma once

#include <string>
#include <vector>

#include "escrle/error.hpp"
#include "escrle/token.hpp"

namespace escrle {
namespace report {

/**
 * @brief JSON object describing a successful encode or decode.
 * @param op      "encode" or "decode".
 * @param scheme  "escaped" or "plain".
 * @param tokens  Optional token list to embed under "tokens".
 * @param indent  nlohmann::json dump indent (-1 for a single line).
 * @return e.g. {"op":"encode","scheme":"escaped","input":"AAAA","output":"##00A4",...}
 */
std::string result_json(const std::string& op,
                        const std::string& scheme,
                        const std::string& input,
                        const std::string& output,
                        const std::vector<Token>* tokens = nullptr,
                        int indent = -1);

/**
 * @brief JSON object describing a failed call.
 * @return {"op":..,"scheme":..,"input":..,"error":{"code":..,"message":..,"offset":n}}
 */
std::string fault_json(const std::string& op,
                       const std::string& scheme,
                       const std::string& input,
                       const Fault& fault,
                       int indent = -1);

/// @brief JSON array with one object per token.
std::string tokens_json(const std::vector<Token>& tokens, int indent = -1);

} // namespace report
} // namespace escrle
