#pragma once
#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace gitagent {

std::string json_escape(const std::string &s);

// "\"...\"" with escaping applied.
std::string json_quote(const std::string &s);
// json_quote(*s) or `null`.
std::string json_quote_or_null(const std::optional<std::string> &s);
std::string json_array(const std::vector<std::string> &items);

// Parses a request or answer body. Anything that is not a JSON object yields
// std::nullopt.
std::optional<nlohmann::json> json_parse_object(const std::string &doc);

// Typed lookups of a top-level member. A missing key and a value of another
// type yield std::nullopt.
std::optional<std::string> json_get_string(const nlohmann::json &obj,
                                           const std::string &key);
std::optional<bool> json_get_bool(const nlohmann::json &obj,
                                  const std::string &key);

std::optional<std::string> json_get_string(const std::string &doc,
                                           const std::string &key);
std::optional<bool> json_get_bool(const std::string &doc,
                                  const std::string &key);

} // namespace gitagent
