#include <gitagent/json.hpp>

namespace gitagent {

std::string json_escape(const std::string &s) {
  std::string o;
  o.reserve(s.size() + 8);
  for (char c : s) {
    switch (c) {
    case '\"': o += "\\\""; break;
    case '\\': o += "\\\\"; break;
    case '\b': o += "\\b"; break;
    case '\f': o += "\\f"; break;
    case '\n': o += "\\n"; break;
    case '\r': o += "\\r"; break;
    case '\t': o += "\\t"; break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        const char *hexd = "0123456789abcdef";
        o += "\\u00";
        o.push_back(hexd[(c >> 4) & 0xF]);
        o.push_back(hexd[c & 0xF]);
      } else {
        o.push_back(c);
      }
    }
  }
  return o;
}

std::string json_quote(const std::string &s) {
  return "\"" + json_escape(s) + "\"";
}

std::string json_quote_or_null(const std::optional<std::string> &s) {
  return s ? json_quote(*s) : std::string("null");
}

std::string json_array(const std::vector<std::string> &items) {
  std::string json = "[";
  for (size_t i = 0; i < items.size(); ++i) {
    json += json_quote(items[i]);
    if (i + 1 < items.size())
      json += ",";
  }
  json += "]";
  return json;
}

std::optional<nlohmann::json> json_parse_object(const std::string &doc) {
  auto j = nlohmann::json::parse(doc, nullptr, false);
  if (j.is_discarded() || !j.is_object())
    return std::nullopt;
  return j;
}

std::optional<std::string> json_get_string(const nlohmann::json &obj,
                                           const std::string &key) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_string())
    return std::nullopt;
  return it->get<std::string>();
}

std::optional<bool> json_get_bool(const nlohmann::json &obj,
                                  const std::string &key) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_boolean())
    return std::nullopt;
  return it->get<bool>();
}

std::optional<std::string> json_get_string(const std::string &doc,
                                           const std::string &key) {
  auto obj = json_parse_object(doc);
  if (!obj)
    return std::nullopt;
  return json_get_string(*obj, key);
}

std::optional<bool> json_get_bool(const std::string &doc,
                                  const std::string &key) {
  auto obj = json_parse_object(doc);
  if (!obj)
    return std::nullopt;
  return json_get_bool(*obj, key);
}

} // namespace gitagent
