#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace gitagent {

struct Request {
  std::string method;
  std::string path;
  std::string query;
  std::unordered_map<std::string, std::string> headers;
  std::string body;
};

struct Response {
  int status = 200;
  std::unordered_map<std::string, std::string> headers;
  std::string body;
};

// Longest request or header line the server reads.
constexpr size_t kMaxHeaderLine = 8 * 1024;
// Largest request body accepted; file saves are the biggest bodies.
constexpr size_t kMaxBodyBytes = 16 * 1024 * 1024;

const char *reason_phrase(int code);

// Case-insensitive header lookup.
std::optional<std::string> header_value(const Request &r,
                                        const std::string &name);

enum class BodyLength {
  None,
  Ok,
  TooLarge,
  Invalid,
};

// Validates Content-Length against `limit`; `len` is set when Ok.
BodyLength content_length(const Request &r, size_t limit, size_t &len);

std::string url_decode(const std::string &s);
std::vector<std::pair<std::string, std::string>>
parse_query(const std::string &q);

} // namespace gitagent
