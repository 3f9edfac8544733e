#include <gitagent/http.hpp>

#include <cctype>
#include <charconv>
#include <system_error>

namespace gitagent {

const char *reason_phrase(int code) {
  switch (code) {
  case 200: return "OK";
  case 201: return "Created";
  case 204: return "No Content";
  case 400: return "Bad Request";
  case 404: return "Not Found";
  case 405: return "Method Not Allowed";
  case 409: return "Conflict";
  case 413: return "Payload Too Large";
  case 431: return "Request Header Fields Too Large";
  case 500: return "Internal Server Error";
  default:  return "OK";
  }
}

std::optional<std::string> header_value(const Request &r,
                                        const std::string &name) {
  for (auto &kv : r.headers) {
    if (kv.first.size() != name.size())
      continue;
    bool same = true;
    for (size_t i = 0; i < name.size() && same; ++i)
      same = std::tolower(static_cast<unsigned char>(kv.first[i])) ==
             std::tolower(static_cast<unsigned char>(name[i]));
    if (same)
      return kv.second;
  }
  return std::nullopt;
}

BodyLength content_length(const Request &r, size_t limit, size_t &len) {
  auto v = header_value(r, "Content-Length");
  if (!v)
    return BodyLength::None;
  const char *b = v->data();
  const char *e = b + v->size();
  while (e > b && (e[-1] == ' ' || e[-1] == '\t'))
    --e;
  unsigned long long n = 0;
  auto [end, ec] = std::from_chars(b, e, n);
  if (ec == std::errc::result_out_of_range)
    return BodyLength::TooLarge;
  if (ec != std::errc() || end != e)
    return BodyLength::Invalid;
  if (n > limit)
    return BodyLength::TooLarge;
  len = static_cast<size_t>(n);
  return BodyLength::Ok;
}

static int hex(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F')
    return 10 + (c - 'A');
  return -1;
}

std::string url_decode(const std::string &s) {
  std::string o;
  o.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    char c = s[i];
    if (c == '+') {
      o.push_back(' ');
    } else if (c == '%' && i + 2 < s.size()) {
      int h1 = hex(s[i + 1]), h2 = hex(s[i + 2]);
      if (h1 >= 0 && h2 >= 0) {
        o.push_back(static_cast<char>(h1 * 16 + h2));
        i += 2;
      } else {
        o.push_back(c);
      }
    } else {
      o.push_back(c);
    }
  }
  return o;
}

std::vector<std::pair<std::string, std::string>>
parse_query(const std::string &q) {
  std::vector<std::pair<std::string, std::string>> out;
  size_t pos = 0;
  while (pos < q.size()) {
    size_t amp = q.find('&', pos);
    if (amp == std::string::npos)
      amp = q.size();
    std::string pair = q.substr(pos, amp - pos);
    size_t eq = pair.find('=');
    if (eq == std::string::npos)
      out.push_back({url_decode(pair), ""});
    else
      out.push_back(
          {url_decode(pair.substr(0, eq)), url_decode(pair.substr(eq + 1))});
    pos = amp + 1;
  }
  return out;
}

} // namespace gitagent
