#include "server.hpp"
#include "thread_pool.hpp"

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <sstream>

namespace gitagentd {

using gitagent::Request;
using gitagent::Response;

struct Server::Impl {
  asio::io_context io;
  asio::ip::tcp::acceptor acc;
  Handler handler;
  ThreadPool pool;
  std::atomic<bool> stopping{false};

  Impl(const std::string &addr, unsigned short port, unsigned workers,
       Handler h)
      : io(),
        acc(io, asio::ip::tcp::endpoint(asio::ip::make_address(addr), port)),
        handler(std::move(h)), pool(workers) {}
};

enum class ReadStatus {
  Ok,
  Closed,
  TooLong,
};

static ReadStatus read_line(asio::ip::tcp::socket &sock, std::string &line) {
  line.clear();
  char c;
  for (;;) {
    asio::error_code ec;
    size_t n = sock.read_some(asio::buffer(&c, 1), ec);
    if (ec)
      return ReadStatus::Closed;
    if (n == 1) {
      if (c == '\r')
        continue;
      if (c == '\n')
        break;
      if (line.size() >= gitagent::kMaxHeaderLine)
        return ReadStatus::TooLong;
      line.push_back(c);
    }
  }
  return ReadStatus::Ok;
}

static bool read_exact(asio::ip::tcp::socket &sock, std::string &data,
                       size_t len) {
  data.clear();
  data.resize(len);
  size_t got = 0;
  asio::error_code ec;
  while (got < len) {
    size_t n = sock.read_some(asio::buffer(&data[got], len - got), ec);
    if (ec)
      return false;
    got += n;
  }
  return true;
}

// Returns 0 when `req` was read, otherwise the status to answer with.
static int parse_request(asio::ip::tcp::socket &sock, Request &req) {
  std::string line;
  auto st = read_line(sock, line);
  if (st != ReadStatus::Ok)
    return st == ReadStatus::TooLong ? 431 : 400;
  std::istringstream rl(line);
  std::string url, proto;
  rl >> req.method >> url >> proto;
  if (req.method.empty() || url.empty())
    return 400;
  size_t qpos = url.find('?');
  if (qpos == std::string::npos) {
    req.path = url;
  } else {
    req.path = url.substr(0, qpos);
    req.query = url.substr(qpos + 1);
  }

  for (size_t count = 0;; ++count) {
    st = read_line(sock, line);
    if (st != ReadStatus::Ok)
      return st == ReadStatus::TooLong ? 431 : 400;
    if (line.empty())
      break;
    if (count >= 100)
      return 431;
    size_t col = line.find(':');
    if (col != std::string::npos) {
      std::string k = line.substr(0, col);
      while (col + 1 < line.size() && line[col + 1] == ' ')
        col++;
      req.headers[k] = line.substr(col + 1);
    }
  }

  size_t len = 0;
  switch (gitagent::content_length(req, gitagent::kMaxBodyBytes, len)) {
  case gitagent::BodyLength::None:
    return 0;
  case gitagent::BodyLength::TooLarge:
    return 413;
  case gitagent::BodyLength::Invalid:
    return 400;
  case gitagent::BodyLength::Ok:
    break;
  }
  return read_exact(sock, req.body, len) ? 0 : 400;
}

static void write_response(asio::ip::tcp::socket &sock, const Response &resp) {
  std::ostringstream ss;
  ss << "HTTP/1.1 " << resp.status << " "
     << gitagent::reason_phrase(resp.status) << "\r\n";
  bool has_ct = resp.headers.find("Content-Type") != resp.headers.end();
  for (auto &kv : resp.headers)
    ss << kv.first << ": " << kv.second << "\r\n";
  if (!has_ct)
    ss << "Content-Type: text/plain\r\n";
  ss << "Content-Length: " << resp.body.size() << "\r\n";
  ss << "Access-Control-Allow-Origin: *\r\n";
  ss << "Connection: close\r\n\r\n";
  ss << resp.body;
  auto s = ss.str();
  asio::error_code ec;
  asio::write(sock, asio::buffer(s.data(), s.size()), ec);
  if (ec)
    spdlog::debug("[http] write failed: {}", ec.message());
}

Server::Server(const std::string &addr, unsigned short port, unsigned workers,
               Handler h)
    : impl_(std::make_unique<Impl>(addr, port, workers, std::move(h))) {}

Server::~Server() = default;

void Server::run() {
  spdlog::info("[http] listening on {}:{}",
               impl_->acc.local_endpoint().address().to_string(),
               impl_->acc.local_endpoint().port());
  while (!impl_->stopping.load()) {
    auto sock = std::make_shared<asio::ip::tcp::socket>(impl_->io);
    asio::error_code ec;
    impl_->acc.accept(*sock, ec);
    if (ec) {
      if (!impl_->stopping.load())
        spdlog::warn("[http] accept failed: {}", ec.message());
      continue;
    }
    if (impl_->stopping.load())
      break;
    Impl *impl = impl_.get();
    impl_->pool.submit([impl, sock] {
      Request req;
      if (int code = parse_request(*sock, req)) {
        spdlog::debug("[http] rejecting request: {}",
                      gitagent::reason_phrase(code));
        Response bad;
        bad.status = code;
        bad.body = gitagent::reason_phrase(code);
        write_response(*sock, bad);
        return;
      }
      write_response(*sock, impl->handler(req));
      asio::error_code ignored;
      sock->shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    });
  }
  asio::error_code ec;
  impl_->acc.close(ec);
  impl_->pool.shutdown();
  spdlog::info("[http] stopped");
}

void Server::stop() {
  if (impl_->stopping.exchange(true))
    return;
  // Wake the blocking accept() with a throwaway connection.
  asio::error_code ec;
  auto ep = impl_->acc.local_endpoint(ec);
  if (ec)
    return;
  if (ep.address().is_unspecified())
    ep.address(ep.protocol() == asio::ip::tcp::v6()
                   ? asio::ip::address(asio::ip::address_v6::loopback())
                   : asio::ip::address(asio::ip::address_v4::loopback()));
  asio::io_context io;
  asio::ip::tcp::socket poke(io);
  poke.connect(ep, ec);
}

} // namespace gitagentd
