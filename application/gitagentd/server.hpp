#pragma once
#include <gitagent/http.hpp>

#include <functional>
#include <memory>
#include <string>

namespace gitagentd {

class Server {
public:
  using Handler = std::function<gitagent::Response(const gitagent::Request &)>;

  Server(const std::string &addr, unsigned short port, unsigned workers,
         Handler h);
  ~Server();

  // Accepts until stop(); connections are served on the worker pool.
  void run();
  void stop();

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace gitagentd
