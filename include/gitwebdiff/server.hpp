#pragma once
#include "http.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace gitwebdiff {
namespace http {

// Blocking accept loop; every connection is served on a worker thread,
// one request per connection.
class Server {
public:
  using Handler = std::function<Response(const Request &)>;

  // Binds immediately; throws std::system_error when the address is unusable.
  // A client has `read_timeout` to deliver its whole request.
  Server(const std::string &host, unsigned short port, Handler h, unsigned workers = 8,
         std::chrono::milliseconds read_timeout = std::chrono::seconds(30));
  ~Server();

  Server(const Server &) = delete;
  Server &operator=(const Server &) = delete;

  unsigned short port() const;

  void run();
  void stop();

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace http
} // namespace gitwebdiff
