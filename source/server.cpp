#include <gitwebdiff/server.hpp>
#include <gitwebdiff/thread_pool.hpp>

#include <asio.hpp>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <sstream>

#include <poll.h>

namespace gitwebdiff {
namespace http {

namespace {

constexpr std::size_t kMaxHeaderLine = 16 * 1024;
constexpr std::size_t kMaxBody = 4 * 1024 * 1024;

asio::ip::tcp::endpoint resolve_endpoint(asio::io_context &io, const std::string &host,
                                         unsigned short port) {
  asio::error_code ec;
  auto addr = asio::ip::make_address(host, ec);
  if (!ec)
    return {addr, port};
  asio::ip::tcp::resolver resolver(io);
  auto results = resolver.resolve(host, std::to_string(port));
  for (const auto &r : results)
    if (r.endpoint().address().is_v4())
      return r.endpoint();
  return results.begin()->endpoint();
}

using Clock = std::chrono::steady_clock;

// Waits until the socket is readable; false once the deadline has passed.
bool wait_readable(asio::ip::tcp::socket &sock, Clock::time_point deadline) {
  for (;;) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    if (left.count() <= 0)
      return false;
    pollfd p{sock.native_handle(), POLLIN, 0};
    int rc = ::poll(&p, 1, static_cast<int>(left.count()));
    if (rc > 0)
      return true;
    if (rc == 0)
      return false;
    if (errno != EINTR)
      return false;
  }
}

bool read_line(asio::ip::tcp::socket &sock, std::string &line, Clock::time_point deadline) {
  line.clear();
  char c;
  for (;;) {
    if (!wait_readable(sock, deadline))
      return false;
    asio::error_code ec;
    std::size_t n = sock.read_some(asio::buffer(&c, 1), ec);
    if (ec)
      return false;
    if (n == 1) {
      if (c == '\r')
        continue;
      if (c == '\n')
        break;
      if (line.size() >= kMaxHeaderLine)
        return false;
      line.push_back(c);
    }
  }
  return true;
}

bool read_exact(asio::ip::tcp::socket &sock, std::string &data, std::size_t len,
                Clock::time_point deadline) {
  data.assign(len, '\0');
  std::size_t got = 0;
  asio::error_code ec;
  while (got < len) {
    if (!wait_readable(sock, deadline))
      return false;
    std::size_t n = sock.read_some(asio::buffer(&data[got], len - got), ec);
    if (ec)
      return false;
    got += n;
  }
  return true;
}

std::string lower(std::string s) {
  for (auto &c : s)
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

// 0 on success, otherwise the status code to answer with.
int parse_request(asio::ip::tcp::socket &sock, Request &req,
                  std::chrono::milliseconds timeout) {
  const auto deadline = Clock::now() + timeout;
  std::string line;
  if (!read_line(sock, line, deadline))
    return 400;
  std::istringstream rl(line);
  std::string url, proto;
  rl >> req.method >> url >> proto;
  if (req.method.empty() || url.empty())
    return 400;
  auto qpos = url.find('?');
  if (qpos == std::string::npos) {
    req.path = url;
  } else {
    req.path = url.substr(0, qpos);
    req.query = url.substr(qpos + 1);
  }

  for (;;) {
    if (!read_line(sock, line, deadline))
      return 400;
    if (line.empty())
      break;
    auto col = line.find(':');
    if (col == std::string::npos)
      continue;
    std::string k = lower(line.substr(0, col));
    while (col + 1 < line.size() && line[col + 1] == ' ')
      col++;
    req.headers[k] = line.substr(col + 1);
  }

  auto it = req.headers.find("content-length");
  if (it != req.headers.end()) {
    char *end = nullptr;
    unsigned long long len = std::strtoull(it->second.c_str(), &end, 10);
    if (end == it->second.c_str() || *end != '\0')
      return 400;
    if (len > kMaxBody)
      return 413;
    if (!read_exact(sock, req.body, static_cast<std::size_t>(len), deadline))
      return 400;
  }
  return 0;
}

void write_response(asio::ip::tcp::socket &sock, const Response &resp) {
  std::ostringstream ss;
  ss << "HTTP/1.1 " << resp.status << " " << reason_phrase(resp.status) << "\r\n";
  bool has_ct = resp.headers.find("Content-Type") != resp.headers.end();
  for (auto &kv : resp.headers)
    ss << kv.first << ": " << kv.second << "\r\n";
  if (!has_ct)
    ss << "Content-Type: application/json\r\n";
  ss << "Content-Length: " << resp.body.size() << "\r\n";
  ss << "Connection: close\r\n\r\n";
  ss << resp.body;
  auto s = ss.str();
  asio::error_code ec;
  asio::write(sock, asio::buffer(s.data(), s.size()), ec);
  if (ec)
    spdlog::debug("[http] write failed: {}", ec.message());
}

} // namespace

struct Server::Impl {
  asio::io_context io;
  asio::ip::tcp::acceptor acc;
  Handler handler;
  std::chrono::milliseconds read_timeout;
  ThreadPool pool;
  std::atomic<bool> stopping{false};

  Impl(const std::string &host, unsigned short port, Handler h, unsigned workers,
       std::chrono::milliseconds timeout)
      : io(), acc(io), handler(std::move(h)), read_timeout(timeout), pool(workers) {
    auto ep = resolve_endpoint(io, host, port);
    acc.open(ep.protocol());
    acc.set_option(asio::ip::tcp::acceptor::reuse_address(true));
    acc.bind(ep);
    acc.listen();
  }

  void serve(std::shared_ptr<asio::ip::tcp::socket> sock) {
    Request req;
    Response resp;
    int status = parse_request(*sock, req, read_timeout);
    if (status != 0) {
      resp.status = status;
      resp.body = fmt::format("{{\"error\":\"{}\"}}", reason_phrase(status));
    } else {
      try {
        resp = handler(req);
      } catch (const std::exception &e) {
        spdlog::error("[http] {} {} failed: {}", req.method, req.path, e.what());
        resp = Response{};
        resp.status = 500;
        resp.body = "{\"error\":\"internal error\"}";
      }
      spdlog::debug("[http] {} {} -> {}", req.method, req.path, resp.status);
    }
    write_response(*sock, resp);
    asio::error_code ec;
    sock->shutdown(asio::ip::tcp::socket::shutdown_both, ec);
  }
};

Server::Server(const std::string &host, unsigned short port, Handler h, unsigned workers,
               std::chrono::milliseconds read_timeout)
    : impl_(std::make_unique<Impl>(host, port, std::move(h), workers, read_timeout)) {}

Server::~Server() { stop(); }

unsigned short Server::port() const {
  asio::error_code ec;
  auto ep = impl_->acc.local_endpoint(ec);
  return ec ? 0 : ep.port();
}

void Server::run() {
  spdlog::info("[http] listening on port {}", port());
  while (!impl_->stopping.load()) {
    auto sock = std::make_shared<asio::ip::tcp::socket>(impl_->io);
    asio::error_code ec;
    impl_->acc.accept(*sock, ec);
    if (impl_->stopping.load())
      break;
    if (ec) {
      spdlog::warn("[http] accept failed: {}", ec.message());
      continue;
    }
    impl_->pool.submit([this, sock] { impl_->serve(sock); });
  }
  asio::error_code ec;
  impl_->acc.close(ec);
  spdlog::info("[http] server stopped");
}

// Wakes a blocked accept() with a throwaway connection to our own port.
void Server::stop() {
  if (impl_->stopping.exchange(true))
    return;
  asio::error_code ec;
  auto ep = impl_->acc.local_endpoint(ec);
  if (ec)
    return;
  if (ep.address().is_unspecified())
    ep.address(ep.address().is_v4() ? asio::ip::address(asio::ip::address_v4::loopback())
                                     : asio::ip::address(asio::ip::address_v6::loopback()));
  asio::io_context io;
  asio::ip::tcp::socket s(io);
  s.connect(ep, ec);
}

} // namespace http
} // namespace gitwebdiff
