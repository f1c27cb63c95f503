#include <catch2/catch_all.hpp>
#include <gitwebdiff/server.hpp>
#include <gitwebdiff/thread_pool.hpp>
#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <string>
#include <thread>

using namespace gitwebdiff;
using namespace std::chrono_literals;

static std::string roundtrip(unsigned short port, const std::string& raw){
  asio::io_context io;
  asio::ip::tcp::socket s(io);
  s.connect({asio::ip::make_address("127.0.0.1"), port});
  asio::write(s, asio::buffer(raw));
  std::string out;
  char buf[1024];
  asio::error_code ec;
  for (;;) {
    auto n = s.read_some(asio::buffer(buf), ec);
    if (ec) break;
    out.append(buf, n);
  }
  return out;
}

TEST_CASE("thread pool runs every submitted job before shutdown") {
  std::atomic<int> done{0};
  {
    ThreadPool pool(3);
    REQUIRE(pool.size() == 3);
    for (int i = 0; i < 50; i++)
      pool.submit([&] { done++; });
    pool.submit([] { throw std::runtime_error("boom"); });
  }
  REQUIRE(done.load() == 50);
}

TEST_CASE("server parses requests and writes responses") {
  http::Server srv("127.0.0.1", 0, [](const http::Request& r) {
    http::Response resp;
    if (r.path != "/echo") {
      resp.status = 404;
      resp.body = "{}";
      return resp;
    }
    resp.headers["X-Method"] = r.method;
    resp.body = r.query + "|" + r.body + "|" + r.headers.at("x-test");
    return resp;
  });
  unsigned short port = srv.port();
  REQUIRE(port != 0);
  std::thread t([&] { srv.run(); });

  auto out = roundtrip(port, "POST /echo?a=1 HTTP/1.1\r\nX-Test: yes\r\n"
                             "Content-Length: 5\r\n\r\nhello");
  REQUIRE(out.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
  REQUIRE(out.find("X-Method: POST\r\n") != std::string::npos);
  REQUIRE(out.find("Connection: close") != std::string::npos);
  REQUIRE(out.find("\r\n\r\na=1|hello|yes") != std::string::npos);

  out = roundtrip(port, "GET /missing HTTP/1.1\r\n\r\n");
  REQUIRE(out.rfind("HTTP/1.1 404 Not Found\r\n", 0) == 0);

  out = roundtrip(port, "POST /echo HTTP/1.1\r\nContent-Length: nope\r\n\r\n");
  REQUIRE(out.rfind("HTTP/1.1 400 Bad Request\r\n", 0) == 0);

  auto t0 = std::chrono::steady_clock::now();
  srv.stop();
  t.join();
  REQUIRE(std::chrono::steady_clock::now() - t0 < 5s);
}

TEST_CASE("handler exceptions become 500 responses") {
  http::Server srv("localhost", 0, [](const http::Request&) -> http::Response {
    throw std::runtime_error("handler broke");
  });
  std::thread t([&] { srv.run(); });
  auto out = roundtrip(srv.port(), "GET / HTTP/1.1\r\n\r\n");
  REQUIRE(out.rfind("HTTP/1.1 500 Internal Server Error\r\n", 0) == 0);
  srv.stop();
  t.join();
}

TEST_CASE("a silent client cannot hold a worker past the read timeout") {
  http::Server srv("127.0.0.1", 0, [](const http::Request&) {
    http::Response resp;
    resp.body = "{\"ok\":true}";
    return resp;
  }, 1, 300ms);
  std::thread t([&] { srv.run(); });

  asio::io_context io;
  asio::ip::tcp::socket idle(io);
  idle.connect({asio::ip::make_address("127.0.0.1"), srv.port()});

  auto t0 = std::chrono::steady_clock::now();
  auto out = roundtrip(srv.port(), "GET / HTTP/1.1\r\n\r\n");
  REQUIRE(out.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
  REQUIRE(std::chrono::steady_clock::now() - t0 < 5s);

  std::string dropped;
  char buf[256];
  asio::error_code ec;
  for (;;) {
    auto n = idle.read_some(asio::buffer(buf), ec);
    if (ec) break;
    dropped.append(buf, n);
  }
  REQUIRE(dropped.rfind("HTTP/1.1 400 Bad Request\r\n", 0) == 0);

  srv.stop();
  t.join();
}
