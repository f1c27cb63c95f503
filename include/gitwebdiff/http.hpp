#pragma once
#include <string>
#include <unordered_map>

namespace gitwebdiff {
namespace http {

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

inline std::string reason_phrase(int code) {
  switch (code) {
  case 200: return "OK";
  case 400: return "Bad Request";
  case 403: return "Forbidden";
  case 404: return "Not Found";
  case 405: return "Method Not Allowed";
  case 409: return "Conflict";
  case 413: return "Payload Too Large";
  case 500: return "Internal Server Error";
  case 503: return "Service Unavailable";
  default: return "Unknown";
  }
}

} // namespace http
} // namespace gitwebdiff
