#ifndef LEDGER_NETWORK_HTTP_PROTOCOL_HPP_
#define LEDGER_NETWORK_HTTP_PROTOCOL_HPP_

#include <nlohmann/json.hpp>

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace ledger {
namespace network {
namespace http {

// Framing limits
constexpr size_t kMaxHeaderBytes = 8 * 1024;
constexpr size_t kMaxBodyBytes = 1024 * 1024;

struct HttpRequest {
  std::string method;
  std::string target;   // raw request target, query string included
  std::string path;     // target without the query string
  std::string version;  // "HTTP/1.1"
  std::map<std::string, std::string> headers;  // keys lowercased
  std::string body;

  /**
   * Header value by case-insensitive name, or "" when absent.
   */
  std::string header(const std::string& name) const;

  /**
   * True when the client asked to keep the connection open after this request.
   * HTTP/1.1 defaults to keep-alive, HTTP/1.0 to close.
   */
  bool keepAlive() const;
};

struct HttpResponse {
  int status = 200;
  std::string content_type = "application/json";
  std::string body;
  std::map<std::string, std::string> headers;

  static HttpResponse json(int status, const nlohmann::json& payload);
  static HttpResponse text(int status, const std::string& body,
                           const std::string& content_type = "text/plain; charset=utf-8");

  /**
   * {"error": message, "code": code}
   */
  static HttpResponse error(int status, const std::string& message, const std::string& code);
};

/**
 * Standard reason phrase for a status code ("OK", "Not Found"...).
 */
const char* reasonPhrase(int status);

/**
 * Incremental HTTP/1.1 request parser.
 *
 * Feed it the connection's receive buffer; it reports whether a whole request
 * is present, how many bytes that request occupies, and the parsed request.
 * Bytes after the consumed prefix belong to the next (pipelined) request.
 */
class RequestParser {
 public:
  enum class State {
    INCOMPLETE,  // need more bytes
    COMPLETE,    // request parsed, `consumed` bytes used
    INVALID      // malformed or over the limits; respond `error_status` and close
  };

  struct Result {
    State state = State::INCOMPLETE;
    size_t consumed = 0;
    HttpRequest request;
    int error_status = 400;
    std::string error_message;
  };

  static Result parse(const std::string& buffer);

 private:
  static Result invalid(int status, const std::string& message);
};

/**
 * Serialize a response with Content-Length and the Connection header.
 */
std::string serializeResponse(const HttpResponse& response, bool keep_alive);

/**
 * "/accounts/abc/transactions" -> {"accounts", "abc", "transactions"}.
 */
std::vector<std::string> splitPath(const std::string& path);

}  // namespace http
}  // namespace network
}  // namespace ledger

#endif  // LEDGER_NETWORK_HTTP_PROTOCOL_HPP_
