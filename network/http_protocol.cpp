#include "network/http_protocol.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace ledger {
namespace network {
namespace http {

namespace {

std::string toLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::string trim(const std::string& value) {
  size_t begin = value.find_first_not_of(" \t");
  if (begin == std::string::npos) return "";
  size_t end = value.find_last_not_of(" \t");
  return value.substr(begin, end - begin + 1);
}

bool isToken(const std::string& value) {
  if (value.empty()) return false;
  return std::all_of(value.begin(), value.end(), [](unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '_' || c == '!' || c == '#' || c == '$' ||
           c == '%' || c == '&' || c == '\'' || c == '*' || c == '+' || c == '.' ||
           c == '^' || c == '`' || c == '|' || c == '~';
  });
}

bool parseContentLength(const std::string& text, size_t& length) {
  if (text.empty() || text.size() > 19) return false;
  size_t value = 0;
  for (char c : text) {
    if (c < '0' || c > '9') return false;
    value = value * 10 + static_cast<size_t>(c - '0');
  }
  length = value;
  return true;
}

}  // namespace

std::string HttpRequest::header(const std::string& name) const {
  auto it = headers.find(toLower(name));
  return it == headers.end() ? "" : it->second;
}

bool HttpRequest::keepAlive() const {
  std::string connection = toLower(header("connection"));
  if (version == "HTTP/1.0") {
    return connection == "keep-alive";
  }
  return connection != "close";
}

HttpResponse HttpResponse::json(int status, const nlohmann::json& payload) {
  HttpResponse response;
  response.status = status;
  response.body = payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  return response;
}

HttpResponse HttpResponse::text(int status, const std::string& body,
                                const std::string& content_type) {
  HttpResponse response;
  response.status = status;
  response.content_type = content_type;
  response.body = body;
  return response;
}

HttpResponse HttpResponse::error(int status, const std::string& message,
                                 const std::string& code) {
  return json(status, nlohmann::json{{"error", message}, {"code", code}});
}

const char* reasonPhrase(int status) {
  switch (status) {
    case 200: return "OK";
    case 201: return "Created";
    case 204: return "No Content";
    case 400: return "Bad Request";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 408: return "Request Timeout";
    case 409: return "Conflict";
    case 411: return "Length Required";
    case 413: return "Payload Too Large";
    case 422: return "Unprocessable Entity";
    case 431: return "Request Header Fields Too Large";
    case 500: return "Internal Server Error";
    case 501: return "Not Implemented";
    case 503: return "Service Unavailable";
    case 505: return "HTTP Version Not Supported";
    default: return "Unknown";
  }
}

RequestParser::Result RequestParser::invalid(int status, const std::string& message) {
  Result result;
  result.state = State::INVALID;
  result.error_status = status;
  result.error_message = message;
  return result;
}

RequestParser::Result RequestParser::parse(const std::string& buffer) {
  size_t header_end = buffer.find("\r\n\r\n");
  if (header_end == std::string::npos) {
    if (buffer.size() > kMaxHeaderBytes) {
      return invalid(413, "request headers too large");
    }
    return Result{};
  }
  if (header_end > kMaxHeaderBytes) {
    return invalid(413, "request headers too large");
  }

  Result result;
  HttpRequest& request = result.request;

  std::istringstream head(buffer.substr(0, header_end));
  std::string line;

  // Request line: METHOD SP TARGET SP VERSION
  if (!std::getline(head, line)) {
    return invalid(400, "missing request line");
  }
  if (!line.empty() && line.back() == '\r') line.pop_back();

  size_t first_space = line.find(' ');
  size_t last_space = line.rfind(' ');
  if (first_space == std::string::npos || first_space == last_space) {
    return invalid(400, "malformed request line");
  }
  request.method = line.substr(0, first_space);
  request.target = line.substr(first_space + 1, last_space - first_space - 1);
  request.version = line.substr(last_space + 1);

  if (!isToken(request.method) || request.target.empty() || request.target[0] != '/') {
    return invalid(400, "malformed request line");
  }
  if (request.version != "HTTP/1.1" && request.version != "HTTP/1.0") {
    return invalid(505, "unsupported HTTP version");
  }
  request.path = request.target.substr(0, request.target.find('?'));

  while (std::getline(head, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty()) continue;

    size_t colon = line.find(':');
    if (colon == std::string::npos || !isToken(line.substr(0, colon))) {
      return invalid(400, "malformed header line");
    }
    std::string name = toLower(line.substr(0, colon));
    std::string value = trim(line.substr(colon + 1));

    auto existing = request.headers.find(name);
    if (existing != request.headers.end()) {
      if (name == "content-length") {
        if (existing->second != value) {
          return invalid(400, "conflicting Content-Length headers");
        }
        continue;
      }
      existing->second += ", " + value;
    } else {
      request.headers.emplace(name, value);
    }
  }

  if (!request.header("transfer-encoding").empty()) {
    return invalid(501, "chunked request bodies are not supported");
  }

  size_t content_length = 0;
  std::string length_text = request.header("content-length");
  if (!length_text.empty() && !parseContentLength(length_text, content_length)) {
    return invalid(400, "invalid Content-Length");
  }
  if (content_length > kMaxBodyBytes) {
    return invalid(413, "request body too large");
  }

  size_t body_start = header_end + 4;
  if (buffer.size() - body_start < content_length) {
    return Result{};
  }

  request.body = buffer.substr(body_start, content_length);
  result.state = State::COMPLETE;
  result.consumed = body_start + content_length;
  return result;
}

std::string serializeResponse(const HttpResponse& response, bool keep_alive) {
  std::ostringstream out;
  out << "HTTP/1.1 " << response.status << " " << reasonPhrase(response.status) << "\r\n";
  out << "Content-Type: " << response.content_type << "\r\n";
  out << "Content-Length: " << response.body.size() << "\r\n";
  for (const auto& [name, value] : response.headers) {
    out << name << ": " << value << "\r\n";
  }
  out << "Connection: " << (keep_alive ? "keep-alive" : "close") << "\r\n";
  out << "\r\n";
  out << response.body;
  return out.str();
}

std::vector<std::string> splitPath(const std::string& path) {
  std::vector<std::string> segments;
  size_t start = 0;
  while (start <= path.size()) {
    size_t end = path.find('/', start);
    if (end == std::string::npos) end = path.size();
    if (end > start) {
      segments.push_back(path.substr(start, end - start));
    }
    start = end + 1;
  }
  return segments;
}

}  // namespace http
}  // namespace network
}  // namespace ledger
