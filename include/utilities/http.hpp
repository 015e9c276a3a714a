#pragma once
#ifndef MERKSEAL_HTTP_HPP
#define MERKSEAL_HTTP_HPP

#include <chrono>
#include <string>
#include <unordered_map>
#include <vector>

namespace merkseal {

std::string trim(const std::string &str);

namespace HTTP {

// Status codes mapping
const std::unordered_map<int, std::string> statusCode = {
    {200, "OK"},
    {400, "Bad Request"},
    {404, "Not Found"},
    {405, "Method Not Allowed"},
    {413, "Payload Too Large"},
    {500, "Internal Server Error"}};

enum class HttpMethod { GET, POST, PUT, DELETE, HEAD, INVALID };

HttpMethod StringToHttpMethod(const std::string &methodStr);
std::string HttpMethodToString(HttpMethod method);

struct HTTPREQUEST {
  HttpMethod method{HttpMethod::INVALID};
  std::string uri;
  std::string protocol;
  std::unordered_map<std::string, std::string> headers;
  std::string body;
};

struct HTTPRESPONSE {
  std::string protocol{"HTTP/1.1"};
  int statusCodeNumber{0};
  std::string reasonPhrase;
  std::string contentType;
  std::unordered_map<std::string, std::string> headers;
  std::string body;
};

/// Case-insensitive header lookup. Returns nullptr when absent.
const std::string *
FindHeader(const std::unordered_map<std::string, std::string> &headers,
           const std::string &name);

HTTPREQUEST ParseHttpRequest(const std::string &requestStr);
std::string GenerateHttpRequestString(const HTTPREQUEST &request);

/// Parses status line, headers and body; de-chunks chunked bodies.
HTTPRESPONSE ParseHttpResponse(const std::string &responseStr);
std::string GenerateHttpResponseString(const HTTPRESPONSE &response);
HTTPRESPONSE MakeResponse(int status, const std::string &contentType,
                          const std::string &body);

/// @throws std::runtime_error on malformed chunk framing.
std::string DecodeChunkedBody(const std::string &body);

struct ParsedUrl {
  bool tls{false};
  std::string host;
  std::string port;
  std::string target; // path and query, at least "/"
};

/// Accepts http:// and https:// URLs.
/// @throws std::invalid_argument for anything else.
ParsedUrl ParseUrl(const std::string &url);

/**
 * @brief Send one request over a fresh connection and read the response.
 *
 * Host, Content-Length and Connection: close are filled in. HTTPS peers are
 * verified against the system trust store. The deadline covers name
 * resolution as well as the exchange itself.
 *
 * @throws std::runtime_error on resolve, connect, TLS or I/O failure, or
 *         when @p timeout elapses.
 */
HTTPRESPONSE SendHttpRequest(const std::string &url, HTTPREQUEST request,
                             std::chrono::milliseconds timeout);

struct MultipartPart {
  std::string name;     // form field name
  std::string filename; // empty when the part is not a file
  std::string contentType;
  std::string data;
};

/// Boundary parameter of a multipart/form-data Content-Type, or "".
std::string GetMultipartBoundary(const std::string &contentType);

/**
 * @brief Split a multipart/form-data body into parts.
 * @throws std::runtime_error if the body does not follow the boundary.
 */
std::vector<MultipartPart> ParseMultipart(const std::string &body,
                                          const std::string &boundary);

} // namespace HTTP
} // namespace merkseal

#endif // MERKSEAL_HTTP_HPP
