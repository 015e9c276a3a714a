#include "utilities/http.hpp"

#include <algorithm>
#include <array>
#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <cctype>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <type_traits>

namespace merkseal {

std::string trim(const std::string &str) {
  const std::string whitespace = " \t\n\r";
  size_t start = str.find_first_not_of(whitespace);
  size_t end = str.find_last_not_of(whitespace);

  if (start == std::string::npos) // No non-whitespace characters found
    return "";

  return str.substr(start, end - start + 1);
}

namespace HTTP {

namespace {

std::string toLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

// Reads "Name: value" lines until the blank line that ends the header block.
void parseHeaderLines(std::istream &in,
                      std::unordered_map<std::string, std::string> &headers) {
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (line.empty())
      break;

    size_t delimiterPos = line.find(':');
    if (delimiterPos != std::string::npos) {
      headers[trim(line.substr(0, delimiterPos))] =
          trim(line.substr(delimiterPos + 1));
    }
  }
}

// Value of a `key=value` or `key="value"` parameter in a header value.
std::string headerParam(const std::string &value, const std::string &key) {
  std::string lower = toLower(value);
  const std::string needle = toLower(key) + "=";
  size_t pos = 0;
  while ((pos = lower.find(needle, pos)) != std::string::npos) {
    // Parameter names start the value or follow a ';' or whitespace.
    if (pos == 0 || lower[pos - 1] == ';' || lower[pos - 1] == ' ' ||
        lower[pos - 1] == '\t')
      break;
    pos += needle.size();
  }
  if (pos == std::string::npos)
    return "";
  size_t start = pos + needle.size();
  if (start < value.size() && value[start] == '"') {
    size_t end = value.find('"', start + 1);
    if (end == std::string::npos)
      return value.substr(start + 1);
    return value.substr(start + 1, end - start - 1);
  }
  size_t end = value.find(';', start);
  return trim(value.substr(start, end == std::string::npos ? std::string::npos
                                                           : end - start));
}

} // namespace

HttpMethod StringToHttpMethod(const std::string &methodStr) {
  if (methodStr == "GET")
    return HttpMethod::GET;
  else if (methodStr == "POST")
    return HttpMethod::POST;
  else if (methodStr == "PUT")
    return HttpMethod::PUT;
  else if (methodStr == "DELETE")
    return HttpMethod::DELETE;
  else if (methodStr == "HEAD")
    return HttpMethod::HEAD;
  else
    return HttpMethod::INVALID;
}

std::string HttpMethodToString(HttpMethod method) {
  switch (method) {
  case HttpMethod::GET:
    return "GET";
  case HttpMethod::POST:
    return "POST";
  case HttpMethod::PUT:
    return "PUT";
  case HttpMethod::DELETE:
    return "DELETE";
  case HttpMethod::HEAD:
    return "HEAD";
  default:
    return "INVALID";
  }
}

const std::string *
FindHeader(const std::unordered_map<std::string, std::string> &headers,
           const std::string &name) {
  auto exact = headers.find(name);
  if (exact != headers.end())
    return &exact->second;
  const std::string wanted = toLower(name);
  for (const auto &kv : headers) {
    if (toLower(kv.first) == wanted)
      return &kv.second;
  }
  return nullptr;
}

HTTPREQUEST ParseHttpRequest(const std::string &requestStr) {
  HTTPREQUEST request;
  std::istringstream requestStream(requestStr);
  std::string requestLine;
  std::getline(requestStream, requestLine);

  if (!requestLine.empty() && requestLine.back() == '\r')
    requestLine.pop_back();

  std::istringstream requestLineStream(requestLine);
  std::string methodStr;
  requestLineStream >> methodStr >> request.uri >> request.protocol;
  request.method = StringToHttpMethod(methodStr);

  parseHeaderLines(requestStream, request.headers);

  std::ostringstream bodyStream;
  bodyStream << requestStream.rdbuf();
  request.body = bodyStream.str();

  return request;
}

std::string GenerateHttpRequestString(const HTTPREQUEST &request) {
  std::ostringstream requestStream;
  requestStream << HttpMethodToString(request.method) << " " << request.uri
                << " " << request.protocol << "\r\n";
  for (const auto &header : request.headers) {
    requestStream << header.first << ": " << header.second << "\r\n";
  }
  requestStream << "\r\n";
  requestStream << request.body;
  return requestStream.str();
}

std::string DecodeChunkedBody(const std::string &body) {
  std::string out;
  size_t pos = 0;
  while (true) {
    size_t lineEnd = body.find("\r\n", pos);
    if (lineEnd == std::string::npos)
      throw std::runtime_error("Malformed chunked body: missing size line");
    std::string sizeField = body.substr(pos, lineEnd - pos);
    size_t ext = sizeField.find(';');
    if (ext != std::string::npos)
      sizeField.erase(ext);
    sizeField = trim(sizeField);
    size_t chunkSize = 0;
    try {
      chunkSize = std::stoul(sizeField, nullptr, 16);
    } catch (const std::exception &) {
      throw std::runtime_error("Malformed chunked body: bad chunk size '" +
                               sizeField + "'");
    }
    pos = lineEnd + 2;
    if (chunkSize == 0)
      break;
    if (chunkSize > body.size() - pos)
      throw std::runtime_error("Malformed chunked body: truncated chunk");
    out.append(body, pos, chunkSize);
    pos += chunkSize;
    if (body.compare(pos, 2, "\r\n") != 0)
      throw std::runtime_error("Malformed chunked body: missing chunk CRLF");
    pos += 2;
  }
  return out;
}

HTTPRESPONSE ParseHttpResponse(const std::string &responseStr) {
  HTTPRESPONSE response;
  std::istringstream responseStream(responseStr);
  std::string statusLine;
  std::getline(responseStream, statusLine);

  if (!statusLine.empty() && statusLine.back() == '\r')
    statusLine.pop_back();

  std::istringstream statusLineStream(statusLine);
  statusLineStream >> response.protocol >> response.statusCodeNumber;
  std::getline(statusLineStream, response.reasonPhrase);
  response.reasonPhrase = trim(response.reasonPhrase);

  parseHeaderLines(responseStream, response.headers);
  if (const std::string *ct = FindHeader(response.headers, "Content-Type"))
    response.contentType = *ct;

  std::ostringstream bodyStream;
  bodyStream << responseStream.rdbuf();
  response.body = bodyStream.str();

  const std::string *te = FindHeader(response.headers, "Transfer-Encoding");
  if (te && toLower(*te).find("chunked") != std::string::npos)
    response.body = DecodeChunkedBody(response.body);

  return response;
}

std::string GenerateHttpResponseString(const HTTPRESPONSE &response) {
  std::ostringstream out;
  out << response.protocol << ' ' << response.statusCodeNumber << ' '
      << response.reasonPhrase << "\r\n";
  if (!response.contentType.empty())
    out << "Content-Type: " << response.contentType << "\r\n";
  for (const auto &header : response.headers)
    out << header.first << ": " << header.second << "\r\n";
  out << "Content-Length: " << response.body.size() << "\r\n\r\n";
  out << response.body;
  return out.str();
}

HTTPRESPONSE MakeResponse(int status, const std::string &contentType,
                          const std::string &body) {
  HTTPRESPONSE res;
  res.statusCodeNumber = status;
  auto it = statusCode.find(status);
  res.reasonPhrase = it != statusCode.end() ? it->second : "Unknown";
  res.contentType = contentType;
  res.headers["Connection"] = "close";
  res.body = body;
  return res;
}

ParsedUrl ParseUrl(const std::string &url) {
  ParsedUrl parsed;
  std::string rest;
  if (url.rfind("https://", 0) == 0) {
    parsed.tls = true;
    rest = url.substr(8);
  } else if (url.rfind("http://", 0) == 0) {
    rest = url.substr(7);
  } else {
    throw std::invalid_argument("Unsupported URL scheme: " + url);
  }

  size_t slash = rest.find('/');
  std::string authority = rest.substr(0, slash);
  parsed.target = slash == std::string::npos ? "/" : rest.substr(slash);

  size_t colon = authority.rfind(':');
  if (colon != std::string::npos && authority.find(']') == std::string::npos) {
    parsed.host = authority.substr(0, colon);
    parsed.port = authority.substr(colon + 1);
  } else {
    parsed.host = authority;
    parsed.port = parsed.tls ? "443" : "80";
  }
  if (parsed.host.empty() || parsed.port.empty() ||
      !std::all_of(parsed.port.begin(), parsed.port.end(),
                   [](unsigned char c) { return std::isdigit(c) != 0; })) {
    throw std::invalid_argument("Malformed URL: " + url);
  }
  return parsed;
}

namespace {

using tcp = boost::asio::ip::tcp;
namespace ssl = boost::asio::ssl;
using TlsStream = ssl::stream<tcp::socket>;

/**
 * One client exchange: resolve, connect, optionally handshake, write the
 * request and read until the peer closes. Everything runs on the exchange's
 * own io_context so the whole exchange shares one deadline. Handlers hold
 * the exchange by shared_ptr.
 */
template <typename Stream>
class Exchange : public std::enable_shared_from_this<Exchange<Stream>> {
public:
  Exchange(ParsedUrl target, std::string wire)
      : target_(std::move(target)), wire_(std::move(wire)), resolver_(ioc_) {
    if constexpr (std::is_same_v<Stream, TlsStream>) {
      ctx_ = std::make_unique<ssl::context>(ssl::context::tls_client);
      ctx_->set_default_verify_paths();
      ctx_->set_verify_mode(ssl::verify_peer);
      stream_ = std::make_unique<TlsStream>(ioc_, *ctx_);
      if (!SSL_set_tlsext_host_name(stream_->native_handle(),
                                    target_.host.c_str())) {
        throw std::runtime_error("Failed to set TLS SNI host name");
      }
      stream_->set_verify_callback(ssl::host_name_verification(target_.host));
    } else {
      stream_ = std::make_unique<tcp::socket>(ioc_);
    }
  }

  /// Run on the calling thread until the peer closes or @p timeout elapses.
  std::string run(std::chrono::milliseconds timeout) {
    auto self = this->shared_from_this();
    resolver_.async_resolve(
        target_.host, target_.port,
        [self](const boost::system::error_code &ec,
               const tcp::resolver::results_type &endpoints) {
          if (ec) {
            self->resolveFailure_ = ec;
            return self->fail(ec);
          }
          self->connect(endpoints);
        });

    ioc_.run_for(timeout);
    if (!finished_) {
      resolver_.cancel();
      boost::system::error_code ignored;
      socket().close(ignored);
      // An in-flight name lookup cannot be interrupted, so the aborted
      // handlers drain on a detached thread that owns the last reference.
      ioc_.restart();
      std::thread([self]() { self->ioc_.run(); }).detach();
      throw std::runtime_error("HTTP request timed out after " +
                               std::to_string(timeout.count()) + " ms");
    }
    if (resolveFailure_)
      throw std::runtime_error("Failed to resolve " + target_.host + ": " +
                               resolveFailure_.message());
    if (failure_)
      throw std::runtime_error("HTTP request failed: " + failure_.message());
    return raw_;
  }

private:
  tcp::socket &socket() {
    if constexpr (std::is_same_v<Stream, TlsStream>)
      return stream_->next_layer();
    else
      return *stream_;
  }

  void fail(const boost::system::error_code &ec) {
    failure_ = ec;
    finished_ = true;
  }

  void connect(const tcp::resolver::results_type &endpoints) {
    auto self = this->shared_from_this();
    boost::asio::async_connect(
        socket(), endpoints,
        [self](const boost::system::error_code &ec, const tcp::endpoint &) {
          if (ec)
            return self->fail(ec);
          if constexpr (std::is_same_v<Stream, TlsStream>) {
            self->stream_->async_handshake(
                ssl::stream_base::client,
                [self](const boost::system::error_code &hec) {
                  if (hec)
                    return self->fail(hec);
                  self->sendRequest();
                });
          } else {
            self->sendRequest();
          }
        });
  }

  void sendRequest() {
    auto self = this->shared_from_this();
    boost::asio::async_write(
        *stream_, boost::asio::buffer(wire_),
        [self](const boost::system::error_code &ec, std::size_t) {
          if (ec)
            return self->fail(ec);
          self->readMore();
        });
  }

  void readMore() {
    auto self = this->shared_from_this();
    stream_->async_read_some(
        boost::asio::buffer(buf_),
        [self](const boost::system::error_code &ec, std::size_t n) {
          self->raw_.append(self->buf_.data(), n);
          if (ec == boost::asio::error::eof ||
              ec == ssl::error::stream_truncated) {
            self->finished_ = true;
            return;
          }
          if (ec)
            return self->fail(ec);
          self->readMore();
        });
  }

  ParsedUrl target_;
  std::string wire_;
  boost::asio::io_context ioc_;
  std::unique_ptr<ssl::context> ctx_;
  std::unique_ptr<Stream> stream_;
  tcp::resolver resolver_;
  std::array<char, 4096> buf_{};
  std::string raw_;
  boost::system::error_code failure_;
  boost::system::error_code resolveFailure_;
  bool finished_{false};
};

} // namespace

HTTPRESPONSE SendHttpRequest(const std::string &url, HTTPREQUEST request,
                             std::chrono::milliseconds timeout) {
  const ParsedUrl target = ParseUrl(url);
  request.uri = target.target;
  request.protocol = "HTTP/1.1";
  request.headers["Host"] = target.host;
  request.headers["Connection"] = "close";
  request.headers["Content-Length"] = std::to_string(request.body.size());
  const std::string wire = GenerateHttpRequestString(request);

  std::string raw;
  if (target.tls)
    raw = std::make_shared<Exchange<TlsStream>>(target, wire)->run(timeout);
  else
    raw = std::make_shared<Exchange<tcp::socket>>(target, wire)->run(timeout);

  if (raw.empty())
    throw std::runtime_error("Empty HTTP response from " + target.host);
  return ParseHttpResponse(raw);
}

std::string GetMultipartBoundary(const std::string &contentType) {
  if (toLower(contentType).find("multipart/form-data") == std::string::npos)
    return "";
  return headerParam(contentType, "boundary");
}

std::vector<MultipartPart> ParseMultipart(const std::string &body,
                                          const std::string &boundary) {
  if (boundary.empty())
    throw std::runtime_error("Multipart boundary is empty");

  const std::string delimiter = "--" + boundary;
  std::vector<MultipartPart> parts;

  size_t pos = body.find(delimiter);
  if (pos == std::string::npos)
    throw std::runtime_error("Multipart body does not contain the boundary");
  pos += delimiter.size();

  while (true) {
    if (body.compare(pos, 2, "--") == 0)
      break; // closing delimiter
    if (body.compare(pos, 2, "\r\n") != 0)
      throw std::runtime_error("Malformed multipart delimiter line");
    pos += 2;

    size_t headerEnd = body.find("\r\n\r\n", pos);
    if (headerEnd == std::string::npos)
      throw std::runtime_error("Multipart part is missing its header block");
    std::istringstream headerStream(body.substr(pos, headerEnd - pos + 2));
    std::unordered_map<std::string, std::string> headers;
    parseHeaderLines(headerStream, headers);
    pos = headerEnd + 4;

    size_t next = body.find("\r\n" + delimiter, pos);
    if (next == std::string::npos)
      throw std::runtime_error("Multipart part is not terminated");

    MultipartPart part;
    if (const std::string *cd = FindHeader(headers, "Content-Disposition")) {
      part.name = headerParam(*cd, "name");
      part.filename = headerParam(*cd, "filename");
    }
    if (const std::string *ct = FindHeader(headers, "Content-Type"))
      part.contentType = *ct;
    part.data = body.substr(pos, next - pos);
    parts.push_back(std::move(part));

    pos = next + 2 + delimiter.size();
    if (pos > body.size())
      throw std::runtime_error("Multipart body ends inside a delimiter");
  }
  return parts;
}

} // namespace HTTP
} // namespace merkseal
