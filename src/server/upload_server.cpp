#include "server/upload_server.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"
#include "utilities/metrics.h"

#include <algorithm>
#include <boost/asio/strand.hpp>
#include <cstring>
#include <memory>
#include <nlohmann/json.hpp>

using tcp = boost::asio::ip::tcp;

namespace merkseal {

namespace {

const std::string JSON_TYPE = "application/json";
constexpr std::size_t MAX_HEADER_SIZE = 64 * 1024;

HTTP::HTTPRESPONSE jsonResponse(int status, const nlohmann::ordered_json &j) {
  // Error messages may echo client supplied names that are not UTF-8.
  return HTTP::MakeResponse(
      status, JSON_TYPE,
      j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

HTTP::HTTPRESPONSE errorResponse(int status, const std::string &message) {
  nlohmann::ordered_json j;
  j["success"] = false;
  j["error"] = message;
  return jsonResponse(status, j);
}

void countUpload(const std::string &status) {
  MetricsRegistry::instance().incrementCounter("merkseal_uploads_total", 1.0,
                                               {{"status", status}});
}

bool isNumber(const std::string &s) {
  return !s.empty() && s.size() <= 20 &&
         std::all_of(s.begin(), s.end(),
                     [](unsigned char c) { return c >= '0' && c <= '9'; });
}

/**
 * One accepted connection. Reads a single request under a deadline, routes
 * it through UploadServer::handleRequest and writes the response. All
 * handlers run on the socket's strand; pending handlers keep it alive.
 */
class Connection : public std::enable_shared_from_this<Connection> {
public:
  Connection(tcp::socket socket, UploadServer &server,
             std::chrono::milliseconds timeout)
      : socket_(std::move(socket)), timer_(socket_.get_executor()),
        server_(server), timeout_(timeout) {}

  tcp::socket::executor_type executor() { return socket_.get_executor(); }

  void start() {
    armDeadline();
    boost::asio::async_read_until(
        socket_, boost::asio::dynamic_buffer(header_, MAX_HEADER_SIZE),
        "\r\n\r\n",
        [self = shared_from_this()](const boost::system::error_code &ec,
                                    std::size_t) { self->onHeader(ec); });
  }

private:
  void armDeadline() {
    timer_.expires_after(timeout_);
    timer_.async_wait(
        [self = shared_from_this()](const boost::system::error_code &ec) {
          self->onDeadline(ec);
        });
  }

  void onDeadline(const boost::system::error_code &ec) {
    // A re-armed timer leaves the superseded wait with a future expiry.
    if (ec || timer_.expiry() > boost::asio::steady_timer::clock_type::now())
      return;
    Logger::getInstance().log(LogLevel::DEBUG,
                              "Closing connection after I/O timeout");
    boost::system::error_code ignored;
    socket_.close(ignored);
  }

  void finish() { timer_.cancel(); }

  void onHeader(const boost::system::error_code &ec) {
    if (ec) {
      Logger::getInstance().log(LogLevel::DEBUG,
                                "Dropping connection: " + ec.message());
      return finish();
    }
    const std::size_t pos = header_.find("\r\n\r\n");
    body_ = header_.substr(pos + 4);
    header_.erase(pos + 4);

    request_ = HTTP::ParseHttpRequest(header_);
    std::size_t expected = 0;
    if (const std::string *cl =
            HTTP::FindHeader(request_.headers, "Content-Length")) {
      try {
        expected = std::stoull(*cl);
      } catch (const std::exception &) {
        return respond(errorResponse(400, "Invalid Content-Length"));
      }
    }
    if (expected > UploadServer::MAX_BODY_SIZE) {
      return respond(errorResponse(
          413, "Request body exceeds " +
                   std::to_string(UploadServer::MAX_BODY_SIZE) + " bytes"));
    }
    if (body_.size() >= expected) {
      body_.resize(expected);
      return dispatchRequest();
    }

    const std::size_t have = body_.size();
    body_.resize(expected);
    boost::asio::async_read(
        socket_, boost::asio::buffer(&body_[have], expected - have),
        [self = shared_from_this()](const boost::system::error_code &rec,
                                    std::size_t) {
          if (rec) {
            Logger::getInstance().log(LogLevel::WARN,
                                      "Failed to read request body: " +
                                          rec.message());
            return self->finish();
          }
          self->dispatchRequest();
        });
  }

  void dispatchRequest() {
    request_.body = std::move(body_);
    respond(server_.handleRequest(request_));
  }

  void respond(const HTTP::HTTPRESPONSE &res) {
    wire_ = HTTP::GenerateHttpResponseString(res);
    armDeadline();
    boost::asio::async_write(
        socket_, boost::asio::buffer(wire_),
        [self = shared_from_this()](const boost::system::error_code &ec,
                                    std::size_t) {
          if (ec) {
            Logger::getInstance().log(LogLevel::WARN,
                                      "Failed to write response: " +
                                          ec.message());
          } else {
            boost::system::error_code ignored;
            self->socket_.shutdown(tcp::socket::shutdown_send, ignored);
          }
          self->finish();
        });
  }

  tcp::socket socket_;
  boost::asio::steady_timer timer_;
  UploadServer &server_;
  std::chrono::milliseconds timeout_;
  std::string header_;
  std::string body_;
  std::string wire_;
  HTTP::HTTPREQUEST request_;
};

} // namespace

UploadServer::UploadServer(boost::asio::io_context &ioc,
                           const std::string &host, unsigned short port,
                           BatchStore &store, std::string registryAddress,
                           std::chrono::milliseconds ioTimeout)
    : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), store_(store),
      registryAddress_(std::move(registryAddress)), ioTimeout_(ioTimeout) {
  tcp::endpoint endpoint(boost::asio::ip::make_address(host), port);
  acceptor_.open(endpoint.protocol());
  acceptor_.set_option(tcp::acceptor::reuse_address(true));
  acceptor_.bind(endpoint);
  acceptor_.listen();
}

void UploadServer::stop() {
  // The acceptor is only touched on its strand.
  boost::asio::post(acceptor_.get_executor(), [this]() {
    boost::system::error_code ec;
    acceptor_.close(ec);
    if (ec)
      Logger::getInstance().log(LogLevel::WARN,
                                "Closing acceptor failed: " + ec.message());
  });
}

void UploadServer::do_accept() {
  acceptor_.async_accept(
      boost::asio::make_strand(ioc_),
      [this](const boost::system::error_code &ec, tcp::socket socket) {
        on_accept(ec, std::move(socket));
      });
}

void UploadServer::on_accept(boost::system::error_code ec,
                             tcp::socket socket) {
  if (ec == boost::asio::error::operation_aborted)
    return; // acceptor closed
  if (ec) {
    Logger::getInstance().log(LogLevel::WARN, "Accept failed: " + ec.message());
  } else {
    auto conn =
        std::make_shared<Connection>(std::move(socket), *this, ioTimeout_);
    boost::asio::dispatch(conn->executor(), [conn]() { conn->start(); });
  }
  if (acceptor_.is_open())
    do_accept();
}

HTTP::HTTPRESPONSE UploadServer::handleRequest(const HTTP::HTTPREQUEST &req) {
  std::string path = req.uri.substr(0, req.uri.find('?'));
  const bool isGet = req.method == HTTP::HttpMethod::GET;

  try {
    if (path == "/upload") {
      if (req.method != HTTP::HttpMethod::POST)
        return errorResponse(405, "Use POST for /upload");
      return handleUpload(req);
    }
    if (path == "/health") {
      if (!isGet)
        return errorResponse(405, "Use GET for /health");
      nlohmann::ordered_json j;
      j["status"] = "ok";
      j["service"] = "MerkSeal Server";
      return jsonResponse(200, j);
    }
    if (path == "/metrics") {
      if (!isGet)
        return errorResponse(405, "Use GET for /metrics");
      return HTTP::MakeResponse(200, "text/plain; version=0.0.4",
                                MetricsRegistry::instance().toPrometheus());
    }
    if (path.rfind("/batches/", 0) == 0) {
      if (!isGet)
        return errorResponse(405, "Use GET for /batches/<id>");
      return handleBatch(path.substr(9));
    }
  } catch (const std::exception &e) {
    Logger::getInstance().log(LogLevel::ERROR,
                              "Request " + req.uri + " failed: " + e.what());
    return errorResponse(500, e.what());
  }
  return errorResponse(404, "Not found");
}

HTTP::HTTPRESPONSE UploadServer::handleUpload(const HTTP::HTTPREQUEST &req) {
  const std::string *contentType = HTTP::FindHeader(req.headers,
                                                    "Content-Type");
  const std::string boundary =
      contentType ? HTTP::GetMultipartBoundary(*contentType) : "";
  if (boundary.empty()) {
    countUpload("rejected");
    return errorResponse(400, "Expected multipart/form-data with a boundary");
  }

  std::vector<HTTP::MultipartPart> parts;
  try {
    parts = HTTP::ParseMultipart(req.body, boundary);
  } catch (const std::runtime_error &e) {
    countUpload("rejected");
    return errorResponse(400, std::string("Malformed multipart body: ") +
                                  e.what());
  }

  std::vector<BatchFile> files;
  files.reserve(parts.size());
  for (const auto &part : parts) {
    BatchFile file;
    file.name = part.filename.empty()
                    ? "file_" + std::to_string(files.size())
                    : part.filename;
    file.data.resize(part.data.size());
    if (!part.data.empty())
      std::memcpy(file.data.data(), part.data.data(), part.data.size());
    files.push_back(std::move(file));
  }
  if (files.empty()) {
    countUpload("rejected");
    return errorResponse(400, "No files uploaded");
  }

  BatchRecord record;
  try {
    record = store_.create(files, registryAddress_);
  } catch (const EmptyInputError &) {
    countUpload("rejected");
    return errorResponse(400, "No files uploaded");
  } catch (const std::invalid_argument &e) {
    countUpload("rejected");
    return errorResponse(400, e.what());
  } catch (const StorageError &e) {
    countUpload("error");
    Logger::getInstance().log(LogLevel::ERROR,
                              std::string("Upload failed: ") + e.what());
    return errorResponse(500, e.what());
  }

  countUpload("ok");
  MetricsRegistry::instance().incrementCounter(
      "merkseal_upload_files_total", static_cast<double>(record.fileCount));

  nlohmann::ordered_json j;
  j["success"] = true;
  j["batch"] = batchRecordToJson(record);
  return jsonResponse(200, j);
}

HTTP::HTTPRESPONSE UploadServer::handleBatch(const std::string &idText) {
  if (!isNumber(idText))
    return errorResponse(400, "Invalid batch id '" + idText + "'");
  uint64_t id = 0;
  try {
    id = std::stoull(idText);
  } catch (const std::out_of_range &) {
    return errorResponse(400, "Invalid batch id '" + idText + "'");
  }

  try {
    return jsonResponse(200, batchRecordToJson(store_.load(id)));
  } catch (const NotFoundError &e) {
    return errorResponse(404, e.what());
  } catch (const CorruptRecordError &e) {
    Logger::getInstance().log(LogLevel::ERROR, e.what());
    return errorResponse(500, e.what());
  } catch (const StorageError &e) {
    Logger::getInstance().log(LogLevel::ERROR, e.what());
    return errorResponse(500, e.what());
  }
}

} // namespace merkseal
