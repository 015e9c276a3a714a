#ifndef MERKSEAL_UPLOAD_SERVER_HPP
#define MERKSEAL_UPLOAD_SERVER_HPP

#include "batch/batch_store.hpp"
#include "utilities/http.hpp"
#include <boost/asio.hpp>
#include <chrono>
#include <cstddef>
#include <string>

namespace merkseal {

/**
 * @brief HTTP front end that turns multipart uploads into sealed batches.
 *
 * Routes:
 *   POST /upload        multipart/form-data, one batch per request
 *   GET  /health        liveness probe
 *   GET  /batches/<id>  stored batch record
 *   GET  /metrics       Prometheus text export
 *
 * Each connection carries one request and is closed after the response.
 * Connections run asynchronously on their own strand, so an idle or slow
 * client never holds an io_context thread. A connection that has not
 * delivered its request within the I/O timeout is closed.
 */
class UploadServer {
public:
  /// Requests with a larger declared body are refused with 413.
  static constexpr std::size_t MAX_BODY_SIZE = 256 * 1024 * 1024;
  static constexpr std::chrono::milliseconds DEFAULT_IO_TIMEOUT{60000};

  /**
   * @param host Address to bind, e.g. "127.0.0.1" or "0.0.0.0".
   * @param port Port to bind; 0 picks a free port (see port()).
   * @param registryAddress Echoed back in every upload response.
   * @param ioTimeout Deadline for reading a request and for writing its
   *        response.
   * @throws boost::system::system_error if the address cannot be bound.
   */
  UploadServer(boost::asio::io_context &ioc, const std::string &host,
               unsigned short port, BatchStore &store,
               std::string registryAddress,
               std::chrono::milliseconds ioTimeout = DEFAULT_IO_TIMEOUT);

  /// Begin accepting connections.
  void run() { do_accept(); }

  /// Stop accepting; connections already accepted still complete.
  /// Safe to call from any thread.
  void stop();

  unsigned short port() const { return acceptor_.local_endpoint().port(); }

  /// Route one parsed request. Never throws.
  HTTP::HTTPRESPONSE handleRequest(const HTTP::HTTPREQUEST &req);

private:
  void do_accept();
  void on_accept(boost::system::error_code ec,
                 boost::asio::ip::tcp::socket socket);

  HTTP::HTTPRESPONSE handleUpload(const HTTP::HTTPREQUEST &req);
  HTTP::HTTPRESPONSE handleBatch(const std::string &idText);

  boost::asio::io_context &ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  BatchStore &store_;
  std::string registryAddress_;
  std::chrono::milliseconds ioTimeout_;
};

} // namespace merkseal

#endif // MERKSEAL_UPLOAD_SERVER_HPP
