#include "batch/batch_store.hpp"
#include "server/upload_server.hpp"
#include "utilities/blockio.hpp"
#include "utilities/metrics.h"
#include "utilities/var_dir.hpp"
#include <array>
#include <boost/asio.hpp>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <thread>
#include <vector>

using namespace merkseal;
namespace fs = std::filesystem;

namespace {

const std::string BOUNDARY = "----merksealTestBoundary";

std::string filePart(const std::string &filename, const std::string &data) {
  return "--" + BOUNDARY +
         "\r\nContent-Disposition: form-data; name=\"files\"; filename=\"" +
         filename + "\"\r\nContent-Type: application/octet-stream\r\n\r\n" +
         data + "\r\n";
}

std::string fieldPart(const std::string &name, const std::string &data) {
  return "--" + BOUNDARY + "\r\nContent-Disposition: form-data; name=\"" +
         name + "\"\r\n\r\n" + data + "\r\n";
}

HTTP::HTTPREQUEST uploadRequest(const std::string &parts) {
  HTTP::HTTPREQUEST req;
  req.method = HTTP::HttpMethod::POST;
  req.uri = "/upload";
  req.protocol = "HTTP/1.1";
  req.headers["Content-Type"] = "multipart/form-data; boundary=" + BOUNDARY;
  req.body = parts + "--" + BOUNDARY + "--\r\n";
  return req;
}

HTTP::HTTPREQUEST getRequest(const std::string &uri) {
  HTTP::HTTPREQUEST req;
  req.method = HTTP::HttpMethod::GET;
  req.uri = uri;
  req.protocol = "HTTP/1.1";
  return req;
}

} // namespace

class UploadServerTest : public ::testing::Test {
protected:
  void SetUp() override {
    const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
    root_ = fs::path(getVarDir()) / "server_tests" / info->name();
    fs::remove_all(root_);
    store_ = std::make_unique<BatchStore>(root_.string(), HashScheme::Legacy,
                                          ids_);
    server_ = std::make_unique<UploadServer>(ioc_, "127.0.0.1", 0, *store_,
                                             "0xRegistryAddress");
    MetricsRegistry::instance().reset();
  }
  void TearDown() override {
    server_.reset();
    std::error_code ec;
    fs::remove_all(root_, ec);
  }

  fs::path root_;
  BatchIdAllocator ids_;
  boost::asio::io_context ioc_;
  std::unique_ptr<BatchStore> store_;
  std::unique_ptr<UploadServer> server_;
};

TEST_F(UploadServerTest, UploadCreatesBatch) {
  auto res = server_->handleRequest(uploadRequest(
      filePart("b.txt", "bravo") + filePart("a.txt", "alpha")));
  ASSERT_EQ(res.statusCodeNumber, 200) << res.body;
  EXPECT_EQ(res.contentType, "application/json");

  auto j = nlohmann::json::parse(res.body);
  EXPECT_EQ(j["success"], true);
  const auto &batch = j["batch"];
  EXPECT_EQ(batch["local_batch_id"], 1);
  EXPECT_EQ(batch["file_count"], 2);
  EXPECT_EQ(batch["suggested_meta_uri"], "ipfs://placeholder-1");
  EXPECT_EQ(batch["registry_address"], "0xRegistryAddress");
  Digest expected = MerkleTree::computeRoot(
      {hashData(std::string("alpha")), hashData(std::string("bravo"))});
  EXPECT_EQ(batch["root"], digestToHex(expected));

  EXPECT_TRUE(fs::exists(root_ / "1" / "a.txt"));
  EXPECT_EQ(store_->load(1).root, digestToHex(expected));
  EXPECT_DOUBLE_EQ(MetricsRegistry::instance().value("merkseal_uploads_total",
                                                     {{"status", "ok"}}),
                   1.0);
  EXPECT_DOUBLE_EQ(
      MetricsRegistry::instance().value("merkseal_upload_files_total"), 2.0);
}

TEST_F(UploadServerTest, PartsWithoutFilenameGetGeneratedNames) {
  auto res = server_->handleRequest(
      uploadRequest(fieldPart("first", "one") + fieldPart("second", "two")));
  ASSERT_EQ(res.statusCodeNumber, 200) << res.body;
  EXPECT_TRUE(fs::exists(root_ / "1" / "file_0"));
  EXPECT_TRUE(fs::exists(root_ / "1" / "file_1"));
}

TEST_F(UploadServerTest, NoFilesIsBadRequest) {
  auto res = server_->handleRequest(uploadRequest(""));
  EXPECT_EQ(res.statusCodeNumber, 400);
  auto j = nlohmann::json::parse(res.body);
  EXPECT_EQ(j["success"], false);
  EXPECT_EQ(j["error"], "No files uploaded");
  EXPECT_EQ(ids_.peek(), 1u);
}

TEST_F(UploadServerTest, RejectsBadUploads) {
  auto notMultipart = uploadRequest(filePart("a", "1"));
  notMultipart.headers["Content-Type"] = "application/json";
  EXPECT_EQ(server_->handleRequest(notMultipart).statusCodeNumber, 400);

  auto broken = uploadRequest("");
  broken.body = "garbage";
  EXPECT_EQ(server_->handleRequest(broken).statusCodeNumber, 400);

  EXPECT_EQ(server_->handleRequest(uploadRequest(filePart("../x", "1")))
                .statusCodeNumber,
            400);
  EXPECT_EQ(server_->handleRequest(
                    uploadRequest(filePart("d", "1") + filePart("d", "2")))
                .statusCodeNumber,
            400);
  EXPECT_FALSE(store_->exists(1));
  EXPECT_DOUBLE_EQ(MetricsRegistry::instance().value("merkseal_uploads_total",
                                                     {{"status", "rejected"}}),
                   4.0);
}

TEST_F(UploadServerTest, StorageFailureIsServerError) {
  // A regular file where the batch directory should go.
  fs::create_directories(root_);
  std::ofstream(root_ / "1") << "in the way";
  auto res = server_->handleRequest(uploadRequest(filePart("a", "1")));
  EXPECT_EQ(res.statusCodeNumber, 500);
  EXPECT_EQ(nlohmann::json::parse(res.body)["success"], false);
}

TEST_F(UploadServerTest, HealthAndRouting) {
  auto res = server_->handleRequest(getRequest("/health"));
  ASSERT_EQ(res.statusCodeNumber, 200);
  auto j = nlohmann::json::parse(res.body);
  EXPECT_EQ(j["status"], "ok");
  EXPECT_EQ(j["service"], "MerkSeal Server");

  EXPECT_EQ(server_->handleRequest(getRequest("/nope")).statusCodeNumber, 404);
  EXPECT_EQ(server_->handleRequest(getRequest("/upload")).statusCodeNumber,
            405);
  auto post = getRequest("/health");
  post.method = HTTP::HttpMethod::POST;
  EXPECT_EQ(server_->handleRequest(post).statusCodeNumber, 405);
}

TEST_F(UploadServerTest, BatchLookup) {
  server_->handleRequest(uploadRequest(filePart("a", "alpha")));
  auto res = server_->handleRequest(getRequest("/batches/1"));
  ASSERT_EQ(res.statusCodeNumber, 200);
  auto j = nlohmann::json::parse(res.body);
  EXPECT_EQ(j["local_batch_id"], 1);
  EXPECT_EQ(j["root"], digestToHex(hashData(std::string("alpha"))));

  EXPECT_EQ(server_->handleRequest(getRequest("/batches/2")).statusCodeNumber,
            404);
  EXPECT_EQ(server_->handleRequest(getRequest("/batches/x")).statusCodeNumber,
            400);

  std::ofstream(root_ / "1" / "metadata.json", std::ios::trunc) << "{";
  EXPECT_EQ(server_->handleRequest(getRequest("/batches/1")).statusCodeNumber,
            500);
}

TEST_F(UploadServerTest, MetricsEndpoint) {
  server_->handleRequest(uploadRequest(filePart("a", "alpha")));
  auto res = server_->handleRequest(getRequest("/metrics"));
  ASSERT_EQ(res.statusCodeNumber, 200);
  EXPECT_NE(res.body.find("merkseal_uploads_total{status=\"ok\"} 1"),
            std::string::npos);
}

TEST_F(UploadServerTest, ServesOverTcp) {
  server_->run();
  std::thread t([this]() { ioc_.run(); });
  const std::string base =
      "http://127.0.0.1:" + std::to_string(server_->port());

  auto health = HTTP::SendHttpRequest(base + "/health", getRequest("/"),
                                      std::chrono::milliseconds(5000));
  EXPECT_EQ(health.statusCodeNumber, 200);
  EXPECT_EQ(nlohmann::json::parse(health.body)["status"], "ok");

  auto upload = HTTP::SendHttpRequest(
      base + "/upload", uploadRequest(filePart("x.bin", std::string(100000, 'x'))),
      std::chrono::milliseconds(5000));
  ASSERT_EQ(upload.statusCodeNumber, 200) << upload.body;
  auto j = nlohmann::json::parse(upload.body);
  EXPECT_EQ(j["batch"]["root"],
            digestToHex(hashData(std::string(100000, 'x'))));

  server_->stop();
  ioc_.stop();
  t.join();
}

TEST_F(UploadServerTest, IdleConnectionDoesNotBlockOtherClients) {
  server_->run();
  std::thread t([this]() { ioc_.run(); });
  const unsigned short port = server_->port();

  boost::asio::io_context client;
  boost::asio::ip::tcp::socket idle(client);
  idle.connect({boost::asio::ip::make_address("127.0.0.1"), port});

  auto health = HTTP::SendHttpRequest(
      "http://127.0.0.1:" + std::to_string(port) + "/health", getRequest("/"),
      std::chrono::milliseconds(2000));
  EXPECT_EQ(health.statusCodeNumber, 200);

  idle.close();
  server_->stop();
  ioc_.stop();
  t.join();
}

TEST_F(UploadServerTest, IdleConnectionIsClosedAfterTimeout) {
  UploadServer server(ioc_, "127.0.0.1", 0, *store_, "0xRegistryAddress",
                      std::chrono::milliseconds(200));
  server.run();
  std::thread t([this]() { ioc_.run(); });

  boost::asio::io_context client;
  boost::asio::ip::tcp::socket idle(client);
  idle.connect({boost::asio::ip::make_address("127.0.0.1"), server.port()});
  std::array<char, 16> buf{};
  boost::system::error_code ec;
  const std::size_t n = idle.read_some(boost::asio::buffer(buf), ec);
  EXPECT_EQ(n, 0u);
  EXPECT_TRUE(ec == boost::asio::error::eof ||
              ec == boost::asio::error::connection_reset)
      << ec.message();

  server.stop();
  ioc_.stop();
  t.join();
}

TEST_F(UploadServerTest, StopFromAnotherThreadEndsAcceptLoop) {
  server_->run();
  const unsigned short port = server_->port();
  std::vector<std::thread> workers;
  for (int i = 0; i < 2; ++i)
    workers.emplace_back([this]() { ioc_.run(); });

  auto health = HTTP::SendHttpRequest(
      "http://127.0.0.1:" + std::to_string(port) + "/health", getRequest("/"),
      std::chrono::milliseconds(2000));
  EXPECT_EQ(health.statusCodeNumber, 200);

  // With the acceptor closed the io_context runs out of work on its own.
  server_->stop();
  for (auto &w : workers)
    w.join();

  boost::asio::io_context client;
  boost::asio::ip::tcp::socket late(client);
  boost::system::error_code ec;
  late.connect({boost::asio::ip::make_address("127.0.0.1"), port}, ec);
  EXPECT_TRUE(ec);
}
