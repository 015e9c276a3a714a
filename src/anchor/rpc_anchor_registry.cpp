#include "anchor/rpc_anchor_registry.hpp"
#include "anchor/abi_codec.hpp"
#include "utilities/errors.hpp"
#include "utilities/http.hpp"
#include "utilities/logger.h"
#include "utilities/metrics.h"

#include <algorithm>
#include <cctype>
#include <nlohmann/json.hpp>

namespace merkseal {

namespace {

// Ethereum clients report execution reverts with code 3 or a message
// containing "revert".
bool isRevert(const nlohmann::json &error) {
  if (error.contains("code") && error["code"].is_number_integer() &&
      error["code"].get<long long>() == 3)
    return true;
  if (error.contains("message") && error["message"].is_string()) {
    std::string msg = error["message"].get<std::string>();
    std::transform(msg.begin(), msg.end(), msg.begin(), [](unsigned char c) {
      return static_cast<char>(std::tolower(c));
    });
    return msg.find("revert") != std::string::npos;
  }
  return false;
}

RpcAnchorRegistry::Transport httpTransport(const std::string &rpcUrl,
                                           std::chrono::milliseconds timeout) {
  return [rpcUrl, timeout](const std::string &body) {
    HTTP::HTTPREQUEST req;
    req.method = HTTP::HttpMethod::POST;
    req.headers["Content-Type"] = "application/json";
    req.headers["Accept"] = "application/json";
    req.body = body;
    HTTP::HTTPRESPONSE res = HTTP::SendHttpRequest(rpcUrl, std::move(req),
                                                   timeout);
    if (res.statusCodeNumber != 200) {
      throw std::runtime_error("RPC endpoint answered HTTP " +
                               std::to_string(res.statusCodeNumber) + " " +
                               res.reasonPhrase);
    }
    return res.body;
  };
}

} // namespace

RpcAnchorRegistry::RpcAnchorRegistry(const std::string &rpcUrl,
                                     std::string registryAddress,
                                     std::chrono::milliseconds timeout)
    : registryAddress_(std::move(registryAddress)),
      transport_(httpTransport(rpcUrl, timeout)) {}

RpcAnchorRegistry::RpcAnchorRegistry(std::string registryAddress,
                                     Transport transport)
    : registryAddress_(std::move(registryAddress)),
      transport_(std::move(transport)) {}

std::string RpcAnchorRegistry::buildRequest(uint64_t batchId) const {
  nlohmann::ordered_json call;
  call["to"] = registryAddress_;
  call["data"] = abi::encodeGetBatchCall(batchId);

  nlohmann::ordered_json req;
  req["jsonrpc"] = "2.0";
  req["id"] = 1;
  req["method"] = "eth_call";
  req["params"] = nlohmann::ordered_json::array({call, "latest"});
  return req.dump();
}

AnchoredBatch RpcAnchorRegistry::parseResponse(uint64_t batchId,
                                               const std::string &body) const {
  using Kind = AnchorLookupError::Kind;
  const std::string idText = std::to_string(batchId);

  nlohmann::json res = nlohmann::json::parse(body, nullptr, false);
  if (res.is_discarded() || !res.is_object())
    throw AnchorLookupError(Kind::Transport,
                            "RPC response is not a JSON object");

  if (res.contains("error") && !res["error"].is_null()) {
    const auto &error = res["error"];
    std::string msg = error.is_object() && error.contains("message") &&
                              error["message"].is_string()
                          ? error["message"].get<std::string>()
                          : error.dump();
    if (error.is_object() && isRevert(error))
      throw AnchorLookupError(Kind::NotFound, "Registry has no batch " +
                                                  idText + ": " + msg);
    throw AnchorLookupError(Kind::Transport, "RPC error: " + msg);
  }

  if (!res.contains("result") || !res["result"].is_string())
    throw AnchorLookupError(Kind::Transport, "RPC response has no result");
  const std::string result = res["result"].get<std::string>();
  if (result == "0x" || result.empty()) {
    throw AnchorLookupError(Kind::Transport,
                            "Empty eth_call result; is " + registryAddress_ +
                                " the registry contract?");
  }

  AnchoredBatch batch;
  try {
    batch = abi::decodeGetBatchResult(result);
  } catch (const std::invalid_argument &e) {
    throw AnchorLookupError(Kind::Transport,
                            std::string("Cannot decode getBatch result: ") +
                                e.what());
  }
  if (batch.timestamp == 0)
    throw AnchorLookupError(Kind::NotFound,
                            "Registry has no batch " + idText);
  return batch;
}

AnchoredBatch RpcAnchorRegistry::getBatch(uint64_t batchId) {
  const auto start = std::chrono::steady_clock::now();
  auto observe = [&start]() {
    std::chrono::duration<double> elapsed =
        std::chrono::steady_clock::now() - start;
    MetricsRegistry::instance().observe("merkseal_anchor_lookup_seconds",
                                        elapsed.count());
  };

  Logger::getInstance().log(LogLevel::DEBUG,
                            "eth_call getBatch(" + std::to_string(batchId) +
                                ") on " + registryAddress_);
  std::string body;
  try {
    body = transport_(buildRequest(batchId));
  } catch (const std::exception &e) {
    observe();
    throw AnchorLookupError(AnchorLookupError::Kind::Transport,
                            std::string("RPC request failed: ") + e.what());
  }
  observe();
  return parseResponse(batchId, body);
}

} // namespace merkseal
