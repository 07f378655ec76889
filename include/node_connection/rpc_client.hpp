#pragma once
#include "node_connection/ledger_client.hpp"
#include <cstdint>
#include <string>
#include <vector>
#include <optional>
#include <unordered_map>
#include <nlohmann/json.hpp>

class HttpClient;

struct RpcClientOptions {
  int timeout_ms = 2000;
  int max_attempts = 3;    // retries apply to transport failures only
  int retry_backoff_ms = 50;
};

// Ledger JSON-RPC client over the shared HttpClient.
class RpcClient : public LedgerClient {
public:
  RpcClient(HttpClient& http,
            const std::string& endpoint_url,
            const std::optional<std::string>& auth_header = std::nullopt,
            RpcClientOptions options = RpcClientOptions());

  // Sends raw JSON-RPC payload and returns the response body.
  std::string Send(const std::string& json_payload, int timeout_ms);
  // Builds the request, sends it and returns the "result" member.
  nlohmann::json Call(const std::string& method, const nlohmann::json& params);

  std::vector<std::optional<SignatureStatus>> GetSignatureStatuses(const std::vector<std::string>& signatures) override;
  std::string GetLatestBlockhash() override;
  std::optional<std::vector<unsigned char>> GetAccountData(const std::string& address) override;
  std::string SendTransaction(const std::string& base64_tx) override;

  const std::string& Endpoint() const { return endpoint_; }
private:
  HttpClient& http_;
  std::string endpoint_;
  RpcClientOptions options_;
  std::unordered_map<std::string, std::string> default_headers_;
};

// "Name: value" becomes that header, anything else is sent as Authorization.
void ApplyAuthHeader(std::unordered_map<std::string, std::string>& headers,
                     const std::optional<std::string>& auth_header);
