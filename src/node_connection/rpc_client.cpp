#include "node_connection/rpc_client.hpp"
#include "net/http_client.hpp"
#include "common/logger.hpp"
#include "utils/json_rpc.hpp"
#include "utils/text_encoding.hpp"
#include <cctype>
#include <chrono>
#include <stdexcept>
#include <thread>

using json = nlohmann::json;

static inline std::string Trim(const std::string& s) {
  size_t start = 0, end = s.size();
  while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
  while (end > start && std::isspace(static_cast<unsigned char>(s[end-1]))) --end;
  return s.substr(start, end - start);
}

void ApplyAuthHeader(std::unordered_map<std::string, std::string>& headers,
                     const std::optional<std::string>& auth_header_opt) {
  if (!auth_header_opt || auth_header_opt->empty()) return;
  const std::string& raw = *auth_header_opt;
  auto pos = raw.find(':');
  if (pos != std::string::npos) {
    std::string name = Trim(raw.substr(0, pos));
    std::string value = Trim(raw.substr(pos + 1));
    if (!name.empty() && !value.empty()) {
      headers[name] = value;
      return;
    }
  }
  headers["Authorization"] = raw;
}

const char* CommitmentLevelName(CommitmentLevel level) {
  switch (level) {
    case CommitmentLevel::Processed: return "processed";
    case CommitmentLevel::Confirmed: return "confirmed";
    case CommitmentLevel::Finalized: return "finalized";
  }
  return "unknown";
}

std::optional<CommitmentLevel> ParseCommitmentLevel(const std::string& name) {
  if (name == "processed") return CommitmentLevel::Processed;
  if (name == "confirmed") return CommitmentLevel::Confirmed;
  if (name == "finalized") return CommitmentLevel::Finalized;
  return std::nullopt;
}

RpcClient::RpcClient(HttpClient& http,
                     const std::string& endpoint_url,
                     const std::optional<std::string>& auth_header,
                     RpcClientOptions options)
  : http_(http), endpoint_(endpoint_url), options_(options) {
  default_headers_.reserve(2);
  default_headers_["Content-Type"] = "application/json";
  ApplyAuthHeader(default_headers_, auth_header);
}

std::string RpcClient::Send(const std::string& json_payload, int timeout_ms) {
  const int attempts = options_.max_attempts > 0 ? options_.max_attempts : 1;
  HttpResponse resp;
  for (int attempt = 1; attempt <= attempts; ++attempt) {
    resp = http_.Post(endpoint_, json_payload, default_headers_, timeout_ms);
    if (resp.status != 0) break;
    Logger::Debug("RPC transport failure (attempt " + std::to_string(attempt) + "): " + resp.error);
    if (attempt < attempts) std::this_thread::sleep_for(std::chrono::milliseconds(options_.retry_backoff_ms * attempt));
  }
  if (resp.status == 0) throw std::runtime_error("RPC unreachable: " + resp.error);
  if (!resp.Ok()) {
    Logger::Error("HTTP POST failed status=" + std::to_string(resp.status));
    throw std::runtime_error("RPC HTTP status " + std::to_string(resp.status));
  }
  return resp.body;
}

json RpcClient::Call(const std::string& method, const json& params) {
  auto body = Send(JsonRpcUtil::BuildRequest(method, params), options_.timeout_ms);
  return JsonRpcUtil::ExtractResult(body);
}

std::vector<std::optional<SignatureStatus>> RpcClient::GetSignatureStatuses(const std::vector<std::string>& signatures) {
  json params = json::array({signatures, {{"searchTransactionHistory", false}}});
  json result = Call("getSignatureStatuses", params);
  const json& values = result.at("value");
  std::vector<std::optional<SignatureStatus>> out;
  out.reserve(signatures.size());
  for (size_t i = 0; i < signatures.size(); ++i) {
    if (i >= values.size() || values[i].is_null()) {
      out.emplace_back(std::nullopt);
      continue;
    }
    const json& v = values[i];
    SignatureStatus st;
    if (v.contains("confirmationStatus") && v["confirmationStatus"].is_string()) {
      st.confirmation = ParseCommitmentLevel(v["confirmationStatus"].get<std::string>());
    } else if (v.contains("confirmations") && v["confirmations"].is_null()) {
      // older nodes: null confirmations means rooted
      st.confirmation = CommitmentLevel::Finalized;
    } else {
      st.confirmation = CommitmentLevel::Processed;
    }
    if (v.contains("err") && !v["err"].is_null()) st.err = v["err"].dump();
    out.emplace_back(st);
  }
  return out;
}

std::string RpcClient::GetLatestBlockhash() {
  json result = Call("getLatestBlockhash", json::array({{{"commitment", "processed"}}}));
  return result.at("value").at("blockhash").get<std::string>();
}

std::optional<std::vector<unsigned char>> RpcClient::GetAccountData(const std::string& address) {
  json result = Call("getAccountInfo", json::array({address, {{"encoding", "base64"}}}));
  const json& value = result.at("value");
  if (value.is_null()) return std::nullopt;
  const json& data = value.at("data");
  if (!data.is_array() || data.empty()) throw std::runtime_error("unexpected account data encoding for " + address);
  return TextEncoding::DecodeBase64(data[0].get<std::string>());
}

std::string RpcClient::SendTransaction(const std::string& base64_tx) {
  json params = json::array({base64_tx, {{"encoding", "base64"}, {"skipPreflight", true}, {"maxRetries", 0}}});
  return Call("sendTransaction", params).get<std::string>();
}
