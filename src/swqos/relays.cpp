#include "swqos/relays.hpp"
#include "node_connection/ledger_client.hpp"
#include "node_connection/rpc_client.hpp"
#include "common/logger.hpp"
#include "utils/json_rpc.hpp"
#include "utils/text_encoding.hpp"

using json = nlohmann::json;

JsonRpcRelay::JsonRpcRelay(HttpClient& http, const ProviderConfig& cfg, std::vector<PublicKey> tip_accounts, int timeout_ms)
  : RelayProvider(cfg.kind,
                  std::string(ProviderKindName(cfg.kind)) + (cfg.region.empty() ? "" : "/" + cfg.region),
                  cfg.endpoint, std::move(tip_accounts), cfg.min_tip.value_or(0.0), false),
    http_(http), timeout_ms_(timeout_ms) {
  if (cfg.endpoint.empty()) throw InvalidParameter(std::string(ProviderKindName(cfg.kind)) + " requires an endpoint");
  headers_["Content-Type"] = "application/json";
  if (!cfg.credential.empty()) ApplyAuthHeader(headers_, cfg.credential);
}

void JsonRpcRelay::Send(const TransactionVariant& variant, SubmissionOutcome& outcome) {
  json params = json::array({TextEncoding::EncodeBase64(variant.serialized), {{"encoding", "base64"}, {"skipPreflight", true}}});
  auto resp = http_.Post(Endpoint(), JsonRpcUtil::BuildRequest("sendTransaction", params), headers_, timeout_ms_);
  ParseRelayAck(resp);
  outcome.signature = variant.signature;
}

RpcRelay::RpcRelay(LedgerClient& ledger, const std::string& endpoint)
  : RelayProvider(ProviderKind::Default, "Default", endpoint, {}, 0.0, false), ledger_(ledger) {}

void RpcRelay::Send(const TransactionVariant& variant, SubmissionOutcome& outcome) {
  std::string sig = ledger_.SendTransaction(TextEncoding::EncodeBase64(variant.serialized));
  if (sig != variant.signature) Logger::Debug("RPC returned " + sig + " for local signature " + variant.signature);
  outcome.signature = variant.signature;
}

DisabledRelay::DisabledRelay(const ProviderConfig& cfg, const std::string& id)
  : RelayProvider(cfg.kind, id, cfg.endpoint, {}, cfg.min_tip.value_or(0.0), true) {}

void DisabledRelay::Send(const TransactionVariant&, SubmissionOutcome& outcome) {
  outcome.error = Unavailable(Id(), "provider is disabled");
}
