#pragma once
#include "swqos/provider.hpp"
#include "net/http_client.hpp"
#include <optional>
#include <string>
#include <vector>

class LedgerClient;

namespace JitoRegions {
  // Block-engine base URL for a region name or alias; empty name means the global endpoint.
  // Throws EngineError(InvalidParameter) for an unknown region.
  std::string Endpoint(const std::string& region);
  const std::vector<std::string>& Names();
}

// Built-in Jito tip accounts
const std::vector<std::string>& JitoTipAccounts();
constexpr double kJitoMinTipSol = 0.00001;

// Jito block engine: sendTransaction and sendBundle over JSON-RPC.
// The credential travels as x-jito-auth and as the uuid query parameter.
class JitoRelay final : public RelayProvider {
public:
  JitoRelay(HttpClient& http, const ProviderConfig& cfg, std::vector<PublicKey> tip_accounts, int timeout_ms);
  // One bundle for all variants; a bundle lands atomically or not at all
  std::vector<SubmissionOutcome> SubmitBatch(const std::vector<TransactionVariant>& variants) override;
protected:
  void Send(const TransactionVariant& variant, SubmissionOutcome& outcome) override;
private:
  std::string Url(const char* path) const;
  HttpHeaders Headers() const;
  HttpClient& http_;
  std::string credential_;
  int timeout_ms_;
};

// Relay that accepts a plain sendTransaction JSON-RPC call with a base64 payload.
class JsonRpcRelay final : public RelayProvider {
public:
  JsonRpcRelay(HttpClient& http, const ProviderConfig& cfg, std::vector<PublicKey> tip_accounts, int timeout_ms);
protected:
  void Send(const TransactionVariant& variant, SubmissionOutcome& outcome) override;
private:
  HttpClient& http_;
  HttpHeaders headers_;
  int timeout_ms_;
};

// Un-accelerated path straight to the ledger RPC node. Never tips.
class RpcRelay final : public RelayProvider {
public:
  RpcRelay(LedgerClient& ledger, const std::string& endpoint);
protected:
  void Send(const TransactionVariant& variant, SubmissionOutcome& outcome) override;
private:
  LedgerClient& ledger_;
};

// Stand-in for a denylisted relay: configured and visible, never sends.
class DisabledRelay final : public RelayProvider {
public:
  explicit DisabledRelay(const ProviderConfig& cfg, const std::string& id);
protected:
  void Send(const TransactionVariant& variant, SubmissionOutcome& outcome) override;
};

// Interprets a relay JSON-RPC response. Returns the acknowledged id or throws.
std::string ParseRelayAck(const HttpResponse& resp);
