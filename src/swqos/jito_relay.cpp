#include "swqos/relays.hpp"
#include "common/logger.hpp"
#include "utils/json_rpc.hpp"
#include "utils/text_encoding.hpp"
#include <algorithm>
#include <cctype>
#include <utility>

using json = nlohmann::json;

namespace {
  struct RegionEntry {
    const char* name;
    std::vector<const char*> aliases;
    const char* url;
  };

  const std::vector<RegionEntry>& RegionTable() {
    static const std::vector<RegionEntry> table{
      {"default", {}, "https://mainnet.block-engine.jito.wtf"},
      {"amsterdam", {"ams"}, "https://amsterdam.mainnet.block-engine.jito.wtf"},
      {"dublin", {"dub"}, "https://dublin.mainnet.block-engine.jito.wtf"},
      {"frankfurt", {"fra", "ffm"}, "https://frankfurt.mainnet.block-engine.jito.wtf"},
      {"london", {"lon"}, "https://london.mainnet.block-engine.jito.wtf"},
      {"ny", {"newyork"}, "https://ny.mainnet.block-engine.jito.wtf"},
      {"slc", {"saltlakecity"}, "https://slc.mainnet.block-engine.jito.wtf"},
      {"singapore", {"sgp", "sg"}, "https://singapore.mainnet.block-engine.jito.wtf"},
      {"tokyo", {"tyo"}, "https://tokyo.mainnet.block-engine.jito.wtf"},
    };
    return table;
  }

  std::string TrimTrailingSlash(std::string url) {
    while (!url.empty() && url.back() == '/') url.pop_back();
    return url;
  }
}

namespace JitoRegions {
  std::string Endpoint(const std::string& region) {
    std::string wanted = region;
    std::transform(wanted.begin(), wanted.end(), wanted.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    if (wanted.empty()) wanted = "default";
    for (const auto& r : RegionTable()) {
      if (wanted == r.name) return r.url;
      for (const char* alias : r.aliases) if (wanted == alias) return r.url;
    }
    throw InvalidParameter("unknown Jito region: " + region);
  }

  const std::vector<std::string>& Names() {
    static const std::vector<std::string> names = []{
      std::vector<std::string> v;
      for (const auto& r : RegionTable()) v.emplace_back(r.name);
      return v;
    }();
    return names;
  }
}

const std::vector<std::string>& JitoTipAccounts() {
  static const std::vector<std::string> accounts{
    "96gYZGLnJYVFmbjzopPSU6QiEV5fGqZNyN9nmNhvrZU5",
    "HFqU5x63VTqvQss8hp11i4wVV8bD44PvwucfZ2bU7gRe",
    "Cw8CFyM9FkoMi7K7Crf6HNQqf4uEMzpKw6QNghXLvLkY",
    "ADaUMid9yfUytqMBgopwjb2DTLSokTSzL1zt6iGPaS49",
    "DfXygSm4jCyNCybVYYK6DwvWqjKee8pbDmJGcLWNDXjh",
    "ADuUkR4vqLUMWXxW9gh6D6L8pMSawimctcNZ5pGwDcEt",
    "DttWaMuVvTiduZRnguLF7jNxTgiMBZ1hyAumKUiL2KRL",
    "3AVi9Tg9Uo68tJfuvoKvqKNWKkC5wPdSSdeBnizKZ6jT",
  };
  return accounts;
}

std::string ParseRelayAck(const HttpResponse& resp) {
  if (resp.status == 0) {
    throw std::runtime_error(resp.timed_out ? "timeout: " + resp.error : "transport error: " + resp.error);
  }
  if (!resp.Ok()) {
    std::string detail = JsonRpcUtil::ExtractError(resp.body);
    if (detail.empty()) detail = resp.body.substr(0, 200);
    throw std::runtime_error("HTTP " + std::to_string(resp.status) + (detail.empty() ? "" : ": " + detail));
  }
  json result = JsonRpcUtil::ExtractResult(resp.body);
  if (result.is_string()) return result.get<std::string>();
  if (result.is_null()) throw std::runtime_error("relay returned a null result");
  return result.dump();
}

JitoRelay::JitoRelay(HttpClient& http, const ProviderConfig& cfg, std::vector<PublicKey> tip_accounts, int timeout_ms)
  : RelayProvider(ProviderKind::Jito,
                  std::string("Jito/") + (cfg.region.empty() ? "default" : cfg.region),
                  TrimTrailingSlash(cfg.endpoint.empty() ? JitoRegions::Endpoint(cfg.region) : cfg.endpoint),
                  std::move(tip_accounts), cfg.min_tip.value_or(kJitoMinTipSol), false),
    http_(http), credential_(cfg.credential), timeout_ms_(timeout_ms) {}

std::string JitoRelay::Url(const char* path) const {
  std::string url = Endpoint() + path;
  if (!credential_.empty()) url += "?uuid=" + credential_;
  return url;
}

HttpHeaders JitoRelay::Headers() const {
  HttpHeaders headers{{"Content-Type", "application/json"}};
  if (!credential_.empty()) headers["x-jito-auth"] = credential_;
  return headers;
}

void JitoRelay::Send(const TransactionVariant& variant, SubmissionOutcome& outcome) {
  json params = json::array({TextEncoding::EncodeBase64(variant.serialized), {{"encoding", "base64"}}});
  auto resp = http_.Post(Url("/api/v1/transactions"), JsonRpcUtil::BuildRequest("sendTransaction", params), Headers(), timeout_ms_);
  std::string ack = ParseRelayAck(resp);
  if (ack != variant.signature) Logger::Debug("Jito ack " + ack + " differs from local signature " + variant.signature);
  outcome.signature = variant.signature;
}

std::vector<SubmissionOutcome> JitoRelay::SubmitBatch(const std::vector<TransactionVariant>& variants) {
  std::vector<SubmissionOutcome> out;
  out.reserve(variants.size());
  for (size_t i = 0; i < variants.size(); ++i) out.push_back(MakeOutcome(variants[i], i));
  if (variants.empty()) return out;

  std::optional<ErrorInfo> failure;
  std::string bundle_id;
  try {
    json txs = json::array();
    for (const auto& v : variants) txs.push_back(TextEncoding::EncodeBase64(v.serialized));
    json params = json::array({txs, {{"encoding", "base64"}}});
    auto resp = http_.Post(Url("/api/v1/bundles"), JsonRpcUtil::BuildRequest("sendBundle", params), Headers(), timeout_ms_);
    bundle_id = ParseRelayAck(resp);
  } catch (const std::exception& ex) {
    failure = Unavailable(Id(), ex.what());
  }
  const auto now = std::chrono::system_clock::now();
  for (size_t i = 0; i < out.size(); ++i) {
    out[i].timestamp = now;
    if (failure) out[i].error = failure;
    else out[i].signature = variants[i].signature;
  }
  if (failure) Logger::Warning("Bundle via " + Id() + " failed: " + failure->message);
  else Logger::Debug("Bundle via " + Id() + " accepted id=" + bundle_id);
  return out;
}
