#include "gas/dynamic_tip.hpp"
#include "net/http_client.hpp"
#include "common/logger.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <stdexcept>

std::optional<TipPercentile> ParseTipPercentile(const std::string& name) {
  std::string s = name;
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  if (s == "25th") return TipPercentile::P25;
  if (s == "50th") return TipPercentile::P50;
  if (s == "75th") return TipPercentile::P75;
  if (s == "95th") return TipPercentile::P95;
  if (s == "99th") return TipPercentile::P99;
  return std::nullopt;
}

const char* TipPercentileName(TipPercentile p) {
  switch (p) {
    case TipPercentile::P25: return "25th";
    case TipPercentile::P50: return "50th";
    case TipPercentile::P75: return "75th";
    case TipPercentile::P95: return "95th";
    case TipPercentile::P99: return "99th";
  }
  return "50th";
}

double TipFloor::At(TipPercentile p) const {
  switch (p) {
    case TipPercentile::P25: return p25;
    case TipPercentile::P50: return p50;
    case TipPercentile::P75: return p75;
    case TipPercentile::P95: return p95;
    case TipPercentile::P99: return p99;
  }
  return p50;
}

TipFloorClient::TipFloorClient(HttpClient& http, std::string endpoint, int timeout_ms)
  : http_(http), endpoint_(std::move(endpoint)), timeout_ms_(timeout_ms) {}

TipFloor TipFloorClient::Parse(const std::string& body) {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(body);
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error(std::string("tip floor: malformed body: ") + e.what());
  }
  // The endpoint answers with a one-element array
  if (!j.is_array() || j.empty() || !j[0].is_object()) throw std::runtime_error("tip floor: expected a non-empty array");
  const auto& o = j[0];
  TipFloor f;
  try {
    f.p25 = o.at("landed_tips_25th_percentile").get<double>();
    f.p50 = o.at("landed_tips_50th_percentile").get<double>();
    f.p75 = o.at("landed_tips_75th_percentile").get<double>();
    f.p95 = o.at("landed_tips_95th_percentile").get<double>();
    f.p99 = o.at("landed_tips_99th_percentile").get<double>();
    f.ema_p50 = o.value("ema_landed_tips_50th_percentile", f.p50);
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error(std::string("tip floor: missing field: ") + e.what());
  }
  return f;
}

TipFloor TipFloorClient::Fetch() {
  const HttpResponse r = http_.Get(endpoint_, {}, timeout_ms_);
  if (r.status == 0) throw std::runtime_error("tip floor: " + (r.error.empty() ? std::string("no response") : r.error));
  if (!r.Ok()) throw std::runtime_error("tip floor: HTTP " + std::to_string(r.status));
  return Parse(r.body);
}

double TipFloorClient::ComputeTip(const TipFloor& floor, const DynamicTipConfig& cfg) {
  const double raw = floor.At(cfg.percentile) * cfg.multiplier;
  return std::min(std::max(raw, cfg.min_tip), cfg.max_tip);
}

double TipFloorClient::OptimalTip(const DynamicTipConfig& cfg) {
  if (!cfg.enabled) return cfg.min_tip;
  const TipFloor floor = Fetch();
  const double tip = ComputeTip(floor, cfg);
  Logger::Info("Dynamic tip: " + std::string(TipPercentileName(cfg.percentile)) + "=" + std::to_string(floor.At(cfg.percentile)) +
               " SOL x" + std::to_string(cfg.multiplier) + " -> " + std::to_string(tip) + " SOL");
  return tip;
}

double TipFloorClient::ApplyTo(FeeStrategyStore& store, TradeDirection direction, const DynamicTipConfig& cfg) {
  const double tip = OptimalTip(cfg);
  store.UpdateTip(direction, tip);
  return tip;
}
