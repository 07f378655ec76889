#pragma once
#include "gas/fee_strategy_store.hpp"
#include <optional>
#include <string>

class HttpClient;

enum class TipPercentile { P25, P50, P75, P95, P99 };

// "25th".."99th", case-insensitive
std::optional<TipPercentile> ParseTipPercentile(const std::string& name);
const char* TipPercentileName(TipPercentile p);

struct DynamicTipConfig {
  bool enabled = false;
  TipPercentile percentile = TipPercentile::P50;
  double multiplier = 1.0;
  double min_tip = 0.00001; // SOL
  double max_tip = 0.001;   // SOL
};

// Landed-tip percentiles published by the block engine, in SOL
struct TipFloor {
  double p25 = 0.0;
  double p50 = 0.0;
  double p75 = 0.0;
  double p95 = 0.0;
  double p99 = 0.0;
  double ema_p50 = 0.0;

  double At(TipPercentile p) const;
};

class TipFloorClient {
public:
  static constexpr const char* kDefaultEndpoint = "https://bundles.jito.wtf/api/v1/bundles/tip_floor";

  explicit TipFloorClient(HttpClient& http, std::string endpoint = kDefaultEndpoint, int timeout_ms = 2000);

  // Throws std::runtime_error on transport failure or an unexpected body
  TipFloor Fetch();
  static TipFloor Parse(const std::string& body);

  static double ComputeTip(const TipFloor& floor, const DynamicTipConfig& cfg);
  // min_tip when disabled, otherwise a fresh fetch through ComputeTip
  double OptimalTip(const DynamicTipConfig& cfg);
  // Pushes OptimalTip into every entry for direction; returns the tip applied
  double ApplyTo(FeeStrategyStore& store, TradeDirection direction, const DynamicTipConfig& cfg);

private:
  HttpClient& http_;
  std::string endpoint_;
  int timeout_ms_;
};
