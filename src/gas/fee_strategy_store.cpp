#include "gas/fee_strategy_store.hpp"
#include "common/logger.hpp"
#include "telemetry/structured_logger.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <tuple>

const char* TradeDirectionName(TradeDirection direction) {
  switch (direction) {
    case TradeDirection::Buy: return "Buy";
    case TradeDirection::Sell: return "Sell";
    case TradeDirection::Create: return "Create";
    case TradeDirection::CreateAndBuy: return "CreateAndBuy";
  }
  return "Unknown";
}

const char* StrategyKindName(StrategyKind kind) {
  switch (kind) {
    case StrategyKind::Normal: return "Normal";
    case StrategyKind::LowTipHighPriorityFee: return "LowTipHighPriorityFee";
    case StrategyKind::HighTipLowPriorityFee: return "HighTipLowPriorityFee";
  }
  return "Unknown";
}

bool IsBuySide(TradeDirection direction) {
  return direction == TradeDirection::Buy || direction == TradeDirection::CreateAndBuy;
}

bool StrategyKey::operator<(const StrategyKey& o) const {
  return std::tie(provider, direction, kind) < std::tie(o.provider, o.direction, o.kind);
}

static void EmitUpdate(const char* op, TradeDirection direction, const std::optional<ProviderKind>& provider) {
  nlohmann::json j = {{"op", op}, {"direction", TradeDirectionName(direction)}};
  if (provider) j["provider"] = ProviderKindName(*provider);
  StructuredLogger::Instance().LogEvent("strategy_update", j);
}

static void PurgeRace(FeeStrategyStore::Table& t, ProviderKind p, TradeDirection d) {
  t.erase(StrategyKey{p, d, StrategyKind::LowTipHighPriorityFee});
  t.erase(StrategyKey{p, d, StrategyKind::HighTipLowPriorityFee});
}

FeeStrategyStore::FeeStrategyStore(std::vector<ProviderKind> providers)
  : providers_(std::move(providers)), table_(std::make_shared<const Table>()) {}

template <typename Fn>
void FeeStrategyStore::Mutate(Fn&& edit) {
  std::shared_ptr<const Table> current = std::atomic_load(&table_);
  for (;;) {
    auto next = std::make_shared<Table>(*current);
    edit(*next);
    std::shared_ptr<const Table> published = std::move(next);
    // on failure current is reloaded with the winner's table and the edit is replayed on it
    if (std::atomic_compare_exchange_weak(&table_, &current, published)) break;
  }
  version_.fetch_add(1, std::memory_order_relaxed);
}

void FeeStrategyStore::SetGlobal(TradeDirection direction, uint32_t cu_limit, uint64_t cu_price,
                                 double buy_tip, double sell_tip, size_t size_limit) {
  const double tip = direction == TradeDirection::Sell ? sell_tip : buy_tip;
  Mutate([&](Table& t) {
    for (ProviderKind p : providers_) {
      if (p == ProviderKind::Default) continue;
      PurgeRace(t, p, direction);
      t[StrategyKey{p, direction, StrategyKind::Normal}] = FeeParameters{cu_limit, cu_price, tip, size_limit};
    }
    PurgeRace(t, ProviderKind::Default, direction);
    t[StrategyKey{ProviderKind::Default, direction, StrategyKind::Normal}] = FeeParameters{cu_limit, cu_price, 0.0, size_limit};
  });
  Logger::Info(std::string("Fee strategy: global ") + TradeDirectionName(direction) +
               " cu_limit=" + std::to_string(cu_limit) + " cu_price=" + std::to_string(cu_price) +
               " tip=" + std::to_string(tip));
  EmitUpdate("set_global", direction, std::nullopt);
}

void FeeStrategyStore::SetNormal(ProviderKind provider, TradeDirection direction, const FeeParameters& params) {
  Mutate([&](Table& t) {
    PurgeRace(t, provider, direction);
    t[StrategyKey{provider, direction, StrategyKind::Normal}] = params;
  });
  EmitUpdate("set_normal", direction, provider);
}

void FeeStrategyStore::SetRace(ProviderKind provider, TradeDirection direction, uint32_t cu_limit,
                               uint64_t low_cu_price, uint64_t high_cu_price,
                               double low_tip, double high_tip, size_t size_limit) {
  Mutate([&](Table& t) {
    t.erase(StrategyKey{provider, direction, StrategyKind::Normal});
    t[StrategyKey{provider, direction, StrategyKind::LowTipHighPriorityFee}] =
      FeeParameters{cu_limit, high_cu_price, low_tip, size_limit};
    t[StrategyKey{provider, direction, StrategyKind::HighTipLowPriorityFee}] =
      FeeParameters{cu_limit, low_cu_price, high_tip, size_limit};
  });
  EmitUpdate("set_race", direction, provider);
}

void FeeStrategyStore::UpdateTip(TradeDirection direction, double tip) {
  Mutate([&](Table& t) {
    for (auto& kv : t) if (kv.first.direction == direction) kv.second.tip = tip;
  });
  EmitUpdate("update_tip", direction, std::nullopt);
}

void FeeStrategyStore::UpdateCuPrice(TradeDirection direction, uint64_t cu_price) {
  Mutate([&](Table& t) {
    for (auto& kv : t) if (kv.first.direction == direction) kv.second.cu_price = cu_price;
  });
  EmitUpdate("update_cu_price", direction, std::nullopt);
}

std::vector<StrategyEntry> FeeStrategyStore::Lookup(const Table& table, ProviderKind provider, TradeDirection direction) {
  std::vector<StrategyEntry> out;
  for (StrategyKind kind : {StrategyKind::Normal, StrategyKind::LowTipHighPriorityFee, StrategyKind::HighTipLowPriorityFee}) {
    auto it = table.find(StrategyKey{provider, direction, kind});
    if (it != table.end()) out.push_back(StrategyEntry{provider, direction, kind, it->second});
  }
  return out;
}

std::vector<StrategyEntry> FeeStrategyStore::Lookup(ProviderKind provider, TradeDirection direction) const {
  return Lookup(*Snapshot(), provider, direction);
}

bool FeeStrategyStore::Delete(ProviderKind provider, TradeDirection direction, StrategyKind kind) {
  bool removed = false;
  Mutate([&](Table& t) { removed = t.erase(StrategyKey{provider, direction, kind}) > 0; });
  EmitUpdate("delete", direction, provider);
  return removed;
}

size_t FeeStrategyStore::DeleteAll(ProviderKind provider, TradeDirection direction) {
  size_t removed = 0;
  Mutate([&](Table& t) {
    removed = t.erase(StrategyKey{provider, direction, StrategyKind::Normal});
    removed += t.erase(StrategyKey{provider, direction, StrategyKind::LowTipHighPriorityFee});
    removed += t.erase(StrategyKey{provider, direction, StrategyKind::HighTipLowPriorityFee});
  });
  EmitUpdate("delete_all", direction, provider);
  return removed;
}

void FeeStrategyStore::Clear() {
  std::atomic_store(&table_, std::shared_ptr<const Table>(std::make_shared<const Table>()));
  version_.fetch_add(1, std::memory_order_relaxed);
  StructuredLogger::Instance().LogEvent("strategy_update", nlohmann::json{{"op", "clear"}});
}

std::shared_ptr<const FeeStrategyStore::Table> FeeStrategyStore::Snapshot() const {
  return std::atomic_load(&table_);
}

std::vector<StrategyEntry> FeeStrategyStore::Entries() const {
  auto snap = Snapshot();
  std::vector<StrategyEntry> out;
  out.reserve(snap->size());
  for (const auto& kv : *snap) {
    out.push_back(StrategyEntry{kv.first.provider, kv.first.direction, kv.first.kind, kv.second});
  }
  return out;
}

uint64_t FeeStrategyStore::Version() const { return version_.load(std::memory_order_relaxed); }
