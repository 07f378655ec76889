#pragma once
#include "swqos/provider_kind.hpp"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <vector>

enum class TradeDirection { Buy, Sell, Create, CreateAndBuy };
enum class StrategyKind { Normal, LowTipHighPriorityFee, HighTipLowPriorityFee };

const char* TradeDirectionName(TradeDirection direction);
const char* StrategyKindName(StrategyKind kind);
// Buy and CreateAndBuy spend the payer's funds on entry
bool IsBuySide(TradeDirection direction);

struct FeeParameters {
  uint32_t cu_limit = 0;
  uint64_t cu_price = 0; // micro-lamports per compute unit
  double tip = 0.0;      // SOL
  size_t max_tx_size = 0;

  bool operator==(const FeeParameters& o) const {
    return cu_limit == o.cu_limit && cu_price == o.cu_price && tip == o.tip && max_tx_size == o.max_tx_size;
  }
};

struct StrategyKey {
  ProviderKind provider;
  TradeDirection direction;
  StrategyKind kind;

  bool operator<(const StrategyKey& o) const;
};

struct StrategyEntry {
  ProviderKind provider;
  TradeDirection direction;
  StrategyKind kind;
  FeeParameters params;
};

// Fee table keyed by (provider, direction, kind). For one (provider, direction)
// it holds either a Normal entry or the Low/High race pair, never both.
//
// The table is immutable once published. Writers copy it, edit the copy and
// swap the shared pointer with compare-exchange, retrying if another writer got
// there first. Readers load the pointer and never take a lock.
class FeeStrategyStore {
public:
  using Table = std::map<StrategyKey, FeeParameters>;

  // providers: the kinds SetGlobal installs entries for
  explicit FeeStrategyStore(std::vector<ProviderKind> providers = AllProviderKinds());

  void SetGlobal(TradeDirection direction, uint32_t cu_limit, uint64_t cu_price,
                 double buy_tip, double sell_tip, size_t size_limit);
  void SetNormal(ProviderKind provider, TradeDirection direction, const FeeParameters& params);
  void SetRace(ProviderKind provider, TradeDirection direction, uint32_t cu_limit,
               uint64_t low_cu_price, uint64_t high_cu_price,
               double low_tip, double high_tip, size_t size_limit);
  void UpdateTip(TradeDirection direction, double tip);
  void UpdateCuPrice(TradeDirection direction, uint64_t cu_price);

  std::vector<StrategyEntry> Lookup(ProviderKind provider, TradeDirection direction) const;
  static std::vector<StrategyEntry> Lookup(const Table& table, ProviderKind provider, TradeDirection direction);

  bool Delete(ProviderKind provider, TradeDirection direction, StrategyKind kind);
  size_t DeleteAll(ProviderKind provider, TradeDirection direction);
  void Clear();

  std::shared_ptr<const Table> Snapshot() const;
  std::vector<StrategyEntry> Entries() const;
  // Number of successful table swaps since construction
  uint64_t Version() const;

private:
  template <typename Fn>
  void Mutate(Fn&& edit);

  std::vector<ProviderKind> providers_;
  std::shared_ptr<const Table> table_;
  std::atomic<uint64_t> version_{0};
};
