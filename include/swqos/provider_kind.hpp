#pragma once
#include <optional>
#include <string>
#include <vector>

// Closed set of relay services. Default is the plain ledger RPC path with no tip.
enum class ProviderKind {
  Jito,
  NextBlock,
  ZeroSlot,
  Temporal,
  Bloxroute,
  Node1,
  FlashBlock,
  BlockRazor,
  Astralane,
  Stellium,
  Lightspeed,
  Soyas,
  Speedlanding,
  Default
};

const char* ProviderKindName(ProviderKind kind);
// Case-insensitive; accepts the names returned by ProviderKindName
std::optional<ProviderKind> ParseProviderKind(const std::string& name);
const std::vector<ProviderKind>& AllProviderKinds();
