#include "swqos/provider_kind.hpp"
#include <algorithm>
#include <cctype>

const char* ProviderKindName(ProviderKind kind) {
  switch (kind) {
    case ProviderKind::Jito: return "Jito";
    case ProviderKind::NextBlock: return "NextBlock";
    case ProviderKind::ZeroSlot: return "ZeroSlot";
    case ProviderKind::Temporal: return "Temporal";
    case ProviderKind::Bloxroute: return "Bloxroute";
    case ProviderKind::Node1: return "Node1";
    case ProviderKind::FlashBlock: return "FlashBlock";
    case ProviderKind::BlockRazor: return "BlockRazor";
    case ProviderKind::Astralane: return "Astralane";
    case ProviderKind::Stellium: return "Stellium";
    case ProviderKind::Lightspeed: return "Lightspeed";
    case ProviderKind::Soyas: return "Soyas";
    case ProviderKind::Speedlanding: return "Speedlanding";
    case ProviderKind::Default: return "Default";
  }
  return "Unknown";
}

const std::vector<ProviderKind>& AllProviderKinds() {
  static const std::vector<ProviderKind> kinds{
    ProviderKind::Jito, ProviderKind::NextBlock, ProviderKind::ZeroSlot, ProviderKind::Temporal,
    ProviderKind::Bloxroute, ProviderKind::Node1, ProviderKind::FlashBlock, ProviderKind::BlockRazor,
    ProviderKind::Astralane, ProviderKind::Stellium, ProviderKind::Lightspeed, ProviderKind::Soyas,
    ProviderKind::Speedlanding, ProviderKind::Default,
  };
  return kinds;
}

static std::string Lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return s;
}

std::optional<ProviderKind> ParseProviderKind(const std::string& name) {
  const std::string wanted = Lower(name);
  for (ProviderKind k : AllProviderKinds()) {
    if (Lower(ProviderKindName(k)) == wanted) return k;
  }
  if (wanted == "rpc") return ProviderKind::Default;
  return std::nullopt;
}
