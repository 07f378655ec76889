#pragma once
#include <optional>
#include <string>
#include <vector>

enum class CommitmentLevel { Processed, Confirmed, Finalized };

const char* CommitmentLevelName(CommitmentLevel level);
std::optional<CommitmentLevel> ParseCommitmentLevel(const std::string& name);

struct SignatureStatus {
  std::optional<CommitmentLevel> confirmation;
  std::optional<std::string> err; // on-chain execution error, serialized

  bool Reached(CommitmentLevel wanted) const {
    return confirmation && static_cast<int>(*confirmation) >= static_cast<int>(wanted);
  }
};

// Read and submit interface to the ledger node. Implementations throw on
// transport or protocol failure.
class LedgerClient {
public:
  virtual ~LedgerClient() = default;
  // One entry per requested signature, nullopt when the node has not seen it
  virtual std::vector<std::optional<SignatureStatus>> GetSignatureStatuses(const std::vector<std::string>& signatures) = 0;
  // Base58 blockhash
  virtual std::string GetLatestBlockhash() = 0;
  // Raw account data, nullopt when the account does not exist
  virtual std::optional<std::vector<unsigned char>> GetAccountData(const std::string& address) = 0;
  // Returns the signature reported by the node
  virtual std::string SendTransaction(const std::string& base64_tx) = 0;
};
