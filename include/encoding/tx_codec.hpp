#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <vector>

using Bytes = std::vector<unsigned char>;

struct PublicKey {
  std::array<unsigned char, 32> bytes{};

  // Throws std::invalid_argument unless the text decodes to exactly 32 bytes
  static PublicKey FromBase58(const std::string& text);
  std::string ToBase58() const;
  bool IsZero() const;
  bool operator==(const PublicKey& other) const { return bytes == other.bytes; }
  bool operator!=(const PublicKey& other) const { return bytes != other.bytes; }
  bool operator<(const PublicKey& other) const { return bytes < other.bytes; }
};

// Recent checkpoint or durable nonce value. Same 32-byte base58 form as a key.
using Blockhash = PublicKey;
using Signature = std::array<unsigned char, 64>;

struct AccountMeta {
  PublicKey pubkey;
  bool is_signer = false;
  bool is_writable = false;
};

struct Instruction {
  PublicKey program_id;
  std::vector<AccountMeta> accounts;
  Bytes data;
};

struct MessageHeader {
  uint8_t num_required_signatures = 0;
  uint8_t num_readonly_signed = 0;
  uint8_t num_readonly_unsigned = 0;
};

struct CompiledInstruction {
  uint8_t program_index = 0;
  std::vector<uint8_t> account_indices;
  Bytes data;
};

struct Message {
  MessageHeader header;
  std::vector<PublicKey> account_keys;
  Blockhash recent_blockhash;
  std::vector<CompiledInstruction> instructions;
};

struct DecodedTransaction {
  std::vector<Signature> signatures;
  Message message;
  Bytes message_bytes;
};

// Legacy transaction wire format: compact-u16 prefixed arrays, account table
// ordered writable signers, readonly signers, writable, readonly.
namespace TxCodec {
  constexpr size_t kMaxPacketSize = 1232;

  void AppendShortVec(Bytes& out, size_t value);
  size_t ReadShortVec(const Bytes& in, size_t& offset);

  Message CompileMessage(const PublicKey& payer, const std::vector<Instruction>& instructions, const Blockhash& blockhash);
  void EncodeMessage(const Message& msg, Bytes& out);
  void EncodeTransaction(const std::vector<Signature>& signatures, const Bytes& message, Bytes& out);

  DecodedTransaction DecodeTransaction(const Bytes& wire);
  Instruction DecompileInstruction(const Message& msg, size_t index);
}
