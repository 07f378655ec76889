#include "encoding/tx_codec.hpp"
#include "common/errors.hpp"
#include "utils/text_encoding.hpp"
#include <algorithm>
#include <stdexcept>

namespace {
  struct KeyFlags {
    PublicKey key;
    bool is_signer = false;
    bool is_writable = false;
  };

  void Upsert(std::vector<KeyFlags>& keys, const PublicKey& key, bool signer, bool writable) {
    for (auto& k : keys) {
      if (k.key == key) {
        k.is_signer = k.is_signer || signer;
        k.is_writable = k.is_writable || writable;
        return;
      }
    }
    keys.push_back(KeyFlags{key, signer, writable});
  }

  int Group(const KeyFlags& k) {
    if (k.is_signer) return k.is_writable ? 0 : 1;
    return k.is_writable ? 2 : 3;
  }

  void Require(const Bytes& in, size_t offset, size_t n) {
    if (offset + n > in.size()) throw std::runtime_error("truncated transaction");
  }

  void AppendBytes(Bytes& out, const unsigned char* p, size_t n) { out.insert(out.end(), p, p + n); }
}

PublicKey PublicKey::FromBase58(const std::string& text) {
  auto raw = TextEncoding::DecodeBase58(text);
  if (raw.size() != 32) throw std::invalid_argument("not a 32-byte key: " + text);
  PublicKey key;
  std::copy(raw.begin(), raw.end(), key.bytes.begin());
  return key;
}

std::string PublicKey::ToBase58() const { return TextEncoding::EncodeBase58(bytes.data(), bytes.size()); }

bool PublicKey::IsZero() const {
  return std::all_of(bytes.begin(), bytes.end(), [](unsigned char b){ return b == 0; });
}

namespace TxCodec {
  void AppendShortVec(Bytes& out, size_t value) {
    if (value > 0xFFFF) throw EngineError(ErrorKind::SerializationFailure, "compact-u16 overflow");
    do {
      unsigned char elem = static_cast<unsigned char>(value & 0x7F);
      value >>= 7;
      if (value != 0) elem |= 0x80;
      out.push_back(elem);
    } while (value != 0);
  }

  size_t ReadShortVec(const Bytes& in, size_t& offset) {
    size_t value = 0;
    for (int shift = 0, n = 0; n < 3; ++n, shift += 7) {
      Require(in, offset, 1);
      unsigned char elem = in[offset++];
      value |= static_cast<size_t>(elem & 0x7F) << shift;
      if ((elem & 0x80) == 0) return value;
    }
    throw std::runtime_error("compact-u16 longer than 3 bytes");
  }

  Message CompileMessage(const PublicKey& payer, const std::vector<Instruction>& instructions, const Blockhash& blockhash) {
    std::vector<KeyFlags> keys;
    keys.push_back(KeyFlags{payer, true, true});
    for (const auto& ix : instructions) {
      for (const auto& meta : ix.accounts) Upsert(keys, meta.pubkey, meta.is_signer, meta.is_writable);
      Upsert(keys, ix.program_id, false, false);
    }
    // payer stays at index 0, the rest keeps first-seen order within each group
    std::stable_sort(keys.begin() + 1, keys.end(), [](const KeyFlags& a, const KeyFlags& b){ return Group(a) < Group(b); });
    if (keys.size() > 256) throw EngineError(ErrorKind::SerializationFailure, "too many accounts: " + std::to_string(keys.size()));

    Message msg;
    msg.recent_blockhash = blockhash;
    size_t signers = 0, ro_signed = 0, ro_unsigned = 0;
    for (const auto& k : keys) {
      msg.account_keys.push_back(k.key);
      if (k.is_signer) { ++signers; if (!k.is_writable) ++ro_signed; }
      else if (!k.is_writable) ++ro_unsigned;
    }
    msg.header.num_required_signatures = static_cast<uint8_t>(signers);
    msg.header.num_readonly_signed = static_cast<uint8_t>(ro_signed);
    msg.header.num_readonly_unsigned = static_cast<uint8_t>(ro_unsigned);

    auto index_of = [&](const PublicKey& key) {
      auto it = std::find(msg.account_keys.begin(), msg.account_keys.end(), key);
      return static_cast<uint8_t>(it - msg.account_keys.begin());
    };
    for (const auto& ix : instructions) {
      CompiledInstruction ci;
      ci.program_index = index_of(ix.program_id);
      for (const auto& meta : ix.accounts) ci.account_indices.push_back(index_of(meta.pubkey));
      ci.data = ix.data;
      msg.instructions.push_back(std::move(ci));
    }
    return msg;
  }

  void EncodeMessage(const Message& msg, Bytes& out) {
    out.push_back(msg.header.num_required_signatures);
    out.push_back(msg.header.num_readonly_signed);
    out.push_back(msg.header.num_readonly_unsigned);
    AppendShortVec(out, msg.account_keys.size());
    for (const auto& k : msg.account_keys) AppendBytes(out, k.bytes.data(), k.bytes.size());
    AppendBytes(out, msg.recent_blockhash.bytes.data(), msg.recent_blockhash.bytes.size());
    AppendShortVec(out, msg.instructions.size());
    for (const auto& ci : msg.instructions) {
      out.push_back(ci.program_index);
      AppendShortVec(out, ci.account_indices.size());
      out.insert(out.end(), ci.account_indices.begin(), ci.account_indices.end());
      AppendShortVec(out, ci.data.size());
      out.insert(out.end(), ci.data.begin(), ci.data.end());
    }
  }

  void EncodeTransaction(const std::vector<Signature>& signatures, const Bytes& message, Bytes& out) {
    AppendShortVec(out, signatures.size());
    for (const auto& s : signatures) AppendBytes(out, s.data(), s.size());
    out.insert(out.end(), message.begin(), message.end());
  }

  DecodedTransaction DecodeTransaction(const Bytes& wire) {
    DecodedTransaction tx;
    size_t off = 0;
    size_t nsig = ReadShortVec(wire, off);
    for (size_t i = 0; i < nsig; ++i) {
      Require(wire, off, 64);
      Signature s;
      std::copy(wire.begin() + off, wire.begin() + off + 64, s.begin());
      tx.signatures.push_back(s);
      off += 64;
    }
    tx.message_bytes.assign(wire.begin() + off, wire.end());

    Message& msg = tx.message;
    Require(wire, off, 3);
    msg.header.num_required_signatures = wire[off++];
    msg.header.num_readonly_signed = wire[off++];
    msg.header.num_readonly_unsigned = wire[off++];
    size_t nkeys = ReadShortVec(wire, off);
    for (size_t i = 0; i < nkeys; ++i) {
      Require(wire, off, 32);
      PublicKey k;
      std::copy(wire.begin() + off, wire.begin() + off + 32, k.bytes.begin());
      msg.account_keys.push_back(k);
      off += 32;
    }
    Require(wire, off, 32);
    std::copy(wire.begin() + off, wire.begin() + off + 32, msg.recent_blockhash.bytes.begin());
    off += 32;
    size_t nix = ReadShortVec(wire, off);
    for (size_t i = 0; i < nix; ++i) {
      CompiledInstruction ci;
      Require(wire, off, 1);
      ci.program_index = wire[off++];
      size_t nacc = ReadShortVec(wire, off);
      Require(wire, off, nacc);
      ci.account_indices.assign(wire.begin() + off, wire.begin() + off + nacc);
      off += nacc;
      size_t ndata = ReadShortVec(wire, off);
      Require(wire, off, ndata);
      ci.data.assign(wire.begin() + off, wire.begin() + off + ndata);
      off += ndata;
      msg.instructions.push_back(std::move(ci));
    }
    if (off != wire.size()) throw std::runtime_error("trailing bytes after transaction");
    return tx;
  }

  Instruction DecompileInstruction(const Message& msg, size_t index) {
    const auto& ci = msg.instructions.at(index);
    const size_t nkeys = msg.account_keys.size();
    const size_t nsig = msg.header.num_required_signatures;
    auto writable = [&](size_t i) {
      if (i < nsig) return i < nsig - msg.header.num_readonly_signed;
      return i < nkeys - msg.header.num_readonly_unsigned;
    };
    Instruction ix;
    ix.program_id = msg.account_keys.at(ci.program_index);
    for (uint8_t i : ci.account_indices) {
      ix.accounts.push_back(AccountMeta{msg.account_keys.at(i), i < nsig, writable(i)});
    }
    ix.data = ci.data;
    return ix;
  }
}
