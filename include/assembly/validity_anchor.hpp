#pragma once
#include "encoding/tx_codec.hpp"

enum class AnchorMode { RecentCheckpoint, DurableNonce };

// What keeps a transaction valid: a recent checkpoint hash that expires on its
// own, or a durable nonce that must be advanced by the transaction itself.
// The caller picks the mode for every call.
struct ValidityAnchor {
  AnchorMode mode = AnchorMode::RecentCheckpoint;
  Blockhash hash;             // checkpoint hash or current nonce value
  PublicKey nonce_account;    // durable mode only
  PublicKey nonce_authority;  // durable mode only

  static ValidityAnchor UsingRecentCheckpoint(const Blockhash& blockhash) {
    ValidityAnchor a;
    a.mode = AnchorMode::RecentCheckpoint;
    a.hash = blockhash;
    return a;
  }

  static ValidityAnchor UsingDurableAnchor(const PublicKey& nonce_account, const PublicKey& authority, const Blockhash& nonce_value) {
    ValidityAnchor a;
    a.mode = AnchorMode::DurableNonce;
    a.hash = nonce_value;
    a.nonce_account = nonce_account;
    a.nonce_authority = authority;
    return a;
  }

  bool IsDurable() const { return mode == AnchorMode::DurableNonce; }
};
