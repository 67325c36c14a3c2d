#pragma once

#include "Module.h"
#include "ResultOrError.hpp"
#include "Types.hpp"

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace hx {

/**
 * Hash-linked chain of blocks with account balances and the pending
 * transaction buffer.
 *
 * Single writer: every mutation takes the ledger mutex. Balances only change
 * through applyBalances() after a block has been appended, or through
 * credit() for rewards and slashed stake.
 */
class Ledger : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  struct Transaction {
    std::string sender;
    std::string recipient;
    int64_t amount{ 0 };
    int64_t timestamp{ 0 };
    std::string payload;   // quadrit-encoded
    std::string signature; // not part of the identity

    template <typename Archive> void serialize(Archive &ar) {
      ar & sender & recipient & amount & timestamp & payload & signature;
    }

    /** Stores raw bytes as a quadrit payload */
    void setData(const std::string &data);
    /** Strict decode of the quadrit payload */
    Roe<std::string> getData() const;

    std::string getHash() const;
    nlohmann::json toJson() const;
  };

  struct Block {
    uint64_t index{ 0 };
    int64_t timestamp{ 0 };
    std::vector<Transaction> transactions;
    std::string previousHash;
    std::string proposalHash;
    consensus::CoherenceProof proof;
    std::vector<consensus::Attestation> attestations; // sorted by attesterId

    template <typename Archive> void serialize(Archive &ar) {
      ar & index & timestamp & transactions & previousHash & proposalHash &
          proof & attestations;
    }

    std::string computeHash() const;
    std::string ltsToString() const;
    bool ltsFromString(const std::string &str);
    nlohmann::json toJson() const;
  };

  /**
   * Block plus its own hash
   */
  struct ChainNode {
    Block block;
    std::string hash;

    template <typename Archive> void serialize(Archive &ar) {
      ar & block & hash;
    }

    nlohmann::json toJson() const;
  };

  /**
   * Everything needed to resume a ledger
   */
  struct State {
    std::vector<ChainNode> chain;
    std::map<std::string, int64_t> balances;
    std::vector<Transaction> pending;

    template <typename Archive> void serialize(Archive &ar) {
      ar & chain & balances & pending;
    }
  };

  struct Config {
    std::string issuanceSender{ "network" };
    int64_t genesisTime{ 0 };
  };

  static constexpr int32_t E_INVALID_TRANSACTION = 1;
  static constexpr int32_t E_INSUFFICIENT_FUNDS = 2;
  static constexpr int32_t E_PREVIOUS_HASH = 3;
  static constexpr int32_t E_INTEGRITY = 4;
  static constexpr int32_t E_INVALID_AMOUNT = 5;
  static constexpr int32_t E_NOT_FOUND = 6;

  using TxVerifier = std::function<bool(const Transaction &)>;

  static const std::string GENESIS_ANCHOR;

  Ledger();
  ~Ledger() override = default;

  /**
   * Reset to a chain holding only the genesis block; balances and pending
   * transactions are cleared.
   */
  void init(const Config &config);

  /**
   * Optional signature check applied by addTransaction()
   */
  void setVerifier(TxVerifier verifier);

  // ----- accessors -----
  const Config &getConfig() const { return config_; }
  size_t getChainLength() const;
  ChainNode getLastBlock() const;
  std::string getLastHash() const;
  Roe<ChainNode> getBlock(uint64_t index) const;
  std::vector<ChainNode> getChain() const;
  int64_t getBalance(const std::string &account) const;
  std::map<std::string, int64_t> getBalances() const;
  /** Sum of all balances, saturating at INT64_MAX */
  int64_t getTotalSupply() const;
  /** Balance minus outgoing amounts still waiting in the buffer */
  int64_t getSpendable(const std::string &account) const;
  std::vector<Transaction> getPending() const;
  size_t getPendingCount() const;

  // ----- methods -----
  /**
   * Validate and buffer a transaction.
   * Rejects empty parties, non-positive amounts, failed verification and,
   * unless sent by the issuance account, amounts above the spendable balance.
   * Issuance is bounded so that the total supply plus every pending issuance
   * stays representable; with non-negative balances no single balance can
   * overflow either.
   */
  Roe<void> addTransaction(const Transaction &tx);

  /**
   * Move a prefix of the buffer (all of it when maxCount is 0) into the
   * in-flight batch of the current round.
   */
  std::vector<Transaction> takePending(size_t maxCount);

  /**
   * Put the in-flight batch back at the front of the buffer, in order
   */
  void returnPending();

  /**
   * Forget the in-flight batch after it was committed
   */
  void clearInFlight();

  /**
   * Replay the in-flight batch in order against the current balances and
   * drop every transaction that no longer applies. Dropped transactions are
   * appended to rejected; the remaining batch is returned.
   */
  std::vector<Transaction> pruneInFlight(std::vector<Transaction> &rejected);

  Roe<ChainNode> appendBlock(const std::string &proposalHash,
                             const consensus::CoherenceProof &proof,
                             std::vector<consensus::Attestation> attestations,
                             const std::vector<Transaction> &transactions,
                             const std::string &previousHash,
                             int64_t timestamp);

  /**
   * Dry run of applyBalances()
   */
  Roe<void> checkBalances(const std::vector<Transaction> &transactions) const;

  /**
   * Debit senders (except issuance) and credit recipients. Either every
   * transaction applies or nothing changes.
   */
  Roe<void> applyBalances(const std::vector<Transaction> &transactions);

  /**
   * Mint amount into account. Fails when the total supply, pending issuance
   * included, would overflow.
   */
  Roe<void> credit(const std::string &account, int64_t amount);

  /**
   * Recompute every block hash and previous-hash link, then check that no
   * balance is negative and that the total supply is representable
   */
  Roe<void> verifyIntegrity() const;
  std::optional<uint64_t> findFirstBrokenBlock() const;

  State exportState() const;
  /**
   * Replace chain, balances and buffer. No integrity check is made here;
   * callers run verifyIntegrity() afterwards.
   */
  void restore(const State &state);

private:
  ChainNode createGenesisBlock() const;
  bool isIssuance(const Transaction &tx) const;
  int64_t pendingOutgoing(const std::string &account) const;
  static bool sumBalances(const std::map<std::string, int64_t> &balances,
                          int64_t &total);
  int64_t supplyHeadroom() const;
  Roe<void> applyTransaction(std::map<std::string, int64_t> &balances,
                             const Transaction &tx) const;
  std::optional<uint64_t> findFirstBrokenBlockLocked() const;
  Roe<std::map<std::string, int64_t>>
  computeBalances(const std::vector<Transaction> &transactions) const;

  Config config_;
  TxVerifier verifier_;
  std::vector<ChainNode> chain_;
  std::map<std::string, int64_t> balances_;
  std::deque<Transaction> pending_;
  std::vector<Transaction> inFlight_;
  mutable std::mutex mutex_;
};

} // namespace hx
