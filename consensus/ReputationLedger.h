#pragma once

#include "Ledger.h"
#include "Module.h"
#include "ResultOrError.hpp"
#include "SoftwareRegistry.h"
#include "Types.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace hx {
namespace consensus {

/**
 * Per-node stake and reputation.
 *
 * Reputation is the only long-term memory of misbehaviour: it drops on every
 * slash and only comes back through reward() or an explicit
 * rehabilitate(). Each node's entry is updated under its own mutex, so a
 * slash changes stake, treasury and reputation together or not at all.
 */
class ReputationLedger : public Module {
public:
  struct Config {
    int64_t slashPenalty{ 100 };
    double slashReputationDecrement{ 0.5 };
    std::string treasuryAccount{ "treasury" };
  };

  enum class SlashReason : uint8_t {
    NON_COMPLIANT_PROPOSER = 0,
    WRONG_CLAIM = 1,
    OMISSION = 2,
    TIMEOUT = 3,
  };

  struct Entry {
    int64_t stake{ 0 };
    double reputation{ 0 };

    template <typename Archive> void serialize(Archive &ar) {
      ar & stake & reputation;
    }
  };

  struct SlashRecord {
    std::string nodeId;
    SlashReason reason{ SlashReason::OMISSION };
    uint64_t round{ 0 };
    int64_t slashedAmount{ 0 };
    int64_t stakeAfter{ 0 };
    double reputationBefore{ 0 };
    double reputationAfter{ 0 };

    template <typename Archive> void serialize(Archive &ar) {
      ar & nodeId & reason & round & slashedAmount & stakeAfter &
          reputationBefore & reputationAfter;
    }
  };

  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr int32_t E_UNKNOWN_NODE = 1;
  static constexpr int32_t E_INVALID_AMOUNT = 2;
  static constexpr int32_t E_CREDIT_FAILED = 3;
  static constexpr int32_t E_DUPLICATE_NODE = 4;

  static const char *reasonToString(SlashReason reason);

  ReputationLedger(Ledger &ledger, const SoftwareRegistry &registry);
  ~ReputationLedger() override = default;

  void setConfig(const Config &config) { config_ = config; }
  const Config &getConfig() const { return config_; }

  Roe<void> registerNode(const std::string &nodeId, int64_t stake,
                         double reputation);
  bool hasNode(const std::string &nodeId) const;

  Roe<Entry> getEntry(const std::string &nodeId) const;
  int64_t getStake(const std::string &nodeId) const;
  double getReputation(const std::string &nodeId) const;
  std::map<std::string, Entry> getEntries() const;

  /**
   * Take min(stake, penalty) into the treasury and lower the reputation by
   * the configured decrement, clamped at 0. A node without stake still loses
   * reputation.
   */
  Roe<SlashRecord> slash(const std::string &nodeId, SlashReason reason,
                         uint64_t round);
  Roe<SlashRecord> slash(const std::string &nodeId, int64_t penalty,
                         SlashReason reason, uint64_t round);

  /**
   * Credit amount to the node's account and raise its reputation, clamped
   * at 1.
   */
  Roe<void> reward(const std::string &nodeId, int64_t amount,
                   double reputationIncrement);

  /**
   * Reset reputation explicitly (clamped to [0,1])
   */
  Roe<void> rehabilitate(const std::string &nodeId, double reputation);

  /**
   * Reputation at or above floor and registry-compliant
   */
  bool eligible(const Node &node, double floor) const;

  std::vector<SlashRecord> getSlashHistory() const;
  size_t getSlashEventCount() const;
  /** Distinct nodes slashed for claiming a wrong proof hash */
  std::set<std::string> getMaliciousNodes() const;
  double getMeanReputation() const;

  void restore(const std::map<std::string, Entry> &entries,
               const std::vector<SlashRecord> &history);

private:
  struct Account {
    Entry entry;
    std::mutex mutex;
  };

  std::shared_ptr<Account> findAccount(const std::string &nodeId) const;
  static double clamp(double reputation);

  Ledger &ledger_;
  const SoftwareRegistry &registry_;
  Config config_;
  std::map<std::string, std::shared_ptr<Account>> accounts_;
  mutable std::mutex accountsMutex_;
  std::vector<SlashRecord> history_;
  mutable std::mutex historyMutex_;
};

} // namespace consensus
} // namespace hx
