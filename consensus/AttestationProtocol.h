#pragma once

#include "FragmentStore.h"
#include "Ledger.h"
#include "Module.h"
#include "ReputationLedger.h"
#include "ResultOrError.hpp"
#include "Signer.h"
#include "SoftwareRegistry.h"
#include "Types.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace hx {
namespace consensus {

/**
 * One consensus round per runRound() call:
 *
 *   IDLE -> PROPOSAL_ISSUED -> ATTESTATIONS_COLLECTING -> QUORUM_EVALUATED
 *        -> COMMITTED | ABORTED
 *
 * or SKIPPED when the transaction buffer is empty.
 *
 * The proposer of round r is validators[r % validators.size()] where the
 * validators are the propose-capable nodes in roster order. Every eligible
 * attester recomputes the coherence proof on its own thread from the round
 * snapshot and signs what it believes; the round waits for all of them up
 * to the attestation timeout before evaluating quorum. Attesters are judged
 * against the plurality hash, which must also equal the coherence proof for
 * the block to commit.
 *
 * Batch transactions that no longer apply to the balances are dropped before
 * the proposal is built; a round left with nothing to propose aborts with
 * E_VALIDATION.
 */
class AttestationProtocol : public Module {
public:
  enum class State : uint8_t {
    IDLE = 0,
    PROPOSAL_ISSUED,
    ATTESTATIONS_COLLECTING,
    QUORUM_EVALUATED,
    COMMITTED,
    ABORTED,
    SKIPPED,
  };

  struct Config {
    double reputationFloor{ 0.5 };
    int64_t blockReward{ 100 };
    double proposerRewardShare{ 0.2 };
    double proposerReputationIncrement{ 0.05 };
    double attesterReputationIncrement{ 0.02 };
    size_t maxTransactionsPerBlock{ 0 }; // 0 = whole buffer
    uint64_t attestationTimeoutMs{ 2000 };
    bool slashOnTimeout{ false };
    uint32_t redundancy{ 3 };
  };

  struct Metrics {
    uint64_t committed{ 0 };
    uint64_t aborted{ 0 };
    uint64_t skipped{ 0 };

    template <typename Archive> void serialize(Archive &ar) {
      ar & committed & aborted & skipped;
    }
  };

  /**
   * Everything an attester needs to derive the round's proof
   */
  struct RoundContext {
    uint64_t round{ 0 };
    ProposalRecord proposal;
    CoherenceAnchors anchors;
    CoherenceProof proof;
  };

  struct RoundResult {
    uint64_t round{ 0 };
    State state{ State::IDLE };
    int32_t errorCode{ 0 };  // E_COMPLIANCE_FAILURE, E_CONSENSUS_ABORTED or E_VALIDATION
    std::string reason;
    std::string proposerId;
    std::string expectedProofHash;
    std::string winningHash;
    size_t eligibleCount{ 0 };
    size_t quorum{ 0 };
    size_t winningTally{ 0 };
    size_t transactionCount{ 0 };
    std::vector<std::string> agreeing;
    std::vector<std::string> disagreeing;
    std::vector<std::string> omitted;
    std::vector<std::string> timedOut;
    std::vector<std::string> slashed;
    std::vector<std::string> rejected; // hashes dropped from the buffer
    std::optional<Ledger::ChainNode> block;
  };

  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr int32_t E_NO_VALIDATORS = 1;
  static constexpr int32_t E_COMPLIANCE_FAILURE = 2;
  static constexpr int32_t E_CONSENSUS_ABORTED = 3;
  static constexpr int32_t E_LEDGER = 4;
  static constexpr int32_t E_UNKNOWN_NODE = 5;
  static constexpr int32_t E_INVALID_NODE = 6;
  static constexpr int32_t E_VALIDATION = 7;

  static const char *stateToString(State state);

  /**
   * Required matching attestations for n eligible attesters: floor(2n/3)+1
   */
  static size_t quorumFor(size_t eligibleCount);

  /**
   * Proof hash an attester of the given strategy claims for a round
   */
  static std::optional<std::string> claimFor(const Node &node,
                                             const RoundContext &context);

  AttestationProtocol(Ledger &ledger, SoftwareRegistry &registry,
                      ReputationLedger &reputation, FragmentStore &fragments,
                      std::shared_ptr<const Signer> signer);
  ~AttestationProtocol() override = default;

  void setConfig(const Config &config) { config_ = config; }
  const Config &getConfig() const { return config_; }

  // ----- roster -----
  Roe<void> addNode(const Node &node);
  Roe<Node> getNode(const std::string &nodeId) const;
  std::vector<Node> getNodes() const;
  std::vector<Node> getValidators() const;
  Roe<void> setOnline(const std::string &nodeId, bool online);
  bool isOnline(const std::string &nodeId) const;
  std::vector<std::string> getOfflineNodes() const;

  /**
   * Attesters above the reputation floor and registry-compliant, in roster
   * order. Offline nodes are included; they time out when asked.
   */
  std::vector<Node> getEligibleAttesters() const;

  // ----- rounds -----
  Roe<std::string> expectedProposer(uint64_t round) const;
  uint64_t getRoundIndex() const;
  void setRoundIndex(uint64_t round);
  State getState() const;
  Metrics getMetrics() const;
  void setMetrics(const Metrics &metrics);

  /**
   * Build the proposal, anchors and proof for a batch without touching
   * the ledger buffer
   */
  RoundContext buildContext(uint64_t round, const std::string &proposerId,
                            const std::vector<Ledger::Transaction> &batch,
                            int64_t timestamp) const;

  /**
   * Run one full round against the ledger. Aborts are reported in the
   * result; an error means the ledger refused a step it should have
   * accepted.
   */
  Roe<RoundResult> runRound();

  /**
   * Collection step on its own, exposed for tests. Returns by the timeout;
   * late attester threads are cancelled and joined before it does.
   */
  struct Collected {
    std::vector<Attestation> attestations; // signature verified
    std::vector<std::string> omitted;      // silent or invalid signature
    std::vector<std::string> timedOut;
  };
  Collected collectAttestations(const RoundContext &context,
                                const std::vector<Node> &attesters) const;

private:
  void transition(State next);
  Roe<RoundResult> abortRound(RoundResult result, int32_t code,
                              const std::string &reason);
  void slashNode(RoundResult &result, const std::string &nodeId,
                 ReputationLedger::SlashReason reason);
  void distributeBlock(const Ledger::ChainNode &node,
                       const std::vector<Node> &attesters);
  void rewardParticipants(const std::string &proposerId,
                          const std::vector<std::string> &attesters);

  Ledger &ledger_;
  SoftwareRegistry &registry_;
  ReputationLedger &reputation_;
  FragmentStore &fragments_;
  std::shared_ptr<const Signer> signer_;
  Config config_;

  std::vector<Node> nodes_;
  std::map<std::string, bool> online_;
  uint64_t round_{ 0 };
  State state_{ State::IDLE };
  Metrics metrics_;
  mutable std::mutex mutex_;
  std::mutex roundMutex_; // one round at a time
};

} // namespace consensus
} // namespace hx
