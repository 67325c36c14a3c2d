#include "AttestationProtocol.h"
#include "Utilities.h"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <stdexcept>
#include <thread>

namespace hx {
namespace consensus {

namespace {

// Proof every colluding byzantine node claims unless given its own
const std::string FORGED_PROOF_HASH =
    CoherenceProof::build(hashchain::digestBytes("hx-ledger/forged-proposal"),
                          hashchain::digestBytes("hx-ledger/forged-anchors"))
        .hash;

/**
 * Answers shared between the collecting round and the attester threads.
 * Once cancelled no thread writes here any more. Owns the threads and joins
 * them, also when the round unwinds.
 */
struct Mailbox {
  std::mutex mutex;
  std::condition_variable cv;
  std::map<std::string, std::optional<Attestation>> answers;
  bool cancelled{ false };
  std::vector<std::thread> threads;

  ~Mailbox() { cancelAndJoin(); }

  void cancelAndJoin() {
    {
      std::lock_guard<std::mutex> lock(mutex);
      cancelled = true;
    }
    cv.notify_all();
    for (auto &thread : threads) {
      if (thread.joinable()) {
        thread.join();
      }
    }
  }
};

std::vector<std::string> hashesOf(const std::vector<Ledger::Transaction> &txs) {
  std::vector<std::string> hashes;
  for (const auto &tx : txs) {
    hashes.push_back(tx.getHash());
  }
  return hashes;
}

} // namespace

const char *AttestationProtocol::stateToString(State state) {
  switch (state) {
  case State::IDLE:
    return "idle";
  case State::PROPOSAL_ISSUED:
    return "proposal-issued";
  case State::ATTESTATIONS_COLLECTING:
    return "attestations-collecting";
  case State::QUORUM_EVALUATED:
    return "quorum-evaluated";
  case State::COMMITTED:
    return "committed";
  case State::ABORTED:
    return "aborted";
  case State::SKIPPED:
    return "skipped";
  }
  return "unknown";
}

size_t AttestationProtocol::quorumFor(size_t eligibleCount) {
  return (eligibleCount * 2) / 3 + 1;
}

std::optional<std::string>
AttestationProtocol::claimFor(const Node &node, const RoundContext &context) {
  switch (node.strategy) {
  case AttestationStrategy::HONEST:
    // Recomputed from the snapshot, not copied from the proposer
    return CoherenceProof::build(context.proposal.getHash(),
                                 context.anchors.getHash())
        .hash;
  case AttestationStrategy::BYZANTINE:
    return node.fakeHash.empty() ? FORGED_PROOF_HASH : node.fakeHash;
  case AttestationStrategy::SILENT:
    return std::nullopt;
  }
  return std::nullopt;
}

AttestationProtocol::AttestationProtocol(Ledger &ledger,
                                         SoftwareRegistry &registry,
                                         ReputationLedger &reputation,
                                         FragmentStore &fragments,
                                         std::shared_ptr<const Signer> signer)
    : Module("consensus.protocol"), ledger_(ledger), registry_(registry),
      reputation_(reputation), fragments_(fragments),
      signer_(std::move(signer)) {
  if (!signer_) {
    throw std::invalid_argument("AttestationProtocol requires a signer");
  }
}

// ----- roster -----

AttestationProtocol::Roe<void> AttestationProtocol::addNode(const Node &node) {
  if (node.id.empty()) {
    return Error(E_INVALID_NODE, "Node id must not be empty");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &existing : nodes_) {
    if (existing.id == node.id) {
      return Error(E_INVALID_NODE, "Node already in roster: " + node.id);
    }
  }
  nodes_.push_back(node);
  online_[node.id] = true;
  log().debug << "Added node " << node.id << " v" << node.version
              << (node.canPropose ? " propose" : "")
              << (node.canAttest ? " attest" : "") << " strategy="
              << strategyToString(node.strategy);
  return {};
}

AttestationProtocol::Roe<Node>
AttestationProtocol::getNode(const std::string &nodeId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &node : nodes_) {
    if (node.id == nodeId) {
      return node;
    }
  }
  return Error(E_UNKNOWN_NODE, "Unknown node: " + nodeId);
}

std::vector<Node> AttestationProtocol::getNodes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return nodes_;
}

std::vector<Node> AttestationProtocol::getValidators() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Node> validators;
  for (const auto &node : nodes_) {
    if (node.canPropose) {
      validators.push_back(node);
    }
  }
  return validators;
}

AttestationProtocol::Roe<void>
AttestationProtocol::setOnline(const std::string &nodeId, bool online) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = online_.find(nodeId);
  if (it == online_.end()) {
    return Error(E_UNKNOWN_NODE, "Unknown node: " + nodeId);
  }
  if (it->second != online) {
    log().info << "Node " << nodeId << (online ? " back online" : " offline");
  }
  it->second = online;
  return {};
}

bool AttestationProtocol::isOnline(const std::string &nodeId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = online_.find(nodeId);
  return it != online_.end() && it->second;
}

std::vector<std::string> AttestationProtocol::getOfflineNodes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> offline;
  for (const auto &item : online_) {
    if (!item.second) {
      offline.push_back(item.first);
    }
  }
  return offline;
}

std::vector<Node> AttestationProtocol::getEligibleAttesters() const {
  std::vector<Node> eligible;
  for (const auto &node : getNodes()) {
    if (node.canAttest && reputation_.eligible(node, config_.reputationFloor)) {
      eligible.push_back(node);
    }
  }
  return eligible;
}

// ----- rounds -----

AttestationProtocol::Roe<std::string>
AttestationProtocol::expectedProposer(uint64_t round) const {
  auto validators = getValidators();
  if (validators.empty()) {
    return Error(E_NO_VALIDATORS, "No node can propose");
  }
  return validators[round % validators.size()].id;
}

uint64_t AttestationProtocol::getRoundIndex() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return round_;
}

void AttestationProtocol::setRoundIndex(uint64_t round) {
  std::lock_guard<std::mutex> lock(mutex_);
  round_ = round;
}

AttestationProtocol::State AttestationProtocol::getState() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

AttestationProtocol::Metrics AttestationProtocol::getMetrics() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return metrics_;
}

void AttestationProtocol::setMetrics(const Metrics &metrics) {
  std::lock_guard<std::mutex> lock(mutex_);
  metrics_ = metrics;
}

void AttestationProtocol::transition(State next) {
  std::lock_guard<std::mutex> lock(mutex_);
  log().debug << "Round " << round_ << ": " << stateToString(state_) << " -> "
              << stateToString(next);
  state_ = next;
}

AttestationProtocol::RoundContext
AttestationProtocol::buildContext(uint64_t round, const std::string &proposerId,
                                  const std::vector<Ledger::Transaction> &batch,
                                  int64_t timestamp) const {
  RoundContext context;
  context.round = round;
  context.proposal.proposerId = proposerId;
  context.proposal.timestamp = timestamp;
  for (const auto &tx : batch) {
    context.proposal.txHashes.push_back(tx.getHash());
  }
  context.anchors.lastBlockHash = ledger_.getLastHash();
  context.anchors.height = ledger_.getChainLength();
  context.anchors.totalSupply = ledger_.getTotalSupply();
  context.proof = CoherenceProof::build(context.proposal.getHash(),
                                        context.anchors.getHash());
  return context;
}

AttestationProtocol::Collected
AttestationProtocol::collectAttestations(const RoundContext &context,
                                         const std::vector<Node> &attesters) const {
  Mailbox mailbox;
  std::vector<std::string> asked;
  Collected collected;

  for (const auto &node : attesters) {
    if (!isOnline(node.id)) {
      collected.timedOut.push_back(node.id);
      continue;
    }
    asked.push_back(node.id);
    const Signer *signer = signer_.get();
    mailbox.threads.emplace_back([&mailbox, signer, node, &context]() {
      {
        // Simulated network latency, cut short by cancellation
        std::unique_lock<std::mutex> lock(mailbox.mutex);
        if (mailbox.cv.wait_for(lock, std::chrono::milliseconds(node.latencyMs),
                                [&mailbox]() { return mailbox.cancelled; })) {
          return;
        }
      }
      std::optional<Attestation> answer;
      auto claim = claimFor(node, context);
      if (claim) {
        Attestation attestation;
        attestation.proofHash = *claim;
        attestation.attesterId = node.id;
        auto signature =
            signer->sign(attestation.signingMessage(), node.privateKey);
        if (signature) {
          attestation.signature = *signature;
        }
        // An unsigned attestation fails verification below
        answer = attestation;
      }
      std::lock_guard<std::mutex> lock(mailbox.mutex);
      if (!mailbox.cancelled) {
        mailbox.answers[node.id] = answer;
        mailbox.cv.notify_all();
      }
    });
  }

  std::map<std::string, std::optional<Attestation>> answers;
  {
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(config_.attestationTimeoutMs);
    std::unique_lock<std::mutex> lock(mailbox.mutex);
    mailbox.cv.wait_until(lock, deadline, [&]() {
      return mailbox.answers.size() >= asked.size();
    });
    answers = mailbox.answers;
  }
  mailbox.cancelAndJoin();

  for (const auto &node : attesters) {
    auto it = answers.find(node.id);
    if (it == answers.end()) {
      if (std::find(asked.begin(), asked.end(), node.id) != asked.end()) {
        collected.timedOut.push_back(node.id);
      }
      continue;
    }
    if (!it->second) {
      collected.omitted.push_back(node.id);
      continue;
    }
    const Attestation &attestation = *it->second;
    if (!signer_->verify(attestation.signingMessage(), attestation.signature,
                         node.publicKey)) {
      log().warning << "Discarding attestation of " << node.id
                    << ": invalid signature";
      collected.omitted.push_back(node.id);
      continue;
    }
    collected.attestations.push_back(attestation);
  }
  return collected;
}

void AttestationProtocol::slashNode(RoundResult &result,
                                   const std::string &nodeId,
                                   ReputationLedger::SlashReason reason) {
  auto slashed = reputation_.slash(nodeId, reason, result.round);
  if (!slashed) {
    log().error << "Failed to slash " << nodeId << ": "
                << slashed.error().message;
    return;
  }
  result.slashed.push_back(nodeId);
}

AttestationProtocol::Roe<AttestationProtocol::RoundResult>
AttestationProtocol::abortRound(RoundResult result, int32_t code,
                                const std::string &reason) {
  ledger_.returnPending();
  result.state = State::ABORTED;
  result.errorCode = code;
  result.reason = reason;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    metrics_.aborted++;
    round_++;
  }
  transition(State::ABORTED);
  log().warning << "Round " << result.round << " aborted: " << reason;
  return result;
}

void AttestationProtocol::rewardParticipants(
    const std::string &proposerId, const std::vector<std::string> &attesters) {
  int64_t proposerReward = static_cast<int64_t>(
      static_cast<double>(config_.blockReward) * config_.proposerRewardShare);
  proposerReward = std::max<int64_t>(0, std::min(proposerReward, config_.blockReward));
  auto rewarded = reputation_.reward(proposerId, proposerReward,
                                     config_.proposerReputationIncrement);
  if (!rewarded) {
    log().error << "Failed to reward proposer " << proposerId << ": "
                << rewarded.error().message;
  }

  if (attesters.empty()) {
    return;
  }
  // Integer split; the remainder is not minted
  int64_t share = (config_.blockReward - proposerReward) /
                  static_cast<int64_t>(attesters.size());
  for (const auto &id : attesters) {
    auto result =
        reputation_.reward(id, share, config_.attesterReputationIncrement);
    if (!result) {
      log().error << "Failed to reward attester " << id << ": "
                  << result.error().message;
    }
  }
}

void AttestationProtocol::distributeBlock(const Ledger::ChainNode &node,
                                          const std::vector<Node> &attesters) {
  std::vector<std::string> candidates;
  for (const auto &attester : attesters) {
    if (isOnline(attester.id) && fragments_.isCustodian(attester.id)) {
      candidates.push_back(attester.id);
    }
  }
  std::sort(candidates.begin(), candidates.end());

  if (candidates.size() < 2) {
    log().warning << "Block " << node.block.index << " not distributed: only "
                  << candidates.size() << " custodian(s) available";
    return;
  }

  // Rotate so that primaries spread over the custodians
  std::rotate(candidates.begin(),
              candidates.begin() + static_cast<std::ptrdiff_t>(
                                      node.block.index % candidates.size()),
              candidates.end());
  size_t count = std::min<size_t>(config_.redundancy + 1, candidates.size());
  candidates.resize(count);

  auto fragment = FragmentStore::Fragment::create(
      "block-" + std::to_string(node.block.index), node.block.ltsToString(),
      config_.redundancy);
  auto distributed = fragments_.distribute(fragment, candidates);
  if (!distributed) {
    log().error << "Failed to distribute block " << node.block.index << ": "
                << distributed.error().message;
  }
}

AttestationProtocol::Roe<AttestationProtocol::RoundResult>
AttestationProtocol::runRound() {
  std::lock_guard<std::mutex> roundLock(roundMutex_);

  RoundResult result;
  result.round = getRoundIndex();

  if (ledger_.getPendingCount() == 0) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      metrics_.skipped++;
    }
    transition(State::SKIPPED);
    result.state = State::SKIPPED;
    result.reason = "no pending transactions";
    log().debug << "Round " << result.round << " skipped: empty buffer";
    return result;
  }

  transition(State::IDLE);
  auto proposerId = expectedProposer(result.round);
  if (!proposerId) {
    return Error(proposerId.error().code, proposerId.error().message);
  }
  result.proposerId = *proposerId;
  auto proposerResult = getNode(result.proposerId);
  if (!proposerResult) {
    return Error(proposerResult.error().code, proposerResult.error().message);
  }
  const Node proposer = *proposerResult;

  if (!isOnline(proposer.id)) {
    return abortRound(result, E_CONSENSUS_ABORTED,
                      "proposer " + proposer.id + " is offline");
  }
  if (!registry_.isCompliant(proposer) ||
      reputation_.getReputation(proposer.id) < config_.reputationFloor) {
    slashNode(result, proposer.id,
              ReputationLedger::SlashReason::NON_COMPLIANT_PROPOSER);
    return abortRound(result, E_COMPLIANCE_FAILURE,
                      "proposer " + proposer.id + " failed compliance");
  }

  // Proposal
  ledger_.takePending(config_.maxTransactionsPerBlock);
  std::vector<Ledger::Transaction> dropped;
  auto batch = ledger_.pruneInFlight(dropped);
  result.rejected = hashesOf(dropped);
  if (batch.empty()) {
    return abortRound(result, E_VALIDATION,
                      std::to_string(dropped.size()) +
                          " transaction(s) no longer apply, nothing to propose");
  }
  int64_t timestamp = utl::getCurrentTime();
  RoundContext context = buildContext(result.round, proposer.id, batch, timestamp);
  result.transactionCount = batch.size();
  result.expectedProofHash = context.proof.hash;
  transition(State::PROPOSAL_ISSUED);
  log().info << "Round " << result.round << ": " << proposer.id << " proposes "
             << batch.size() << " transaction(s) at height "
             << context.anchors.height;

  auto attesters = getEligibleAttesters();
  result.eligibleCount = attesters.size();
  result.quorum = quorumFor(attesters.size());
  if (attesters.empty()) {
    return abortRound(result, E_CONSENSUS_ABORTED, "no eligible attesters");
  }

  // Collection
  transition(State::ATTESTATIONS_COLLECTING);
  Collected collected = collectAttestations(context, attesters);
  result.omitted = collected.omitted;
  result.timedOut = collected.timedOut;

  // Evaluation
  std::map<std::string, size_t> tally;
  for (const auto &attestation : collected.attestations) {
    tally[attestation.proofHash]++;
  }
  // map order makes the smallest hash win a tie
  for (const auto &item : tally) {
    if (item.second > result.winningTally) {
      result.winningHash = item.first;
      result.winningTally = item.second;
    }
  }
  transition(State::QUORUM_EVALUATED);

  std::vector<Attestation> winning;
  for (const auto &attestation : collected.attestations) {
    if (attestation.proofHash == result.winningHash) {
      result.agreeing.push_back(attestation.attesterId);
      winning.push_back(attestation);
    } else {
      result.disagreeing.push_back(attestation.attesterId);
    }
  }

  for (const auto &id : result.disagreeing) {
    slashNode(result, id, ReputationLedger::SlashReason::WRONG_CLAIM);
  }
  for (const auto &id : result.omitted) {
    slashNode(result, id, ReputationLedger::SlashReason::OMISSION);
  }
  if (config_.slashOnTimeout) {
    for (const auto &id : result.timedOut) {
      slashNode(result, id, ReputationLedger::SlashReason::TIMEOUT);
    }
  }

  if (result.winningHash != result.expectedProofHash) {
    return abortRound(result, E_CONSENSUS_ABORTED,
                      "winning hash does not match the coherence proof");
  }
  if (result.winningTally < result.quorum) {
    return abortRound(result, E_CONSENSUS_ABORTED,
                      "quorum not reached: " +
                          std::to_string(result.winningTally) + "/" +
                          std::to_string(result.quorum));
  }

  // Commit
  auto checked = ledger_.checkBalances(batch);
  if (!checked) {
    dropped.clear();
    ledger_.pruneInFlight(dropped);
    auto more = hashesOf(dropped);
    result.rejected.insert(result.rejected.end(), more.begin(), more.end());
    return abortRound(result, E_VALIDATION,
                      "batch no longer applies: " + checked.error().message);
  }
  auto appended =
      ledger_.appendBlock(context.proposal.getHash(), context.proof, winning,
                          batch, context.anchors.lastBlockHash, timestamp);
  if (!appended) {
    ledger_.returnPending();
    return Error(E_LEDGER, "Failed to append block: " + appended.error().message);
  }
  auto applied = ledger_.applyBalances(batch);
  if (!applied) {
    return Error(E_LEDGER, "Block " + std::to_string(appended->block.index) +
                               " appended but balances failed: " +
                               applied.error().message);
  }
  ledger_.clearInFlight();
  result.block = *appended;

  rewardParticipants(proposer.id, result.agreeing);
  distributeBlock(*appended, attesters);

  result.state = State::COMMITTED;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    metrics_.committed++;
    round_++;
  }
  transition(State::COMMITTED);
  log().info << "Round " << result.round << " committed block "
             << appended->block.index << " (" << result.winningTally << "/"
             << result.eligibleCount << " attestations, quorum "
             << result.quorum << ")";
  return result;
}

} // namespace consensus
} // namespace hx
