#include "ReputationLedger.h"

#include <algorithm>

namespace hx {
namespace consensus {

const char *ReputationLedger::reasonToString(SlashReason reason) {
  switch (reason) {
  case SlashReason::NON_COMPLIANT_PROPOSER:
    return "non-compliant proposer";
  case SlashReason::WRONG_CLAIM:
    return "wrong proof claim";
  case SlashReason::OMISSION:
    return "omission";
  case SlashReason::TIMEOUT:
    return "timeout";
  }
  return "unknown";
}

ReputationLedger::ReputationLedger(Ledger &ledger,
                                   const SoftwareRegistry &registry)
    : Module("consensus.reputation"), ledger_(ledger), registry_(registry) {}

double ReputationLedger::clamp(double reputation) {
  return std::min(1.0, std::max(0.0, reputation));
}

std::shared_ptr<ReputationLedger::Account>
ReputationLedger::findAccount(const std::string &nodeId) const {
  std::lock_guard<std::mutex> lock(accountsMutex_);
  auto it = accounts_.find(nodeId);
  if (it == accounts_.end()) {
    return nullptr;
  }
  return it->second;
}

ReputationLedger::Roe<void>
ReputationLedger::registerNode(const std::string &nodeId, int64_t stake,
                               double reputation) {
  if (stake < 0) {
    return Error(E_INVALID_AMOUNT, "Stake of " + nodeId + " must not be negative");
  }
  std::lock_guard<std::mutex> lock(accountsMutex_);
  if (accounts_.count(nodeId) > 0) {
    return Error(E_DUPLICATE_NODE, "Node already registered: " + nodeId);
  }
  auto account = std::make_shared<Account>();
  account->entry.stake = stake;
  account->entry.reputation = clamp(reputation);
  accounts_[nodeId] = account;
  log().debug << "Registered node " << nodeId << " stake=" << stake
              << " reputation=" << account->entry.reputation;
  return {};
}

bool ReputationLedger::hasNode(const std::string &nodeId) const {
  return findAccount(nodeId) != nullptr;
}

ReputationLedger::Roe<ReputationLedger::Entry>
ReputationLedger::getEntry(const std::string &nodeId) const {
  auto account = findAccount(nodeId);
  if (!account) {
    return Error(E_UNKNOWN_NODE, "Unknown node: " + nodeId);
  }
  std::lock_guard<std::mutex> lock(account->mutex);
  return account->entry;
}

int64_t ReputationLedger::getStake(const std::string &nodeId) const {
  auto entry = getEntry(nodeId);
  return entry ? entry->stake : 0;
}

double ReputationLedger::getReputation(const std::string &nodeId) const {
  auto entry = getEntry(nodeId);
  return entry ? entry->reputation : 0.0;
}

std::map<std::string, ReputationLedger::Entry>
ReputationLedger::getEntries() const {
  std::map<std::string, std::shared_ptr<Account>> accounts;
  {
    std::lock_guard<std::mutex> lock(accountsMutex_);
    accounts = accounts_;
  }
  std::map<std::string, Entry> result;
  for (const auto &item : accounts) {
    std::lock_guard<std::mutex> lock(item.second->mutex);
    result[item.first] = item.second->entry;
  }
  return result;
}

ReputationLedger::Roe<ReputationLedger::SlashRecord>
ReputationLedger::slash(const std::string &nodeId, SlashReason reason,
                        uint64_t round) {
  return slash(nodeId, config_.slashPenalty, reason, round);
}

ReputationLedger::Roe<ReputationLedger::SlashRecord>
ReputationLedger::slash(const std::string &nodeId, int64_t penalty,
                        SlashReason reason, uint64_t round) {
  if (penalty < 0) {
    return Error(E_INVALID_AMOUNT, "Slash penalty must not be negative");
  }
  auto account = findAccount(nodeId);
  if (!account) {
    return Error(E_UNKNOWN_NODE, "Cannot slash unknown node: " + nodeId);
  }

  SlashRecord record;
  {
    std::lock_guard<std::mutex> lock(account->mutex);
    Entry &entry = account->entry;
    int64_t amount = std::min(entry.stake, penalty);

    // Treasury first: if the credit fails nothing else has changed
    auto credited = ledger_.credit(config_.treasuryAccount, amount);
    if (!credited) {
      return Error(E_CREDIT_FAILED, "Failed to move slashed stake of " + nodeId +
                                        " to treasury: " +
                                        credited.error().message);
    }

    record.nodeId = nodeId;
    record.reason = reason;
    record.round = round;
    record.slashedAmount = amount;
    record.reputationBefore = entry.reputation;
    entry.stake -= amount;
    entry.reputation = clamp(entry.reputation - config_.slashReputationDecrement);
    record.stakeAfter = entry.stake;
    record.reputationAfter = entry.reputation;
  }

  {
    std::lock_guard<std::mutex> lock(historyMutex_);
    history_.push_back(record);
  }

  log().warning << "Slashed " << nodeId << " (" << reasonToString(reason)
                << ", round " << round << "): stake -" << record.slashedAmount
                << " -> " << record.stakeAfter << ", reputation "
                << record.reputationBefore << " -> " << record.reputationAfter;
  return record;
}

ReputationLedger::Roe<void>
ReputationLedger::reward(const std::string &nodeId, int64_t amount,
                         double reputationIncrement) {
  if (amount < 0 || reputationIncrement < 0) {
    return Error(E_INVALID_AMOUNT, "Reward must not be negative");
  }
  auto account = findAccount(nodeId);
  if (!account) {
    return Error(E_UNKNOWN_NODE, "Cannot reward unknown node: " + nodeId);
  }

  std::lock_guard<std::mutex> lock(account->mutex);
  auto credited = ledger_.credit(nodeId, amount);
  if (!credited) {
    return Error(E_CREDIT_FAILED,
                 "Failed to credit reward to " + nodeId + ": " +
                     credited.error().message);
  }
  account->entry.reputation =
      clamp(account->entry.reputation + reputationIncrement);
  log().debug << "Rewarded " << nodeId << " with " << amount
              << ", reputation now " << account->entry.reputation;
  return {};
}

ReputationLedger::Roe<void>
ReputationLedger::rehabilitate(const std::string &nodeId, double reputation) {
  auto account = findAccount(nodeId);
  if (!account) {
    return Error(E_UNKNOWN_NODE, "Cannot rehabilitate unknown node: " + nodeId);
  }
  std::lock_guard<std::mutex> lock(account->mutex);
  double before = account->entry.reputation;
  account->entry.reputation = clamp(reputation);
  log().info << "Rehabilitated " << nodeId << ": reputation " << before
             << " -> " << account->entry.reputation;
  return {};
}

bool ReputationLedger::eligible(const Node &node, double floor) const {
  auto account = findAccount(node.id);
  if (!account) {
    return false;
  }
  double reputation = 0;
  {
    std::lock_guard<std::mutex> lock(account->mutex);
    reputation = account->entry.reputation;
  }
  return reputation >= floor && registry_.isCompliant(node);
}

std::vector<ReputationLedger::SlashRecord>
ReputationLedger::getSlashHistory() const {
  std::lock_guard<std::mutex> lock(historyMutex_);
  return history_;
}

size_t ReputationLedger::getSlashEventCount() const {
  std::lock_guard<std::mutex> lock(historyMutex_);
  return history_.size();
}

std::set<std::string> ReputationLedger::getMaliciousNodes() const {
  std::lock_guard<std::mutex> lock(historyMutex_);
  std::set<std::string> result;
  for (const auto &record : history_) {
    if (record.reason == SlashReason::WRONG_CLAIM) {
      result.insert(record.nodeId);
    }
  }
  return result;
}

double ReputationLedger::getMeanReputation() const {
  auto entries = getEntries();
  if (entries.empty()) {
    return 0.0;
  }
  double total = 0;
  for (const auto &item : entries) {
    total += item.second.reputation;
  }
  return total / static_cast<double>(entries.size());
}

void ReputationLedger::restore(const std::map<std::string, Entry> &entries,
                               const std::vector<SlashRecord> &history) {
  {
    std::lock_guard<std::mutex> lock(accountsMutex_);
    for (const auto &item : entries) {
      auto it = accounts_.find(item.first);
      if (it == accounts_.end()) {
        it = accounts_.emplace(item.first, std::make_shared<Account>()).first;
      }
      std::lock_guard<std::mutex> entryLock(it->second->mutex);
      it->second->entry.stake = std::max<int64_t>(0, item.second.stake);
      it->second->entry.reputation = clamp(item.second.reputation);
    }
  }
  std::lock_guard<std::mutex> lock(historyMutex_);
  history_ = history;
}

} // namespace consensus
} // namespace hx
