#include "Ledger.h"
#include "BinaryPack.hpp"
#include "HashChain.h"
#include "Quadrits.h"
#include "Utilities.h"

#include <algorithm>
#include <limits>

namespace hx {

const std::string Ledger::GENESIS_ANCHOR = "hx-ledger/genesis-anchors/v1";

// ----- Transaction -----

void Ledger::Transaction::setData(const std::string &data) {
  payload = quadrit::encode(data);
}

Ledger::Roe<std::string> Ledger::Transaction::getData() const {
  auto decoded = quadrit::decode(payload);
  if (!decoded) {
    return Error(E_INVALID_TRANSACTION,
                 "Invalid quadrit payload: " + decoded.error().message);
  }
  return decoded.value();
}

std::string Ledger::Transaction::getHash() const {
  Transaction body = *this;
  body.signature.clear();
  return hashchain::digest(body);
}

nlohmann::json Ledger::Transaction::toJson() const {
  nlohmann::json j;
  j["hash"] = getHash();
  j["sender"] = sender;
  j["recipient"] = recipient;
  j["amount"] = amount;
  j["timestamp"] = timestamp;
  j["payload"] = payload;
  j["signature"] = utl::hexEncode(signature);
  return j;
}

// ----- Block -----

std::string Ledger::Block::computeHash() const {
  return hashchain::digest(*this);
}

std::string Ledger::Block::ltsToString() const { return utl::binaryPack(*this); }

bool Ledger::Block::ltsFromString(const std::string &str) {
  auto result = utl::binaryUnpack<Block>(str);
  if (!result) {
    return false;
  }
  *this = result.value();
  return true;
}

nlohmann::json Ledger::Block::toJson() const {
  nlohmann::json j;
  j["index"] = index;
  j["timestamp"] = timestamp;
  j["previousHash"] = previousHash;
  j["proposalHash"] = proposalHash;
  j["proof"] = { { "proposalHash", proof.proposalHash },
                 { "anchorsHash", proof.anchorsHash },
                 { "hash", proof.hash } };
  nlohmann::json txs = nlohmann::json::array();
  for (const auto &tx : transactions) {
    txs.push_back(tx.toJson());
  }
  j["transactions"] = txs;
  nlohmann::json atts = nlohmann::json::array();
  for (const auto &att : attestations) {
    atts.push_back({ { "attesterId", att.attesterId },
                     { "proofHash", att.proofHash },
                     { "signature", utl::hexEncode(att.signature) } });
  }
  j["attestations"] = atts;
  return j;
}

nlohmann::json Ledger::ChainNode::toJson() const {
  nlohmann::json j = block.toJson();
  j["hash"] = hash;
  return j;
}

// ----- Ledger -----

Ledger::Ledger() : Module("ledger") { init(Config{}); }

void Ledger::init(const Config &config) {
  std::lock_guard<std::mutex> lock(mutex_);
  config_ = config;
  chain_.clear();
  balances_.clear();
  pending_.clear();
  inFlight_.clear();
  chain_.push_back(createGenesisBlock());
  log().debug << "Ledger initialized with genesis " << chain_.back().hash;
}

void Ledger::setVerifier(TxVerifier verifier) {
  std::lock_guard<std::mutex> lock(mutex_);
  verifier_ = std::move(verifier);
}

Ledger::ChainNode Ledger::createGenesisBlock() const {
  ChainNode node;
  node.block.index = 0;
  node.block.timestamp = config_.genesisTime;
  node.block.previousHash = hashchain::ZERO_HASH;
  node.block.proposalHash = hashchain::ZERO_HASH;
  node.block.proof = consensus::CoherenceProof::build(
      hashchain::ZERO_HASH, hashchain::digestBytes(GENESIS_ANCHOR));
  node.hash = node.block.computeHash();
  return node;
}

size_t Ledger::getChainLength() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chain_.size();
}

Ledger::ChainNode Ledger::getLastBlock() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chain_.back();
}

std::string Ledger::getLastHash() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chain_.back().hash;
}

Ledger::Roe<Ledger::ChainNode> Ledger::getBlock(uint64_t index) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (index >= chain_.size()) {
    return Error(E_NOT_FOUND, "Block " + std::to_string(index) + " not found");
  }
  return chain_[index];
}

std::vector<Ledger::ChainNode> Ledger::getChain() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chain_;
}

int64_t Ledger::getBalance(const std::string &account) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = balances_.find(account);
  return it == balances_.end() ? 0 : it->second;
}

std::map<std::string, int64_t> Ledger::getBalances() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return balances_;
}

int64_t Ledger::getTotalSupply() const {
  std::lock_guard<std::mutex> lock(mutex_);
  int64_t total = 0;
  if (!sumBalances(balances_, total)) {
    log().error << "Total supply exceeds " << std::numeric_limits<int64_t>::max();
    return std::numeric_limits<int64_t>::max();
  }
  return total;
}

int64_t Ledger::getSpendable(const std::string &account) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = balances_.find(account);
  int64_t balance = it == balances_.end() ? 0 : it->second;
  return balance - pendingOutgoing(account);
}

std::vector<Ledger::Transaction> Ledger::getPending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Transaction> result(inFlight_.begin(), inFlight_.end());
  result.insert(result.end(), pending_.begin(), pending_.end());
  return result;
}

size_t Ledger::getPendingCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return inFlight_.size() + pending_.size();
}

bool Ledger::isIssuance(const Transaction &tx) const {
  return tx.sender == config_.issuanceSender;
}

// Saturates at INT64_MAX; a restored buffer is not bounded by admission
int64_t Ledger::pendingOutgoing(const std::string &account) const {
  const int64_t limit = std::numeric_limits<int64_t>::max();
  int64_t total = 0;
  auto add = [&](const Transaction &tx) {
    if (tx.sender == account && tx.amount > 0) {
      total = total > limit - tx.amount ? limit : total + tx.amount;
    }
  };
  std::for_each(inFlight_.begin(), inFlight_.end(), add);
  std::for_each(pending_.begin(), pending_.end(), add);
  return total;
}

// False when the sum leaves the int64 range
bool Ledger::sumBalances(const std::map<std::string, int64_t> &balances,
                         int64_t &total) {
  total = 0;
  for (const auto &entry : balances) {
    if (entry.second > 0 &&
        total > std::numeric_limits<int64_t>::max() - entry.second) {
      return false;
    }
    if (entry.second < 0 &&
        total < std::numeric_limits<int64_t>::min() - entry.second) {
      return false;
    }
    total += entry.second;
  }
  return true;
}

// How much more may still be minted, pending issuance included
int64_t Ledger::supplyHeadroom() const {
  int64_t total = 0;
  if (!sumBalances(balances_, total)) {
    return 0;
  }
  int64_t headroom = std::numeric_limits<int64_t>::max() - std::max<int64_t>(total, 0);
  int64_t issuing = pendingOutgoing(config_.issuanceSender);
  return issuing >= headroom ? 0 : headroom - issuing;
}

Ledger::Roe<void> Ledger::addTransaction(const Transaction &tx) {
  if (tx.sender.empty() || tx.recipient.empty()) {
    return Error(E_INVALID_TRANSACTION,
                 "Transaction must include sender and recipient");
  }
  if (tx.amount <= 0) {
    return Error(E_INVALID_AMOUNT, "Transaction amount must be positive, got " +
                                       std::to_string(tx.amount));
  }
  if (!quadrit::isValid(tx.payload)) {
    return Error(E_INVALID_TRANSACTION, "Transaction payload is not quadrit-encoded");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (tx.recipient == config_.issuanceSender) {
    return Error(E_INVALID_TRANSACTION,
                 "Issuance account cannot receive funds");
  }
  if (verifier_ && !verifier_(tx)) {
    return Error(E_INVALID_TRANSACTION, "Transaction verification failed");
  }

  if (isIssuance(tx)) {
    int64_t headroom = supplyHeadroom();
    if (tx.amount > headroom) {
      log().warning << "Rejected issuance to " << tx.recipient << " of "
                    << tx.amount << ": supply headroom is " << headroom;
      return Error(E_INVALID_AMOUNT, "Issuance of " + std::to_string(tx.amount) +
                                         " would overflow the total supply");
    }
  } else {
    auto it = balances_.find(tx.sender);
    int64_t balance = it == balances_.end() ? 0 : it->second;
    int64_t spendable = balance - pendingOutgoing(tx.sender);
    if (spendable < tx.amount) {
      log().warning << "Rejected transaction from " << tx.sender
                    << ": insufficient funds (spendable " << spendable
                    << ", amount " << tx.amount << ")";
      return Error(E_INSUFFICIENT_FUNDS,
                   "Insufficient funds: " + tx.sender + " can spend " +
                       std::to_string(spendable) + ", needs " +
                       std::to_string(tx.amount));
    }
  }

  pending_.push_back(tx);
  log().info << "Transaction " << tx.sender << " -> " << tx.recipient << " for "
             << tx.amount << " added to buffer";
  return {};
}

std::vector<Ledger::Transaction> Ledger::takePending(size_t maxCount) {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t count = pending_.size();
  if (maxCount > 0 && maxCount < count) {
    count = maxCount;
  }
  std::vector<Transaction> batch(pending_.begin(), pending_.begin() + count);
  pending_.erase(pending_.begin(), pending_.begin() + count);
  inFlight_.insert(inFlight_.end(), batch.begin(), batch.end());
  return batch;
}

void Ledger::returnPending() {
  std::lock_guard<std::mutex> lock(mutex_);
  pending_.insert(pending_.begin(), inFlight_.begin(), inFlight_.end());
  inFlight_.clear();
}

void Ledger::clearInFlight() {
  std::lock_guard<std::mutex> lock(mutex_);
  inFlight_.clear();
}

std::vector<Ledger::Transaction>
Ledger::pruneInFlight(std::vector<Transaction> &rejected) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::map<std::string, int64_t> next = balances_;
  std::vector<Transaction> kept;
  for (const auto &tx : inFlight_) {
    auto applied = applyTransaction(next, tx);
    if (!applied) {
      log().warning << "Dropping transaction " << tx.getHash() << ": "
                    << applied.error().message;
      rejected.push_back(tx);
      continue;
    }
    kept.push_back(tx);
  }
  inFlight_ = kept;
  return kept;
}

Ledger::Roe<Ledger::ChainNode>
Ledger::appendBlock(const std::string &proposalHash,
                    const consensus::CoherenceProof &proof,
                    std::vector<consensus::Attestation> attestations,
                    const std::vector<Transaction> &transactions,
                    const std::string &previousHash, int64_t timestamp) {
  std::lock_guard<std::mutex> lock(mutex_);
  const ChainNode &tail = chain_.back();
  if (previousHash != tail.hash) {
    return Error(E_PREVIOUS_HASH, "Previous hash " + previousHash +
                                      " does not match chain tail " + tail.hash);
  }

  std::sort(attestations.begin(), attestations.end(),
            [](const consensus::Attestation &a, const consensus::Attestation &b) {
              return a.attesterId < b.attesterId;
            });

  ChainNode node;
  node.block.index = tail.block.index + 1;
  node.block.timestamp = timestamp;
  node.block.transactions = transactions;
  node.block.previousHash = previousHash;
  node.block.proposalHash = proposalHash;
  node.block.proof = proof;
  node.block.attestations = std::move(attestations);
  node.hash = node.block.computeHash();
  chain_.push_back(node);

  log().info << "Appended block " << node.block.index << " (" << node.hash
             << ") with " << transactions.size() << " transactions";
  return node;
}

Ledger::Roe<void>
Ledger::applyTransaction(std::map<std::string, int64_t> &balances,
                         const Transaction &tx) const {
  if (tx.amount <= 0) {
    return Error(E_INVALID_AMOUNT,
                 "Transaction " + tx.getHash() + " has non-positive amount");
  }
  if (isIssuance(tx)) {
    int64_t total = 0;
    if (!sumBalances(balances, total) ||
        tx.amount > std::numeric_limits<int64_t>::max() - std::max<int64_t>(total, 0)) {
      return Error(E_INVALID_AMOUNT, "Issuance " + tx.getHash() +
                                         " would overflow the total supply");
    }
  } else {
    auto sender = balances.find(tx.sender);
    if (sender == balances.end() || sender->second < tx.amount) {
      return Error(E_INSUFFICIENT_FUNDS, "Applying " + tx.getHash() +
                                             " would leave " + tx.sender +
                                             " negative");
    }
    if (tx.sender == tx.recipient) {
      return {};
    }
  }
  auto recipient = balances.find(tx.recipient);
  int64_t recipientBalance = recipient == balances.end() ? 0 : recipient->second;
  if (recipientBalance > std::numeric_limits<int64_t>::max() - tx.amount) {
    return Error(E_INVALID_AMOUNT, "Balance overflow for " + tx.recipient);
  }
  if (!isIssuance(tx)) {
    balances[tx.sender] -= tx.amount;
  }
  balances[tx.recipient] = recipientBalance + tx.amount;
  return {};
}

Ledger::Roe<std::map<std::string, int64_t>>
Ledger::computeBalances(const std::vector<Transaction> &transactions) const {
  std::map<std::string, int64_t> next = balances_;
  for (const auto &tx : transactions) {
    auto applied = applyTransaction(next, tx);
    if (!applied) {
      return applied.error();
    }
  }
  return next;
}

Ledger::Roe<void>
Ledger::checkBalances(const std::vector<Transaction> &transactions) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto result = computeBalances(transactions);
  if (!result) {
    return result.error();
  }
  return {};
}

Ledger::Roe<void>
Ledger::applyBalances(const std::vector<Transaction> &transactions) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto result = computeBalances(transactions);
  if (!result) {
    log().error << "Balance application rejected: " << result.error().message;
    return result.error();
  }
  balances_ = std::move(result.value());
  return {};
}

Ledger::Roe<void> Ledger::credit(const std::string &account, int64_t amount) {
  if (account.empty()) {
    return Error(E_INVALID_TRANSACTION, "Cannot credit an empty account id");
  }
  if (amount < 0) {
    return Error(E_INVALID_AMOUNT, "Credit amount must not be negative");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (amount > supplyHeadroom()) {
    return Error(E_INVALID_AMOUNT, "Crediting " + std::to_string(amount) +
                                       " to " + account +
                                       " would overflow the total supply");
  }
  int64_t &balance = balances_[account];
  if (balance > std::numeric_limits<int64_t>::max() - amount) {
    return Error(E_INVALID_AMOUNT, "Balance overflow for " + account);
  }
  balance += amount;
  return {};
}

std::optional<uint64_t> Ledger::findFirstBrokenBlockLocked() const {
  for (size_t i = 0; i < chain_.size(); ++i) {
    const ChainNode &node = chain_[i];
    if (node.block.index != i) {
      return i;
    }
    if (node.hash != node.block.computeHash()) {
      return i;
    }
    const std::string &expectedPrevious =
        i == 0 ? hashchain::ZERO_HASH : chain_[i - 1].hash;
    if (node.block.previousHash != expectedPrevious) {
      return i;
    }
  }
  return std::nullopt;
}

std::optional<uint64_t> Ledger::findFirstBrokenBlock() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return findFirstBrokenBlockLocked();
}

Ledger::Roe<void> Ledger::verifyIntegrity() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (chain_.empty()) {
    return Error(E_INTEGRITY, "Chain has no genesis block");
  }
  auto broken = findFirstBrokenBlockLocked();
  if (broken) {
    log().critical << "Chain integrity violation at block " << *broken;
    return Error(E_INTEGRITY, "Chain integrity violation at block " +
                                  std::to_string(*broken));
  }
  for (const auto &entry : balances_) {
    if (entry.second < 0) {
      log().critical << "Negative balance for " << entry.first;
      return Error(E_INTEGRITY, "Negative balance for " + entry.first);
    }
  }
  int64_t total = 0;
  if (!sumBalances(balances_, total)) {
    log().critical << "Total supply overflows";
    return Error(E_INTEGRITY, "Total supply overflows");
  }
  return {};
}

Ledger::State Ledger::exportState() const {
  std::lock_guard<std::mutex> lock(mutex_);
  State state;
  state.chain = chain_;
  state.balances = balances_;
  state.pending.assign(inFlight_.begin(), inFlight_.end());
  state.pending.insert(state.pending.end(), pending_.begin(), pending_.end());
  return state;
}

void Ledger::restore(const State &state) {
  std::lock_guard<std::mutex> lock(mutex_);
  chain_ = state.chain;
  if (chain_.empty()) {
    chain_.push_back(createGenesisBlock());
  }
  balances_ = state.balances;
  pending_.assign(state.pending.begin(), state.pending.end());
  inFlight_.clear();
  log().info << "Restored ledger with " << chain_.size() << " blocks, "
             << balances_.size() << " accounts, " << pending_.size()
             << " pending transactions";
}

} // namespace hx
