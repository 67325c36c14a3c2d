#include "FragmentStore.h"
#include "Utilities.h"

#include <algorithm>

namespace hx {

namespace {

const std::string SIBLING_SEPARATOR = "#r";
const std::string MASK_DOMAIN = "hx-ledger/fragment-mask/v1:";

} // namespace

FragmentStore::Fragment FragmentStore::Fragment::create(
    const std::string &id, const std::string &payload, uint32_t redundancy) {
  Fragment fragment;
  fragment.id = id;
  fragment.payload = payload;
  fragment.checksum = utl::sha256(payload);
  fragment.redundancy = redundancy;
  return fragment;
}

std::string FragmentStore::memberId(const std::string &baseId, uint32_t index) {
  if (index == 0) {
    return baseId;
  }
  return baseId + SIBLING_SEPARATOR + std::to_string(index);
}

bool FragmentStore::parseMemberId(const std::string &memberId,
                                  std::string &baseId, uint32_t &index) {
  auto pos = memberId.rfind(SIBLING_SEPARATOR);
  if (pos == std::string::npos) {
    baseId = memberId;
    index = 0;
    return !baseId.empty();
  }
  std::string suffix = memberId.substr(pos + SIBLING_SEPARATOR.size());
  int64_t value = 0;
  if (!utl::parseInt64(suffix, value) || value <= 0 ||
      value > static_cast<int64_t>(UINT32_MAX)) {
    return false;
  }
  baseId = memberId.substr(0, pos);
  index = static_cast<uint32_t>(value);
  return !baseId.empty();
}

std::string FragmentStore::mask(const std::string &baseId, uint32_t index,
                                size_t size) {
  if (index == 0) {
    return std::string(size, '\0');
  }
  std::string stream;
  stream.reserve(size + 32);
  for (uint64_t counter = 0; stream.size() < size; ++counter) {
    stream += utl::hmacSha256(baseId, MASK_DOMAIN + std::to_string(index) +
                                          ":" + std::to_string(counter));
  }
  stream.resize(size);
  return stream;
}

std::string FragmentStore::applyMask(const std::string &bytes,
                                     const std::string &baseId,
                                     uint32_t index) {
  if (index == 0) {
    return bytes;
  }
  std::string keystream = mask(baseId, index, bytes.size());
  std::string out(bytes.size(), '\0');
  for (size_t i = 0; i < bytes.size(); ++i) {
    out[i] = static_cast<char>(bytes[i] ^ keystream[i]);
  }
  return out;
}

FragmentStore::FragmentStore() : Module("storage.fragments") {}

void FragmentStore::addCustodian(const std::string &nodeId) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (custodians_.insert(nodeId).second) {
    log().debug << "Custodian " << nodeId << " joined";
  }
}

bool FragmentStore::isCustodian(const std::string &nodeId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return custodians_.count(nodeId) > 0;
}

std::set<std::string> FragmentStore::getCustodians() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return custodians_;
}

FragmentStore::Roe<void>
FragmentStore::distribute(const Fragment &fragment,
                          const std::vector<std::string> &targets) {
  if (fragment.id.empty() ||
      fragment.id.find(SIBLING_SEPARATOR) != std::string::npos) {
    return Error(E_INVALID_FRAGMENT, "Invalid fragment id: " + fragment.id);
  }
  if (targets.size() < 2) {
    return Error(E_TOO_FEW_TARGETS,
                 "Fragment " + fragment.id +
                     " needs at least 2 target nodes for redundancy");
  }
  if (utl::sha256(fragment.payload) != fragment.checksum) {
    return Error(E_INVALID_FRAGMENT,
                 "Checksum mismatch for fragment " + fragment.id);
  }
  std::set<std::string> unique(targets.begin(), targets.end());
  if (unique.size() != targets.size()) {
    return Error(E_INVALID_TARGETS,
                 "Duplicate target nodes for fragment " + fragment.id);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &nodeId : targets) {
    if (custodians_.count(nodeId) == 0) {
      return Error(E_NO_CUSTODIAN, "Target " + nodeId + " is not a live custodian");
    }
  }

  auto existing = groups_.find(fragment.id);
  if (existing != groups_.end()) {
    if (existing->second.checksum == fragment.checksum) {
      log().debug << "Fragment " << fragment.id << " already distributed";
      return {};
    }
    return Error(E_CONFLICT, "Fragment " + fragment.id +
                                 " already exists with different content");
  }

  size_t memberCount =
      std::min<size_t>(static_cast<size_t>(fragment.redundancy) + 1, targets.size());

  Group group;
  group.checksum = fragment.checksum;
  group.redundancy = fragment.redundancy;
  group.size = fragment.payload.size();
  for (size_t i = 0; i < memberCount; ++i) {
    uint32_t index = static_cast<uint32_t>(i);
    std::string id = memberId(fragment.id, index);
    custody_[targets[i]][id] = applyMask(fragment.payload, fragment.id, index);
    locations_[id].insert(targets[i]);
    group.members.push_back(id);
  }
  groups_[fragment.id] = group;

  log().info << "Distributed fragment " << fragment.id << " ("
             << fragment.payload.size() << " bytes) as " << memberCount
             << " members to " << utl::join(std::vector<std::string>(
                                                targets.begin(),
                                                targets.begin() + memberCount),
                                            ", ");
  return {};
}

FragmentStore::FailureReport
FragmentStore::onNodeFailure(const std::vector<std::string> &nodeIds) {
  std::lock_guard<std::mutex> lock(mutex_);
  FailureReport report;
  std::set<std::string> lost;

  for (const auto &nodeId : nodeIds) {
    report.failedNodes.push_back(nodeId);
    custodians_.erase(nodeId);
    auto held = custody_.find(nodeId);
    if (held == custody_.end()) {
      continue;
    }
    for (const auto &item : held->second) {
      auto &where = locations_[item.first];
      where.erase(nodeId);
      if (where.empty()) {
        lost.insert(item.first);
      }
    }
    custody_.erase(held);
  }
  log().warning << "Node failure: " << utl::join(report.failedNodes, ", ")
                << ", " << lost.size() << " fragment members lost custody";

  std::set<std::string> irrecoverable;
  for (const auto &member : lost) {
    report.lostMembers.push_back(member);
    auto result = regenerateLocked(member);
    if (result) {
      report.regenerated.push_back(result.value());
      continue;
    }
    const auto &error = result.error();
    if (error.code == E_IRRECOVERABLE) {
      std::string baseId;
      uint32_t index = 0;
      if (parseMemberId(member, baseId, index)) {
        irrecoverable.insert(baseId);
      }
    } else {
      report.unplaced.push_back(member);
      log().error << "Member " << member << " not regenerated: " << error.message;
    }
  }
  report.irrecoverable.assign(irrecoverable.begin(), irrecoverable.end());
  return report;
}

FragmentStore::Roe<FragmentStore::Placement>
FragmentStore::regenerate(const std::string &memberId) {
  std::lock_guard<std::mutex> lock(mutex_);
  return regenerateLocked(memberId);
}

void FragmentStore::markLostLocked(const std::string &baseId, Group &group) {
  if (group.lost) {
    return;
  }
  group.lost = true;
  ++irrecoverableLosses_;
  log().critical << "Irrecoverable fragment loss: " << baseId
                 << " has no surviving member";
}

FragmentStore::Roe<std::string>
FragmentStore::decodeGroupLocked(const std::string &baseId,
                                 const Group &group) const {
  for (const auto &member : group.members) {
    auto where = locations_.find(member);
    if (where == locations_.end()) {
      continue;
    }
    std::string memberBase;
    uint32_t index = 0;
    if (!parseMemberId(member, memberBase, index)) {
      continue;
    }
    for (const auto &nodeId : where->second) {
      auto held = custody_.find(nodeId);
      if (held == custody_.end()) {
        continue;
      }
      auto bytes = held->second.find(member);
      if (bytes == held->second.end()) {
        continue;
      }
      std::string payload = applyMask(bytes->second, baseId, index);
      if (utl::sha256(payload) == group.checksum) {
        return payload;
      }
      log().error << "Member " << member << " on " << nodeId
                  << " failed checksum verification";
    }
  }
  return Error(E_IRRECOVERABLE,
               "No surviving member of fragment " + baseId + " decodes");
}

FragmentStore::Roe<FragmentStore::Placement>
FragmentStore::regenerateLocked(const std::string &member) {
  std::string baseId;
  uint32_t index = 0;
  if (!parseMemberId(member, baseId, index)) {
    return Error(E_UNKNOWN_FRAGMENT, "Malformed member id: " + member);
  }
  auto groupIt = groups_.find(baseId);
  if (groupIt == groups_.end()) {
    return Error(E_UNKNOWN_FRAGMENT, "Unknown fragment: " + baseId);
  }
  Group &group = groupIt->second;
  if (std::find(group.members.begin(), group.members.end(), member) ==
      group.members.end()) {
    return Error(E_UNKNOWN_FRAGMENT,
                 "Fragment " + baseId + " has no member " + member);
  }

  auto &where = locations_[member];
  if (!where.empty()) {
    return Placement{ member, *where.begin() };
  }

  auto decoded = decodeGroupLocked(baseId, group);
  if (!decoded) {
    markLostLocked(baseId, group);
    return decoded.error();
  }

  // Prefer a node holding nothing of this group, then any node lacking
  // this member.
  std::string target;
  for (const auto &nodeId : custodians_) {
    bool holdsGroup = false;
    for (const auto &sibling : group.members) {
      if (locations_[sibling].count(nodeId) > 0) {
        holdsGroup = true;
        break;
      }
    }
    if (!holdsGroup) {
      target = nodeId;
      break;
    }
  }
  if (target.empty()) {
    for (const auto &nodeId : custodians_) {
      if (where.count(nodeId) == 0) {
        target = nodeId;
        break;
      }
    }
  }
  if (target.empty()) {
    return Error(E_NO_CUSTODIAN,
                 "No live custodian available for " + member);
  }

  custody_[target][member] = applyMask(decoded.value(), baseId, index);
  where.insert(target);
  ++regenerations_;
  log().info << "Regenerated " << member << " on " << target;
  return Placement{ member, target };
}

FragmentStore::Roe<std::string>
FragmentStore::retrieve(const std::string &baseId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto groupIt = groups_.find(baseId);
  if (groupIt == groups_.end()) {
    return Error(E_UNKNOWN_FRAGMENT, "Unknown fragment: " + baseId);
  }
  return decodeGroupLocked(baseId, groupIt->second);
}

bool FragmentStore::hasFragment(const std::string &baseId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return groups_.count(baseId) > 0;
}

std::vector<std::string> FragmentStore::getFragmentIds() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> ids;
  for (const auto &item : groups_) {
    ids.push_back(item.first);
  }
  return ids;
}

FragmentStore::Roe<FragmentStore::Group>
FragmentStore::getGroup(const std::string &baseId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = groups_.find(baseId);
  if (it == groups_.end()) {
    return Error(E_UNKNOWN_FRAGMENT, "Unknown fragment: " + baseId);
  }
  return it->second;
}

std::set<std::string>
FragmentStore::getLocations(const std::string &memberId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = locations_.find(memberId);
  if (it == locations_.end()) {
    return {};
  }
  return it->second;
}

std::map<std::string, std::string>
FragmentStore::getHoldings(const std::string &nodeId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = custody_.find(nodeId);
  if (it == custody_.end()) {
    return {};
  }
  return it->second;
}

uint64_t FragmentStore::getRegenerationCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return regenerations_;
}

uint64_t FragmentStore::getIrrecoverableCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return irrecoverableLosses_;
}

FragmentStore::State FragmentStore::exportState() const {
  std::lock_guard<std::mutex> lock(mutex_);
  State state;
  state.groups = groups_;
  state.custody = custody_;
  state.custodians = custodians_;
  state.regenerations = regenerations_;
  state.irrecoverableLosses = irrecoverableLosses_;
  return state;
}

void FragmentStore::restore(const State &state) {
  std::lock_guard<std::mutex> lock(mutex_);
  groups_ = state.groups;
  custody_ = state.custody;
  custodians_ = state.custodians;
  regenerations_ = state.regenerations;
  irrecoverableLosses_ = state.irrecoverableLosses;
  rebuildLocationsLocked();
}

void FragmentStore::rebuildLocationsLocked() {
  locations_.clear();
  for (const auto &held : custody_) {
    for (const auto &item : held.second) {
      locations_[item.first].insert(held.first);
    }
  }
}

} // namespace hx
