#pragma once

#include "Module.h"
#include "ResultOrError.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace hx {

/**
 * Redundant custody of ledger fragments across nodes.
 *
 * A fragment is stored as a group of members: the primary (member 0, the
 * payload itself, id = fragment id) and up to k siblings (member i, id =
 * "<fragment id>#r<i>", payload XOR a keyed HMAC-SHA256 keystream). Any
 * single surviving member decodes back to the payload, so a group of k+1
 * members survives k custodian failures and is lost only when every member
 * is gone. Lost members are regenerated by an actual decode, verified
 * against the fragment checksum, and re-placed on a live custodian.
 */
class FragmentStore : public Module {
public:
  struct Fragment {
    std::string id;
    std::string payload;
    std::string checksum; // SHA-256 hex of payload
    uint32_t redundancy{ 3 };

    static Fragment create(const std::string &id, const std::string &payload,
                           uint32_t redundancy);
  };

  struct Placement {
    std::string memberId;
    std::string nodeId;

    bool operator==(const Placement &other) const {
      return memberId == other.memberId && nodeId == other.nodeId;
    }
  };

  struct FailureReport {
    std::vector<std::string> failedNodes;
    std::vector<std::string> lostMembers;    // members left without a custodian
    std::vector<Placement> regenerated;
    std::vector<std::string> unplaced;       // decodable but no live custodian
    std::vector<std::string> irrecoverable;  // fragment ids with no survivor
  };

  struct Group {
    std::string checksum;
    uint32_t redundancy{ 0 };
    uint64_t size{ 0 };
    std::vector<std::string> members;
    bool lost{ false };

    template <typename Archive> void serialize(Archive &ar) {
      ar & checksum & redundancy & size & members & lost;
    }
  };

  struct State {
    std::map<std::string, Group> groups;
    // node id -> member id -> stored bytes
    std::map<std::string, std::map<std::string, std::string>> custody;
    std::set<std::string> custodians;
    uint64_t regenerations{ 0 };
    uint64_t irrecoverableLosses{ 0 };

    template <typename Archive> void serialize(Archive &ar) {
      ar & groups & custody & custodians & regenerations & irrecoverableLosses;
    }
  };

  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr int32_t E_TOO_FEW_TARGETS = 1;
  static constexpr int32_t E_INVALID_FRAGMENT = 2;
  static constexpr int32_t E_UNKNOWN_FRAGMENT = 3;
  static constexpr int32_t E_IRRECOVERABLE = 4;
  static constexpr int32_t E_NO_CUSTODIAN = 5;
  static constexpr int32_t E_CONFLICT = 6;
  static constexpr int32_t E_INVALID_TARGETS = 7;

  static std::string memberId(const std::string &baseId, uint32_t index);

  /**
   * Split a member id into fragment id and member index
   * @return false if the id is not a well-formed member id
   */
  static bool parseMemberId(const std::string &memberId, std::string &baseId,
                            uint32_t &index);

  /**
   * Keystream for sibling index (index 0 is the all-zero mask)
   */
  static std::string mask(const std::string &baseId, uint32_t index,
                          size_t size);

  FragmentStore();
  ~FragmentStore() override = default;

  // ----- custodians -----
  void addCustodian(const std::string &nodeId);
  bool isCustodian(const std::string &nodeId) const;
  std::set<std::string> getCustodians() const;

  // ----- methods -----
  /**
   * Primary to targets[0], sibling i to targets[i] while targets last.
   * Every target must be a live custodian. Re-distributing an identical
   * fragment is a no-op.
   */
  Roe<void> distribute(const Fragment &fragment,
                       const std::vector<std::string> &targets);

  /**
   * Drop the failed nodes and everything they held, then regenerate every
   * member left without a location.
   */
  FailureReport onNodeFailure(const std::vector<std::string> &nodeIds);

  /**
   * Rebuild a lost member from any surviving member of its group.
   * A member that still has a location is returned as is.
   */
  Roe<Placement> regenerate(const std::string &memberId);

  /**
   * Byte-exact payload of a fragment, checksum verified
   */
  Roe<std::string> retrieve(const std::string &baseId) const;

  // ----- accessors -----
  bool hasFragment(const std::string &baseId) const;
  std::vector<std::string> getFragmentIds() const;
  Roe<Group> getGroup(const std::string &baseId) const;
  std::set<std::string> getLocations(const std::string &memberId) const;
  std::map<std::string, std::string> getHoldings(const std::string &nodeId) const;
  uint64_t getRegenerationCount() const;
  uint64_t getIrrecoverableCount() const;

  State exportState() const;
  void restore(const State &state);

private:
  static std::string applyMask(const std::string &bytes,
                               const std::string &baseId, uint32_t index);

  Roe<Placement> regenerateLocked(const std::string &memberId);
  Roe<std::string> decodeGroupLocked(const std::string &baseId,
                                     const Group &group) const;
  void markLostLocked(const std::string &baseId, Group &group);
  void rebuildLocationsLocked();

  std::map<std::string, Group> groups_;
  std::map<std::string, std::map<std::string, std::string>> custody_;
  std::map<std::string, std::set<std::string>> locations_;
  std::set<std::string> custodians_;
  uint64_t regenerations_{ 0 };
  uint64_t irrecoverableLosses_{ 0 };
  mutable std::mutex mutex_;
};

} // namespace hx
