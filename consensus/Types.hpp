#pragma once

#include "HashChain.h"

#include <cstdint>
#include <string>
#include <vector>

namespace hx {
namespace consensus {

/**
 * How a node answers an attestation request.
 * BYZANTINE nodes always claim their configured fake hash, SILENT nodes
 * never answer.
 */
enum class AttestationStrategy : uint8_t { HONEST = 0, BYZANTINE = 1, SILENT = 2 };

const char *strategyToString(AttestationStrategy strategy);
bool strategyFromString(const std::string &name, AttestationStrategy &strategy);

/**
 * A network participant. Proposing and attesting are independent
 * capabilities; a node may hold either, both or none.
 * Stake and reputation are kept by the ReputationLedger.
 */
struct Node {
  std::string id;
  std::string version;
  std::string softwareHash;
  bool canPropose{ false };
  bool canAttest{ false };
  AttestationStrategy strategy{ AttestationStrategy::HONEST };
  std::string fakeHash;     // claimed by a BYZANTINE attester
  uint64_t latencyMs{ 0 };  // simulated response delay
  std::string publicKey;
  std::string privateKey;
};

/**
 * Commits the proposer to an exact, ordered transaction set
 */
struct ProposalRecord {
  std::string proposerId;
  std::vector<std::string> txHashes;
  int64_t timestamp{ 0 };

  template <typename Archive> void serialize(Archive &ar) {
    ar & proposerId & txHashes & timestamp;
  }

  std::string getHash() const { return hashchain::digest(*this); }
};

/**
 * Ledger state every honest node sees identically during a round.
 * Snapshotted once per round.
 */
struct CoherenceAnchors {
  std::string lastBlockHash;
  uint64_t height{ 0 };
  int64_t totalSupply{ 0 };

  template <typename Archive> void serialize(Archive &ar) {
    ar & lastBlockHash & height & totalSupply;
  }

  std::string getHash() const { return hashchain::digest(*this); }
};

struct CoherenceProof {
  std::string proposalHash;
  std::string anchorsHash;
  std::string hash;

  template <typename Archive> void serialize(Archive &ar) {
    ar & proposalHash & anchorsHash & hash;
  }

  static CoherenceProof build(const std::string &proposalHash,
                              const std::string &anchorsHash) {
    CoherenceProof proof;
    proof.proposalHash = proposalHash;
    proof.anchorsHash = anchorsHash;
    proof.hash = hashchain::combine(proposalHash, anchorsHash);
    return proof;
  }

  bool isConsistent() const {
    return hash == hashchain::combine(proposalHash, anchorsHash);
  }
};

struct Attestation {
  std::string proofHash;
  std::string attesterId;
  std::string signature;

  template <typename Archive> void serialize(Archive &ar) {
    ar & proofHash & attesterId & signature;
  }

  // Bytes covered by the attester's signature
  static std::string signingMessage(const std::string &proofHash,
                                    const std::string &attesterId) {
    return "hx-ledger/attestation/v1:" + proofHash + ":" + attesterId;
  }

  std::string signingMessage() const {
    return signingMessage(proofHash, attesterId);
  }
};

inline const char *strategyToString(AttestationStrategy strategy) {
  switch (strategy) {
  case AttestationStrategy::HONEST:
    return "honest";
  case AttestationStrategy::BYZANTINE:
    return "byzantine";
  case AttestationStrategy::SILENT:
    return "silent";
  }
  return "unknown";
}

inline bool strategyFromString(const std::string &name,
                               AttestationStrategy &strategy) {
  if (name == "honest") {
    strategy = AttestationStrategy::HONEST;
  } else if (name == "byzantine") {
    strategy = AttestationStrategy::BYZANTINE;
  } else if (name == "silent") {
    strategy = AttestationStrategy::SILENT;
  } else {
    return false;
  }
  return true;
}

} // namespace consensus
} // namespace hx
