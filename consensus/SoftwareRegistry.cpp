#include "SoftwareRegistry.h"
#include "HashChain.h"
#include "Utilities.h"

namespace hx {
namespace consensus {

std::string SoftwareRegistry::softwareHashFor(const std::string &version) {
  return hashchain::digest(std::string("hx-ledger node software ") + version);
}

SoftwareRegistry::SoftwareRegistry() : Module("consensus.registry") {}

SoftwareRegistry::Roe<void>
SoftwareRegistry::registerVersion(const std::string &version,
                                  const std::string &trustedHash) {
  if (version.empty()) {
    return Error(E_INVALID_VERSION, "Version must not be empty");
  }
  if (!utl::isHash256(trustedHash)) {
    return Error(E_INVALID_HASH,
                 "Trusted hash for " + version + " is not a SHA-256 hex digest");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = trusted_.find(version);
  if (it != trusted_.end() && it->second != trustedHash) {
    log().warning << "Overwriting trusted hash of version " << version << ": "
                  << it->second << " -> " << trustedHash;
  }
  trusted_[version] = trustedHash;
  log().info << "Registered software version " << version << " (" << trustedHash
             << ")";
  return {};
}

SoftwareRegistry::Roe<void>
SoftwareRegistry::registerOfficialVersion(const std::string &version) {
  return registerVersion(version, softwareHashFor(version));
}

bool SoftwareRegistry::isCompliant(const Node &node) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = trusted_.find(node.version);
  if (it == trusted_.end()) {
    log().debug << "Node " << node.id << " runs unregistered version "
                << node.version;
    return false;
  }
  if (it->second != node.softwareHash) {
    log().debug << "Node " << node.id << " software hash mismatch for version "
                << node.version;
    return false;
  }
  return true;
}

bool SoftwareRegistry::hasVersion(const std::string &version) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return trusted_.count(version) > 0;
}

SoftwareRegistry::Roe<std::string>
SoftwareRegistry::getTrustedHash(const std::string &version) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = trusted_.find(version);
  if (it == trusted_.end()) {
    return Error(E_UNKNOWN_VERSION, "Unknown software version: " + version);
  }
  return it->second;
}

std::map<std::string, std::string> SoftwareRegistry::getVersions() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return trusted_;
}

void SoftwareRegistry::restore(
    const std::map<std::string, std::string> &versions) {
  std::lock_guard<std::mutex> lock(mutex_);
  trusted_ = versions;
}

} // namespace consensus
} // namespace hx
