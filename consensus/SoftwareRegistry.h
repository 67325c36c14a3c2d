#pragma once

#include "Module.h"
#include "ResultOrError.hpp"
#include "Types.hpp"

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace hx {
namespace consensus {

/**
 * Trusted software versions ("stencil").
 *
 * Maps a declared version to the hash a genuine build of that version has.
 * Compliance fails closed: a version that was never registered is never
 * trusted.
 */
class SoftwareRegistry : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr int32_t E_INVALID_VERSION = 1;
  static constexpr int32_t E_INVALID_HASH = 2;
  static constexpr int32_t E_UNKNOWN_VERSION = 3;

  /**
   * Hash of the canonical identity string of an official build
   */
  static std::string softwareHashFor(const std::string &version);

  SoftwareRegistry();
  ~SoftwareRegistry() override = default;

  /**
   * Register or overwrite the trusted hash of a version
   */
  Roe<void> registerVersion(const std::string &version,
                            const std::string &trustedHash);

  /**
   * Register a version with the hash of its official build
   */
  Roe<void> registerOfficialVersion(const std::string &version);

  bool isCompliant(const Node &node) const;
  bool hasVersion(const std::string &version) const;
  Roe<std::string> getTrustedHash(const std::string &version) const;
  std::map<std::string, std::string> getVersions() const;

  /** Replace every entry; used when restoring from the state file */
  void restore(const std::map<std::string, std::string> &versions);

private:
  std::map<std::string, std::string> trusted_;
  mutable std::mutex mutex_;
};

} // namespace consensus
} // namespace hx
