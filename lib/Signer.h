#ifndef HX_LEDGER_SIGNER_H
#define HX_LEDGER_SIGNER_H

#include "Utilities.h"

#include <string>

namespace hx {

/**
 * Signature primitive used by attesters and the protocol.
 * Protocol code only sees this interface.
 */
class Signer {
public:
  using KeyPair = utl::Ed25519KeyPair;

  virtual ~Signer() = default;

  virtual Roe<std::string> sign(const std::string &message,
                                const std::string &privateKey) const = 0;

  virtual bool verify(const std::string &message, const std::string &signature,
                      const std::string &publicKey) const = 0;

  /**
   * Deterministic key pair for a seed string. Same seed, same keys.
   */
  virtual Roe<KeyPair> deriveKeyPair(const std::string &seed) const = 0;
};

class Ed25519Signer : public Signer {
public:
  Roe<std::string> sign(const std::string &message,
                        const std::string &privateKey) const override;
  bool verify(const std::string &message, const std::string &signature,
              const std::string &publicKey) const override;
  Roe<KeyPair> deriveKeyPair(const std::string &seed) const override;
};

} // namespace hx

#endif // HX_LEDGER_SIGNER_H
