#include "Signer.h"

namespace hx {

Roe<std::string> Ed25519Signer::sign(const std::string &message,
                                     const std::string &privateKey) const {
  return utl::ed25519Sign(privateKey, message);
}

bool Ed25519Signer::verify(const std::string &message,
                           const std::string &signature,
                           const std::string &publicKey) const {
  return utl::ed25519Verify(publicKey, message, signature);
}

Roe<Signer::KeyPair>
Ed25519Signer::deriveKeyPair(const std::string &seed) const {
  return utl::ed25519FromSeed(seed);
}

} // namespace hx
