#ifndef INCLUDE_COFFER_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP
#define INCLUDE_COFFER_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP

#include "coffer/crypto/ICryptoProvider.hpp"
#include <memory>

namespace coffer::crypto::providers
{

// Monocypher backend: Argon2id and ChaCha20-Poly1305. AES-256-GCM is unavailable.
[[nodiscard]] std::unique_ptr<coffer::crypto::ICryptoProvider> makeNativeCryptoProvider();

} // namespace coffer::crypto::providers

#endif // INCLUDE_COFFER_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP
