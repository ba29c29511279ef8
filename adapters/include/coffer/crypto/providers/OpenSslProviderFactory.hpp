#ifndef INCLUDE_COFFER_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
#define INCLUDE_COFFER_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP

#include "coffer/crypto/ICryptoProvider.hpp"
#include <memory>

namespace coffer::crypto::providers
{

// OpenSSL 3 backend: both AEAD algorithms. Argon2id needs OpenSSL 3.2 or later at runtime.
[[nodiscard]] std::unique_ptr<coffer::crypto::ICryptoProvider> makeOpenSslCryptoProvider();

} // namespace coffer::crypto::providers

#endif // INCLUDE_COFFER_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
