#ifndef INCLUDE_STRONGBOX_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
#define INCLUDE_STRONGBOX_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP

#include "strongbox/crypto/ICryptoProvider.hpp"
#include <memory>

namespace strongbox::crypto::providers
{

// OpenSSL EVP-backed provider, byte-compatible with the native one.
[[nodiscard]] std::unique_ptr<strongbox::crypto::ICryptoProvider> makeOpenSslCryptoProvider();

} // namespace strongbox::crypto::providers

#endif // INCLUDE_STRONGBOX_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
