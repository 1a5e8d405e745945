#ifndef INCLUDE_STRONGBOX_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP
#define INCLUDE_STRONGBOX_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP

#include "strongbox/crypto/ICryptoProvider.hpp"
#include <memory>

namespace strongbox::crypto::providers
{

// Monocypher-backed provider.
[[nodiscard]] std::unique_ptr<strongbox::crypto::ICryptoProvider> makeNativeCryptoProvider();

} // namespace strongbox::crypto::providers

#endif // INCLUDE_STRONGBOX_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP
