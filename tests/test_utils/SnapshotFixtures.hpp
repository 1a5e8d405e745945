#ifndef STRONGBOX_TESTS_TEST_UTILS_SNAPSHOTFIXTURES_HPP
#define STRONGBOX_TESTS_TEST_UTILS_SNAPSHOTFIXTURES_HPP

#include "strongbox/core/ClientSnapshot.hpp"
#include "strongbox/core/SecureClientState.hpp"
#include "strongbox/crypto/ICryptoProvider.hpp"
#include "strongbox/security/SecureString.hpp"
#include <cstddef>
#include <gtest/gtest.h>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace strongbox::test_utils
{

[[nodiscard]] inline std::span<const std::byte> textBytes(std::string_view s) noexcept
{
    return { reinterpret_cast<const std::byte*>(s.data()), s.size() };
}

[[nodiscard]] inline strongbox::core::ClientId clientNamed(std::string_view name)
{
    return strongbox::core::deriveClientId(strongbox::core::bytesFrom(name));
}

// A client holding one counter secret ("passwords"/0 = `secret`) and one store entry.
[[nodiscard]] inline strongbox::core::ClientSnapshot sampleClient(strongbox::crypto::ICryptoProvider& crypto,
                                                                  std::string_view name, std::string_view secret)
{
    strongbox::core::SecureClientState state{ crypto, clientNamed(name) };
    const auto written{ state.writeSecret(strongbox::core::counterLocation("passwords", 0U), textBytes(secret)) };
    EXPECT_FALSE(strongbox::core::isError(written));
    (void)state.writeToStore(strongbox::core::bytesFrom("owner"), strongbox::core::bytesFrom(name));
    return state.exportSnapshot();
}

// Plaintext of "passwords"/0 after loading `snapshot` into a fresh state.
[[nodiscard]] inline std::string readSampleSecret(strongbox::crypto::ICryptoProvider& crypto,
                                                  const strongbox::core::ClientId& clientId,
                                                  strongbox::core::ClientSnapshot snapshot)
{
    strongbox::core::SecureClientState state{ crypto, clientId };
    if (strongbox::core::isError(state.reloadData(clientId, std::move(snapshot))))
    {
        return {};
    }
    const auto read{ state.readSecret(strongbox::core::counterLocation("passwords", 0U)) };
    if (strongbox::core::isError(read))
    {
        return {};
    }
    return std::string{ strongbox::security::asStringView(std::get<strongbox::security::SecureBuffer>(read)) };
}

} // namespace strongbox::test_utils

#endif // STRONGBOX_TESTS_TEST_UTILS_SNAPSHOTFIXTURES_HPP
