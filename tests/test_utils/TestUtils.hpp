#ifndef STRONGBOX_TESTS_TEST_UTILS_TESTUTILS_HPP
#define STRONGBOX_TESTS_TEST_UTILS_TESTUTILS_HPP

#include "strongbox/core/Ids.hpp"
#include "strongbox/crypto/ICryptoProvider.hpp"
#include "strongbox/crypto/KeyDerivation.hpp"
#include "strongbox/security/SecureBuffer.hpp"
#include "strongbox/security/SecureRandom.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

namespace strongbox::test_utils
{

[[nodiscard]] inline std::optional<std::string> getEnv(const std::string& name)
{
    const char* value{ std::getenv(name.c_str()) };
    return value == nullptr ? std::nullopt : std::optional<std::string>{ value };
}

// Private per-test directory under $XDG_RUNTIME_DIR (or the OS temp dir), removed on destruction.
// path() is empty when no directory could be created; tests skip in that case.
class TempDir final
{
public:
    explicit TempDir(std::string_view prefix)
    {
        constexpr int kAttempts{ 8 };

        std::error_code ec{};
        std::filesystem::path root{};
        if (const auto xdg{ getEnv("XDG_RUNTIME_DIR") }; xdg && !xdg->empty())
        {
            root = *xdg;
        }
        else
        {
            root = std::filesystem::temp_directory_path(ec);
            if (ec)
            {
                return;
            }
        }

        for (int i{}; i < kAttempts && m_path.empty(); ++i)
        {
            std::array<std::uint8_t, 12> suffix{};
            if (!strongbox::security::secureRandomFill(suffix))
            {
                return;
            }
            const auto dir{ root / (std::string{ prefix } + strongbox::core::toHex(suffix)) };
            if (std::filesystem::create_directory(dir, ec) && !ec)
            {
                std::filesystem::permissions(dir, std::filesystem::perms::owner_all,
                                             std::filesystem::perm_options::replace, ec);
                m_path = dir;
            }
        }
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;
    ~TempDir() noexcept
    {
        if (!m_path.empty())
        {
            std::error_code ec{};
            std::filesystem::remove_all(m_path, ec);
        }
    }

    [[nodiscard]] const std::filesystem::path& path() const noexcept
    {
        return m_path;
    }

private:
    std::filesystem::path m_path;
};

// Argon2id at the smallest cost the KDF accepts; tests only need determinism.
[[nodiscard]] inline strongbox::crypto::Argon2idParams fastArgon2idParams() noexcept
{
    return strongbox::crypto::Argon2idParams{ .iterations = 1U, .memoryKiB = 8U };
}

[[nodiscard]] inline strongbox::security::SecureBuffer filledKey(std::uint8_t value)
{
    return strongbox::security::SecureBuffer(strongbox::crypto::g_aeadKeyBytes, value);
}

} // namespace strongbox::test_utils

#endif // STRONGBOX_TESTS_TEST_UTILS_TESTUTILS_HPP
