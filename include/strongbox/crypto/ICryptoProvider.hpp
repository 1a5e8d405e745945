#ifndef INCLUDE_STRONGBOX_CRYPTO_ICRYPTOPROVIDER_HPP
#define INCLUDE_STRONGBOX_CRYPTO_ICRYPTOPROVIDER_HPP

#include "strongbox/security/SecureBuffer.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace strongbox::crypto
{

constexpr std::size_t g_aeadKeyBytes{ 32 };
constexpr std::size_t g_aeadNonceBytes{ 12 };
constexpr std::size_t g_aeadTagBytes{ 16 };
// Bytes a sealed payload carries beyond its ciphertext.
constexpr std::size_t g_aeadOverheadBytes{ g_aeadNonceBytes + g_aeadTagBytes };

// Output of one seal. Vault records and snapshot files are kept in this form.
struct AeadBox final
{
    std::array<std::uint8_t, g_aeadNonceBytes> nonce{};
    std::array<std::uint8_t, g_aeadTagBytes> tag{};
    std::vector<std::uint8_t> cipherText;

    friend bool operator==(const AeadBox&, const AeadBox&) = default;
};

class ICryptoProvider
{
public:
    ICryptoProvider() = default;
    ICryptoProvider(const ICryptoProvider&) = delete;
    ICryptoProvider& operator=(const ICryptoProvider&) = delete;
    ICryptoProvider(ICryptoProvider&&) = delete;
    ICryptoProvider& operator=(ICryptoProvider&&) = delete;
    virtual ~ICryptoProvider() = default;

    // Also the source of vault keys.
    [[nodiscard]] virtual bool randomBytes(std::span<std::uint8_t> out) noexcept = 0;

    // ChaCha20-Poly1305, IETF variant. A fresh nonce is drawn for every call.
    // Throws std::invalid_argument for a key that is not g_aeadKeyBytes long and std::runtime_error
    // when the backend fails.
    [[nodiscard]] virtual AeadBox aeadEncrypt(std::span<const std::uint8_t> key, std::span<const std::byte> plainText,
                                              std::span<const std::byte> associatedData) = 0;

    // std::nullopt means the tag did not verify: wrong key, altered bytes or different associated data.
    [[nodiscard]] virtual std::optional<strongbox::security::SecureBuffer>
    aeadDecrypt(std::span<const std::uint8_t> key, const AeadBox& box, std::span<const std::byte> associatedData) = 0;
};

} // namespace strongbox::crypto

#endif // INCLUDE_STRONGBOX_CRYPTO_ICRYPTOPROVIDER_HPP
