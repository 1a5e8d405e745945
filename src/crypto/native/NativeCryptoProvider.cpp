#include "strongbox/crypto/providers/NativeProviderFactory.hpp"
#include "strongbox/security/MemoryWiper.hpp"
#include "strongbox/security/SecureBuffer.hpp"
#include "strongbox/security/SecureRandom.hpp"
#include "monocypher.h"
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>

namespace strongbox::crypto::providers
{
namespace
{

// Monocypher incremental AEAD state, keyed once and wiped on scope exit.
class ChachaContext final
{
public:
    ChachaContext(std::span<const std::uint8_t> key, std::span<const std::uint8_t, g_aeadNonceBytes> nonce) noexcept
    {
        crypto_aead_init_ietf(&m_ctx, key.data(), nonce.data());
    }
    ChachaContext(const ChachaContext&) = delete;
    ChachaContext& operator=(const ChachaContext&) = delete;
    ChachaContext(ChachaContext&&) = delete;
    ChachaContext& operator=(ChachaContext&&) = delete;
    ~ChachaContext()
    {
        strongbox::security::secureWipe(std::span{ &m_ctx, 1 });
    }

    [[nodiscard]] crypto_aead_ctx* get() noexcept
    {
        return &m_ctx;
    }

private:
    crypto_aead_ctx m_ctx{};
};

const std::uint8_t* bytePtr(std::span<const std::byte> s) noexcept
{
    return reinterpret_cast<const std::uint8_t*>(s.data());
}

void checkKey(std::span<const std::uint8_t> key, const char* op)
{
    if (key.size() != strongbox::crypto::g_aeadKeyBytes)
    {
        throw std::invalid_argument(std::string{ op } + ": key must be " +
                                    std::to_string(strongbox::crypto::g_aeadKeyBytes) + " bytes, got " +
                                    std::to_string(key.size()));
    }
}

class NativeCryptoProvider final : public strongbox::crypto::ICryptoProvider
{
public:
    [[nodiscard]] bool randomBytes(std::span<std::uint8_t> out) noexcept override
    {
        return strongbox::security::secureRandomFill(out);
    }

    [[nodiscard]] strongbox::crypto::AeadBox aeadEncrypt(std::span<const std::uint8_t> key,
                                                         std::span<const std::byte> plainText,
                                                         std::span<const std::byte> associatedData) override
    {
        checkKey(key, "native seal");

        strongbox::crypto::AeadBox sealed{};
        if (!randomBytes(sealed.nonce))
        {
            throw std::runtime_error("native seal: nonce generation failed");
        }
        sealed.cipherText.resize(plainText.size());

        ChachaContext ctx{ key, sealed.nonce };
        crypto_aead_write(ctx.get(), sealed.cipherText.data(), sealed.tag.data(), bytePtr(associatedData),
                          associatedData.size(), bytePtr(plainText), plainText.size());
        return sealed;
    }

    [[nodiscard]] std::optional<strongbox::security::SecureBuffer>
    aeadDecrypt(std::span<const std::uint8_t> key, const strongbox::crypto::AeadBox& sealed,
                std::span<const std::byte> associatedData) override
    {
        checkKey(key, "native open");
        if (sealed.cipherText.size() > std::numeric_limits<std::uint32_t>::max())
        {
            throw std::invalid_argument("native open: ciphertext exceeds 4 GiB");
        }

        strongbox::security::SecureBuffer opened(sealed.cipherText.size());
        ChachaContext ctx{ key, sealed.nonce };
        if (crypto_aead_read(ctx.get(), opened.data(), sealed.tag.data(), bytePtr(associatedData),
                             associatedData.size(), sealed.cipherText.data(), sealed.cipherText.size()) != 0)
        {
            strongbox::security::secureRelease(opened);
            return std::nullopt;
        }
        return opened;
    }
};

} // namespace

[[nodiscard]] std::unique_ptr<strongbox::crypto::ICryptoProvider> makeNativeCryptoProvider()
{
    return std::make_unique<NativeCryptoProvider>();
}

} // namespace strongbox::crypto::providers
