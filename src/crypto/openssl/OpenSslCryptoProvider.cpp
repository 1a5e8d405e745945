#include "strongbox/crypto/providers/OpenSslProviderFactory.hpp"
#include "strongbox/security/SecureBuffer.hpp"
#include "strongbox/security/SecureRandom.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <openssl/evp.h>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>

namespace strongbox::crypto::providers
{
namespace
{

constexpr std::size_t g_kEvpMaxLen{ static_cast<std::size_t>(std::numeric_limits<int>::max()) };

enum class Direction : int
{
    Open = 0,
    Seal = 1,
};

void checkKey(std::span<const std::uint8_t> key, const char* op)
{
    if (key.size() != strongbox::crypto::g_aeadKeyBytes)
    {
        throw std::invalid_argument(std::string{ op } + ": key must be " +
                                    std::to_string(strongbox::crypto::g_aeadKeyBytes) + " bytes, got " +
                                    std::to_string(key.size()));
    }
}

void checkEvpLength(std::size_t n, const char* op, const char* what)
{
    if (n > g_kEvpMaxLen)
    {
        throw std::invalid_argument(std::string{ op } + ": " + what + " exceeds EVP length limit");
    }
}

const unsigned char* uchars(std::span<const std::byte> s) noexcept
{
    return reinterpret_cast<const unsigned char*>(s.data());
}

// One ChaCha20-Poly1305 pass over an EVP context.
class EvpChachaSession final
{
public:
    EvpChachaSession(std::span<const std::uint8_t> key, std::span<const std::uint8_t> nonce, Direction dir)
        : m_ctx{ EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free }, m_enc{ static_cast<int>(dir) }
    {
        if (!m_ctx)
        {
            throw std::runtime_error("openssl aead: context allocation failed");
        }
        if (EVP_CipherInit_ex(m_ctx.get(), EVP_chacha20_poly1305(), nullptr, nullptr, nullptr, m_enc) != 1 ||
            EVP_CIPHER_CTX_ctrl(m_ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(nonce.size()), nullptr) != 1 ||
            EVP_CipherInit_ex(m_ctx.get(), nullptr, nullptr, key.data(), nonce.data(), m_enc) != 1)
        {
            throw std::runtime_error("openssl aead: cipher setup failed");
        }
    }

    [[nodiscard]] bool authenticate(std::span<const std::byte> aad) noexcept
    {
        int ignored{ 0 };
        return EVP_CipherUpdate(m_ctx.get(), nullptr, &ignored, uchars(aad), static_cast<int>(aad.size())) == 1;
    }

    // Returns false unless every input byte produced one output byte.
    [[nodiscard]] bool transform(const unsigned char* in, std::size_t n, std::uint8_t* out) noexcept
    {
        if (n == 0)
        {
            return true;
        }
        int written{ 0 };
        return EVP_CipherUpdate(m_ctx.get(), out, &written, in, static_cast<int>(n)) == 1 &&
               static_cast<std::size_t>(written) == n;
    }

    // The stream construction never flushes bytes here; a non-zero length is a backend fault.
    [[nodiscard]] bool finish() noexcept
    {
        std::array<unsigned char, EVP_MAX_BLOCK_LENGTH> scratch{};
        int flushed{ 0 };
        return EVP_CipherFinal_ex(m_ctx.get(), scratch.data(), &flushed) == 1 && flushed == 0;
    }

    [[nodiscard]] bool readTag(std::span<std::uint8_t> tag) noexcept
    {
        return EVP_CIPHER_CTX_ctrl(m_ctx.get(), EVP_CTRL_AEAD_GET_TAG, static_cast<int>(tag.size()), tag.data()) == 1;
    }

    [[nodiscard]] bool expectTag(std::span<const std::uint8_t> tag) noexcept
    {
        std::array<std::uint8_t, strongbox::crypto::g_aeadTagBytes> copy{};
        for (std::size_t i{}; i < copy.size() && i < tag.size(); ++i)
        {
            copy[i] = tag[i];
        }
        return EVP_CIPHER_CTX_ctrl(m_ctx.get(), EVP_CTRL_AEAD_SET_TAG, static_cast<int>(copy.size()), copy.data()) ==
               1;
    }

private:
    std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)> m_ctx;
    int m_enc;
};

class OpenSslCryptoProvider final : public strongbox::crypto::ICryptoProvider
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
        checkKey(key, "openssl seal");
        checkEvpLength(plainText.size(), "openssl seal", "plaintext");
        checkEvpLength(associatedData.size(), "openssl seal", "associated data");

        strongbox::crypto::AeadBox sealed{};
        if (!randomBytes(sealed.nonce))
        {
            throw std::runtime_error("openssl seal: nonce generation failed");
        }
        sealed.cipherText.resize(plainText.size());

        EvpChachaSession session{ key, sealed.nonce, Direction::Seal };
        if (!session.authenticate(associatedData) ||
            !session.transform(uchars(plainText), plainText.size(), sealed.cipherText.data()) || !session.finish() ||
            !session.readTag(sealed.tag))
        {
            throw std::runtime_error("openssl seal: cipher operation failed");
        }
        return sealed;
    }

    [[nodiscard]] std::optional<strongbox::security::SecureBuffer>
    aeadDecrypt(std::span<const std::uint8_t> key, const strongbox::crypto::AeadBox& sealed,
                std::span<const std::byte> associatedData) override
    {
        checkKey(key, "openssl open");
        checkEvpLength(sealed.cipherText.size(), "openssl open", "ciphertext");
        checkEvpLength(associatedData.size(), "openssl open", "associated data");

        EvpChachaSession session{ key, sealed.nonce, Direction::Open };
        if (!session.authenticate(associatedData))
        {
            throw std::runtime_error("openssl open: cipher operation failed");
        }

        strongbox::security::SecureBuffer opened(sealed.cipherText.size());
        if (!session.transform(sealed.cipherText.data(), sealed.cipherText.size(), opened.data()))
        {
            strongbox::security::secureRelease(opened);
            return std::nullopt;
        }
        if (!session.expectTag(sealed.tag))
        {
            throw std::runtime_error("openssl open: cannot install tag");
        }
        if (!session.finish())
        {
            strongbox::security::secureRelease(opened);
            return std::nullopt;
        }
        return opened;
    }
};

} // namespace

[[nodiscard]] std::unique_ptr<strongbox::crypto::ICryptoProvider> makeOpenSslCryptoProvider()
{
    return std::make_unique<OpenSslCryptoProvider>();
}

} // namespace strongbox::crypto::providers
