#include "strongbox/core/Ids.hpp"
#include "strongbox/security/SecureRandom.hpp"

namespace strongbox::core
{
namespace
{

[[nodiscard]] std::optional<std::uint8_t> nibble(char c) noexcept
{
    if (c >= '0' && c <= '9')
    {
        return static_cast<std::uint8_t>(c - '0');
    }
    if (c >= 'a' && c <= 'f')
    {
        return static_cast<std::uint8_t>(c - 'a' + 10);
    }
    if (c >= 'A' && c <= 'F')
    {
        return static_cast<std::uint8_t>(c - 'A' + 10);
    }
    return std::nullopt;
}

} // namespace

[[nodiscard]] std::string toHex(std::span<const std::uint8_t> bytes)
{
    constexpr char kHex[] = "0123456789abcdef";
    constexpr std::uint8_t kNibbleShift{ 4U };
    constexpr std::uint8_t kNibbleMask{ 0x0FU };

    std::string out;
    out.reserve(bytes.size() * 2U);
    for (const std::uint8_t b : bytes)
    {
        out.push_back(kHex[(b >> kNibbleShift) & kNibbleMask]);
        out.push_back(kHex[b & kNibbleMask]);
    }
    return out;
}

[[nodiscard]] std::optional<IdBytes> idBytesFromHex(std::string_view hex) noexcept
{
    if (hex.size() != g_idBytes * 2U)
    {
        return std::nullopt;
    }

    IdBytes out{};
    for (std::size_t i{}; i < out.size(); ++i)
    {
        const auto hi{ nibble(hex[2U * i]) };
        const auto lo{ nibble(hex[(2U * i) + 1U]) };
        if (!hi || !lo)
        {
            return std::nullopt;
        }
        out[i] = static_cast<std::uint8_t>((*hi << 4U) | *lo);
    }
    return out;
}

[[nodiscard]] bool randomIdBytes(IdBytes& out) noexcept
{
    return strongbox::security::secureRandomFill(std::span<std::uint8_t>{ out });
}

} // namespace strongbox::core
