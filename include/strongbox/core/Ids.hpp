#ifndef INCLUDE_STRONGBOX_CORE_IDS_HPP
#define INCLUDE_STRONGBOX_CORE_IDS_HPP

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace strongbox::core
{

constexpr std::size_t g_idBytes{ 24U };

using IdBytes = std::array<std::uint8_t, g_idBytes>;

[[nodiscard]] std::string toHex(std::span<const std::uint8_t> bytes);

[[nodiscard]] std::optional<IdBytes> idBytesFromHex(std::string_view hex) noexcept;

[[nodiscard]] bool randomIdBytes(IdBytes& out) noexcept;

// Fixed-width identifier; the tag keeps client, vault and record ids from being mixed up.
template <class Tag> class BasicId final
{
public:
    BasicId() = default;
    explicit BasicId(const IdBytes& bytes) noexcept : m_bytes(bytes)
    {
    }

    [[nodiscard]] static std::optional<BasicId> fromSpan(std::span<const std::uint8_t> bytes) noexcept
    {
        if (bytes.size() != g_idBytes)
        {
            return std::nullopt;
        }
        IdBytes raw{};
        std::memcpy(raw.data(), bytes.data(), raw.size());
        return BasicId{ raw };
    }

    [[nodiscard]] static std::optional<BasicId> fromHex(std::string_view hex) noexcept
    {
        const auto raw{ idBytesFromHex(hex) };
        if (!raw)
        {
            return std::nullopt;
        }
        return BasicId{ *raw };
    }

    // Random id for vaults created outside the path scheme.
    [[nodiscard]] static std::optional<BasicId> random() noexcept
    {
        IdBytes raw{};
        if (!randomIdBytes(raw))
        {
            return std::nullopt;
        }
        return BasicId{ raw };
    }

    [[nodiscard]] const IdBytes& bytes() const noexcept
    {
        return m_bytes;
    }

    [[nodiscard]] std::span<const std::uint8_t> asSpan() const noexcept
    {
        return std::span<const std::uint8_t>{ m_bytes };
    }

    [[nodiscard]] std::string toString() const
    {
        return toHex(asSpan());
    }

    // Short form for logs.
    [[nodiscard]] std::string shortString() const
    {
        constexpr std::size_t kShortBytes{ 4U };
        return toHex(asSpan().first(kShortBytes));
    }

    friend auto operator<=>(const BasicId&, const BasicId&) = default;

private:
    IdBytes m_bytes{};
};

struct ClientIdTag;
struct VaultIdTag;
struct RecordIdTag;

using ClientId = BasicId<ClientIdTag>;
using VaultId = BasicId<VaultIdTag>;
using RecordId = BasicId<RecordIdTag>;

} // namespace strongbox::core

namespace std
{

template <class Tag> struct hash<strongbox::core::BasicId<Tag>>
{
    [[nodiscard]] std::size_t operator()(const strongbox::core::BasicId<Tag>& id) const noexcept
    {
        // Ids are HMAC outputs or CSPRNG bytes, so any window is uniformly distributed.
        std::size_t out{};
        std::memcpy(&out, id.bytes().data(), sizeof(out));
        return out;
    }
};

} // namespace std

#endif // INCLUDE_STRONGBOX_CORE_IDS_HPP
