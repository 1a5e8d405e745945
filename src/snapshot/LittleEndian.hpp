#ifndef STRONGBOX_SRC_SNAPSHOT_LITTLEENDIAN_HPP
#define STRONGBOX_SRC_SNAPSHOT_LITTLEENDIAN_HPP

#include "strongbox/security/SecureBuffer.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>

namespace strongbox::snapshot::detail
{

constexpr std::size_t g_kU32Bytes{ sizeof(std::uint32_t) };
constexpr std::size_t g_kU64Bytes{ sizeof(std::uint64_t) };

constexpr std::uint64_t g_kByteMaskU64{ 0xFFU };
constexpr std::uint64_t g_kBitsPerByte{ 8U };

// Appends little-endian fields to a wiped-on-release buffer; the encoded state carries vault keys.
class ByteWriter final
{
public:
    explicit ByteWriter(strongbox::security::SecureBuffer& out) noexcept : m_out(&out)
    {
    }

    void putU8(std::uint8_t v)
    {
        m_out->push_back(v);
    }

    void putU32(std::uint32_t v)
    {
        for (std::size_t i{}; i < g_kU32Bytes; ++i)
        {
            const std::uint32_t shiftBits{ static_cast<std::uint32_t>(i * g_kBitsPerByte) };
            m_out->push_back(static_cast<std::uint8_t>((v >> shiftBits) & g_kByteMaskU64));
        }
    }

    void putU64(std::uint64_t v)
    {
        for (std::size_t i{}; i < g_kU64Bytes; ++i)
        {
            const std::uint64_t shiftBits{ static_cast<std::uint64_t>(i) * g_kBitsPerByte };
            m_out->push_back(static_cast<std::uint8_t>((v >> shiftBits) & g_kByteMaskU64));
        }
    }

    void putRaw(std::span<const std::uint8_t> bytes)
    {
        m_out->insert(m_out->end(), bytes.begin(), bytes.end());
    }

    // u32 length prefix, then the bytes.
    void putBlob(std::span<const std::uint8_t> bytes)
    {
        putU32(checkedCount(bytes.size()));
        putRaw(bytes);
    }

    [[nodiscard]] static std::uint32_t checkedCount(std::size_t n)
    {
        if (n > UINT32_MAX)
        {
            throw std::length_error("snapshot field does not fit a u32 length");
        }
        return static_cast<std::uint32_t>(n);
    }

private:
    strongbox::security::SecureBuffer* m_out;
};

// Bounds-checked cursor. Throws std::runtime_error on truncation.
class ByteReader final
{
public:
    explicit ByteReader(std::span<const std::uint8_t> in) noexcept : m_in(in)
    {
    }

    [[nodiscard]] std::uint8_t getU8()
    {
        return take(1U)[0];
    }

    [[nodiscard]] std::uint32_t getU32()
    {
        const auto in{ take(g_kU32Bytes) };
        std::uint32_t v{ 0U };
        for (std::size_t i{}; i < in.size(); ++i)
        {
            v |= static_cast<std::uint32_t>(in[i]) << static_cast<std::uint32_t>(i * g_kBitsPerByte);
        }
        return v;
    }

    [[nodiscard]] std::uint64_t getU64()
    {
        const auto in{ take(g_kU64Bytes) };
        std::uint64_t v{ 0U };
        for (std::size_t i{}; i < in.size(); ++i)
        {
            v |= static_cast<std::uint64_t>(in[i]) << (static_cast<std::uint64_t>(i) * g_kBitsPerByte);
        }
        return v;
    }

    [[nodiscard]] std::span<const std::uint8_t> getRaw(std::size_t n)
    {
        return take(n);
    }

    [[nodiscard]] std::span<const std::uint8_t> getBlob()
    {
        const std::size_t n{ getU32() };
        return take(n);
    }

    [[nodiscard]] std::size_t remaining() const noexcept
    {
        return m_in.size() - m_offset;
    }

private:
    [[nodiscard]] std::span<const std::uint8_t> take(std::size_t n)
    {
        if (n > remaining())
        {
            throw std::runtime_error("snapshot data is truncated");
        }
        const auto out{ m_in.subspan(m_offset, n) };
        m_offset += n;
        return out;
    }

    std::span<const std::uint8_t> m_in;
    std::size_t m_offset{};
};

} // namespace strongbox::snapshot::detail

#endif // STRONGBOX_SRC_SNAPSHOT_LITTLEENDIAN_HPP
