#ifndef INCLUDE_STRONGBOX_CORE_LOCATION_HPP
#define INCLUDE_STRONGBOX_CORE_LOCATION_HPP

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <variant>
#include <vector>

namespace strongbox::core
{

using Bytes = std::vector<std::uint8_t>;

[[nodiscard]] inline Bytes bytesFrom(std::string_view s)
{
    return Bytes(s.begin(), s.end());
}

// Both components are derived independently.
struct GenericLocation final
{
    Bytes vaultPath;
    Bytes recordPath;
};

// The record id is derived from the vault path and the counter.
struct CounterLocation final
{
    Bytes vaultPath;
    std::uint64_t counter{ 0U };
};

using Location = std::variant<GenericLocation, CounterLocation>;

[[nodiscard]] inline Location genericLocation(std::string_view vaultPath, std::string_view recordPath)
{
    return GenericLocation{ bytesFrom(vaultPath), bytesFrom(recordPath) };
}

[[nodiscard]] inline Location counterLocation(std::string_view vaultPath, std::uint64_t counter)
{
    return CounterLocation{ bytesFrom(vaultPath), counter };
}

} // namespace strongbox::core

#endif // INCLUDE_STRONGBOX_CORE_LOCATION_HPP
