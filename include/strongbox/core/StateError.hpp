#ifndef INCLUDE_STRONGBOX_CORE_STATEERROR_HPP
#define INCLUDE_STRONGBOX_CORE_STATEERROR_HPP

#include <cstdint>
#include <string_view>
#include <variant>

namespace strongbox::core
{

enum class StateError : std::uint8_t
{
    NotExisting,
    BadPasswordOrCorrupt,
    IoFailure,
    InternalInvariantViolation,
    RandomFailed,
    CryptoError,
    WrongVaultKey,
};

template <class T> using StateResult = std::variant<T, StateError>;

// Text carried by error replies. Never includes key material or paths.
[[nodiscard]] std::string_view describe(StateError error) noexcept;

template <class T> [[nodiscard]] bool isError(const StateResult<T>& result) noexcept
{
    return std::holds_alternative<StateError>(result);
}

} // namespace strongbox::core

#endif // INCLUDE_STRONGBOX_CORE_STATEERROR_HPP
