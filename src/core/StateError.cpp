#include "strongbox/core/StateError.hpp"

namespace strongbox::core
{

[[nodiscard]] std::string_view describe(StateError error) noexcept
{
    switch (error)
    {
    case StateError::NotExisting:
        return "not existing";
    case StateError::BadPasswordOrCorrupt:
        return "bad password or corrupt snapshot";
    case StateError::IoFailure:
        return "i/o failure";
    case StateError::InternalInvariantViolation:
        return "internal invariant violation";
    case StateError::RandomFailed:
        return "random generator failure";
    case StateError::CryptoError:
        return "crypto error";
    case StateError::WrongVaultKey:
        return "wrong vault key";
    }
    return "unknown error";
}

} // namespace strongbox::core
