#ifndef INCLUDE_STRONGBOX_SECURITY_ZEROALLOCATOR_HPP
#define INCLUDE_STRONGBOX_SECURITY_ZEROALLOCATOR_HPP

#include "strongbox/security/MemoryWiper.hpp"
#include <cstddef>
#include <limits>
#include <new>
#include <span>
#include <type_traits>

namespace strongbox::security
{

// Stateless allocator for key and secret storage. Freed blocks are zeroed first, so a vector
// that grows never leaves an old copy of a secret on the heap.
template <class T> struct ZeroAllocator
{
    using value_type = T;
    using is_always_equal = std::true_type;
    using propagate_on_container_move_assignment = std::true_type;
    using propagate_on_container_swap = std::true_type;

    static constexpr std::size_t kMaxElements{ std::numeric_limits<std::size_t>::max() / sizeof(T) };

    ZeroAllocator() noexcept = default;

    template <class U> constexpr explicit ZeroAllocator(const ZeroAllocator<U>& /*rebound*/) noexcept
    {
    }

    [[nodiscard]] T* allocate(std::size_t count)
    {
        if (count > kMaxElements)
        {
            throw std::bad_array_new_length{};
        }
        return count == 0U ? nullptr
                           : static_cast<T*>(::operator new(count * sizeof(T), std::align_val_t{ alignof(T) }));
    }

    void deallocate(T* block, std::size_t count) noexcept
    {
        if (block != nullptr)
        {
            secureWipe(std::as_writable_bytes(std::span<T>{ block, count }));
            ::operator delete(block, std::align_val_t{ alignof(T) });
        }
    }
};

template <class T, class U>
constexpr bool operator==(const ZeroAllocator<T>& /*lhs*/, const ZeroAllocator<U>& /*rhs*/) noexcept
{
    return true;
}

} // namespace strongbox::security

#endif // INCLUDE_STRONGBOX_SECURITY_ZEROALLOCATOR_HPP
