#ifndef INCLUDE_NOPASSPLZ_SECURITY_ZEROALLOCATOR_HPP
#define INCLUDE_NOPASSPLZ_SECURITY_ZEROALLOCATOR_HPP

#include "nopassplz/security/MemoryWiper.hpp"
#include <cstddef>
#include <limits>
#include <new>
#include <span>
#include <type_traits>

namespace nopassplz::security
{

// Allocator for containers of secret bytes. Storage is zeroed before it returns to the heap,
// which also covers the old block a vector drops when it grows.
template <class T> class ZeroAllocator
{
    static_assert(std::is_trivially_copyable_v<T>, "ZeroAllocator only holds trivially copyable values");

public:
    using value_type = T;
    using is_always_equal = std::true_type;
    using propagate_on_container_move_assignment = std::true_type;
    using propagate_on_container_swap = std::true_type;

    constexpr ZeroAllocator() noexcept = default;

    template <class U> constexpr ZeroAllocator(const ZeroAllocator<U>& /*other*/) noexcept
    {
    }

    [[nodiscard]] T* allocate(std::size_t n)
    {
        if (n == 0U)
        {
            return nullptr;
        }
        if (n > max_size())
        {
            throw std::bad_array_new_length{};
        }
        return static_cast<T*>(::operator new(n * sizeof(T), std::align_val_t{ alignof(T) }));
    }

    void deallocate(T* p, std::size_t n) noexcept
    {
        if (p == nullptr)
        {
            return;
        }
        secureWipe(std::span<T>{ p, n });
        ::operator delete(p, std::align_val_t{ alignof(T) });
    }

    [[nodiscard]] static constexpr std::size_t max_size() noexcept
    {
        return std::numeric_limits<std::size_t>::max() / sizeof(T);
    }

    template <class U> constexpr bool operator==(const ZeroAllocator<U>& /*other*/) const noexcept
    {
        return true;
    }
};

} // namespace nopassplz::security

#endif // INCLUDE_NOPASSPLZ_SECURITY_ZEROALLOCATOR_HPP
