#ifndef ONEBOX_LAYOUT_HPP
#define ONEBOX_LAYOUT_HPP

#include <cstddef>
#include <type_traits>

// Layout - size and alignment of a single payload value
// Equivalent to Rust's core::alloc::Layout, restricted to one value
//
// The only functions in onebox that touch the global heap are declared
// here. Everything else goes through them.

namespace onebox {

// A type whose values need no storage. C++ gives every object at least one
// byte, so "no storage" means a class with no data members.
template<typename T>
struct is_zero_sized : std::integral_constant<bool, std::is_empty<T>::value> {};

template<typename T>
inline constexpr bool is_zero_sized_v = is_zero_sized<T>::value;

struct Layout {
    std::size_t size;
    std::size_t align;

    template<typename T>
    static constexpr Layout of() {
        return Layout{is_zero_sized_v<T> ? 0 : sizeof(T), alignof(T)};
    }

    constexpr bool is_zero_sized() const { return size == 0; }
};

constexpr bool operator==(Layout a, Layout b) {
    return a.size == b.size && a.align == b.align;
}

constexpr bool operator!=(Layout a, Layout b) {
    return !(a == b);
}

// Request exactly one slot of `layout` from the global heap.
// Never returns null: exhaustion calls handle_alloc_error().
// `layout` must not be zero-sized.
void* allocate(Layout layout);

// Return a slot obtained from allocate() with the same layout.
void deallocate(void* ptr, Layout layout) noexcept;

// Reports the failed request and aborts the process.
[[noreturn]] void handle_alloc_error(Layout layout) noexcept;

} // namespace onebox

#endif // ONEBOX_LAYOUT_HPP
