#ifndef ONEBOX_BOX_HPP
#define ONEBOX_BOX_HPP

#include <ostream>
#include <type_traits>  // for std::enable_if, std::is_copy_constructible
#include <utility>  // for std::move, std::forward, std::in_place

#include "onebox/layout.hpp"
#include "onebox/slot.hpp"
#include "onebox/utils.hpp"

// Box<T> - A single heap-allocated value with single ownership
// Equivalent to Rust's Box<T>
//
// Guarantees:
// - Exactly one T, allocated with T's own size and alignment
// - Zero-sized T never touches the heap
// - The slot is freed exactly once, by the destructor or by into_inner()
// - Move semantics only; deep copies are explicit through clone()
// - Using a Box after into_inner() or after a move aborts

// @safe
namespace onebox {

template<typename T>
class Box {
private:
    detail::Slot<T> slot_;

    static constexpr bool kNothrowMove =
        std::is_nothrow_move_constructible<detail::Slot<T>>::value;

public:
    // No default constructor - a Box always starts out owning a value
    Box() = delete;

    // Construct the payload directly in its slot
    // @lifetime: owned
    template<typename... Args>
    explicit Box(std::in_place_t, Args&&... args) {
        slot_.emplace(std::forward<Args>(args)...);
    }

    // Rust-idiomatic factory method - Box::new()
    // @lifetime: owned
    static Box<T> new_(T value) {
        return Box<T>(std::in_place, std::move(value));
    }

    // C++-friendly factory method
    // @lifetime: owned
    static Box<T> make(T value) {
        return new_(std::move(value));
    }

    // No implicit copies - use clone()
    Box(const Box&) = delete;
    Box& operator=(const Box&) = delete;

    // Move constructor - transfers ownership, other becomes consumed
    // @lifetime: owned
    Box(Box&& other) noexcept(kNothrowMove) : slot_(std::move(other.slot_)) {}

    // Move assignment - takes over other's slot, then frees our old value
    // other may live inside our own payload (head = std::move(head->next)),
    // so it is emptied before anything is destroyed
    // @lifetime: owned
    Box& operator=(Box&& other) noexcept(kNothrowMove) {
        if (this != &other) {
            detail::Slot<T> incoming(std::move(other.slot_));
            slot_.reset();
            slot_.swap(incoming);
        }
        return *this;
    }

    // Destructor - payload cleanup first, then the slot is freed
    ~Box() {
        slot_.reset();
    }

    // Dereference - borrow the value
    // @lifetime: (&'a) -> &'a
    T& operator*() {
        ONEBOX_VERIFY(slot_.live(), "dereferencing a consumed Box");
        return *slot_.address();
    }

    // @lifetime: (&'a) -> &'a
    const T& operator*() const {
        ONEBOX_VERIFY(slot_.live(), "dereferencing a consumed Box");
        return *slot_.address();
    }

    // Arrow operator - access members
    // @lifetime: (&'a) -> &'a
    T* operator->() {
        ONEBOX_VERIFY(slot_.live(), "dereferencing a consumed Box");
        return slot_.address();
    }

    // @lifetime: (&'a) -> &'a
    const T* operator->() const {
        ONEBOX_VERIFY(slot_.live(), "dereferencing a consumed Box");
        return slot_.address();
    }

    // Raw pointer without transferring ownership, nullptr once consumed
    // @lifetime: (&'a) -> &'a
    T* get() {
        return slot_.address();
    }

    // @lifetime: (&'a) -> &'a
    const T* get() const {
        return slot_.address();
    }

    bool is_valid() const {
        return slot_.live();
    }

    explicit operator bool() const {
        return is_valid();
    }

    // Move the value back to the caller and free the slot (Rust: Box::into_inner)
    // Only callable on an rvalue: std::move(b).into_inner()
    // @lifetime: owned
    T into_inner() && {
        ONEBOX_VERIFY(slot_.live(), "into_inner() on a consumed Box");
        return slot_.take();
    }

    // Deep copy into a fresh, independent slot
    // @lifetime: owned
    Box clone() const {
        static_assert(std::is_copy_constructible<T>::value,
                      "Box<T>::clone() requires a copy-constructible T");
        ONEBOX_VERIFY(slot_.live(), "cloning a consumed Box");
        return Box(std::in_place, static_cast<const T&>(*slot_.address()));
    }

    void swap(Box& other) noexcept(kNothrowMove) {
        slot_.swap(other.slot_);
    }

    // Layout used for every allocation and free of this Box type
    static constexpr Layout layout() {
        return detail::Slot<T>::kLayout;
    }
};

template<typename T>
void swap(Box<T>& a, Box<T>& b) noexcept(noexcept(a.swap(b))) {
    a.swap(b);
}

// Rust-idiomatic factory function
template<typename T, typename... Args>
// @lifetime: owned
Box<T> box(Args&&... args) {
    return Box<T>(std::in_place, std::forward<Args>(args)...);
}

// Factory function following C++ make_* convention
template<typename T, typename... Args>
// @lifetime: owned
Box<T> make_box(Args&&... args) {
    return Box<T>(std::in_place, std::forward<Args>(args)...);
}

namespace detail {

template<typename T, typename = void>
struct is_streamable : std::false_type {};

template<typename T>
struct is_streamable<T, std::void_t<decltype(std::declval<std::ostream&>()
                                             << std::declval<const T&>())>>
    : std::true_type {};

} // namespace detail

// Debug rendering: Box(<value>)
template<typename T, typename = typename std::enable_if<
    detail::is_streamable<T>::value>::type>
std::ostream& operator<<(std::ostream& os, const Box<T>& b) {
    if (!b.is_valid()) {
        return os << "Box(<consumed>)";
    }
    return os << "Box(" << *b << ")";
}

} // namespace onebox

#endif // ONEBOX_BOX_HPP
