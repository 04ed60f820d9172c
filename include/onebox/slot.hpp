#ifndef ONEBOX_SLOT_HPP
#define ONEBOX_SLOT_HPP

#include <new>
#include <type_traits>
#include <utility>

#include "onebox/layout.hpp"

// Slot<T> - storage for exactly one T
//
// All raw memory handling of onebox lives here: allocation, placement
// construction, in-place destruction, moving the value out and freeing.
// Box<T> only ever talks to a Slot.
//
// A Slot is either live (holds an initialized T) or empty. An empty slot
// owns no memory and its destructor is a no-op, so every path frees at
// most once.

// @unsafe
namespace onebox {
namespace detail {

template<typename T, bool = is_zero_sized_v<T>>
class Slot;

// Sized payload: the value lives in its own heap allocation.
template<typename T>
class Slot<T, false> {
private:
    // invariant: null, or the unique pointer to an allocation of kLayout
    // holding an initialized T
    T* ptr_;

    // T may be const-qualified, the allocator only deals in void*
    static void* storage(T* p) noexcept {
        return const_cast<void*>(static_cast<const void*>(p));
    }

public:
    static constexpr Layout kLayout = Layout::of<T>();

    Slot() noexcept : ptr_(nullptr) {}

    Slot(Slot&& other) noexcept : ptr_(other.ptr_) {
        other.ptr_ = nullptr;
    }

    Slot(const Slot&) = delete;
    Slot& operator=(const Slot&) = delete;
    Slot& operator=(Slot&&) = delete;

    ~Slot() { reset(); }

    // @lifetime: owned
    template<typename... Args>
    void emplace(Args&&... args) {
        void* raw = allocate(kLayout);
        try {
            ptr_ = ::new (raw) T(std::forward<Args>(args)...);
        } catch (...) {
            // the payload never came to life, give the memory back
            deallocate(raw, kLayout);
            throw;
        }
    }

    bool live() const noexcept { return ptr_ != nullptr; }

    // @lifetime: (&'a) -> &'a
    T* address() const noexcept { return ptr_; }

    // Move the value out, end its lifetime and free the allocation.
    // If T's move constructor throws, the slot is left untouched.
    // @lifetime: owned
    T take() {
        T value(std::move(*ptr_));
        ptr_->~T();
        deallocate(storage(ptr_), kLayout);
        ptr_ = nullptr;
        return value;
    }

    // Destroy the value in place first, then free its allocation.
    void reset() noexcept {
        if (ptr_ == nullptr) {
            return;
        }
        T* doomed = ptr_;
        ptr_ = nullptr;
        doomed->~T();
        deallocate(storage(doomed), kLayout);
    }

    void swap(Slot& other) noexcept { std::swap(ptr_, other.ptr_); }
};

// Zero-sized payload: never allocates. The empty object is kept in a
// placeholder buffer inside the slot itself.
template<typename T>
class Slot<T, true> {
private:
    alignas(T) unsigned char placeholder_[sizeof(T)];
    bool live_;

    T* object() noexcept {
        return std::launder(reinterpret_cast<T*>(placeholder_));
    }

    const T* object() const noexcept {
        return std::launder(reinterpret_cast<const T*>(placeholder_));
    }

public:
    static constexpr Layout kLayout = Layout::of<T>();

    Slot() noexcept : live_(false) {}

    Slot(Slot&& other) noexcept(std::is_nothrow_move_constructible<T>::value)
        : live_(false) {
        if (other.live_) {
            emplace(std::move(*other.object()));
            other.reset();
        }
    }

    Slot(const Slot&) = delete;
    Slot& operator=(const Slot&) = delete;
    Slot& operator=(Slot&&) = delete;

    ~Slot() { reset(); }

    // @lifetime: owned
    template<typename... Args>
    void emplace(Args&&... args) {
        ::new (static_cast<void*>(placeholder_)) T(std::forward<Args>(args)...);
        live_ = true;
    }

    bool live() const noexcept { return live_; }

    // @lifetime: (&'a) -> &'a
    T* address() const noexcept {
        return live_ ? const_cast<T*>(object()) : nullptr;
    }

    // @lifetime: owned
    T take() {
        T value(std::move(*object()));
        object()->~T();
        live_ = false;
        return value;
    }

    void reset() noexcept {
        if (!live_) {
            return;
        }
        live_ = false;
        object()->~T();
    }

    void swap(Slot& other) noexcept(std::is_nothrow_move_constructible<T>::value) {
        Slot tmp(std::move(other));
        if (live_) {
            other.emplace(std::move(*object()));
            reset();
        }
        if (tmp.live_) {
            emplace(std::move(*tmp.object()));
        }
    }
};

} // namespace detail
} // namespace onebox

#endif // ONEBOX_SLOT_HPP
