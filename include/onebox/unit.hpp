#ifndef ONEBOX_UNIT_HPP
#define ONEBOX_UNIT_HPP

#include <ostream>

// Unit - the value of a type with exactly one value
// Equivalent to Rust's ()
//
// Unit is zero-sized, so Box<Unit> never allocates.

// @safe
namespace onebox {

struct Unit {};

inline constexpr Unit unit{};

constexpr bool operator==(Unit, Unit) { return true; }
constexpr bool operator!=(Unit, Unit) { return false; }

inline std::ostream& operator<<(std::ostream& os, Unit) {
    return os << "()";
}

} // namespace onebox

#endif // ONEBOX_UNIT_HPP
