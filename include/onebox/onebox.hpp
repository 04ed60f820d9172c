#ifndef ONEBOX_HPP
#define ONEBOX_HPP

// onebox - a single heap-allocated value with exactly-once cleanup
//
// Box<T> owns one T on the heap (nothing at all for zero-sized T) and
// frees it exactly once: when the Box is destroyed, or when the value is
// moved back out with into_inner().

#include "onebox/layout.hpp"
#include "onebox/unit.hpp"
#include "onebox/box.hpp"

// @safe
namespace onebox {
    template<typename T>
    using SingleValueBox = Box<T>;
}

#endif // ONEBOX_HPP
