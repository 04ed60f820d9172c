#include "onebox/layout.hpp"

#include <cstdlib>
#include <iostream>
#include <new>

#include "onebox/utils.hpp"

namespace onebox {

void* allocate(Layout layout) {
    ONEBOX_VERIFY(!layout.is_zero_sized(),
                  "zero-sized payloads must never reach the allocator");
    void* raw = ::operator new(layout.size, std::align_val_t(layout.align),
                               std::nothrow);
    if (raw == nullptr) {
        handle_alloc_error(layout);
    }
    return raw;
}

void deallocate(void* ptr, Layout layout) noexcept {
    ::operator delete(ptr, layout.size, std::align_val_t(layout.align));
}

void handle_alloc_error(Layout layout) noexcept {
    std::cerr << "memory allocation of " << layout.size
              << " bytes failed (align " << layout.align << ")" << std::endl;
    ONEBOX_PRINT_STACK_TRACE();
    std::abort();
}

} // namespace onebox
