#ifndef ONEBOX_UTILS_HPP
#define ONEBOX_UTILS_HPP

#include <execinfo.h>

#include <cstdlib>
#include <iostream>

#ifndef DBG_MACRO_NO_WARNING
#define DBG_MACRO_NO_WARNING
#endif
#include <dbg.h>

// Contract checking for onebox.
//
// A failed check is a bug in the caller (e.g. dereferencing a Box after
// into_inner()), never a runtime condition, so it reports and aborts.

#define ONEBOX_PRINT_STACK_TRACE()                                     \
	do {                                                               \
		void* buffer[30];                                              \
		int size = backtrace(buffer, 30);                              \
		char** symbols = backtrace_symbols(buffer, size);              \
		if (symbols == nullptr) {                                      \
			std::cerr << "Failed to obtain stack trace." << std::endl; \
			break;                                                     \
		}                                                              \
		std::cerr << "Stack trace:" << std::endl;                      \
		for (int i = 0; i < size; ++i) {                               \
			std::cerr << symbols[i] << std::endl;                      \
		}                                                              \
		free(symbols);                                                 \
	} while (0)

#ifndef ONEBOX_VERIFY
#ifdef ONEBOX_INFER_CHECK
// infer run --pulse-only -- clang++ -std=c++17 -D ONEBOX_INFER_CHECK=1 ...
#define ONEBOX_VERIFY(x, errmsg)       \
	{                                  \
		if (!(x)) {                    \
			volatile int* a = nullptr; \
			*a;                        \
		}                              \
	}
#else
#define ONEBOX_VERIFY(x, errmsg)        \
	do {                                \
		if (!(x)) {                     \
			dbg(x, errmsg);             \
			ONEBOX_PRINT_STACK_TRACE(); \
			std::abort();               \
		}                               \
	} while (0)
#endif
#endif

#endif // ONEBOX_UTILS_HPP
