// Contract violations on onebox::Box<T> abort the process
//
// Each misuse runs in a forked child; the parent checks that the child
// died from SIGABRT instead of touching freed memory.
#include "onebox/onebox.hpp"
#include <sys/wait.h>
#include <unistd.h>
#include <cassert>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <string>

using namespace onebox;

template<typename F>
bool aborts(F misuse) {
    fflush(stdout);
    fflush(stderr);
    pid_t pid = fork();
    assert(pid >= 0);
    if (pid == 0) {
        misuse();
        _exit(0);
    }
    int status = 0;
    waitpid(pid, &status, 0);
    return WIFSIGNALED(status) && WTERMSIG(status) == SIGABRT;
}

void test_contract_deref_after_into_inner() {
    printf("test_contract_deref_after_into_inner: ");
    assert(aborts([] {
        auto boxed = Box<int>::new_(1);
        int v = std::move(boxed).into_inner();
        (void)v;
        volatile int again = *boxed;
        (void)again;
    }));
    assert(aborts([] {
        auto boxed = Box<Unit>::new_(unit);
        Unit v = std::move(boxed).into_inner();
        (void)v;
        Unit again = *boxed;
        (void)again;
    }));
    printf("PASS\n");
}

void test_contract_double_into_inner() {
    printf("test_contract_double_into_inner: ");
    assert(aborts([] {
        auto boxed = Box<std::string>::new_("once");
        std::string first = std::move(boxed).into_inner();
        std::string second = std::move(boxed).into_inner();
        (void)first;
        (void)second;
    }));
    printf("PASS\n");
}

void test_contract_use_after_move() {
    printf("test_contract_use_after_move: ");
    assert(aborts([] {
        auto boxed = Box<std::string>::new_("moved");
        auto other = std::move(boxed);
        (void)other;
        volatile std::size_t n = boxed->size();
        (void)n;
    }));
    assert(aborts([] {
        auto boxed = Box<int>::new_(3);
        auto other = std::move(boxed);
        auto copy = boxed.clone();
        (void)copy;
    }));
    printf("PASS\n");
}

// Heap exhaustion is fatal rather than a recoverable error
void test_contract_alloc_failure() {
    printf("test_contract_alloc_failure: ");
    assert(aborts([] {
        void* p = allocate(Layout{SIZE_MAX / 2, 16});
        (void)p;
    }));
    printf("PASS\n");
}

// Valid use in a child exits normally
void test_contract_valid_use() {
    printf("test_contract_valid_use: ");
    assert(!aborts([] {
        auto boxed = Box<int>::new_(4);
        *boxed += 1;
        int v = std::move(boxed).into_inner();
        (void)v;
    }));
    printf("PASS\n");
}

int main() {
    printf("=== Testing onebox contract checks ===\n");

    test_contract_deref_after_into_inner();
    test_contract_double_into_inner();
    test_contract_use_after_move();
    test_contract_alloc_failure();
    test_contract_valid_use();

    printf("\nAll contract tests passed!\n");
    return 0;
}
