// Walkthrough of onebox::Box<T>: put a value on the heap, change it,
// copy it, and take it back.
#include <iostream>
#include <string>

#include "onebox/onebox.hpp"

using onebox::Box;

struct Account {
    std::string owner;
    long balance;
};

std::ostream& operator<<(std::ostream& os, const Account& a) {
    return os << a.owner << ": " << a.balance;
}

int main() {
    auto number = Box<int>::new_(1);
    *number = 2;
    std::cout << "box holds " << number << std::endl;

    auto account = onebox::make_box<Account>(Account{"ada", 100});
    auto backup = account.clone();
    account->balance -= 40;
    std::cout << "after withdrawal " << account << ", backup " << backup
              << std::endl;

    // Box<Unit> never touches the heap
    auto nothing = Box<onebox::Unit>::new_(onebox::unit);
    std::cout << "unit box " << nothing << std::endl;

    Account restored = std::move(account).into_inner();
    std::cout << "unwrapped " << restored << std::endl;

    return 0;
}
