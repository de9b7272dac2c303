#pragma once

#include "../account.hpp"
#include <string>
#include <vector>

namespace instman {

struct AccountListing {
    std::vector<Account> accounts;
    // Entries that exist but could not be read, so their accounts are unknown
    std::vector<std::string> skipped;

    [[nodiscard]] bool complete() const { return skipped.empty(); }
};

// Owner of the account list. Accounts are never created or deleted here.
class IAccountSource {
public:
    virtual ~IAccountSource() = default;

    // Throws StorageError when the account store itself cannot be read
    virtual AccountListing read_accounts() = 0;

    std::vector<Account> list_accounts() { return read_accounts().accounts; }
};

} // namespace instman
