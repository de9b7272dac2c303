#pragma once

#include "interfaces/i_account_source.hpp"
#include <filesystem>

namespace instman {

// Reads one account per <accounts_dir>/*.json, sorted by file name.
// Unreadable or malformed files are skipped with a warning and reported in
// the listing. A missing or unlistable directory is a StorageError.
class JsonAccountSource : public IAccountSource {
public:
    explicit JsonAccountSource(std::filesystem::path accounts_dir);
    ~JsonAccountSource() override = default;

    AccountListing read_accounts() override;

private:
    std::filesystem::path accounts_dir_;
};

} // namespace instman
