#include "json_account_source.hpp"
#include "errors.hpp"
#include "json_codec.hpp"
#include <algorithm>
#include <fstream>
#include <set>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace instman {

JsonAccountSource::JsonAccountSource(fs::path accounts_dir)
    : accounts_dir_(std::move(accounts_dir))
{
}

AccountListing JsonAccountSource::read_accounts() {
    std::error_code ec;
    if (!fs::is_directory(accounts_dir_, ec)) {
        throw StorageError(fmt::format("Account directory {} is not readable{}", accounts_dir_.string(),
                                       ec ? ": " + ec.message() : std::string{}));
    }

    std::vector<fs::path> files;
    for (fs::directory_iterator it(accounts_dir_, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->path().extension() == ".json") {
            files.push_back(it->path());
        }
    }
    if (ec) {
        throw StorageError(fmt::format("Failed to list accounts in {}: {}", accounts_dir_.string(), ec.message()));
    }
    std::sort(files.begin(), files.end());

    AccountListing listing;
    std::set<std::string> seen;
    for (const auto& path : files) {
        std::ifstream file(path);
        if (!file) {
            spdlog::warn("Skipping unreadable account file {}", path.string());
            listing.skipped.push_back(path.string());
            continue;
        }

        try {
            auto account = nlohmann::json::parse(file).get<Account>();
            if (account.id.empty() || !seen.insert(account.id).second) {
                // A duplicate hides no account, so the listing stays complete
                spdlog::warn("Ignoring account file {} with empty or duplicate id", path.string());
                continue;
            }
            listing.accounts.push_back(std::move(account));
        } catch (const nlohmann::json::exception& e) {
            spdlog::warn("Skipping malformed account file {}: {}", path.string(), e.what());
            listing.skipped.push_back(path.string());
        }
    }
    return listing;
}

} // namespace instman
