#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace instman {

inline constexpr const char* kUserDataDirFlag = "--user-data-dir";
inline constexpr const char* kHelperTypeFlag = "--type=";

// One isolated copy of the application, rooted at its own user data dir
struct Instance {
    std::string id;
    std::string name;
    std::string user_data_dir;
    std::optional<std::string> executable;
    std::vector<std::string> extra_args;

    // Bound accounts in bind order, no duplicates
    std::vector<std::string> account_ids;
    std::optional<std::string> current_account_id;

    bool is_default = false;

    // argv (without argv[0]) of the most recent launch
    std::optional<std::vector<std::string>> last_launch_args;

    int64_t created_at = 0;

    [[nodiscard]] bool has_account(const std::string& account_id) const;

    // Returns false when the account was already bound
    bool bind_account(const std::string& account_id);

    // Clears current_account_id when it was the unbound account.
    // Returns false when the account was not bound.
    bool unbind_account(const std::string& account_id);

    // Arguments for a fresh launch: the user data dir flag for non-default
    // instances, then extra_args
    [[nodiscard]] std::vector<std::string> launch_args() const;
};

struct InstanceSummary {
    std::string id;
    std::string name;
    std::string user_data_dir;
    bool is_default = false;
    size_t account_count = 0;

    static InstanceSummary from(const Instance& instance);
};

// Lexically normalized absolute form with trailing separators removed, used
// for comparing user data dirs
std::string normalize_dir(const std::string& path);

// True when args come from a helper subprocess rather than a root launch
bool has_helper_marker(const std::vector<std::string>& args);

} // namespace instman
