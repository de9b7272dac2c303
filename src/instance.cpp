#include "instance.hpp"
#include <algorithm>
#include <filesystem>

namespace instman {

bool Instance::has_account(const std::string& account_id) const {
    return std::find(account_ids.begin(), account_ids.end(), account_id) != account_ids.end();
}

bool Instance::bind_account(const std::string& account_id) {
    if (has_account(account_id)) {
        return false;
    }
    account_ids.push_back(account_id);
    return true;
}

bool Instance::unbind_account(const std::string& account_id) {
    auto it = std::find(account_ids.begin(), account_ids.end(), account_id);
    if (it == account_ids.end()) {
        return false;
    }
    account_ids.erase(it);
    if (current_account_id == account_id) {
        current_account_id.reset();
    }
    return true;
}

std::vector<std::string> Instance::launch_args() const {
    std::vector<std::string> args;
    if (!is_default) {
        args.push_back(std::string(kUserDataDirFlag) + "=" + user_data_dir);
    }
    args.insert(args.end(), extra_args.begin(), extra_args.end());
    return args;
}

InstanceSummary InstanceSummary::from(const Instance& instance) {
    return InstanceSummary{
        instance.id,
        instance.name,
        instance.user_data_dir,
        instance.is_default,
        instance.account_ids.size()
    };
}

std::string normalize_dir(const std::string& path) {
    if (path.empty()) return {};
    std::string normalized = std::filesystem::path(path).lexically_normal().string();
    while (normalized.size() > 1 && normalized.back() == '/') {
        normalized.pop_back();
    }
    return normalized;
}

bool has_helper_marker(const std::vector<std::string>& args) {
    return std::any_of(args.begin(), args.end(), [](const std::string& arg) {
        return arg.rfind(kHelperTypeFlag, 0) == 0;
    });
}

} // namespace instman
