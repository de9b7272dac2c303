#pragma once

#include "../account.hpp"
#include "../recommendation.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace instman {

struct OverviewViewModel {
    // Visibility
    bool is_visible = true;

    // From the overview poller
    size_t instance_count = 0;
    size_t running_count = 0;
    uint64_t generation = 0;

    // Best account per category
    std::vector<Recommendation> recommendations;

    // account id -> email, for display
    std::map<std::string, std::string> account_emails;

    std::chrono::steady_clock::time_point updated;

    [[nodiscard]] std::string label_for(const std::string& account_id) const {
        auto it = account_emails.find(account_id);
        if (it == account_emails.end() || it->second.empty()) return account_id;
        return it->second;
    }
};

} // namespace instman
