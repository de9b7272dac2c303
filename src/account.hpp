#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace instman {

// How a category rule names a model in a quota snapshot
enum class ModelMatch {
    Exact,     // case-insensitive equality
    Contains   // case-insensitive substring
};

struct QuotaModel {
    std::string name;
    int percentage = 0;                     // remaining allowance, 0-100
    std::optional<std::string> reset_time;  // as reported by the quota service
};

struct QuotaSnapshot {
    std::string subscription_tier;
    std::vector<QuotaModel> models;

    // First model matching the selector, or nullptr
    [[nodiscard]] const QuotaModel* find_model(std::string_view name, ModelMatch match) const;
};

// Accounts are owned by the account source. The core only binds their ids to
// instances and reads their quota for recommendations.
struct Account {
    std::string id;
    std::string email;
    std::optional<QuotaSnapshot> quota;

    // Percentage of the matching model, 0 when there is no quota or no match
    [[nodiscard]] int model_percentage(std::string_view name, ModelMatch match) const;
};

} // namespace instman
