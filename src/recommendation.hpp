#pragma once

#include "account.hpp"
#include <string>
#include <vector>

namespace instman {

enum class CategoryKind {
    Single,   // percentage of one model
    Blended   // weighted mix of two models
};

struct ModelSelector {
    std::string name;
    ModelMatch match = ModelMatch::Exact;
};

struct CategoryRule {
    std::string name;
    CategoryKind kind = CategoryKind::Single;
    ModelSelector primary;
    ModelSelector secondary;          // Blended only
    double primary_weight = 0.7;      // Blended only
    double secondary_weight = 0.3;    // Blended only
};

struct Recommendation {
    std::string account_id;
    std::string category;
    int score = 0;
};

// Score of an account for one category, 0 when it has no quota or the
// models are absent
int score_account(const Account& account, const CategoryRule& rule);

// At most one recommendation per category, in category order. Accounts with
// score 0 and excluded_account_id are never recommended, and no account is
// recommended for two categories when a fallback exists.
std::vector<Recommendation> recommend(const std::vector<Account>& accounts,
                                      const std::vector<CategoryRule>& categories,
                                      const std::string& excluded_account_id = {});

std::vector<CategoryRule> default_categories();

} // namespace instman
