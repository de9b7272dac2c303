#include "recommendation.hpp"
#include <algorithm>
#include <cmath>

namespace instman {

namespace {

struct Candidate {
    const Account* account;
    int score;
};

// Per category pick state during duplicate resolution
struct Pick {
    std::vector<Candidate> candidates;
    size_t index = 0;
    bool used_fallback = false;
    bool dropped = false;

    [[nodiscard]] const Candidate* current() const {
        if (dropped || index >= candidates.size()) return nullptr;
        return &candidates[index];
    }

    [[nodiscard]] const Candidate* fallback() const {
        if (dropped || used_fallback || index + 1 >= candidates.size()) return nullptr;
        return &candidates[index + 1];
    }

    void reassign() {
        if (fallback()) {
            ++index;
            used_fallback = true;
        } else {
            dropped = true;
        }
    }
};

int score_of(const Candidate* candidate) {
    return candidate ? candidate->score : 0;
}

// Finds the first pair of categories sharing an account and reassigns one
// of them. Returns false when no duplicate is left.
bool resolve_one_duplicate(std::vector<Pick>& picks) {
    for (size_t a = 0; a < picks.size(); ++a) {
        const Candidate* top_a = picks[a].current();
        if (!top_a) continue;

        for (size_t b = a + 1; b < picks.size(); ++b) {
            const Candidate* top_b = picks[b].current();
            if (!top_b || top_a->account->id != top_b->account->id) continue;

            const int keep_a = top_a->score + score_of(picks[b].fallback());
            const int keep_b = score_of(picks[a].fallback()) + top_b->score;

            // Ties keep the earlier category's pick
            if (keep_b > keep_a) {
                picks[a].reassign();
            } else {
                picks[b].reassign();
            }
            return true;
        }
    }
    return false;
}

} // namespace

int score_account(const Account& account, const CategoryRule& rule) {
    const int primary = account.model_percentage(rule.primary.name, rule.primary.match);
    if (rule.kind == CategoryKind::Single) {
        return primary;
    }

    const int secondary = account.model_percentage(rule.secondary.name, rule.secondary.match);
    return static_cast<int>(std::lround(rule.primary_weight * primary + rule.secondary_weight * secondary));
}

std::vector<Recommendation> recommend(const std::vector<Account>& accounts,
                                      const std::vector<CategoryRule>& categories,
                                      const std::string& excluded_account_id) {
    std::vector<Pick> picks(categories.size());

    for (size_t c = 0; c < categories.size(); ++c) {
        auto& candidates = picks[c].candidates;
        for (const auto& account : accounts) {
            if (!excluded_account_id.empty() && account.id == excluded_account_id) continue;

            const int score = score_account(account, categories[c]);
            if (score > 0) {
                candidates.push_back({&account, score});
            }
        }
        std::stable_sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
            return a.score > b.score;
        });
    }

    const auto with_candidates = std::count_if(picks.begin(), picks.end(), [](const Pick& pick) {
        return !pick.candidates.empty();
    });

    if (with_candidates >= 2) {
        while (resolve_one_duplicate(picks)) {
        }
    }

    std::vector<Recommendation> result;
    for (size_t c = 0; c < categories.size(); ++c) {
        if (const Candidate* pick = picks[c].current()) {
            result.push_back({pick->account->id, categories[c].name, pick->score});
        }
    }
    return result;
}

std::vector<CategoryRule> default_categories() {
    CategoryRule gemini;
    gemini.name = "gemini";
    gemini.kind = CategoryKind::Blended;
    gemini.primary = {"gemini-3-pro-high", ModelMatch::Exact};
    gemini.secondary = {"gemini-3-flash", ModelMatch::Exact};
    gemini.primary_weight = 0.7;
    gemini.secondary_weight = 0.3;

    CategoryRule claude;
    claude.name = "claude";
    claude.kind = CategoryKind::Single;
    claude.primary = {"claude", ModelMatch::Contains};

    return {gemini, claude};
}

} // namespace instman
