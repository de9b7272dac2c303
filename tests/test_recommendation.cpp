#include <catch2/catch.hpp>
#include "recommendation.hpp"

using namespace instman;

namespace {

Account account(const std::string& id, std::vector<QuotaModel> models) {
    Account a;
    a.id = id;
    a.email = id + "@example.com";
    QuotaSnapshot quota;
    quota.subscription_tier = "pro";
    quota.models = std::move(models);
    a.quota = quota;
    return a;
}

CategoryRule single(const std::string& name, const std::string& model) {
    CategoryRule rule;
    rule.name = name;
    rule.kind = CategoryKind::Single;
    rule.primary = {model, ModelMatch::Exact};
    return rule;
}

} // namespace

TEST_CASE("Blended scores are rounded weighted sums", "[recommend]") {
    CategoryRule rule;
    rule.name = "blend";
    rule.kind = CategoryKind::Blended;
    rule.primary = {"high", ModelMatch::Exact};
    rule.secondary = {"flash", ModelMatch::Exact};

    CHECK(score_account(account("a", {{"high", 60, {}}, {"flash", 20, {}}}), rule) == 48);
    CHECK(score_account(account("a", {{"high", 100, {}}}), rule) == 70);
}

TEST_CASE("Model matching is case-insensitive", "[recommend]") {
    CategoryRule rule;
    rule.name = "claude";
    rule.primary = {"claude", ModelMatch::Contains};

    CHECK(score_account(account("a", {{"Claude-Sonnet-4.5", 64, {}}}), rule) == 64);
    CHECK(score_account(account("a", {{"gemini", 64, {}}}), rule) == 0);

    Account no_quota;
    no_quota.id = "n";
    CHECK(score_account(no_quota, rule) == 0);
}

TEST_CASE("Duplicate picks go to the assignment with the larger total", "[recommend]") {
    const std::vector<CategoryRule> categories{single("x", "mx"), single("y", "my")};
    const std::vector<Account> accounts{
        account("A", {{"mx", 80, {}}, {"my", 80, {}}}),
        account("B", {{"mx", 60, {}}, {"my", 10, {}}}),
    };

    const auto result = recommend(accounts, categories);

    REQUIRE(result.size() == 2);
    CHECK(result[0].category == "x");
    CHECK(result[0].account_id == "B");
    CHECK(result[0].score == 60);
    CHECK(result[1].category == "y");
    CHECK(result[1].account_id == "A");
    CHECK(result[1].score == 80);
}

TEST_CASE("Equal totals keep the earlier category's pick", "[recommend]") {
    const std::vector<CategoryRule> categories{single("x", "mx"), single("y", "my")};
    const std::vector<Account> accounts{
        account("A", {{"mx", 50, {}}, {"my", 50, {}}}),
        account("B", {{"mx", 30, {}}, {"my", 30, {}}}),
    };

    const auto result = recommend(accounts, categories);

    REQUIRE(result.size() == 2);
    CHECK(result[0].category == "x");
    CHECK(result[0].account_id == "A");
    CHECK(result[0].score == 50);
    CHECK(result[1].category == "y");
    CHECK(result[1].account_id == "B");
    CHECK(result[1].score == 30);
}

TEST_CASE("A category without a fallback is dropped", "[recommend]") {
    const std::vector<CategoryRule> categories{single("x", "mx"), single("y", "my")};
    const std::vector<Account> accounts{account("A", {{"mx", 80, {}}, {"my", 80, {}}})};

    const auto result = recommend(accounts, categories);

    REQUIRE(result.size() == 1);
    CHECK(result[0].category == "x");
    CHECK(result[0].account_id == "A");
}

TEST_CASE("Zero scores and the excluded account are never recommended", "[recommend]") {
    const std::vector<CategoryRule> categories{single("x", "mx"), single("y", "my")};

    SECTION("all zero") {
        const std::vector<Account> accounts{account("A", {{"mx", 0, {}}, {"my", 0, {}}})};
        CHECK(recommend(accounts, categories).empty());
    }

    SECTION("excluded") {
        const std::vector<Account> accounts{
            account("A", {{"mx", 90, {}}}),
            account("B", {{"mx", 30, {}}, {"my", 20, {}}}),
        };
        const auto result = recommend(accounts, categories, "A");
        REQUIRE(result.size() == 1);
        CHECK(result[0].account_id == "B");
        CHECK(result[0].category == "x");
    }

    SECTION("no accounts") {
        CHECK(recommend({}, categories).empty());
    }
}

TEST_CASE("Distinct best accounts need no resolution", "[recommend]") {
    const auto result = recommend(
        {
            account("A", {{"mx", 90, {}}, {"my", 10, {}}}),
            account("B", {{"mx", 20, {}}, {"my", 70, {}}}),
        },
        {single("x", "mx"), single("y", "my")});

    REQUIRE(result.size() == 2);
    CHECK(result[0].account_id == "A");
    CHECK(result[1].account_id == "B");
}

TEST_CASE("Default categories", "[recommend]") {
    const auto categories = default_categories();
    REQUIRE(categories.size() == 2);
    CHECK(categories[0].name == "gemini");
    CHECK(categories[0].kind == CategoryKind::Blended);
    CHECK(categories[1].name == "claude");
    CHECK(categories[1].primary.match == ModelMatch::Contains);
}
