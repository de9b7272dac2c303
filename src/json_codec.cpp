#include "json_codec.hpp"
#include "errors.hpp"
#include <algorithm>

namespace instman {

namespace {

template<typename T>
void read_optional(const nlohmann::json& j, const char* key, std::optional<T>& out) {
    if (auto it = j.find(key); it != j.end() && !it->is_null()) {
        out = it->get<T>();
    } else {
        out.reset();
    }
}

const char* match_to_string(ModelMatch match) {
    return match == ModelMatch::Contains ? "contains" : "exact";
}

ModelMatch match_from_string(const std::string& s) {
    if (s == "exact") return ModelMatch::Exact;
    if (s == "contains") return ModelMatch::Contains;
    throw ValidationError("Unknown model match '" + s + "'");
}

nlohmann::json selector_to_json(const ModelSelector& selector) {
    return {{"model", selector.name}, {"match", match_to_string(selector.match)}};
}

ModelSelector selector_from_json(const nlohmann::json& j) {
    ModelSelector selector;
    selector.name = j.at("model").get<std::string>();
    selector.match = match_from_string(j.value("match", std::string("exact")));
    return selector;
}

} // namespace

void to_json(nlohmann::json& j, const Instance& instance) {
    j = nlohmann::json{
        {"id", instance.id},
        {"name", instance.name},
        {"user_data_dir", instance.user_data_dir},
        {"extra_args", instance.extra_args},
        {"account_ids", instance.account_ids},
        {"is_default", instance.is_default},
        {"created_at", instance.created_at}
    };
    if (instance.executable) j["executable"] = *instance.executable;
    if (instance.current_account_id) j["current_account_id"] = *instance.current_account_id;
    if (instance.last_launch_args) j["last_launch_args"] = *instance.last_launch_args;
}

void from_json(const nlohmann::json& j, Instance& instance) {
    instance.id = j.at("id").get<std::string>();
    instance.name = j.at("name").get<std::string>();
    instance.user_data_dir = j.at("user_data_dir").get<std::string>();
    instance.extra_args = j.value("extra_args", std::vector<std::string>{});
    instance.account_ids = j.value("account_ids", std::vector<std::string>{});
    instance.is_default = j.value("is_default", false);
    instance.created_at = j.value("created_at", int64_t{0});
    read_optional(j, "executable", instance.executable);
    read_optional(j, "current_account_id", instance.current_account_id);
    read_optional(j, "last_launch_args", instance.last_launch_args);
}

void to_json(nlohmann::json& j, const InstanceSummary& summary) {
    j = nlohmann::json{
        {"id", summary.id},
        {"name", summary.name},
        {"user_data_dir", summary.user_data_dir},
        {"is_default", summary.is_default},
        {"account_count", summary.account_count}
    };
}

void from_json(const nlohmann::json& j, InstanceSummary& summary) {
    summary.id = j.at("id").get<std::string>();
    summary.name = j.value("name", std::string{});
    summary.user_data_dir = j.value("user_data_dir", std::string{});
    summary.is_default = j.value("is_default", false);
    summary.account_count = j.value("account_count", size_t{0});
}

void to_json(nlohmann::json& j, const QuotaModel& model) {
    j = nlohmann::json{{"name", model.name}, {"percentage", model.percentage}};
    if (model.reset_time) j["reset_time"] = *model.reset_time;
}

void from_json(const nlohmann::json& j, QuotaModel& model) {
    model.name = j.at("name").get<std::string>();
    model.percentage = std::clamp(j.value("percentage", 0), 0, 100);
    read_optional(j, "reset_time", model.reset_time);
}

void to_json(nlohmann::json& j, const QuotaSnapshot& quota) {
    j = nlohmann::json{{"subscription_tier", quota.subscription_tier}, {"models", quota.models}};
}

void from_json(const nlohmann::json& j, QuotaSnapshot& quota) {
    quota.subscription_tier = j.value("subscription_tier", std::string{});
    quota.models = j.value("models", std::vector<QuotaModel>{});
}

void to_json(nlohmann::json& j, const Account& account) {
    j = nlohmann::json{{"id", account.id}, {"email", account.email}};
    if (account.quota) j["quota"] = *account.quota;
}

void from_json(const nlohmann::json& j, Account& account) {
    account.id = j.at("id").get<std::string>();
    account.email = j.value("email", std::string{});
    read_optional(j, "quota", account.quota);
}

void to_json(nlohmann::json& j, const Recommendation& recommendation) {
    j = nlohmann::json{
        {"account_id", recommendation.account_id},
        {"category", recommendation.category},
        {"score", recommendation.score}
    };
}

void to_json(nlohmann::json& j, const CategoryRule& rule) {
    j = nlohmann::json{{"name", rule.name}, {"primary", selector_to_json(rule.primary)}};
    if (rule.kind == CategoryKind::Blended) {
        j["kind"] = "blended";
        j["secondary"] = selector_to_json(rule.secondary);
        j["weights"] = {rule.primary_weight, rule.secondary_weight};
    } else {
        j["kind"] = "single";
    }
}

void from_json(const nlohmann::json& j, CategoryRule& rule) {
    rule.name = j.at("name").get<std::string>();
    const std::string kind = j.value("kind", std::string("single"));
    if (kind == "single") {
        rule.kind = CategoryKind::Single;
    } else if (kind == "blended") {
        rule.kind = CategoryKind::Blended;
    } else {
        throw ValidationError("Unknown category kind '" + kind + "'");
    }
    rule.primary = selector_from_json(j.at("primary"));
    if (rule.kind == CategoryKind::Blended) {
        rule.secondary = selector_from_json(j.at("secondary"));
        if (auto it = j.find("weights"); it != j.end()) {
            const auto weights = it->get<std::vector<double>>();
            if (weights.size() != 2) {
                throw ValidationError("Category '" + rule.name + "': weights must have two entries");
            }
            rule.primary_weight = weights[0];
            rule.secondary_weight = weights[1];
        }
    }
}

} // namespace instman
