#pragma once

#include "account.hpp"
#include "instance.hpp"
#include "recommendation.hpp"
#include <nlohmann/json.hpp>

// nlohmann::json conversions for the persisted and command-facing types.
// Keys are snake_case; optional fields are omitted when empty.
namespace instman {

void to_json(nlohmann::json& j, const Instance& instance);
void from_json(const nlohmann::json& j, Instance& instance);

void to_json(nlohmann::json& j, const InstanceSummary& summary);
void from_json(const nlohmann::json& j, InstanceSummary& summary);

void to_json(nlohmann::json& j, const QuotaModel& model);
void from_json(const nlohmann::json& j, QuotaModel& model);

void to_json(nlohmann::json& j, const QuotaSnapshot& quota);
void from_json(const nlohmann::json& j, QuotaSnapshot& quota);

void to_json(nlohmann::json& j, const Account& account);
void from_json(const nlohmann::json& j, Account& account);

void to_json(nlohmann::json& j, const Recommendation& recommendation);

void to_json(nlohmann::json& j, const CategoryRule& rule);
void from_json(const nlohmann::json& j, CategoryRule& rule);

} // namespace instman
