#include "command_dispatcher.hpp"
#include "errors.hpp"
#include "json_codec.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace instman {

namespace {

// Arguments are camelCase; the snake_case spelling is accepted as well
const nlohmann::json* find_arg(const nlohmann::json& args, const char* name, const char* alias) {
    if (!args.is_object()) return nullptr;
    if (auto it = args.find(name); it != args.end() && !it->is_null()) return &*it;
    if (auto it = args.find(alias); it != args.end() && !it->is_null()) return &*it;
    return nullptr;
}

std::string require_string(const nlohmann::json& args, const char* name, const char* alias) {
    const nlohmann::json* value = find_arg(args, name, alias);
    if (!value) {
        throw ValidationError(fmt::format("Missing argument '{}'", name));
    }
    if (!value->is_string()) {
        throw ValidationError(fmt::format("Argument '{}' must be a string", name));
    }
    return value->get<std::string>();
}

std::string optional_string(const nlohmann::json& args, const char* name, const char* alias) {
    const nlohmann::json* value = find_arg(args, name, alias);
    if (!value) return {};
    if (!value->is_string()) {
        throw ValidationError(fmt::format("Argument '{}' must be a string", name));
    }
    return value->get<std::string>();
}

std::vector<std::string> optional_string_list(const nlohmann::json& args, const char* name, const char* alias) {
    const nlohmann::json* value = find_arg(args, name, alias);
    if (!value) return {};
    if (!value->is_array()) {
        throw ValidationError(fmt::format("Argument '{}' must be an array of strings", name));
    }
    std::vector<std::string> result;
    for (const auto& item : *value) {
        if (!item.is_string()) {
            throw ValidationError(fmt::format("Argument '{}' must be an array of strings", name));
        }
        result.push_back(item.get<std::string>());
    }
    return result;
}

} // namespace

CommandDispatcher::CommandDispatcher(InstanceRegistry& registry,
                                     BindingManager& bindings,
                                     ProcessController& controller,
                                     IAccountSource& accounts,
                                     std::vector<CategoryRule> categories)
    : registry_(registry)
    , bindings_(bindings)
    , controller_(controller)
    , accounts_(accounts)
    , categories_(std::move(categories))
{
    register_commands();
}

void CommandDispatcher::register_commands() {
    handlers_["list_instances"] = [this](const nlohmann::json&) {
        return nlohmann::json(registry_.list());
    };

    handlers_["list_instance_summaries"] = [this](const nlohmann::json&) {
        return nlohmann::json(registry_.summaries());
    };

    handlers_["create_instance"] = [this](const nlohmann::json& args) {
        return nlohmann::json(registry_.create(require_string(args, "name", "name"),
                                               require_string(args, "userDataDir", "user_data_dir"),
                                               optional_string_list(args, "extraArgs", "extra_args")));
    };

    handlers_["get_instance"] = [this](const nlohmann::json& args) {
        return nlohmann::json(registry_.get(require_string(args, "instanceId", "instance_id")));
    };

    handlers_["update_instance"] = [this](const nlohmann::json& args) {
        const nlohmann::json* value = find_arg(args, "instance", "instance");
        if (!value || !value->is_object()) {
            throw ValidationError("Missing argument 'instance'");
        }
        Instance instance;
        try {
            instance = value->get<Instance>();
        } catch (const nlohmann::json::exception& e) {
            throw ValidationError(fmt::format("Invalid instance: {}", e.what()));
        }
        registry_.update(instance);
        return nlohmann::json(nullptr);
    };

    handlers_["delete_instance"] = [this](const nlohmann::json& args) {
        bindings_.remove_instance(require_string(args, "instanceId", "instance_id"));
        return nlohmann::json(nullptr);
    };

    handlers_["bind_account_to_instance"] = [this](const nlohmann::json& args) {
        bindings_.bind(require_string(args, "accountId", "account_id"),
                       require_string(args, "instanceId", "instance_id"));
        return nlohmann::json(nullptr);
    };

    handlers_["unbind_account_from_instance"] = [this](const nlohmann::json& args) {
        bindings_.unbind(require_string(args, "accountId", "account_id"),
                         require_string(args, "instanceId", "instance_id"));
        return nlohmann::json(nullptr);
    };

    handlers_["start_instance"] = [this](const nlohmann::json& args) {
        return nlohmann::json(controller_.start(require_string(args, "instanceId", "instance_id")));
    };

    handlers_["stop_instance"] = [this](const nlohmann::json& args) {
        controller_.stop(require_string(args, "instanceId", "instance_id"));
        return nlohmann::json(nullptr);
    };

    handlers_["restart_instance"] = [this](const nlohmann::json& args) {
        controller_.restart(require_string(args, "instanceId", "instance_id"));
        return nlohmann::json(nullptr);
    };

    handlers_["get_instance_status"] = [this](const nlohmann::json& args) {
        return nlohmann::json(controller_.status(require_string(args, "instanceId", "instance_id")));
    };

    handlers_["get_running_instances"] = [this](const nlohmann::json&) {
        return nlohmann::json(controller_.running_instances());
    };

    handlers_["ensure_default_instance"] = [this](const nlohmann::json&) {
        return nlohmann::json(registry_.ensure_default());
    };

    handlers_["migrate_accounts_to_default_instance"] = [this](const nlohmann::json&) {
        return nlohmann::json(bindings_.migrate_legacy_accounts());
    };

    handlers_["get_instances_for_account"] = [this](const nlohmann::json& args) {
        return nlohmann::json(bindings_.instances_for_account(require_string(args, "accountId", "account_id")));
    };

    handlers_["get_accounts_for_instance"] = [this](const nlohmann::json& args) {
        return nlohmann::json(bindings_.accounts_for_instance(require_string(args, "instanceId", "instance_id")));
    };

    handlers_["set_current_account_for_instance"] = [this](const nlohmann::json& args) {
        bindings_.set_current_account(require_string(args, "instanceId", "instance_id"),
                                      require_string(args, "accountId", "account_id"));
        return nlohmann::json(nullptr);
    };

    handlers_["switch_account_in_instance"] = [this](const nlohmann::json& args) {
        bindings_.switch_account(require_string(args, "instanceId", "instance_id"),
                                 require_string(args, "accountId", "account_id"));
        return nlohmann::json(nullptr);
    };

    handlers_["prune_missing_accounts"] = [this](const nlohmann::json&) {
        return nlohmann::json(bindings_.prune_missing_accounts());
    };

    handlers_["recommend_accounts"] = [this](const nlohmann::json& args) {
        return nlohmann::json(recommend(accounts_.list_accounts(), categories_,
                                        optional_string(args, "excludeAccountId", "exclude_account_id")));
    };
}

nlohmann::json CommandDispatcher::dispatch(const std::string& command, const nlohmann::json& args) {
    auto it = handlers_.find(command);
    if (it == handlers_.end()) {
        throw ValidationError(fmt::format("Unknown command '{}'", command));
    }
    if (!args.is_null() && !args.is_object()) {
        throw ValidationError("Command arguments must be a JSON object");
    }

    spdlog::debug("Dispatching {}", command);
    return it->second(args);
}

std::vector<std::string> CommandDispatcher::command_names() const {
    std::vector<std::string> names;
    names.reserve(handlers_.size());
    for (const auto& [name, handler] : handlers_) {
        names.push_back(name);
    }
    return names;
}

} // namespace instman
