#pragma once

#include "binding_manager.hpp"
#include "instance_registry.hpp"
#include "interfaces/i_account_source.hpp"
#include "process_controller.hpp"
#include "recommendation.hpp"
#include <functional>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace instman {

// Named commands taking a JSON object of arguments and returning one JSON
// result. Failures are thrown as instman::Error; unknown commands and
// missing or mistyped arguments are ValidationError.
class CommandDispatcher {
public:
    CommandDispatcher(InstanceRegistry& registry,
                      BindingManager& bindings,
                      ProcessController& controller,
                      IAccountSource& accounts,
                      std::vector<CategoryRule> categories);

    nlohmann::json dispatch(const std::string& command, const nlohmann::json& args);

    [[nodiscard]] std::vector<std::string> command_names() const;

private:
    using Handler = std::function<nlohmann::json(const nlohmann::json&)>;

    void register_commands();

    InstanceRegistry& registry_;
    BindingManager& bindings_;
    ProcessController& controller_;
    IAccountSource& accounts_;
    std::vector<CategoryRule> categories_;

    std::map<std::string, Handler> handlers_;
};

} // namespace instman
