#include "account.hpp"
#include "string_utils.hpp"

namespace instman {

const QuotaModel* QuotaSnapshot::find_model(std::string_view name, const ModelMatch match) const {
    const std::string wanted = to_lower(name);
    for (const auto& model : models) {
        const std::string model_name = to_lower(model.name);
        if (match == ModelMatch::Exact ? model_name == wanted
                                       : model_name.find(wanted) != std::string::npos) {
            return &model;
        }
    }
    return nullptr;
}

int Account::model_percentage(std::string_view name, const ModelMatch match) const {
    if (!quota) return 0;
    const QuotaModel* model = quota->find_model(name, match);
    return model ? model->percentage : 0;
}

} // namespace instman
