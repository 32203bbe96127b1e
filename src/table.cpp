#include "clarg/table.hpp"
#include "clarg/errors.hpp"

namespace clarg {

ParamTable ParamTable::buildFromMapping(const std::vector<Entry>& entries) {
    ParamTable table;
    for (const auto& [key, param] : entries) {
        if (!param.name().empty() && param.name() != key) {
            throw InvalidNameError(param.name(), "declared under the key \"" + key + "\"");
        }
        table.declare(param.renamed(key));
    }
    return table;
}

void ParamTable::declareFlag(const std::string& name, const std::string& helpText) {
    declare(Param::flag(name, helpText));
}

void ParamTable::declareArgument(const std::string& name,
                                 ValueType type,
                                 int arity,
                                 bool isSwitch,
                                 const std::string& helpText) {
    declare(Param::argument(name, type, arity, isSwitch, helpText));
}

void ParamTable::declareArgument(const std::string& name,
                                 Converter converter,
                                 const std::string& typeName,
                                 int arity,
                                 bool isSwitch,
                                 const std::string& helpText) {
    declare(Param::argument(name, std::move(converter), typeName, arity, isSwitch, helpText));
}

void ParamTable::declare(Param param) {
    validateName(param.name());
    if (contains(param.name())) throw DuplicateNameError(param.name());
    if (param.isArgument() && param.arity() < 1) throw InvalidArityError(param.name(), param.arity());

    index_.emplace(param.name(), params_.size());
    params_.push_back(std::move(param));
}

const Param* ParamTable::find(const std::string& name) const {
    const auto it = index_.find(name);
    if (it == index_.end()) return nullptr;
    return &params_[it->second];
}

std::vector<const Param*> ParamTable::flags() const {
    std::vector<const Param*> out;
    for (const auto& p : params_) {
        if (p.isFlag()) out.push_back(&p);
    }
    return out;
}

std::vector<const Param*> ParamTable::arguments() const {
    std::vector<const Param*> out;
    for (const auto& p : params_) {
        if (p.isArgument()) out.push_back(&p);
    }
    return out;
}

} // namespace clarg
