#include "clarg/result.hpp"

#include <utility>

namespace clarg {

ResultStore ResultStore::unparsed(const ParamTable& table) {
    ResultStore store;
    for (const auto& p : table.params()) {
        if (p.isFlag()) {
            store.flags_.emplace(p.name(), FlagState::NotParsed);
        } else {
            store.arguments_.emplace(p.name(), NotParsed{});
        }
    }
    return store;
}

ResultStore ResultStore::started(const ParamTable& table) {
    ResultStore store;
    for (const auto& p : table.params()) {
        if (p.isFlag()) {
            store.flags_.emplace(p.name(), FlagState::False);
        } else {
            store.arguments_.emplace(p.name(), Missing{});
        }
    }
    store.parsed_ = true;
    return store;
}

const FlagState* ResultStore::flag(const std::string& name) const {
    const auto it = flags_.find(name);
    if (it == flags_.end()) return nullptr;
    return &it->second;
}

const ArgumentState* ResultStore::argument(const std::string& name) const {
    const auto it = arguments_.find(name);
    if (it == arguments_.end()) return nullptr;
    return &it->second;
}

void ResultStore::setFlag(const std::string& name, bool present) {
    flags_[name] = present ? FlagState::True : FlagState::False;
}

void ResultStore::setValues(const std::string& name, Values values) {
    arguments_[name] = std::move(values);
}

void ResultStore::setMissing(const std::string& name) {
    arguments_[name] = Missing{};
}

const char* toString(FlagState state) {
    switch (state) {
        case FlagState::NotParsed: return "[not parsed]";
        case FlagState::False: return "False";
        case FlagState::True: return "True";
    }
    return "[not parsed]";
}

std::string toString(const ArgumentState& state) {
    if (std::holds_alternative<NotParsed>(state)) return "[not parsed]";
    if (std::holds_alternative<Missing>(state)) return "Missing";

    std::string out = "[";
    const auto& values = std::get<Values>(state);
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i) out += ", ";
        out += toString(values[i]);
    }
    out += "]";
    return out;
}

} // namespace clarg
