#include "clarg/matcher.hpp"
#include "clarg/utils.hpp"

#include <stdexcept>
#include <unordered_set>
#include <utility>
#include <variant>

namespace clarg {

const char* toString(WarningKind kind) {
    switch (kind) {
        case WarningKind::UnknownToken: return "UnknownTokenWarning";
        case WarningKind::InsufficientValues: return "InsufficientValuesWarning";
        case WarningKind::MissingArgument: return "MissingArgumentWarning";
        case WarningKind::Conversion: return "ConversionError";
    }
    return "Warning";
}

struct TokenMatcher::State {
    ResultStore results;
    std::vector<Warning> warnings;
    // Arguments already served by a marker or a positional run; pass 2 skips them.
    std::unordered_set<std::string> claimed;
    std::vector<std::string> unclaimed;

    void warn(WarningKind kind, std::string parameter, std::string token, std::string message) {
        warnings.push_back({kind, std::move(parameter), std::move(token), std::move(message)});
    }
};

const Param* TokenMatcher::namedParam(const std::string& token) const {
    if (token.size() < 2 || token[0] != '-') return nullptr;
    const std::size_t dashes = token[1] == '-' ? 2 : 1;
    if (token.size() <= dashes) return nullptr;
    return table_.find(token.substr(dashes));
}

bool TokenMatcher::isShortGroup(const std::string& token) const {
    if (!options_.shortFlagGrouping) return false;
    if (token.size() < 3 || token[0] != '-' || token[1] == '-') return false;
    for (std::size_t i = 1; i < token.size(); ++i) {
        const Param* p = table_.find(std::string(1, token[i]));
        if (!p || !p->isFlag()) return false;
    }
    return true;
}

TokenMatcher::Outcome TokenMatcher::match(const std::vector<std::string>& tokens) const {
    State state;
    state.results = ResultStore::started(table_);

    std::size_t pos = 0;
    while (pos < tokens.size()) {
        const std::string& token = tokens[pos];

        if (const Param* p = namedParam(token)) {
            if (p->isFlag()) {
                state.results.setFlag(p->name(), true);
                ++pos;
            } else {
                pos = takeMarked(*p, tokens, pos + 1, state);
            }
            continue;
        }

        if (isShortGroup(token)) {
            for (std::size_t i = 1; i < token.size(); ++i) state.results.setFlag(std::string(1, token[i]), true);
            ++pos;
            continue;
        }

        if (token.size() > 2 && token.rfind("--", 0) == 0) {
            reportUnknown(token, state);
            ++pos;
            continue;
        }

        state.unclaimed.push_back(token);
        ++pos;
    }

    assignPositionals(state);

    for (const Param* p : table_.arguments()) {
        if (!std::holds_alternative<Missing>(*state.results.argument(p->name()))) continue;
        state.warn(WarningKind::MissingArgument, p->name(), {}, "argument " + p->name() + " was not supplied");
    }

    return Outcome{std::move(state.results), std::move(state.warnings)};
}

std::size_t TokenMatcher::takeMarked(const Param& param,
                                     const std::vector<std::string>& tokens,
                                     std::size_t pos,
                                     State& state) const {
    const auto arity = static_cast<std::size_t>(param.arity());
    std::vector<std::string> raw;
    raw.reserve(arity);
    while (raw.size() < arity && pos < tokens.size() && !isFlagStyle(tokens[pos])) {
        raw.push_back(tokens[pos++]);
    }

    if (raw.size() < arity) {
        state.results.setMissing(param.name());
        state.claimed.insert(param.name());
        state.warn(WarningKind::InsufficientValues,
                   param.name(),
                   pos < tokens.size() ? tokens[pos] : std::string(),
                   "argument " + param.name() + " ended abruptly: expected " + std::to_string(arity) + " value(s), got " +
                       std::to_string(raw.size()));
        return pos;
    }

    assign(param, raw, state);
    return pos;
}

void TokenMatcher::assignPositionals(State& state) const {
    std::size_t next = 0;
    for (const Param* p : table_.arguments()) {
        if (p->isSwitch() || state.claimed.count(p->name())) continue;
        if (next >= state.unclaimed.size()) break;

        const auto arity = static_cast<std::size_t>(p->arity());
        const std::size_t available = state.unclaimed.size() - next;
        if (available < arity) {
            state.results.setMissing(p->name());
            state.claimed.insert(p->name());
            state.warn(WarningKind::InsufficientValues,
                       p->name(),
                       {},
                       "argument " + p->name() + " did not receive enough values: expected " + std::to_string(arity) +
                           ", got " + std::to_string(available));
            next = state.unclaimed.size();
            break;
        }

        const std::vector<std::string> raw(state.unclaimed.begin() + static_cast<std::ptrdiff_t>(next),
                                           state.unclaimed.begin() + static_cast<std::ptrdiff_t>(next + arity));
        next += arity;
        assign(*p, raw, state);
    }

    for (; next < state.unclaimed.size(); ++next) {
        const std::string& token = state.unclaimed[next];
        state.warn(WarningKind::UnknownToken, {}, token, "no remaining argument in which to store '" + token + "'");
    }
}

void TokenMatcher::assign(const Param& param, const std::vector<std::string>& raw, State& state) const {
    state.claimed.insert(param.name());

    Values values;
    values.reserve(raw.size());
    for (const auto& token : raw) {
        try {
            values.push_back(param.convert(token));
        } catch (const std::invalid_argument& e) {
            state.results.setMissing(param.name());
            state.warn(WarningKind::Conversion,
                       param.name(),
                       token,
                       "argument " + param.name() + " requires values of type " + param.typeName() + ": " + e.what());
            return;
        }
    }
    state.results.setValues(param.name(), std::move(values));
}

void TokenMatcher::reportUnknown(const std::string& token, State& state) const {
    std::string message = "unrecognised argument '" + token + "'";
    if (options_.suggestNames) {
        std::vector<std::string> names;
        names.reserve(table_.size());
        for (const auto& p : table_.params()) names.push_back(p.name());

        const auto suggestions = utils::suggest(token.substr(2), names, 3, options_.suggestionsMaxDistance);
        if (!suggestions.empty()) {
            message += ", did you mean";
            for (std::size_t i = 0; i < suggestions.size(); ++i) {
                message += (i ? ", --" : " --") + suggestions[i];
            }
            message += "?";
        }
    }
    state.warn(WarningKind::UnknownToken, {}, token, std::move(message));
}

} // namespace clarg
