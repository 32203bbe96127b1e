#ifndef CLARG_MATCHER_HPP
#define CLARG_MATCHER_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "param.hpp"
#include "result.hpp"
#include "table.hpp"

namespace clarg {

enum class WarningKind {
    UnknownToken,       // --name not declared, or a plain value nothing could store
    InsufficientValues, // fewer than arity values before the input ended or a flag-style token
    MissingArgument,    // argument never supplied
    Conversion,         // value rejected by the argument's type
};

const char* toString(WarningKind kind);

// Non-fatal problem found while matching. `parameter` is empty for tokens that matched nothing.
struct Warning {
    WarningKind kind;
    std::string parameter;
    std::string token;
    std::string message;
};

// Walks the tokens of one invocation against a ParamTable.
//
// Pass 1 (left to right): flags are set, argument markers (--name / -name) take the next
// arity tokens, unknown --names are reported, and every other token is kept as an unclaimed
// plain value. Pass 2: unclaimed values go, in order, to the non-switch arguments not already
// named by a marker, in declaration order. Pass 3: arguments that received nothing are reported.
class TokenMatcher {
public:
    struct Options {
        bool shortFlagGrouping{true}; // -lisa sets l, i, s and a
        bool suggestNames{true};
        std::size_t suggestionsMaxDistance{2};
    };

    struct Outcome {
        ResultStore results;
        std::vector<Warning> warnings;
    };

    explicit TokenMatcher(const ParamTable& table) : TokenMatcher(table, Options{}) {}
    TokenMatcher(const ParamTable& table, Options options) : table_(table), options_(options) {}

    [[nodiscard]] Outcome match(const std::vector<std::string>& tokens) const;

    // The declaration a --name / -name token refers to, or nullptr.
    [[nodiscard]] const Param* namedParam(const std::string& token) const;
    // -abc where every letter is a declared single-character flag.
    [[nodiscard]] bool isShortGroup(const std::string& token) const;
    [[nodiscard]] bool isFlagStyle(const std::string& token) const { return namedParam(token) || isShortGroup(token); }

private:
    struct State;

    std::size_t takeMarked(const Param& param, const std::vector<std::string>& tokens, std::size_t pos, State& state) const;
    void assignPositionals(State& state) const;
    void assign(const Param& param, const std::vector<std::string>& raw, State& state) const;
    void reportUnknown(const std::string& token, State& state) const;

    const ParamTable& table_;
    Options options_;
};

} // namespace clarg

#endif // CLARG_MATCHER_HPP
