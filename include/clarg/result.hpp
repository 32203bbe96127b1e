#ifndef CLARG_RESULT_HPP
#define CLARG_RESULT_HPP

#include <string>
#include <unordered_map>
#include <variant>

#include "param.hpp"
#include "table.hpp"

namespace clarg {

enum class FlagState { NotParsed, False, True };

struct NotParsed {};
struct Missing {};

using ArgumentState = std::variant<NotParsed, Missing, Values>;

// Per-parse state of every declared parameter. Built whole by the matcher and swapped into the
// Parser; nothing updates it between parses.
class ResultStore {
public:
    ResultStore() = default;

    // Every entry NotParsed (state of a parser that has not parsed yet).
    static ResultStore unparsed(const ParamTable& table);
    // Flags False, Arguments Missing (state at the start of a parse).
    static ResultStore started(const ParamTable& table);

    [[nodiscard]] bool parsed() const { return parsed_; }

    // Both getters return nullptr for names the store does not know as that kind.
    [[nodiscard]] const FlagState* flag(const std::string& name) const;
    [[nodiscard]] const ArgumentState* argument(const std::string& name) const;

    void setFlag(const std::string& name, bool present);
    void setValues(const std::string& name, Values values);
    void setMissing(const std::string& name);

private:
    std::unordered_map<std::string, FlagState> flags_;
    std::unordered_map<std::string, ArgumentState> arguments_;
    bool parsed_{false};
};

const char* toString(FlagState state);
// "[not parsed]", "Missing" or "[v1, v2]".
std::string toString(const ArgumentState& state);

} // namespace clarg

#endif // CLARG_RESULT_HPP
