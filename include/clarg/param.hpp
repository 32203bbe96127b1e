#ifndef CLARG_PARAM_HPP
#define CLARG_PARAM_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace clarg {

using ArgValue = std::variant<bool, int, std::int64_t, std::uint64_t, float, double, std::chrono::milliseconds, std::string>;
using Values = std::vector<ArgValue>;

// User conversion for ValueType::Custom. Throws (std::invalid_argument preferred) when the token is rejected.
using Converter = std::function<ArgValue(const std::string&)>;

enum class ValueType { Bool, Int, Int64, Uint64, Float, Double, Duration, String, Custom };

const char* toString(ValueType type);

// Value rendering used by the dump: strings as-is, durations with an "ms" suffix.
std::string toString(const ArgValue& value);

// Maps a C++ type to its ValueType tag (used by Parser::declareArgument<T>).
template <typename T>
struct ValueTypeOf;
template <> struct ValueTypeOf<bool> { static constexpr ValueType value = ValueType::Bool; };
template <> struct ValueTypeOf<int> { static constexpr ValueType value = ValueType::Int; };
template <> struct ValueTypeOf<std::int64_t> { static constexpr ValueType value = ValueType::Int64; };
template <> struct ValueTypeOf<std::uint64_t> { static constexpr ValueType value = ValueType::Uint64; };
template <> struct ValueTypeOf<float> { static constexpr ValueType value = ValueType::Float; };
template <> struct ValueTypeOf<double> { static constexpr ValueType value = ValueType::Double; };
template <> struct ValueTypeOf<std::chrono::milliseconds> { static constexpr ValueType value = ValueType::Duration; };
template <> struct ValueTypeOf<std::string> { static constexpr ValueType value = ValueType::String; };

// Immutable declaration of a Flag (presence only) or an Argument (arity typed values).
class Param {
public:
    enum class Kind { Flag, Argument };

    static Param flag(std::string name, std::string helpText = {});

    static Param argument(std::string name,
                          ValueType type,
                          int arity = 1,
                          bool isSwitch = false,
                          std::string helpText = {});

    static Param argument(std::string name,
                          Converter converter,
                          std::string typeName,
                          int arity = 1,
                          bool isSwitch = false,
                          std::string helpText = {});

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] Kind kind() const { return kind_; }
    [[nodiscard]] bool isFlag() const { return kind_ == Kind::Flag; }
    [[nodiscard]] bool isArgument() const { return kind_ == Kind::Argument; }
    [[nodiscard]] ValueType valueType() const { return valueType_; }
    [[nodiscard]] int arity() const { return arity_; }
    [[nodiscard]] bool isSwitch() const { return isSwitch_; }
    [[nodiscard]] const std::string& helpText() const { return helpText_; }
    // "int", "string", ... or the name given with a custom converter.
    [[nodiscard]] std::string typeName() const;

    // Converts one raw token. Throws std::invalid_argument naming the expected type on failure.
    [[nodiscard]] ArgValue convert(const std::string& token) const;

    // Copy of this declaration under another name (used when the name comes from a mapping key).
    [[nodiscard]] Param renamed(std::string name) const;

private:
    Param(std::string name, Kind kind, ValueType type, int arity, bool isSwitch, std::string helpText)
        : name_(std::move(name)),
          kind_(kind),
          valueType_(type),
          arity_(arity),
          isSwitch_(isSwitch),
          helpText_(std::move(helpText)) {}

    std::string name_;        // data, n, help
    Kind kind_;
    ValueType valueType_;     // Bool for flags
    int arity_;               // 0 for flags
    bool isSwitch_;           // --n 50 instead of positional 50
    std::string helpText_;
    Converter converter_;     // ValueType::Custom only
    std::string customTypeName_;
};

// Throws InvalidNameError unless name is usable on the command line (non-empty, no leading dash, no blanks or '=').
void validateName(const std::string& name);

} // namespace clarg

#endif // CLARG_PARAM_HPP
