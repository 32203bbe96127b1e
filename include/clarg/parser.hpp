#ifndef CLARG_PARSER_HPP
#define CLARG_PARSER_HPP

#include <iosfwd>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "color.hpp"
#include "errors.hpp"
#include "matcher.hpp"
#include "param.hpp"
#include "result.hpp"
#include "table.hpp"

namespace clarg {

// Declares parameters, parses one token sequence at a time and answers queries about the last parse.
//
//   clarg::Parser parser("app");
//   parser.declareFlag("help", "Prints help")
//         .declareArgument<int>("n", 1, true)
//         .declareArgument<int>("data", 4);
//   parser.parse(argc, argv);
//   if (parser.getFlag("help")) ...
//   const auto data = parser.getValues<int>("data", {});
class Parser {
public:
    struct Options {
        bool shortFlagGrouping{true}; // -lisa
        bool suggestNames{true};      // "did you mean --help?" on unknown --names
        bool reportWarnings{true};    // write each warning to err()
        ColorMode colorMode{ColorMode::Never};
    };

    // Flags yield bool, Arguments their converted values.
    using Result = std::variant<bool, Values>;

    explicit Parser(std::string name = {}) : Parser(std::move(name), Options{}) {}
    Parser(std::string name, Options options);

    // Bulk declaration from an ordered name -> Param mapping; throws on the first bad entry.
    static Parser fromMapping(const std::vector<ParamTable::Entry>& entries, std::string name = {});
    static Parser fromMapping(const std::vector<ParamTable::Entry>& entries, std::string name, Options options);

    Parser& setOut(std::ostream& os) {
        out_ = &os;
        return *this;
    }

    Parser& setErr(std::ostream& os) {
        err_ = &os;
        return *this;
    }

    std::ostream& out() const;
    std::ostream& err() const;

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const Options& options() const { return options_; }
    [[nodiscard]] const ParamTable& table() const { return table_; }
    [[nodiscard]] const ResultStore& results() const { return results_; }

    // Declaring after a parse discards its results (everything reads as not parsed again).
    Parser& declareFlag(const std::string& name, const std::string& helpText = {});
    Parser& declareArgument(const std::string& name,
                            ValueType type,
                            int arity = 1,
                            bool isSwitch = false,
                            const std::string& helpText = {});
    Parser& declareArgument(const std::string& name,
                            Converter converter,
                            const std::string& typeName,
                            int arity = 1,
                            bool isSwitch = false,
                            const std::string& helpText = {});

    template <typename T>
    Parser& declareArgument(const std::string& name, int arity = 1, bool isSwitch = false, const std::string& helpText = {}) {
        return declareArgument(name, ValueTypeOf<T>::value, arity, isSwitch, helpText);
    }

    // Replaces all previous results. Returns the warnings of this call.
    const std::vector<Warning>& parse(const std::vector<std::string>& tokens);
    // argv[0] (the program name) is skipped.
    const std::vector<Warning>& parse(int argc, char** argv);

    [[nodiscard]] bool parsed() const { return results_.parsed(); }
    [[nodiscard]] const std::vector<Warning>& warnings() const { return warnings_; }

    // Throws UnknownParameterError, NotYetParsedError or MissingValueError.
    [[nodiscard]] Result get(const std::string& name) const;
    // Returns defaultValue instead of throwing NotYetParsedError or MissingValueError.
    [[nodiscard]] Result get(const std::string& name, Result defaultValue) const;

    [[nodiscard]] bool getFlag(const std::string& name) const;
    [[nodiscard]] bool getFlag(const std::string& name, bool defaultValue) const;

    template <typename T>
    std::vector<T> getValues(const std::string& name) const {
        return castValues<T>(name, *argumentValues(name, true));
    }

    template <typename T>
    std::vector<T> getValues(const std::string& name, std::vector<T> defaultValue) const {
        const Values* values = argumentValues(name, false);
        if (!values) return defaultValue;
        return castValues<T>(name, *values);
    }

    // First value, for single-value arguments.
    template <typename T>
    T getValue(const std::string& name) const {
        return getValues<T>(name).front();
    }

    template <typename T>
    T getValue(const std::string& name, T defaultValue) const {
        const Values* values = argumentValues(name, false);
        if (!values) return defaultValue;
        return castValues<T>(name, *values).front();
    }

    // Arguments then Flags, declaration order, "[not parsed]" before the first parse. Never colored.
    [[nodiscard]] std::string formattedDump() const { return formattedDump(false); }
    // Headers and names styled with the default theme when `on` is set.
    [[nodiscard]] std::string formattedDump(bool on) const;

    // Colors only when the options enable color for `os` itself.
    friend std::ostream& operator<<(std::ostream& os, const Parser& parser);

private:
    const Param& lookup(const std::string& name) const;
    // nullptr when not parsed or missing and `required` is false; throws otherwise.
    const Values* argumentValues(const std::string& name, bool required) const;
    void reportWarnings() const;
    bool colorOn(const std::ostream& os) const;

    template <typename T>
    static std::vector<T> castValues(const std::string& name, const Values& values) {
        std::vector<T> out;
        out.reserve(values.size());
        for (const auto& v : values) {
            const T* x = std::get_if<T>(&v);
            if (!x) throw ValueTypeError(name, toString(ValueTypeOf<T>::value));
            out.push_back(*x);
        }
        return out;
    }

    std::string name_;
    Options options_;
    ParamTable table_;
    ResultStore results_;
    std::vector<Warning> warnings_;
    std::ostream* out_{nullptr};
    std::ostream* err_{nullptr};
};

} // namespace clarg

#endif // CLARG_PARSER_HPP
