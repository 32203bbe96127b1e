#include "clarg/parser.hpp"

#include <iostream>
#include <sstream>

namespace clarg {

Parser::Parser(std::string name, Options options)
    : name_(std::move(name)),
      options_(options),
      results_(ResultStore::unparsed(table_)) {}

Parser Parser::fromMapping(const std::vector<ParamTable::Entry>& entries, std::string name) {
    return fromMapping(entries, std::move(name), Options{});
}

Parser Parser::fromMapping(const std::vector<ParamTable::Entry>& entries, std::string name, Options options) {
    Parser parser(std::move(name), options);
    parser.table_ = ParamTable::buildFromMapping(entries);
    parser.results_ = ResultStore::unparsed(parser.table_);
    return parser;
}

std::ostream& Parser::out() const {
    if (out_) return *out_;
    return std::cout;
}

std::ostream& Parser::err() const {
    if (err_) return *err_;
    return std::cerr;
}

Parser& Parser::declareFlag(const std::string& name, const std::string& helpText) {
    table_.declareFlag(name, helpText);
    results_ = ResultStore::unparsed(table_);
    warnings_.clear();
    return *this;
}

Parser& Parser::declareArgument(const std::string& name,
                                ValueType type,
                                int arity,
                                bool isSwitch,
                                const std::string& helpText) {
    table_.declareArgument(name, type, arity, isSwitch, helpText);
    results_ = ResultStore::unparsed(table_);
    warnings_.clear();
    return *this;
}

Parser& Parser::declareArgument(const std::string& name,
                                Converter converter,
                                const std::string& typeName,
                                int arity,
                                bool isSwitch,
                                const std::string& helpText) {
    table_.declareArgument(name, std::move(converter), typeName, arity, isSwitch, helpText);
    results_ = ResultStore::unparsed(table_);
    warnings_.clear();
    return *this;
}

const std::vector<Warning>& Parser::parse(const std::vector<std::string>& tokens) {
    TokenMatcher::Options matchOptions;
    matchOptions.shortFlagGrouping = options_.shortFlagGrouping;
    matchOptions.suggestNames = options_.suggestNames;

    auto outcome = TokenMatcher(table_, matchOptions).match(tokens);
    results_ = std::move(outcome.results);
    warnings_ = std::move(outcome.warnings);

    if (options_.reportWarnings) reportWarnings();
    return warnings_;
}

const std::vector<Warning>& Parser::parse(int argc, char** argv) {
    std::vector<std::string> tokens;
    for (int i = 1; i < argc; ++i) tokens.emplace_back(argv[i]);
    return parse(tokens);
}

Parser::Result Parser::get(const std::string& name) const {
    const Param& param = lookup(name);
    if (param.isFlag()) return getFlag(name);
    return *argumentValues(name, true);
}

Parser::Result Parser::get(const std::string& name, Result defaultValue) const {
    const Param& param = lookup(name);
    if (param.isFlag()) {
        const FlagState* state = results_.flag(name);
        if (!state || *state == FlagState::NotParsed) return defaultValue;
        return *state == FlagState::True;
    }
    const Values* values = argumentValues(name, false);
    if (!values) return defaultValue;
    return *values;
}

bool Parser::getFlag(const std::string& name) const {
    if (!lookup(name).isFlag()) throw ParameterKindError(name, "a flag");
    const FlagState* state = results_.flag(name);
    if (!state || *state == FlagState::NotParsed) throw NotYetParsedError(name);
    return *state == FlagState::True;
}

bool Parser::getFlag(const std::string& name, bool defaultValue) const {
    if (!lookup(name).isFlag()) throw ParameterKindError(name, "a flag");
    const FlagState* state = results_.flag(name);
    if (!state || *state == FlagState::NotParsed) return defaultValue;
    return *state == FlagState::True;
}

const Param& Parser::lookup(const std::string& name) const {
    const Param* param = table_.find(name);
    if (!param) throw UnknownParameterError(name);
    return *param;
}

const Values* Parser::argumentValues(const std::string& name, bool required) const {
    if (!lookup(name).isArgument()) throw ParameterKindError(name, "an argument");

    const ArgumentState* state = results_.argument(name);
    if (!state || std::holds_alternative<NotParsed>(*state)) {
        if (required) throw NotYetParsedError(name);
        return nullptr;
    }
    if (std::holds_alternative<Missing>(*state)) {
        if (required) throw MissingValueError(name);
        return nullptr;
    }
    return &std::get<Values>(*state);
}

void Parser::reportWarnings() const {
    std::ostream& os = err();
    const bool on = colorOn(os);
    const ColorTheme theme{};
    for (const auto& w : warnings_) {
        os << color::paint(theme, ColorRole::Warning, "[WARNING]:", on) << " " << w.message << "\n";
    }
}

bool Parser::colorOn(const std::ostream& os) const {
    auto stream = color::Stream::Other;
    if (&os == &std::cout) stream = color::Stream::Stdout;
    if (&os == &std::cerr) stream = color::Stream::Stderr;
    return color::enabled(options_.colorMode, stream);
}

std::string Parser::formattedDump(bool on) const {
    const ColorTheme theme{};
    auto section = [&](const std::string& s) { return color::paint(theme, ColorRole::Section, s, on); };
    auto flagName = [&](const std::string& s) { return color::paint(theme, ColorRole::Name, "--" + s, on); };

    std::ostringstream oss;
    oss << section(name_.empty() ? "Command line parser:" : "Command line parser " + name_ + ":");

    oss << "\n\t" << section("Arguments:");
    const auto arguments = table_.arguments();
    if (arguments.empty()) oss << "\n\t\t(None)";
    for (const Param* p : arguments) {
        oss << "\n\t\t" << flagName(p->name()) << " (nargs: " << p->arity();
        if (p->isSwitch()) oss << ", switch";
        oss << ")";
        if (!p->helpText().empty()) oss << "\t" << p->helpText();
        const ArgumentState* state = results_.argument(p->name());
        oss << "\tResults: " << (state ? toString(*state) : std::string("[not parsed]"));
    }

    oss << "\n\t" << section("Flags:");
    const auto flags = table_.flags();
    if (flags.empty()) oss << "\n\t\t(None)";
    for (const Param* p : flags) {
        const FlagState* state = results_.flag(p->name());
        oss << "\n\t\t" << flagName(p->name()) << "\t" << p->helpText()
            << "\tStatus: " << toString(state ? *state : FlagState::NotParsed);
    }
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const Parser& parser) {
    return os << parser.formattedDump(parser.colorOn(os));
}

} // namespace clarg
