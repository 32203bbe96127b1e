#include "catch2/catch.hpp"
#include "clarg/matcher.hpp"

#include <algorithm>

using namespace clarg;

namespace {

ParamTable exampleTable() {
    ParamTable table;
    table.declareFlag("help");
    table.declareArgument("n", ValueType::Int, 1, true);
    table.declareArgument("data", ValueType::Int, 4);
    table.declareFlag("l");
    table.declareFlag("i");
    table.declareFlag("s");
    table.declareFlag("a");
    return table;
}

std::size_t countKind(const std::vector<Warning>& warnings, WarningKind kind) {
    return static_cast<std::size_t>(std::count_if(warnings.begin(), warnings.end(), [&](const Warning& w) { return w.kind == kind; }));
}

const Values& valuesOf(const ResultStore& store, const std::string& name) {
    return std::get<Values>(*store.argument(name));
}

bool isMissing(const ResultStore& store, const std::string& name) {
    return std::holds_alternative<Missing>(*store.argument(name));
}

} // namespace

TEST_CASE( "classification", "[matcher]" ) {
    const auto table = exampleTable();
    const TokenMatcher matcher(table);

    REQUIRE(matcher.namedParam("--help")->name() == "help");
    REQUIRE(matcher.namedParam("-help")->name() == "help");
    REQUIRE(matcher.namedParam("help") == nullptr);
    REQUIRE(matcher.namedParam("--") == nullptr);
    REQUIRE(matcher.namedParam("-") == nullptr);
    REQUIRE(matcher.namedParam("---help") == nullptr);
    REQUIRE(matcher.namedParam("-5") == nullptr);

    REQUIRE(matcher.isShortGroup("-lisa"));
    REQUIRE(matcher.isShortGroup("-li"));
    REQUIRE(!matcher.isShortGroup("-lx"));
    REQUIRE(!matcher.isShortGroup("--lisa"));
    REQUIRE(!matcher.isShortGroup("-12"));

    TokenMatcher::Options options;
    options.shortFlagGrouping = false;
    REQUIRE(!TokenMatcher(table, options).isShortGroup("-lisa"));
}

TEST_CASE( "switch and positional arguments", "[matcher]" ) {
    const auto table = exampleTable();
    const auto outcome = TokenMatcher(table).match({"--n", "50", "1", "2", "3", "4"});

    REQUIRE(outcome.warnings.empty());
    REQUIRE(outcome.results.parsed());
    REQUIRE(std::get<int>(valuesOf(outcome.results, "n").at(0)) == 50);
    const auto& data = valuesOf(outcome.results, "data");
    REQUIRE(data.size() == 4);
    REQUIRE(std::get<int>(data[0]) == 1);
    REQUIRE(std::get<int>(data[3]) == 4);
    REQUIRE(*outcome.results.flag("help") == FlagState::False);
}

TEST_CASE( "positional values around a switch", "[matcher]" ) {
    const auto table = exampleTable();
    const auto outcome = TokenMatcher(table).match({"1", "2", "-n", "-3", "3", "4", "--help"});

    REQUIRE(outcome.warnings.empty());
    REQUIRE(std::get<int>(valuesOf(outcome.results, "n")[0]) == -3);
    const auto& data = valuesOf(outcome.results, "data");
    REQUIRE(std::get<int>(data[0]) == 1);
    REQUIRE(std::get<int>(data[1]) == 2);
    REQUIRE(std::get<int>(data[2]) == 3);
    REQUIRE(std::get<int>(data[3]) == 4);
    REQUIRE(*outcome.results.flag("help") == FlagState::True);
}

TEST_CASE( "flags and short groups", "[matcher]" ) {
    const auto table = exampleTable();
    const auto outcome = TokenMatcher(table).match({"-lisa", "--help"});

    for (const char* name : {"l", "i", "s", "a", "help"}) {
        REQUIRE(*outcome.results.flag(name) == FlagState::True);
    }
    // Both arguments absent.
    REQUIRE(countKind(outcome.warnings, WarningKind::MissingArgument) == 2);
    REQUIRE(isMissing(outcome.results, "n"));
    REQUIRE(isMissing(outcome.results, "data"));
}

TEST_CASE( "switch cut short by the end of input", "[matcher]" ) {
    ParamTable table;
    table.declareArgument("pair", ValueType::Int, 2, true);
    const auto outcome = TokenMatcher(table).match({"--pair", "7"});

    REQUIRE(outcome.warnings.size() == 2);
    REQUIRE(outcome.warnings[0].kind == WarningKind::InsufficientValues);
    REQUIRE(outcome.warnings[0].parameter == "pair");
    REQUIRE(outcome.warnings[1].kind == WarningKind::MissingArgument);
    REQUIRE(outcome.warnings[1].parameter == "pair");
    REQUIRE(isMissing(outcome.results, "pair"));
}

TEST_CASE( "switch cut short by a flag", "[matcher]" ) {
    ParamTable table;
    table.declareFlag("verbose");
    table.declareArgument("pair", ValueType::Int, 2, true);
    const auto outcome = TokenMatcher(table).match({"--pair", "7", "--verbose"});

    REQUIRE(outcome.warnings.size() == 2);
    REQUIRE(outcome.warnings[0].kind == WarningKind::InsufficientValues);
    REQUIRE(outcome.warnings[0].token == "--verbose");
    REQUIRE(isMissing(outcome.results, "pair"));
    // The flag that stopped the switch is still applied.
    REQUIRE(*outcome.results.flag("verbose") == FlagState::True);
}

TEST_CASE( "too few positional values", "[matcher]" ) {
    ParamTable table;
    table.declareArgument("data", ValueType::Int, 4);
    const auto outcome = TokenMatcher(table).match({"1", "2"});

    // The short run is reported, then the argument is still reported as not supplied.
    REQUIRE(outcome.warnings.size() == 2);
    REQUIRE(outcome.warnings[0].kind == WarningKind::InsufficientValues);
    REQUIRE(outcome.warnings[1].kind == WarningKind::MissingArgument);
    REQUIRE(outcome.warnings[1].parameter == "data");
    REQUIRE(isMissing(outcome.results, "data"));
}

TEST_CASE( "positional arguments fill in declaration order", "[matcher]" ) {
    ParamTable table;
    table.declareArgument("src", ValueType::String);
    table.declareArgument("size", ValueType::Int, 2);
    table.declareArgument("dst", ValueType::String);
    const auto outcome = TokenMatcher(table).match({"a.txt", "3", "4", "b.txt", "extra"});

    REQUIRE(std::get<std::string>(valuesOf(outcome.results, "src")[0]) == "a.txt");
    REQUIRE(std::get<int>(valuesOf(outcome.results, "size")[1]) == 4);
    REQUIRE(std::get<std::string>(valuesOf(outcome.results, "dst")[0]) == "b.txt");

    REQUIRE(outcome.warnings.size() == 1);
    REQUIRE(outcome.warnings[0].kind == WarningKind::UnknownToken);
    REQUIRE(outcome.warnings[0].token == "extra");
}

TEST_CASE( "naming a positional argument claims it", "[matcher]" ) {
    ParamTable table;
    table.declareArgument("src", ValueType::String);
    table.declareArgument("dst", ValueType::String);
    const auto outcome = TokenMatcher(table).match({"--dst", "out", "in"});

    REQUIRE(outcome.warnings.empty());
    REQUIRE(std::get<std::string>(valuesOf(outcome.results, "dst")[0]) == "out");
    REQUIRE(std::get<std::string>(valuesOf(outcome.results, "src")[0]) == "in");
}

TEST_CASE( "later switch occurrence wins", "[matcher]" ) {
    const auto table = exampleTable();
    const auto outcome = TokenMatcher(table).match({"--n", "1", "--n", "2", "1", "2", "3", "4"});
    REQUIRE(std::get<int>(valuesOf(outcome.results, "n")[0]) == 2);
}

TEST_CASE( "unknown tokens are skipped", "[matcher]" ) {
    const auto table = exampleTable();
    const auto outcome = TokenMatcher(table).match({"--hepl", "--n", "5", "1", "2", "3", "4"});

    REQUIRE(outcome.warnings.size() == 1);
    const auto& w = outcome.warnings[0];
    REQUIRE(w.kind == WarningKind::UnknownToken);
    REQUIRE(w.token == "--hepl");
    REQUIRE(w.parameter.empty());
    REQUIRE(w.message.find("did you mean --help?") != std::string::npos);
    REQUIRE(std::get<int>(valuesOf(outcome.results, "n")[0]) == 5);
    REQUIRE(valuesOf(outcome.results, "data").size() == 4);

    TokenMatcher::Options quiet;
    quiet.suggestNames = false;
    const auto plain = TokenMatcher(table, quiet).match({"--hepl"});
    REQUIRE(plain.warnings[0].message.find("did you mean") == std::string::npos);
}

TEST_CASE( "conversion failures are recoverable", "[matcher]" ) {
    const auto table = exampleTable();
    const auto outcome = TokenMatcher(table).match({"--n", "fifty", "1", "2", "3", "4", "--help"});

    REQUIRE(outcome.warnings.size() == 2);
    REQUIRE(outcome.warnings[1].kind == WarningKind::MissingArgument);
    REQUIRE(outcome.warnings[1].parameter == "n");
    REQUIRE(outcome.warnings[0].kind == WarningKind::Conversion);
    REQUIRE(outcome.warnings[0].parameter == "n");
    REQUIRE(outcome.warnings[0].token == "fifty");
    REQUIRE(isMissing(outcome.results, "n"));
    // The rest of the pass still ran.
    REQUIRE(valuesOf(outcome.results, "data").size() == 4);
    REQUIRE(*outcome.results.flag("help") == FlagState::True);
}

TEST_CASE( "positional conversion failure", "[matcher]" ) {
    ParamTable table;
    table.declareArgument("data", ValueType::Int, 4);
    table.declareArgument("label", ValueType::String);
    const auto outcome = TokenMatcher(table).match({"1", "x", "3", "4", "tag"});

    REQUIRE(countKind(outcome.warnings, WarningKind::Conversion) == 1);
    const auto& w = outcome.warnings[0];
    REQUIRE(w.kind == WarningKind::Conversion);
    REQUIRE(w.parameter == "data");
    REQUIRE(w.token == "x");
    REQUIRE(isMissing(outcome.results, "data"));
    REQUIRE(outcome.warnings[1].kind == WarningKind::MissingArgument);
    REQUIRE(outcome.warnings[1].parameter == "data");
    REQUIRE(outcome.warnings.size() == 2);

    // All four tokens went to data, so the next positional still gets its own.
    REQUIRE(std::get<std::string>(valuesOf(outcome.results, "label")[0]) == "tag");
}

TEST_CASE( "empty input", "[matcher]" ) {
    const auto table = exampleTable();
    const auto outcome = TokenMatcher(table).match({});

    REQUIRE(countKind(outcome.warnings, WarningKind::MissingArgument) == 2);
    REQUIRE(outcome.warnings[0].parameter == "n");
    REQUIRE(outcome.warnings[1].parameter == "data");
    REQUIRE(*outcome.results.flag("help") == FlagState::False);
}

TEST_CASE( "warning kind names", "[matcher]" ) {
    REQUIRE(std::string(toString(WarningKind::UnknownToken)) == "UnknownTokenWarning");
    REQUIRE(std::string(toString(WarningKind::InsufficientValues)) == "InsufficientValuesWarning");
    REQUIRE(std::string(toString(WarningKind::MissingArgument)) == "MissingArgumentWarning");
    REQUIRE(std::string(toString(WarningKind::Conversion)) == "ConversionError");
}
