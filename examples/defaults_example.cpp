#include <iostream>
#include <string>
#include <vector>

#include "clarg/clarg.hpp"

int main(int argc, char** argv) {
    clarg::Parser::Options options;
    options.colorMode = clarg::ColorMode::Auto;

    clarg::Parser parser("defaults", options);
    parser.declareFlag("verbose", "Print more")
        .declareArgument<int>("retries", 1, true, "Retry count")
        .declareArgument<double>("point", 2, true, "x y");

    // Before parse() every value falls back to its default.
    std::cout << "retries (unparsed)=" << parser.getValue<int>("retries", 3) << "\n";

    parser.parse(argc, argv);

    const bool verbose = parser.getFlag("verbose");
    const auto retries = parser.getValue<int>("retries", 3);
    const auto point = parser.getValues<double>("point", {0.0, 0.0});
    std::cout << "verbose=" << std::boolalpha << verbose << "\n";
    std::cout << "retries=" << retries << "\n";
    std::cout << "point=" << point[0] << "," << point[1] << "\n";

    try {
        (void)parser.get("colour");
    } catch (const clarg::UnknownParameterError& e) {
        std::cout << e.what() << "\n";
    }

    if (verbose) std::cout << parser << "\n";
    return 0;
}
