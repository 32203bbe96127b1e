#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>

#include "clarg/clarg.hpp"

// app --level high --timeout 1m30s in.txt out.txt
int main(int argc, char** argv) {
    clarg::Parser parser("app");
    parser
        .declareArgument(
            "level",
            [](const std::string& s) -> clarg::ArgValue {
                if (s == "low") return 1;
                if (s == "medium") return 5;
                if (s == "high") return 10;
                throw std::invalid_argument("expected low, medium or high");
            },
            "level", 1, true, "Compression level")
        .declareArgument<std::chrono::milliseconds>("timeout", 1, true, "Give up after this long")
        .declareArgument<std::string>("files", 2, false, "Input and output file");

    const auto& warnings = parser.parse(argc, argv);

    const auto level = parser.getValue<int>("level", 5);
    const auto timeout = parser.getValue<std::chrono::milliseconds>("timeout", std::chrono::seconds(30));
    std::cout << "level=" << level << "\n";
    std::cout << "timeout_ms=" << timeout.count() << "\n";

    try {
        const auto files = parser.getValues<std::string>("files");
        std::cout << files[0] << " -> " << files[1] << "\n";
    } catch (const clarg::MissingValueError& e) {
        std::cerr << e.what() << "\n";
        return 2;
    }
    return warnings.empty() ? 0 : 1;
}
