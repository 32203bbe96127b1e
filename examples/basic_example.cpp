#include <iostream>

#include "clarg/clarg.hpp"

// app --n 50 1 2 3 4 -lis
int main(int argc, char** argv) {
    auto parser = clarg::Parser::fromMapping(
        {
            {"help", clarg::Param::flag("", "Prints help message as to how to use the program.")},
            {"n", clarg::Param::argument("", clarg::ValueType::Int, 1, true)},
            {"data", clarg::Param::argument("", clarg::ValueType::Int, 4)},
            {"l", clarg::Param::flag("", "Flag l.")},
            {"i", clarg::Param::flag("", "Flag i.")},
            {"s", clarg::Param::flag("", "Flag s.")},
            {"a", clarg::Param::flag("", "Flag a.")},
        },
        "app");

    parser.parse(argc, argv);
    std::cout << parser << "\n";
    return 0;
}
