#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "console.hpp"
#include "modes.hpp"
#include "options.hpp"

// Точка входа в программу
int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    try {
        intcalc::Options options = intcalc::parseOptions(args);
        switch (options.mode) {
        case intcalc::Mode::Evaluate:
            return intcalc::runEvaluateMode(options.expression, std::cout, std::cerr);
        case intcalc::Mode::Batch:
            return intcalc::runBatchMode(options);
        case intcalc::Mode::Generate:
            return intcalc::runGenerateMode(options);
        case intcalc::Mode::Usage:
            break;
        }
        std::cerr << intcalc::usage() << "\n";
        return 1;
    }
    catch (const std::exception& ex) {
        intcalc::printError(ex.what());
        return 1;
    }
}
