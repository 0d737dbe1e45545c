#include "config/options.hpp"
#include "driver/batchRunner.hpp"

#include <iostream>
#include <string>
#include <vector>

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [options] <pattern>\n";
    std::cerr << "\nOptions:\n";
    std::cerr << "  -n, --count N       Number of strings to generate (default 1)\n";
    std::cerr << "  -s, --seed N        Seed for the random source (default: time based)\n";
    std::cerr << "  -c, --cap N         Cap for unbounded quantifiers (default 32)\n";
    std::cerr << "      --config FILE   Load options from a JSON file (flags override it)\n";
    std::cerr << "      --dump-ast      Print the parsed pattern as JSON\n";
    std::cerr << "      --canonical     Print the canonical form of the pattern\n";
    std::cerr << "      --debug         Enable debug logging\n";
    std::cerr << "  -h, --help          Show this help\n";
    std::cerr << "\nExample:\n";
    std::cerr << "  " << program << " -n 5 -s 42 'id-\\d{4}[abc]~Cat(a=0.5,.=0.5)'\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return regen::EXIT_USAGE;
    }

    std::vector<std::string> args(argv + 1, argv + argc);

    regen::Options options;
    try {
        options = regen::parseCommandLine(args);
    } catch (const regen::ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        printUsage(argv[0]);
        return regen::EXIT_USAGE;
    }

    if (options.help) {
        printUsage(argv[0]);
        return regen::EXIT_OK;
    }

    try {
        regen::BatchRunner runner(options);
        return runner.run(std::cout, std::cerr);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return regen::EXIT_USAGE;
    }
}
