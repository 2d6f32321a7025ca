/// @file src/main.cpp
/// @brief pricenorm CLI entry point.
///
/// Usage:
///   pricenorm                 Read prices from stdin until a blank line
///   pricenorm --file <path>   Read prices from a file (one per line)
///   pricenorm --help          Print usage

#include "pricenorm/normalizer.hpp"

#include <fmt/core.h>

#include <fstream>
#include <iostream>
#include <istream>
#include <string>
#include <vector>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  pricenorm                 Read prices from stdin (blank line to finish)\n"
        "  pricenorm --file <path>   Read prices from a file, one per line\n"
        "  pricenorm --help          Show this help\n"
        "\n"
        "Accepted forms include: $1,234.56  EUR 1.234,56  1234.56  (£5.00)\n"
    );
}

/// Read lines until EOF or the first blank (whitespace-only) line.
std::vector<std::string> read_prices(std::istream& in) {
    std::vector<std::string> inputs;
    std::string line;
    while (std::getline(in, line)) {
        // Trim carriage return for Windows-style line endings.
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t\f\v") == std::string::npos) {
            break;
        }
        inputs.push_back(line);
    }
    return inputs;
}

/// Normalize `inputs` and print failures followed by the sorted amounts.
int report(const std::vector<std::string>& inputs) {
    const auto result = pricenorm::normalize_and_sort(inputs);

    if (!result.failures.empty()) {
        fmt::print("Encountered errors:\n");
        for (const auto& f : result.failures) {
            fmt::print("- Failed to parse '{}': {}\n", f.input, f.reason);
        }
    }

    fmt::print("\nNormalized and Sorted Prices:\n");
    fmt::print("{:-<30}\n", "");
    for (const auto& amount : result.amounts) {
        fmt::print("{}\n", amount.to_string());
    }
    return 0;
}

int run_interactive() {
    fmt::print("Price Normalization System\n");
    fmt::print("Enter prices (one per line, empty line to finish):\n");
    return report(read_prices(std::cin));
}

int run_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", path);
        return 1;
    }
    const auto inputs = read_prices(file);
    fmt::print("Loaded {} prices from '{}'\n", inputs.size(), path);
    return report(inputs);
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        return run_interactive();
    }

    const std::string mode(argv[1]);

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    if (mode == "--file") {
        if (argc < 3) {
            fmt::print(stderr, "Error: --file requires a path\n");
            print_usage();
            return 1;
        }
        return run_file(std::string(argv[2]));
    }

    fmt::print(stderr, "Unknown option: {}\n", mode);
    print_usage();
    return 1;
}
