#include "functions/env_config/src/env_config.hpp"
#include "functions/run_report/src/run_report.hpp"
#include "functions/stream_filter/src/stream_filter.hpp"

#include <exception>
#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

static void print_usage(std::ostream& os, const std::string& default_output) {
    os << "Usage: p2pkh_filter <input_file> [-o <output_file>]\n"
          "\n"
          "Filter Legacy P2PKH Bitcoin addresses (starting with \"1\") from a file.\n"
          "\n"
          "  input_file           addresses, one per line (.txt or .zip)\n"
          "  -o, --output <path>  output file (default: " << default_output << ")\n"
          "                       also -o<path> and --output=<path>\n"
          "  -h, --help           show this help\n";
}

int main(int argc, char* argv[]) {
    const FilterConfig cfg = load_filter_config(std::cerr);

    // argv[1..] : <input_file> [-o <output_file> | -o<output_file> | --output=<output_file>]
    std::string input_arg;
    std::string output_arg = cfg.default_output;

    for (int i = 1; i < argc; ++i) {
        const std::string arg(argv[i]);
        if (arg == "-h" || arg == "--help") {
            print_usage(std::cout, cfg.default_output);
            return 0;
        } else if (arg == "-o" || arg == "--output") {
            if (i + 1 >= argc) {
                std::cerr << "[error] " << arg << " expects a path\n";
                print_usage(std::cerr, cfg.default_output);
                return 2;
            }
            output_arg = argv[++i];
        } else if (arg.rfind("--output=", 0) == 0 || (arg.size() > 2 && arg.rfind("-o", 0) == 0)) {
            // --output=<path>, -o<path>
            output_arg = arg.substr(arg[1] == '-' ? 9 : 2);
            if (output_arg.empty()) {
                std::cerr << "[error] --output expects a path\n";
                print_usage(std::cerr, cfg.default_output);
                return 2;
            }
        } else if (!arg.empty() && arg[0] == '-' && arg != "-") {
            std::cerr << "[error] unknown option: " << arg << "\n";
            print_usage(std::cerr, cfg.default_output);
            return 2;
        } else if (input_arg.empty()) {
            input_arg = arg;
        } else {
            std::cerr << "[error] unexpected argument: " << arg << "\n";
            print_usage(std::cerr, cfg.default_output);
            return 2;
        }
    }

    if (input_arg.empty()) {
        print_usage(std::cerr, cfg.default_output);
        return 2;
    }

    const fs::path input  = fs::path(input_arg).lexically_normal();
    const fs::path output = fs::path(output_arg).lexically_normal();

    try {
        RunSummary summary = filter_addresses(input, output, std::cerr, cfg.options);

        if (!cfg.report_path.empty()) {
            if (write_run_report(cfg.report_path, input, output, cfg.options, summary))
                std::cerr << "[info] report written to " << cfg.report_path << "\n";
            else
                std::cerr << "[warn] failed to write report: " << cfg.report_path << "\n";
        }
        return 0;
    } catch (const std::exception& e) {
        // FilterError 포함
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
