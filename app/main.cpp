#include <iostream>
#include <string>

#include <cli/cli_common.hpp>
#include <common/logging.hpp>

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <command> [options]\n";
    std::cerr << "\n";
    std::cerr << "Prepares road networks for the wide-path routing solver.\n";
    std::cerr << "\n";
    std::cerr << "Commands:\n";
    std::cerr << "  convert     Convert a raw dataset to nodes_<N>.txt / edges_<N>.txt\n";
    std::cerr << "  check       Validate a converted dataset\n";
    std::cerr << "  report      Summarize a Pareto path report from the solver\n";
    std::cerr << "\n";
    std::cerr << "Run '" << program_name << " <command> --help' for command options.\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  WIDEPATH_LOG_LEVEL - Set log level (trace, debug, info, warn, error)\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "convert") {
        return widepath::cli::command_convert(argc, argv);
    } else if (command == "check") {
        return widepath::cli::command_check(argc, argv);
    } else if (command == "report") {
        return widepath::cli::command_report(argc, argv);
    } else if (command == "--help" || command == "-h") {
        print_usage(argv[0]);
        return 0;
    }

    widepath::logging::get_logger()->error("Unknown command: {}", command);
    print_usage(argv[0]);
    return 1;
}
