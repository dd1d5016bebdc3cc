#include <cxxopts.hpp>
#include <iostream>
#include <map>
#include <string>
#include <vector>
#include "numeral/Commands.hpp"
#include "numeral/Loader.hpp"

using namespace numeral;

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("numeral", "Read, write and inspect locale-aware numerals");
        options.positional_help("COMMAND [ARGS]");

        options.add_options()
            ("f,formats", "Path to JSON/TOML file of named formats", cxxopts::value<std::string>())
            ("r,radix", "Use the radix 2/8/16 codec instead of a named format", cxxopts::value<unsigned>())
            ("k,kind", "Override the value kind: real, int or unsigned", cxxopts::value<std::string>())
            ("h,help", "Show help");

        // Command + arguments captured as positional strings
        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help() << "\n";
            std::cout << "Commands: read FORMAT TEXT | write FORMAT VALUE | test FORMAT TEXT | describe FORMAT | list\n"
                      << "With --radix, FORMAT is omitted.\n";
            return 0;
        }

        std::map<std::string, FormatEntry> file_formats;
        if (result.count("formats")) {
            file_formats = load_format_file(result["formats"].as<std::string>());
        }

        auto cmdv = result["command"].as<std::vector<std::string>>();
        if (cmdv.empty()) { std::cerr << "Error: missing command\n"; return 1; }
        const std::string cmd = cmdv[0];

        // LIST
        if (cmd == "list") {
            return list_command(file_formats, std::cout);
        }

        // Remaining commands take a format (unless --radix) and maybe one argument
        std::size_t next = 1;
        SelectedFormat format;
        if (result.count("radix")) {
            format = select_radix(result["radix"].as<unsigned>());
        } else {
            if (cmdv.size() < 2) {
                std::cerr << "Error: missing FORMAT for command '" << cmd << "'\n";
                return 1;
            }
            format = select_format(cmdv[1], file_formats);
            next = 2;
        }
        if (result.count("kind")) {
            override_kind(format, result["kind"].as<std::string>());
        }

        // DESCRIBE
        if (cmd == "describe") {
            return describe_command(format, std::cout);
        }

        if (cmdv.size() <= next) {
            std::cerr << "Error: insufficient arguments for command '" << cmd << "'\n";
            return 1;
        }
        const std::string arg = cmdv[next];

        // READ
        if (cmd == "read") {
            return read_command(format, arg, std::cout, std::cerr);
        }

        // WRITE
        if (cmd == "write") {
            return write_command(format, arg, std::cout, std::cerr);
        }

        // TEST
        if (cmd == "test") {
            return test_command(format, arg, std::cout);
        }

        std::cerr << "Unknown command: " << cmd << "\n";
        return 1;

    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
