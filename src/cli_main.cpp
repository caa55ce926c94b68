#include <cxxopts.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <iostream>
#include <string>
#include <vector>

#include "cli_commands.hpp"

using namespace deepcol;
using namespace deepcol::cli;

int main(int argc, char** argv) {
    spdlog::set_default_logger(spdlog::stderr_color_mt("deepcol"));
    spdlog::set_pattern("%^%l%$: %v");
    spdlog::set_level(spdlog::level::warn);

    cxxopts::Options options("deepcol", "Read, write and search nested JSON/TOML documents by path");
    options.positional_help("COMMAND [ARGS]");

    // Global options
    options.add_options()
        ("f,file", "JSON/TOML document (default: JSON on stdin)", cxxopts::value<std::string>())
        ("d,delimiter", "Key delimiter in paths", cxxopts::value<char>()->default_value("."))
        ("no-auto-create", "set: fail instead of creating missing containers")
        ("lenient", "delete: ignore missing members")
        ("max-depth", "search: nesting limit", cxxopts::value<std::size_t>()->default_value("256"))
        ("default", "get: JSON value printed when PATH is absent", cxxopts::value<std::string>())
        ("dedupe", "values: drop duplicate values")
        ("v,verbose", "Log debug details to stderr")
        ("h,help", "Show help");

    // Command + arguments captured as positional strings
    options.add_options()
        ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

    options.parse_positional({"command"});

    std::vector<std::string> cmdv;
    CommandOptions command;
    AccessOptions access;

    try {
        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            std::cout << options.help() << "\n" << kCommandHelp;
            return kExitOk;
        }
        if (!result.count("command")) {
            std::cerr << options.help() << "\n" << kCommandHelp;
            return kExitUsage;
        }
        cmdv = result["command"].as<std::vector<std::string>>();
        if (result.count("file")) command.file = result["file"].as<std::string>();
        access.delimiter = result["delimiter"].as<char>();
        access.auto_create = result.count("no-auto-create") == 0;
        access.strict = result.count("lenient") == 0;
        access.max_depth = result["max-depth"].as<std::size_t>();
        command.dedupe = result.count("dedupe") > 0;
        if (result.count("default")) {
            command.default_text = result["default"].as<std::string>();
            command.has_default = true;
        }
        if (result.count("verbose")) {
            spdlog::set_level(spdlog::level::debug);
        }
    } catch (const std::exception& ex) {
        spdlog::error("{}", ex.what());
        return kExitUsage;
    }

    return cli::run(cmdv, command, access, std::cin, std::cout);
}
