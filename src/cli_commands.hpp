/**
 * @file cli_commands.hpp
 * @brief Command dispatch for the deepcol tool
 *
 * main() parses flags with cxxopts and hands the positional words here.
 */

#ifndef DEEPCOL_CLI_COMMANDS_HPP
#define DEEPCOL_CLI_COMMANDS_HPP

#include "deepcol/Accessor.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace deepcol {
namespace cli {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

extern const char* const kCommandHelp;

/**
 * @brief Command-specific flags
 */
struct CommandOptions {
    std::string file;          ///< -f FILE; empty reads JSON from the input stream
    bool has_default = false;  ///< get: --default given
    std::string default_text;  ///< get: literal printed when PATH is absent
    bool dedupe = false;       ///< values: drop duplicates
};

/**
 * @brief Load the document and run one command
 *
 * @param args Command word followed by its arguments, e.g. {"get", "a.b"}
 * @param in Read for the document when no file is given
 * @param out Receives command output; errors go to the spdlog logger
 * @return kExitOk, kExitFailure (absent, empty or failed) or kExitUsage
 */
int run(const std::vector<std::string>& args, const CommandOptions& command,
        const AccessOptions& access, std::istream& in, std::ostream& out);

} // namespace cli
} // namespace deepcol

#endif // DEEPCOL_CLI_COMMANDS_HPP
