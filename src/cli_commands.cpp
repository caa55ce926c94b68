/**
 * @file cli_commands.cpp
 * @brief Command dispatch for the deepcol tool
 */

#include "cli_commands.hpp"

#include <spdlog/spdlog.h>

#include <istream>
#include <ostream>
#include <utility>

#include "deepcol/Document.hpp"
#include "deepcol/Errors.hpp"
#include "deepcol/Loader.hpp"
#include "deepcol/PathParser.hpp"

namespace deepcol {
namespace cli {

const char* const kCommandHelp =
    "Commands:\n"
    "  get PATH            print the value at PATH (or --default)\n"
    "  set PATH VALUE      set PATH to VALUE (JSON, or a plain string)\n"
    "  delete PATH         delete the member at PATH\n"
    "  has PATH            print true/false\n"
    "  search PATTERN      print every match of PATTERN (wildcards, slices)\n"
    "  paths FIELD         print every path where FIELD occurs\n"
    "  values FIELD        print the values found at FIELD [--dedupe]\n"
    "  dump                print the document\n"
    "Use -- before arguments that start with '-'.\n";

namespace {

std::string render(const Value& value) {
    return value.dump(2, ' ', false, Value::error_handler_t::replace);
}

/**
 * @brief Write the document after a mutation: back to the file, or to out
 */
void commit(const Document& doc, const std::string& file, std::ostream& out) {
    if (file.empty()) {
        out << doc.to_json_string(2) << "\n";
    } else {
        doc.save(file);
    }
}

} // anonymous namespace

int run(const std::vector<std::string>& args, const CommandOptions& command,
        const AccessOptions& access, std::istream& in, std::ostream& out) {
    if (args.empty()) {
        spdlog::error("no command given");
        return kExitUsage;
    }
    const std::string& cmd = args[0];

    // Helpers to require extra args
    auto expect_args = [&](std::size_t want) {
        if (args.size() != want) {
            spdlog::error("command '{}' takes {} argument(s)", cmd, want - 1);
            return false;
        }
        return true;
    };

    try {
        Document doc = command.file.empty()
            ? Document(load_json_stream(in), access)
            : Document::load(command.file, access);

        // GET
        if (cmd == "get") {
            if (!expect_args(2)) return kExitUsage;
            if (command.has_default) {
                out << render(doc.get(args[1], parse_literal(command.default_text))) << "\n";
                return kExitOk;
            }
            try {
                out << render(doc.get(args[1])) << "\n";
            } catch (const MemberNotFound& ex) {
                spdlog::error("{}", ex.what());
                return kExitFailure;
            }
            return kExitOk;
        }

        // SET
        if (cmd == "set") {
            if (!expect_args(3)) return kExitUsage;
            doc.set(args[1], parse_literal(args[2]));
            commit(doc, command.file, out);
            return kExitOk;
        }

        // DELETE
        if (cmd == "delete") {
            if (!expect_args(2)) return kExitUsage;
            if (!doc.erase(args[1])) {
                spdlog::debug("nothing deleted at '{}'", args[1]);
            }
            commit(doc, command.file, out);
            return kExitOk;
        }

        // HAS
        if (cmd == "has") {
            if (!expect_args(2)) return kExitUsage;
            const bool ok = doc.has(args[1]);
            out << (ok ? "true" : "false") << "\n";
            return ok ? kExitOk : kExitFailure;
        }

        // SEARCH
        if (cmd == "search") {
            if (!expect_args(2)) return kExitUsage;
            Value found = Value::object();
            SearchCursor cursor = doc.search(args[1]);
            while (auto match = cursor.next()) {
                found[format_path(match->path, access.delimiter)] = match->value->to_value();
            }
            if (found.empty()) {
                out << "No matches\n";
                return kExitFailure;
            }
            out << render(found) << "\n";
            return kExitOk;
        }

        // PATHS
        if (cmd == "paths") {
            if (!expect_args(2)) return kExitUsage;
            FieldSearch cursor = doc.paths_to_field(args[1]);
            bool any = false;
            while (auto match = cursor.next()) {
                out << format_path(match->path, access.delimiter) << "\n";
                any = true;
            }
            return any ? kExitOk : kExitFailure;
        }

        // VALUES
        if (cmd == "values") {
            if (!expect_args(2)) return kExitUsage;
            Value values = Value::array();
            for (auto& value : doc.values_for_field(args[1], command.dedupe)) {
                values.push_back(std::move(value));
            }
            out << render(values) << "\n";
            return values.empty() ? kExitFailure : kExitOk;
        }

        // DUMP
        if (cmd == "dump") {
            if (!expect_args(1)) return kExitUsage;
            out << doc.to_json_string(2) << "\n";
            return kExitOk;
        }

        spdlog::error("unknown command: {}", cmd);
        return kExitUsage;

    } catch (const PathError& ex) {
        spdlog::error("{}", ex.what());
        return kExitFailure;
    } catch (const DocumentError& ex) {
        spdlog::error("{}", ex.what());
        return kExitFailure;
    } catch (const std::exception& ex) {
        spdlog::error("{}", ex.what());
        return kExitFailure;
    }
}

} // namespace cli
} // namespace deepcol
