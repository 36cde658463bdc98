#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

namespace chandb {

// ── CliCommand ────────────────────────────────────────────────────────────────

enum class CliCommand {
    Put,      // put <id> <channel-json>
    Get,      // get <id>
    List,     // list
    Delete,   // delete <id>
    Hash,     // hash <channel-json>
    TraceId,  // trace-id
};

// ── CliConfig ─────────────────────────────────────────────────────────────────
// Full configuration for one chandb-cli invocation.
// Populated by parse_cli_config() from CLI arguments.

struct CliConfig {
    std::string db_path;             // Snapshot file; empty = memory only
    std::string log_level;           // spdlog level string
    std::string traceparent;         // Caller-supplied trace id; empty = generate

    CliCommand command = CliCommand::List;
    std::vector<std::string> args;   // Command operands

    std::vector<std::string> if_match;       // put only
    std::vector<std::string> if_none_match;  // put only

    // put only; Unix epoch milliseconds, as printed by `list`
    std::optional<int64_t> if_modified_since_ms;
    std::optional<int64_t> if_unmodified_since_ms;
};

// ── parse_cli_config ──────────────────────────────────────────────────────────
// Parse CLI arguments into a CliConfig.
//
// On success: returns a fully validated CliConfig.
// On error  : throws std::runtime_error with a human-readable message.
// --help    : throws std::runtime_error carrying the help text.
//
// Validates:
//   - a known command is given with the right number of operands
//   - conditional options (--if-match, --if-none-match, --if-modified-since,
//     --if-unmodified-since) are only used with put
//   - --traceparent, when given, is a well-formed trace id

[[nodiscard]] CliConfig parse_cli_config(int argc, char* argv[]);

// ── add_options ───────────────────────────────────────────────────────────────
// Populate a boost::program_options::options_description with chandb-cli
// options. Exposed for testing and help-text generation.

void add_options(boost::program_options::options_description& desc);

} // namespace chandb
