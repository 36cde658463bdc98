#include "common/cli_config.hpp"

#include "catalog/preconditions.hpp"
#include "trace/trace_id.hpp"

#include <cstddef>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <boost/program_options.hpp>
#include <fmt/format.h>

namespace po = boost::program_options;

namespace chandb {

namespace {

// ── Helpers ───────────────────────────────────────────────────────────────────

struct CommandSpec {
    const char* name;
    CliCommand  command;
    std::size_t operands;
    const char* usage;
};

constexpr CommandSpec kCommands[] = {
    {"put",      CliCommand::Put,     2, "put <id> <channel-json>"},
    {"get",      CliCommand::Get,     1, "get <id>"},
    {"list",     CliCommand::List,    0, "list"},
    {"delete",   CliCommand::Delete,  1, "delete <id>"},
    {"hash",     CliCommand::Hash,    1, "hash <channel-json>"},
    {"trace-id", CliCommand::TraceId, 0, "trace-id"},
};

[[nodiscard]] const CommandSpec& find_command(const std::string& name) {
    for (const auto& spec : kCommands) {
        if (name == spec.name) {
            return spec;
        }
    }
    throw std::runtime_error(fmt::format(
        "Unknown command '{}' (expected put, get, list, delete, hash or trace-id)", name));
}

// Collect every occurrence of a repeated option, splitting comma lists.
[[nodiscard]] std::vector<std::string> collect_etags(const po::variables_map& vm,
                                                     const char* name) {
    std::vector<std::string> result;
    if (!vm.count(name)) {
        return result;
    }
    for (const auto& value : vm[name].as<std::vector<std::string>>()) {
        for (auto& tag : catalog::parse_etag_list(value)) {
            result.push_back(std::move(tag));
        }
    }
    return result;
}

} // anonymous namespace

// ── add_options ───────────────────────────────────────────────────────────────

void add_options(po::options_description& desc) {
    desc.add_options()
        ("help,h",
            "Show this help message and exit")
        ("db",
            po::value<std::string>()->default_value("channels.db"),
            "Snapshot file backing the channel store (empty for memory only)")
        ("log-level,l",
            po::value<std::string>()->default_value("warn"),
            "Log level: trace|debug|info|warn|error|critical|off")
        ("traceparent",
            po::value<std::string>(),
            "Trace id to tag log lines with (generated when omitted)")
        ("if-match",
            po::value<std::vector<std::string>>()->composing(),
            "put: only write if the current ETag matches (repeatable, '*' = exists)")
        ("if-none-match",
            po::value<std::vector<std::string>>()->composing(),
            "put: only write if the current ETag does not match (repeatable, '*' = exists)")
        ("if-modified-since",
            po::value<int64_t>(),
            "put: only write if the channel changed after this Unix time (ms)")
        ("if-unmodified-since",
            po::value<int64_t>(),
            "put: only write if the channel is unchanged since this Unix time (ms)")
        ("command",
            po::value<std::string>(),
            "Command: put|get|list|delete|hash|trace-id")
        ("args",
            po::value<std::vector<std::string>>(),
            "Command operands");
}

// ── parse_cli_config ──────────────────────────────────────────────────────────

CliConfig parse_cli_config(int argc, char* argv[]) {
    po::options_description desc("chandb-cli options");
    add_options(desc);

    po::positional_options_description positional;
    positional.add("command", 1);
    positional.add("args", -1);

    po::variables_map vm;
    try {
        po::store(
            po::command_line_parser(argc, argv)
                .options(desc)
                .positional(positional)
                .run(),
            vm);

        if (vm.count("help")) {
            std::ostringstream oss;
            oss << "Usage: chandb-cli [options] <command> [args...]\n\nCommands:\n";
            for (const auto& spec : kCommands) {
                oss << "  " << spec.usage << '\n';
            }
            oss << '\n' << desc;
            throw std::runtime_error(oss.str());
        }

        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error(fmt::format("Argument error: {}", e.what()));
    }

    if (!vm.count("command")) {
        throw std::runtime_error("Missing command (try --help)");
    }

    const auto& spec = find_command(vm["command"].as<std::string>());

    CliConfig cfg;
    cfg.db_path   = vm["db"].as<std::string>();
    cfg.log_level = vm["log-level"].as<std::string>();
    cfg.command   = spec.command;
    if (vm.count("args")) {
        cfg.args = vm["args"].as<std::vector<std::string>>();
    }
    if (vm.count("traceparent")) {
        cfg.traceparent = vm["traceparent"].as<std::string>();
    }
    cfg.if_match      = collect_etags(vm, "if-match");
    cfg.if_none_match = collect_etags(vm, "if-none-match");
    if (vm.count("if-modified-since")) {
        cfg.if_modified_since_ms = vm["if-modified-since"].as<int64_t>();
    }
    if (vm.count("if-unmodified-since")) {
        cfg.if_unmodified_since_ms = vm["if-unmodified-since"].as<int64_t>();
    }

    if (cfg.args.size() != spec.operands) {
        throw std::runtime_error(fmt::format(
            "'{}' takes {} operand(s), got {} (usage: {})",
            spec.name, spec.operands, cfg.args.size(), spec.usage));
    }

    const bool conditional = !cfg.if_match.empty() || !cfg.if_none_match.empty() ||
                             cfg.if_modified_since_ms || cfg.if_unmodified_since_ms;
    if (cfg.command != CliCommand::Put && conditional) {
        throw std::runtime_error(
            "--if-match / --if-none-match / --if-modified-since / "
            "--if-unmodified-since only apply to put");
    }

    if (!cfg.traceparent.empty() && !trace::is_valid_trace_id(cfg.traceparent)) {
        throw std::runtime_error(fmt::format(
            "--traceparent must look like 00-<32 hex>-<16 hex>-00, got '{}'",
            cfg.traceparent));
    }

    return cfg;
}

} // namespace chandb
