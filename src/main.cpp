#include "depgraph/cli/commands.hpp"

#include <charconv>
#include <cstdlib>
#include <format>
#include <print>
#include <string>
#include <string_view>
#include <vector>

namespace {

void print_usage(const char* prog) {
  std::println("depgraph - task dependency graph engine");
  std::println("Usage: {} [OPTIONS] <command> [ARGS]", prog);
  std::println("");
  std::println("Commands:");
  std::println("  add <task> <depends-on>      Add a dependency edge");
  std::println("      --type <type>            blocking (default), related, optional,");
  std::println("                               finish-to-start, start-to-start,");
  std::println("                               finish-to-finish, start-to-finish");
  std::println("      --reason <text>          Reason recorded with the edge");
  std::println("      --force                  Override cycle and type checks");
  std::println("      --no-cycle-check         Skip cycle validation");
  std::println("  remove <task> <depends-on>   Remove a dependency edge");
  std::println("      --force                  Override blocking removal warnings");
  std::println("      --cascade                Remove now-redundant edges of dependents");
  std::println("      --no-impact              Skip removal impact analysis");
  std::println("      --reason <text>          Reason recorded in the change log");
  std::println("  validate                     Audit the whole graph");
  std::println("      --checks <list>          full, cycles, logical, orphans,");
  std::println("                               redundant, critical-path (comma separated)");
  std::println("      --severity <level>       info (default), warning, critical");
  std::println("      --fix                    Apply auto-fixes and save");
  std::println("      --metrics                Include dependency metrics");
  std::println("  impact [--task <id>]         Per-task impact analysis");
  std::println("  subgraph <task> [--depth N]  Tasks connected to <task>");
  std::println("");
  std::println("Options:");
  std::println("  -c, --config <file>          Config file (YAML)");
  std::println("  --tasks <file>               Tasks file (overrides config)");
  std::println("  --log-level <level>          trace, debug, info, warn, error, off");
  std::println("  -v, --version                Show version and exit");
  std::println("  -h, --help                   Show this help message");
  std::println("");
  std::println("Exit status: 0 success, 1 usage or I/O error,");
  std::println("             2 rejected mutation or critical audit issues");
}

void print_version() {
  std::println("depgraph v0.1.0");
}

struct Options {
  depgraph::cli::CommonOptions common;
  std::string command;
  std::vector<std::string> positional;
  std::string type{"blocking"};
  std::string reason;
  std::string checks;
  std::string severity;
  std::string task;
  std::size_t depth{0};
  bool force{false};
  bool skip_cycle_check{false};
  bool cascade{false};
  bool skip_impact{false};
  bool fix{false};
  bool metrics{false};
};

[[noreturn]] void usage_error(const char* prog, std::string_view message) {
  std::println(stderr, "Error: {}", message);
  std::println(stderr, "Run '{} --help' for usage.", prog);
  std::exit(depgraph::cli::kExitError);
}

auto parse_args(int argc, char* argv[]) -> Options {
  Options opts;

  auto value_of = [&](int& i, std::string_view flag) -> std::string {
    if (++i >= argc) {
      usage_error(argv[0], std::format("{} requires an argument", flag));
    }
    return argv[i];
  };

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "-v" || arg == "--version") {
      print_version();
      std::exit(0);
    } else if (arg == "-c" || arg == "--config") {
      opts.common.config_file = value_of(i, arg);
    } else if (arg == "--tasks") {
      opts.common.tasks_file = value_of(i, arg);
    } else if (arg == "--log-level") {
      opts.common.log_level = value_of(i, arg);
    } else if (arg == "--type") {
      opts.type = value_of(i, arg);
    } else if (arg == "--reason") {
      opts.reason = value_of(i, arg);
    } else if (arg == "--checks") {
      opts.checks = value_of(i, arg);
    } else if (arg == "--severity") {
      opts.severity = value_of(i, arg);
    } else if (arg == "--task") {
      opts.task = value_of(i, arg);
    } else if (arg == "--depth") {
      auto text = value_of(i, arg);
      auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(),
                                       opts.depth);
      if (ec != std::errc{} || ptr != text.data() + text.size()) {
        usage_error(argv[0], std::format("invalid depth: {}", text));
      }
    } else if (arg == "--force") {
      opts.force = true;
    } else if (arg == "--no-cycle-check") {
      opts.skip_cycle_check = true;
    } else if (arg == "--cascade") {
      opts.cascade = true;
    } else if (arg == "--no-impact") {
      opts.skip_impact = true;
    } else if (arg == "--fix") {
      opts.fix = true;
    } else if (arg == "--metrics") {
      opts.metrics = true;
    } else if (arg.starts_with("-")) {
      usage_error(argv[0], std::format("unknown option: {}", arg));
    } else if (opts.command.empty()) {
      opts.command = arg;
    } else {
      opts.positional.emplace_back(arg);
    }
  }

  return opts;
}

auto require_positional(const Options& opts, std::size_t count,
                        const char* prog) -> void {
  if (opts.positional.size() != count) {
    usage_error(prog, std::format("'{}' expects {} argument(s), got {}",
                                  opts.command, count, opts.positional.size()));
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  namespace cli = depgraph::cli;
  auto opts = parse_args(argc, argv);

  if (opts.command == "add") {
    require_positional(opts, 2, argv[0]);
    return cli::cmd_add({
        .common = opts.common,
        .task_id = opts.positional[0],
        .depends_on = opts.positional[1],
        .type = opts.type,
        .reason = opts.reason,
        .force = opts.force,
        .skip_cycle_check = opts.skip_cycle_check,
    });
  }
  if (opts.command == "remove") {
    require_positional(opts, 2, argv[0]);
    return cli::cmd_remove({
        .common = opts.common,
        .task_id = opts.positional[0],
        .depends_on = opts.positional[1],
        .reason = opts.reason,
        .force = opts.force,
        .cascade = opts.cascade,
        .skip_impact = opts.skip_impact,
    });
  }
  if (opts.command == "validate") {
    require_positional(opts, 0, argv[0]);
    cli::ValidateCommandOptions validate{.common = opts.common,
                                         .fix = opts.fix,
                                         .metrics = opts.metrics};
    if (!opts.checks.empty()) validate.checks = opts.checks;
    if (!opts.severity.empty()) validate.min_severity = opts.severity;
    return cli::cmd_validate(validate);
  }
  if (opts.command == "impact") {
    require_positional(opts, 0, argv[0]);
    return cli::cmd_impact({.common = opts.common, .task_id = opts.task});
  }
  if (opts.command == "subgraph") {
    require_positional(opts, 1, argv[0]);
    return cli::cmd_subgraph({.common = opts.common,
                              .focus = opts.positional[0],
                              .max_depth = opts.depth});
  }

  if (opts.command.empty()) {
    print_usage(argv[0]);
  } else {
    std::println(stderr, "Error: unknown command: {}", opts.command);
  }
  return cli::kExitError;
}
