#include "cli.h"
#include "tui.h"

#include "CLI/CLI.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace strata {

cli_args cli_parse(int argc, char **argv) {
  CLI::App app{ "strata - declarative infrastructure provisioning" };
  app.allow_windows_style_options(false);

  bool verbose{ false };
  app.add_flag(
      "--verbose",
      verbose,
      "Enable decorated verbose logging (prefix stdout/stderr with timestamp and level)");

  std::string trace_spec;
  auto *trace_option{ app.add_option("--trace",
                                     trace_spec,
                                     "Enable trace logging. Provide a comma-separated "
                                     "list: 'stderr' for human-readable stderr and/or "
                                     "'file:<path>' for JSONL file output. Defaults to "
                                     "stderr if no value provided.") };
  trace_option->expected(0, 1);

  bool version_flag_short{ false };
  bool version_flag_long{ false };
  app.add_flag("-v",
               version_flag_short,
               "Show version information (alias for version subcommand)");
  app.add_flag("--version",
               version_flag_long,
               "Show version information (alias for version subcommand)");

  std::optional<cli_args::cmd_cfg_t> cmd_cfg;
  auto const on_selected{ [&cmd_cfg](auto cfg) { cmd_cfg = std::move(cfg); } };

  cmd_plan::register_cli(app, on_selected);
  cmd_apply::register_cli(app, on_selected);
  cmd_state_register_cli(app, on_selected, on_selected);
  cmd_version::register_cli(app, on_selected);

  cli_args args{};

  try {
    app.parse(argc, argv);
  } catch (CLI::CallForHelp const &) {
    args.cli_output = app.help();
  } catch (CLI::ParseError const &e) { args.cli_output = std::string(e.what()); }

  // --trace defaults to stderr if no value provided
  bool const trace_requested{ trace_option->count() > 0 };
  std::vector<std::string> trace_specs_tokens;

  if (trace_requested) {
    if (trace_spec.empty()) {
      trace_specs_tokens.push_back("stderr");
    } else {
      for (std::string_view sv{ trace_spec }; !sv.empty();) {
        auto const pos{ sv.find(',') };
        auto const token{ sv.substr(0, pos) };
        if (!token.empty()) { trace_specs_tokens.emplace_back(token); }
        sv = (pos == std::string_view::npos) ? std::string_view{} : sv.substr(pos + 1);
      }
    }
  }

  if (!trace_specs_tokens.empty()) {
    args.verbosity = tui::level::TUI_TRACE;
    args.decorated_logging = true;
    for (auto const &spec : trace_specs_tokens) {
      if (spec == "stderr") {
        args.trace_outputs.push_back({ tui::trace_output_type::std_err, std::nullopt });
      } else if (spec.starts_with("file:") && spec.size() > 5) {
        args.trace_outputs.push_back(
            { tui::trace_output_type::file, std::filesystem::path{ spec.substr(5) } });
      } else {
        args.cli_output = "Invalid trace output spec: " + spec;
        args.trace_outputs.clear();
        cmd_cfg.reset();
        break;
      }
    }
  } else if (verbose) {
    args.verbosity = tui::level::TUI_DEBUG;
    args.decorated_logging = true;
  } else {
    args.verbosity = tui::level::TUI_INFO;
    args.decorated_logging = false;
  }

  if (version_flag_short || version_flag_long) {
    args.cmd_cfg = cmd_version::cfg{};
    return args;
  }

  if (cmd_cfg) {
    args.cmd_cfg = std::move(*cmd_cfg);
  } else if (args.cli_output.empty()) {
    args.cli_output = app.help();
  }

  return args;
}

}  // namespace strata
