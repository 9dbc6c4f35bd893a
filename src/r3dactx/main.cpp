#include "cli.hpp"
#include "commands/redact.hpp"
#include <r3dact/r3dact.hpp>
#include <args.hxx>
#include <redlog.hpp>
#include <iostream>
#include <string>
#include <vector>

namespace cli {
args::Group arguments("arguments");
args::HelpFlag help_flag(arguments, "help", "help", {'h', "help"});
args::CounterFlag verbosity_flag(arguments, "verbosity", "verbosity level", {'v'});
} // namespace cli

int main(int argc, char* argv[]) {
  auto log = redlog::get_logger("r3dactx");

  args::ArgumentParser parser(
      std::string("r3dactx ") + r3dact::version + " - overwrite literal byte patterns in files with 'x'"
  );
  parser.helpParams.showTerminator = false;
  parser.helpParams.helpindent = 2;
  parser.helpParams.width = 120;

  parser.Add(cli::arguments);

  args::ValueFlagList<std::string> pattern_flags(
      parser, "pattern", "pattern to overwrite with x's (repeat for more, applied in order)", {'x', "x-out"}
  );
  args::Flag hex_flag(parser, "hex", "patterns are hex byte strings, e.g. \"de ad be ef\"", {"hex"});
  args::Flag dry_run_flag(parser, "dry-run", "report matches without modifying files", {'n', "dry-run"});
  args::Flag recursive_flag(parser, "recursive", "descend into directories", {'r', "recursive"});
  args::Flag hidden_flag(parser, "hidden", "include dot-files when descending", {"hidden"});
  args::PositionalList<std::string> file_list(parser, "file", "file to clean");

  try {
    parser.ParseCLI(argc, argv);
  } catch (const args::Help&) {
    std::cout << parser;
    return 0;
  } catch (const args::ParseError& e) {
    std::cerr << e.what() << std::endl;
    std::cerr << parser;
    return 1;
  } catch (const args::ValidationError& e) {
    std::cerr << e.what() << std::endl;
    std::cerr << parser;
    return 1;
  }

  r3dactx::cli::apply_verbosity(args::get(cli::verbosity_flag));

  std::vector<std::string> files = args::get(file_list);
  std::vector<std::string> patterns = args::get(pattern_flags);

  if (files.empty()) {
    log.err("no input files");
    std::cerr << "error: at least one file is required" << std::endl;
    std::cerr << parser;
    return 1;
  }

  if (patterns.empty()) {
    log.err("no patterns");
    std::cerr << "error: at least one pattern (-x/--x-out) is required" << std::endl;
    std::cerr << parser;
    return 1;
  }

  r3dactx::commands::redact_settings settings;
  settings.hex = args::get(hex_flag);
  settings.dry_run = args::get(dry_run_flag);
  settings.recursive = args::get(recursive_flag);
  settings.include_hidden = args::get(hidden_flag);

  return r3dactx::commands::redact(files, patterns, settings, std::cout, std::cerr);
}
