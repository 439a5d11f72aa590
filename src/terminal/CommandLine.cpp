#include "CommandLine.hpp"

namespace ptyhost {
const vector<string> CommandLine::VALUE_OPTIONS = {
    "-v", "--verbose", "-l", "--logdir", "--poll-interval",
};

CommandLine::CommandLine()
    : options("ptyhost",
              "Runs a command on a pseudo-terminal and relays it over stdio") {
  options.custom_help("[OPTION...] <columns> <rows> <command> [args...]");
  options.positional_help("");
  options.add_options()                 //
      ("h,help", "Print help")          //
      ("version", "Print version")      //
      ("v,verbose", "Enable verbose logging",
       cxxopts::value<int>()->default_value("0"))  //
      ("l,logdir", "Base directory for log files.",
       cxxopts::value<std::string>()->default_value(GetTempDirectory()))  //
      ("logtostdout",
       "Write log to stdout (mixes with terminal output, debugging only)")  //
      ("poll-interval",
       "Milliseconds to wait for I/O before checking on the child",
       cxxopts::value<int>()->default_value("50"))  //
      ;
}

string CommandLine::help() { return options.help({}); }

int CommandLine::parseDimension(const string& value, const string& what) {
  if (value.empty() || value.size() > 9 ||
      value.find_first_not_of("0123456789") != string::npos) {
    throw ArgumentError(what + " must be a positive integer, got '" + value +
                        "'");
  }
  int dimension = stoi(value);
  if (dimension <= 0 || dimension > 65535) {
    throw ArgumentError(what + " must be between 1 and 65535, got '" + value +
                        "'");
  }
  return dimension;
}

HostOptions CommandLine::parse(int argc, const char* const* argv) {
  vector<const char*> optionArgs;
  optionArgs.push_back(argc > 0 ? argv[0] : "ptyhost");

  int a = 1;
  for (; a < argc; a++) {
    string arg = argv[a];
    if (arg == "--") {
      a++;
      break;
    }
    if (arg.size() < 2 || arg[0] != '-') {
      break;
    }
    optionArgs.push_back(argv[a]);
    if (std::find(VALUE_OPTIONS.begin(), VALUE_OPTIONS.end(), arg) !=
            VALUE_OPTIONS.end() &&
        a + 1 < argc) {
      a++;
      optionArgs.push_back(argv[a]);
    }
  }

  HostOptions hostOptions;
  try {
    auto result = options.parse((int)optionArgs.size(), &optionArgs[0]);
    hostOptions.help = result.count("help") > 0;
    hostOptions.version = result.count("version") > 0;
    hostOptions.verbose = result["verbose"].as<int>();
    hostOptions.logDirectory = result["logdir"].as<string>();
    hostOptions.logToStdout = result.count("logtostdout") > 0;
    hostOptions.pollIntervalMs = result["poll-interval"].as<int>();
  } catch (const cxxopts::exceptions::exception& oe) {
    throw ArgumentError(oe.what());
  }

  if (hostOptions.help || hostOptions.version) {
    return hostOptions;
  }
  if (hostOptions.pollIntervalMs < 1 || hostOptions.pollIntervalMs > 1000) {
    throw ArgumentError("--poll-interval must be between 1 and 1000");
  }

  vector<string> positionals;
  for (; a < argc; a++) {
    positionals.push_back(argv[a]);
  }
  if (positionals.size() < 3) {
    throw ArgumentError("Expected <columns> <rows> <command> [args...]");
  }
  hostOptions.initialSize.columns = parseDimension(positionals[0], "columns");
  hostOptions.initialSize.rows = parseDimension(positionals[1], "rows");
  hostOptions.command.assign(positionals.begin() + 2, positionals.end());
  return hostOptions;
}
}  // namespace ptyhost
