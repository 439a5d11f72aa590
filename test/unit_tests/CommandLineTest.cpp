#include "CommandLine.hpp"

#include "TestHeaders.hpp"

using namespace ptyhost;

namespace {
HostOptions parseArgs(const vector<string>& args) {
  vector<const char*> argv;
  argv.push_back("ptyhost");
  for (const auto& arg : args) {
    argv.push_back(arg.c_str());
  }
  CommandLine commandLine;
  return commandLine.parse((int)argv.size(), &argv[0]);
}
}  // namespace

TEST_CASE("Positionals give the size and the command", "[CommandLine]") {
  auto options = parseArgs({"120", "40", "bash", "-l"});
  REQUIRE(options.initialSize == TerminalSize(120, 40));
  REQUIRE(options.command == vector<string>({"bash", "-l"}));
  REQUIRE(options.pollIntervalMs == 50);
  REQUIRE(options.verbose == 0);
  REQUIRE_FALSE(options.logToStdout);
  REQUIRE_FALSE(options.help);
}

TEST_CASE("Options come before the positionals", "[CommandLine]") {
  auto options = parseArgs({"-v", "3", "--poll-interval", "20", "--logtostdout",
                            "--logdir", "/tmp/ptyhost-logs", "80", "24", "vim",
                            "--help", "-v"});
  REQUIRE(options.verbose == 3);
  REQUIRE(options.pollIntervalMs == 20);
  REQUIRE(options.logToStdout);
  REQUIRE(options.logDirectory == "/tmp/ptyhost-logs");
  REQUIRE(options.initialSize == TerminalSize(80, 24));
  // Everything after the command belongs to the child
  REQUIRE_FALSE(options.help);
  REQUIRE(options.command == vector<string>({"vim", "--help", "-v"}));
}

TEST_CASE("Double dash ends the options", "[CommandLine]") {
  auto options = parseArgs({"--", "80", "24", "-weird-command"});
  REQUIRE(options.command == vector<string>({"-weird-command"}));
}

TEST_CASE("Help and version need no positionals", "[CommandLine]") {
  REQUIRE(parseArgs({"--help"}).help);
  REQUIRE(parseArgs({"-h"}).help);
  REQUIRE(parseArgs({"--version"}).version);

  CommandLine commandLine;
  REQUIRE(commandLine.help().find("poll-interval") != string::npos);
}

TEST_CASE("Bad arguments are rejected", "[CommandLine]") {
  REQUIRE_THROWS_AS(parseArgs({}), ArgumentError);
  REQUIRE_THROWS_AS(parseArgs({"80", "24"}), ArgumentError);
  REQUIRE_THROWS_AS(parseArgs({"eighty", "24", "sh"}), ArgumentError);
  REQUIRE_THROWS_AS(parseArgs({"80", "0", "sh"}), ArgumentError);
  REQUIRE_THROWS_AS(parseArgs({"-80", "24", "sh"}), ArgumentError);
  REQUIRE_THROWS_AS(parseArgs({"80", "70000", "sh"}), ArgumentError);
  REQUIRE_THROWS_AS(parseArgs({"--poll-interval", "0", "80", "24", "sh"}),
                    ArgumentError);
  REQUIRE_THROWS_AS(parseArgs({"--poll-interval", "5000", "80", "24", "sh"}),
                    ArgumentError);
  REQUIRE_THROWS_AS(parseArgs({"--no-such-option", "80", "24", "sh"}),
                    ArgumentError);
  REQUIRE_THROWS_AS(parseArgs({"-v", "lots", "80", "24", "sh"}),
                    ArgumentError);
}

TEST_CASE("parseDimension", "[CommandLine]") {
  REQUIRE(CommandLine::parseDimension("1", "columns") == 1);
  REQUIRE(CommandLine::parseDimension("065535", "rows") == 65535);
  REQUIRE_THROWS_AS(CommandLine::parseDimension("", "rows"), ArgumentError);
  REQUIRE_THROWS_AS(CommandLine::parseDimension("12a", "rows"), ArgumentError);
  REQUIRE_THROWS_AS(CommandLine::parseDimension("9999999999", "rows"),
                    ArgumentError);
}
