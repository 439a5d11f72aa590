#ifndef __PTYHOST_COMMAND_LINE_HPP__
#define __PTYHOST_COMMAND_LINE_HPP__

#include <cxxopts.hpp>

#include "Errors.hpp"
#include "Headers.hpp"
#include "TerminalSize.hpp"

namespace ptyhost {
/**
 * @brief Everything ptyhost needs from its command line.
 */
struct HostOptions {
  TerminalSize initialSize;
  vector<string> command;
  int pollIntervalMs;
  int verbose;
  bool logToStdout;
  string logDirectory;
  bool help;
  bool version;

  HostOptions()
      : pollIntervalMs(50),
        verbose(0),
        logToStdout(false),
        logDirectory(GetTempDirectory()),
        help(false),
        version(false) {}
};

/**
 * @brief Parses `ptyhost [options] <columns> <rows> <command> [args...]`.
 *
 * Options have to come before the positionals.  The command and everything
 * after it go to the child as-is, even when they look like options.
 */
class CommandLine {
 public:
  CommandLine();

  /**
   * @throws ArgumentError when the arguments are unusable.  Help and version
   * requests return early without positionals.
   */
  HostOptions parse(int argc, const char* const* argv);

  /** @brief Usage text for the operator. */
  string help();

  /**
   * @brief Parses a strictly positive decimal integer.
   * @throws ArgumentError naming `what` on failure.
   */
  static int parseDimension(const string& value, const string& what);

 protected:
  /** @brief Options that take their value as the following argument. */
  static const vector<string> VALUE_OPTIONS;

  cxxopts::Options options;
};
}  // namespace ptyhost

#endif  // __PTYHOST_COMMAND_LINE_HPP__
