#ifndef __PTYHOST_TERMINAL_SIZE_HPP__
#define __PTYHOST_TERMINAL_SIZE_HPP__

#include "Headers.hpp"

namespace ptyhost {
/**
 * @brief Character-cell dimensions of a terminal.
 */
struct TerminalSize {
  int columns;
  int rows;

  TerminalSize() : columns(0), rows(0) {}
  TerminalSize(int _columns, int _rows) : columns(_columns), rows(_rows) {}

  bool operator==(const TerminalSize& other) const {
    return columns == other.columns && rows == other.rows;
  }
  bool operator!=(const TerminalSize& other) const { return !(*this == other); }

  /** @brief True when both dimensions fit a `winsize`/`COORD` field. */
  bool isValid() const {
    return columns > 0 && rows > 0 && columns <= 65535 && rows <= 65535;
  }
};

inline std::ostream& operator<<(std::ostream& os, const TerminalSize& size) {
  os << size.columns << "x" << size.rows;
  return os;
}
}  // namespace ptyhost

#endif  // __PTYHOST_TERMINAL_SIZE_HPP__
