#ifndef __PTYHOST_FOCUS_EVENT_FILTER_HPP__
#define __PTYHOST_FOCUS_EVENT_FILTER_HPP__

#include "Headers.hpp"

namespace ptyhost {
/**
 * @brief Removes focus reporting sequences (DECSET/DECRST 1004 and the
 * FocusIn/FocusOut reports) from terminal output.
 *
 * ConPTY echoes these back spuriously.  Each chunk is filtered on its own; a
 * sequence split across two reads passes through.
 */
class FocusEventFilter {
 public:
  static const vector<string> FOCUS_SEQUENCES;

  /** @brief Returns `data` with every focus sequence removed. */
  static string filter(const string& data);
};
}  // namespace ptyhost

#endif  // __PTYHOST_FOCUS_EVENT_FILTER_HPP__
