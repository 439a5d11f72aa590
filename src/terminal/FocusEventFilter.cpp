#include "FocusEventFilter.hpp"

namespace ptyhost {
const vector<string> FocusEventFilter::FOCUS_SEQUENCES = {
    "\x1b[?1004h",
    "\x1b[?1004l",
    "\x1b[I",
    "\x1b[O",
};

string FocusEventFilter::filter(const string& data) {
  if (data.find('\x1b') == string::npos) {
    return data;
  }
  string filtered = data;
  int removed = 0;
  for (const auto& sequence : FOCUS_SEQUENCES) {
    removed += replaceAll(filtered, sequence, "");
  }
  if (removed) {
    VLOG(2) << "Dropped " << removed << " focus event sequences";
  }
  return filtered;
}
}  // namespace ptyhost
