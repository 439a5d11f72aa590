#include "ResizeSequenceDecoder.hpp"

namespace ptyhost {
const string ResizeSequenceDecoder::DIRECTIVE_PREFIX = "\x1b]RESIZE;";

size_t ResizeSequenceDecoder::matchPrefix(const string& buf, size_t pos) {
  size_t matched = 0;
  while (matched < DIRECTIVE_PREFIX.size() && pos + matched < buf.size() &&
         buf[pos + matched] == DIRECTIVE_PREFIX[matched]) {
    matched++;
  }
  return matched;
}

vector<InputEvent> ResizeSequenceDecoder::decode(const string& chunk) {
  vector<InputEvent> events;
  string buf;
  buf.swap(pending);
  buf.append(chunk);

  string data;
  size_t i = 0;
  while (i < buf.size()) {
    if (buf[i] != DIRECTIVE_PREFIX[0]) {
      size_t next = buf.find(DIRECTIVE_PREFIX[0], i);
      if (next == string::npos) {
        next = buf.size();
      }
      data.append(buf, i, next - i);
      i = next;
      continue;
    }

    size_t matched = matchPrefix(buf, i);
    if (matched < DIRECTIVE_PREFIX.size()) {
      if (i + matched == buf.size()) {
        // Input ran out while it still looked like a directive
        pending = buf.substr(i);
        break;
      }
      // Some other escape sequence, the ESC is plain data
      data.push_back(buf[i]);
      i++;
      continue;
    }

    size_t bodyStart = i + DIRECTIVE_PREFIX.size();
    size_t end = buf.find(DIRECTIVE_TERMINATOR, bodyStart);
    if (end != string::npos) {
      if (!data.empty()) {
        events.push_back(InputEvent::makeData(data));
        data.clear();
      }
      string body = buf.substr(bodyStart, end - bodyStart);
      try {
        events.push_back(InputEvent::makeResize(parseBody(body)));
      } catch (const DecodeError& de) {
        events.push_back(InputEvent::makeDecodeError(de.what()));
      }
      i = end + 1;
      continue;
    }

    if (buf.size() - i > MAX_PENDING_BYTES) {
      LOG(WARNING) << "Resize directive not terminated within "
                   << MAX_PENDING_BYTES << " bytes, passing it through";
      data.append(buf, i, MAX_PENDING_BYTES + 1);
      i += MAX_PENDING_BYTES + 1;
      continue;
    }

    pending = buf.substr(i);
    break;
  }

  if (!data.empty()) {
    events.push_back(InputEvent::makeData(data));
  }
  if (!pending.empty()) {
    VLOG(3) << "Holding back " << pending.size() << " bytes of input";
  }
  return events;
}

string ResizeSequenceDecoder::flushPartialPrefix() {
  if (!hasPartialPrefix()) {
    return string();
  }
  string released;
  released.swap(pending);
  return released;
}

string ResizeSequenceDecoder::flushAll() {
  string released;
  released.swap(pending);
  return released;
}

namespace {
int parseField(const string& field, const string& body) {
  if (field.empty()) {
    throw DecodeError("Empty field in resize directive: '" + body + "'");
  }
  size_t start = (field[0] == '-' || field[0] == '+') ? 1 : 0;
  if (start == field.size()) {
    throw DecodeError("Invalid field in resize directive: '" + body + "'");
  }
  for (size_t a = start; a < field.size(); a++) {
    if (field[a] < '0' || field[a] > '9') {
      throw DecodeError("Non-numeric field in resize directive: '" + body +
                        "'");
    }
  }
  errno = 0;
  long value = strtol(field.c_str(), NULL, 10);
  if (errno == ERANGE || value > std::numeric_limits<int>::max() ||
      value < std::numeric_limits<int>::min()) {
    throw DecodeError("Field out of range in resize directive: '" + body +
                      "'");
  }
  return (int)value;
}
}  // namespace

TerminalSize ResizeSequenceDecoder::parseBody(const string& body) {
  size_t separator = body.find(';');
  if (separator == string::npos ||
      body.find(';', separator + 1) != string::npos) {
    throw DecodeError("Resize directive needs exactly two fields: '" + body +
                      "'");
  }
  int columns = parseField(body.substr(0, separator), body);
  int rows = parseField(body.substr(separator + 1), body);
  return TerminalSize(columns, rows);
}

string ResizeSequenceDecoder::cleanPayload(const vector<InputEvent>& events) {
  string payload;
  for (const auto& event : events) {
    if (event.type == InputEvent::DATA) {
      payload.append(event.data);
    }
  }
  return payload;
}
}  // namespace ptyhost
