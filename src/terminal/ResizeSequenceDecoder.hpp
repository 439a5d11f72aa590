#ifndef __PTYHOST_RESIZE_SEQUENCE_DECODER_HPP__
#define __PTYHOST_RESIZE_SEQUENCE_DECODER_HPP__

#include "Errors.hpp"
#include "Headers.hpp"
#include "TerminalSize.hpp"

namespace ptyhost {
/**
 * @brief One unit of decoded embedder input, in stream order.
 */
struct InputEvent {
  enum Type {
    /** Plain bytes for the child. */
    DATA,
    /** A well-formed resize directive. */
    RESIZE,
    /** A directive that was consumed but could not be parsed. */
    DECODE_ERROR
  };

  Type type;
  string data;
  TerminalSize size;

  static InputEvent makeData(const string& data) {
    InputEvent e;
    e.type = DATA;
    e.data = data;
    return e;
  }

  static InputEvent makeResize(const TerminalSize& size) {
    InputEvent e;
    e.type = RESIZE;
    e.size = size;
    return e;
  }

  static InputEvent makeDecodeError(const string& message) {
    InputEvent e;
    e.type = DECODE_ERROR;
    e.data = message;
    return e;
  }
};

/**
 * @brief Splits the embedder's input stream into child data and in-band
 * resize directives of the form `ESC ] RESIZE ; <cols> ; <rows> BEL`.
 *
 * The decoder is stateful: a directive (or the start of one) that is cut off
 * at the end of a chunk is held back and completed by the next call.  Held
 * back bytes are bounded by MAX_PENDING_BYTES; past that bound they are
 * released verbatim as data.  A directive whose terminator is already in
 * hand is always consumed, whatever its length.
 */
class ResizeSequenceDecoder {
 public:
  static const string DIRECTIVE_PREFIX;
  static constexpr char DIRECTIVE_TERMINATOR = '\x07';
  static constexpr size_t MAX_PENDING_BYTES = 50;

  ResizeSequenceDecoder() {}

  /**
   * @brief Decodes one chunk.  Adjacent plain bytes are merged into a single
   * DATA event.
   */
  vector<InputEvent> decode(const string& chunk);

  /**
   * @brief Releases a held back partial prefix as data.  A held back
   * sequence that already matched the full prefix stays pending, since only
   * the embedder can send it.
   * @return The released bytes, or an empty string.
   */
  string flushPartialPrefix();

  /** @brief Releases everything held back, used when input ends. */
  string flushAll();

  const string& getPending() const { return pending; }

  /** @brief True when held back bytes are a strict prefix of the literal. */
  bool hasPartialPrefix() const {
    return !pending.empty() && pending.size() < DIRECTIVE_PREFIX.size();
  }

  /**
   * @brief Parses a directive body such as "80;24".
   * @throws DecodeError on a wrong field count or a non-integer field.
   */
  static TerminalSize parseBody(const string& body);

  /** @brief Joins the DATA events, the bytes that reach the child. */
  static string cleanPayload(const vector<InputEvent>& events);

 protected:
  /**
   * @brief Number of bytes at `pos` that agree with DIRECTIVE_PREFIX.
   */
  static size_t matchPrefix(const string& buf, size_t pos);

  string pending;
};
}  // namespace ptyhost

#endif  // __PTYHOST_RESIZE_SEQUENCE_DECODER_HPP__
