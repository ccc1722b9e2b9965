#ifndef __BURROW_TEXT_DECODER__
#define __BURROW_TEXT_DECODER__

#include "Headers.hpp"

namespace burrow {
/**
 * @brief Lossy, streaming UTF-8 decoder for pty output.
 *
 * Invalid sequences become U+FFFD.  A multi-byte character cut in half by a
 * read boundary is held back until the next chunk completes it.
 */
class TextDecoder {
 public:
  /** @brief Returns the valid UTF-8 prefix of `pending + bytes`. */
  string decode(const string& bytes);

  /** @brief Emits whatever is still held back (as replacement characters). */
  string flush();

  /** @brief Bytes held back from the previous chunk. */
  size_t heldBack() const { return pending.size(); }

 protected:
  string pending;
};

/** @brief Stateless lossy conversion, used for file names. */
string toValidUtf8(const string& bytes);

/**
 * @brief Lowercases every character of a UTF-8 string, not just ASCII.
 *
 * Case mappings come from the first UTF-8 locale available (C.UTF-8,
 * en_US.UTF-8, or the environment's); without one only ASCII is folded.
 * Invalid input is made valid first, as in `toValidUtf8`.
 */
string toLowerUtf8(const string& text);
}  // namespace burrow

#endif  // __BURROW_TEXT_DECODER__
