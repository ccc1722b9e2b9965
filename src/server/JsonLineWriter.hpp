#ifndef __BURROW_JSON_LINE_WRITER__
#define __BURROW_JSON_LINE_WRITER__

#include "Headers.hpp"
#include "JsonLib.hpp"

namespace burrow {
/**
 * @brief Serializes json values one per line onto a stream.  Responses and
 * events share it, so whole lines never interleave.
 */
class JsonLineWriter {
 public:
  explicit JsonLineWriter(std::ostream& _out) : out(_out) {}

  /** @brief Returns false once the stream has failed (consumer gone). */
  bool writeLine(const json& value) {
    // replace instead of throwing on invalid UTF-8
    string line = value.dump(-1, ' ', false, json::error_handler_t::replace);
    lock_guard<std::mutex> guard(writeMutex);
    out << line << '\n';
    out.flush();
    return bool(out);
  }

 protected:
  std::ostream& out;
  std::mutex writeMutex;
};
}  // namespace burrow

#endif  // __BURROW_JSON_LINE_WRITER__
