#include "PathUtils.hpp"

#include "TextDecoder.hpp"

namespace burrow {
namespace {
const string EXTENDED_UNC_PREFIX = "\\\\?\\UNC\\";
const string EXTENDED_PREFIX = "\\\\?\\";
}  // namespace

string cleanPath(const string& path) {
  string retval(path);
  if (retval.compare(0, EXTENDED_UNC_PREFIX.length(), EXTENDED_UNC_PREFIX) ==
      0) {
    // \\?\UNC\server\share -> //server/share
    retval = "//" + retval.substr(EXTENDED_UNC_PREFIX.length());
  } else if (retval.compare(0, EXTENDED_PREFIX.length(), EXTENDED_PREFIX) ==
             0) {
    retval = retval.substr(EXTENDED_PREFIX.length());
  }
  std::replace(retval.begin(), retval.end(), '\\', '/');
  return retval;
}

string displayPath(const fs::path& path) {
  std::error_code ec;
  fs::path canonical = fs::canonical(path, ec);
  if (ec) {
    VLOG(2) << "Cannot canonicalize " << path << ": " << ec.message();
    return cleanPath(toValidUtf8(path.string()));
  }
  return cleanPath(toValidUtf8(canonical.string()));
}
}  // namespace burrow
