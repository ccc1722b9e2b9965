#include "TextDecoder.hpp"

namespace burrow {
namespace {
const char REPLACEMENT_CHARACTER[] = "\xEF\xBF\xBD";

/**
 * Appends the valid UTF-8 in `in` to `out`.  Returns the offset of a trailing
 * incomplete sequence when `holdIncomplete` is set, otherwise `in.size()`.
 */
size_t appendValidUtf8(const string& in, bool holdIncomplete, string* out) {
  const size_t n = in.size();
  size_t i = 0;
  while (i < n) {
    unsigned char c = (unsigned char)in[i];
    if (c < 0x80) {
      out->push_back(char(c));
      i++;
      continue;
    }

    int length = 0;
    unsigned char secondLow = 0x80, secondHigh = 0xBF;
    if (c >= 0xC2 && c <= 0xDF) {
      length = 2;
    } else if (c == 0xE0) {
      length = 3;
      secondLow = 0xA0;
    } else if ((c >= 0xE1 && c <= 0xEC) || c == 0xEE || c == 0xEF) {
      length = 3;
    } else if (c == 0xED) {
      // Excludes UTF-16 surrogates
      length = 3;
      secondHigh = 0x9F;
    } else if (c == 0xF0) {
      length = 4;
      secondLow = 0x90;
    } else if (c >= 0xF1 && c <= 0xF3) {
      length = 4;
    } else if (c == 0xF4) {
      length = 4;
      secondHigh = 0x8F;
    } else {
      out->append(REPLACEMENT_CHARACTER);
      i++;
      continue;
    }

    int k = 1;
    bool truncated = false;
    for (; k < length; k++) {
      if (i + k >= n) {
        truncated = true;
        break;
      }
      unsigned char b = (unsigned char)in[i + k];
      unsigned char low = (k == 1) ? secondLow : 0x80;
      unsigned char high = (k == 1) ? secondHigh : 0xBF;
      if (b < low || b > high) {
        break;
      }
    }

    if (k == length) {
      out->append(in, i, length);
      i += length;
    } else if (truncated && holdIncomplete) {
      return i;
    } else {
      // The maximal invalid subpart collapses into one replacement
      out->append(REPLACEMENT_CHARACTER);
      i += k;
    }
  }
  return n;
}

/** Decodes one character of valid UTF-8 starting at `i`, advancing `i`. */
char32_t nextCodePoint(const string& in, size_t* i) {
  unsigned char c = (unsigned char)in[*i];
  int length = c < 0x80 ? 1 : c < 0xE0 ? 2 : c < 0xF0 ? 3 : 4;
  char32_t codePoint =
      length == 1 ? c : length == 2 ? (c & 0x1F) : length == 3 ? (c & 0x0F)
                                                               : (c & 0x07);
  for (int k = 1; k < length; k++) {
    codePoint = (codePoint << 6) | ((unsigned char)in[*i + k] & 0x3F);
  }
  *i += length;
  return codePoint;
}

void appendCodePoint(char32_t codePoint, string* out) {
  if (codePoint < 0x80) {
    out->push_back(char(codePoint));
  } else if (codePoint < 0x800) {
    out->push_back(char(0xC0 | (codePoint >> 6)));
    out->push_back(char(0x80 | (codePoint & 0x3F)));
  } else if (codePoint < 0x10000) {
    out->push_back(char(0xE0 | (codePoint >> 12)));
    out->push_back(char(0x80 | ((codePoint >> 6) & 0x3F)));
    out->push_back(char(0x80 | (codePoint & 0x3F)));
  } else {
    out->push_back(char(0xF0 | (codePoint >> 18)));
    out->push_back(char(0x80 | ((codePoint >> 12) & 0x3F)));
    out->push_back(char(0x80 | ((codePoint >> 6) & 0x3F)));
    out->push_back(char(0x80 | (codePoint & 0x3F)));
  }
}

std::locale findCaseLocale() {
  for (const char* name : {"C.UTF-8", "C.utf8", "en_US.UTF-8", ""}) {
    try {
      std::locale candidate(name);
      if (std::use_facet<std::ctype<wchar_t>>(candidate).tolower(L'\u00C4') ==
          L'\u00E4') {
        return candidate;
      }
    } catch (const std::runtime_error& re) {
      VLOG(1) << "Locale \"" << name << "\" unavailable: " << re.what();
    }
  }
  LOG(WARNING) << "No UTF-8 locale found, search folds ASCII case only";
  return std::locale::classic();
}

const std::ctype<wchar_t>& caseFacet() {
  static const std::locale caseLocale = findCaseLocale();
  return std::use_facet<std::ctype<wchar_t>>(caseLocale);
}
}  // namespace

string TextDecoder::decode(const string& bytes) {
  string input;
  input.reserve(pending.size() + bytes.size());
  input.append(pending);
  input.append(bytes);
  pending.clear();

  string retval;
  retval.reserve(input.size());
  size_t consumed = appendValidUtf8(input, true, &retval);
  if (consumed < input.size()) {
    pending = input.substr(consumed);
  }
  return retval;
}

string TextDecoder::flush() {
  if (pending.empty()) {
    return string();
  }
  string retval;
  appendValidUtf8(pending, false, &retval);
  pending.clear();
  return retval;
}

string toValidUtf8(const string& bytes) {
  string retval;
  retval.reserve(bytes.size());
  appendValidUtf8(bytes, false, &retval);
  return retval;
}

string toLowerUtf8(const string& text) {
  static_assert(sizeof(wchar_t) >= 4, "wchar_t must hold any code point");
  const std::ctype<wchar_t>& facet = caseFacet();
  string valid = toValidUtf8(text);
  string retval;
  retval.reserve(valid.size());
  size_t i = 0;
  while (i < valid.size()) {
    char32_t codePoint = nextCodePoint(valid, &i);
    if (codePoint < 0x80) {
      if (codePoint >= 'A' && codePoint <= 'Z') {
        codePoint += 'a' - 'A';
      }
    } else {
      codePoint = char32_t(facet.tolower(wchar_t(codePoint)));
    }
    appendCodePoint(codePoint, &retval);
  }
  return retval;
}
}  // namespace burrow
