#ifndef __WT_STRING_UTILS__
#define __WT_STRING_UTILS__

#include "Headers.hpp"

namespace wt {
/**
 * @brief Returns the length of the longest prefix of `s` that does not end in
 * a truncated UTF-8 sequence.
 *
 * PTY reads can split a multi-byte character; the trailing bytes are held back
 * until the next read completes them.  Bytes that can never become valid
 * UTF-8 are not held back.
 */
inline size_t utf8CompletePrefixLength(const string &s) {
  size_t n = s.size();
  // A UTF-8 sequence is at most 4 bytes, so only the last 3 can be pending.
  size_t lookback = min<size_t>(3, n);
  for (size_t i = 1; i <= lookback; i++) {
    unsigned char c = static_cast<unsigned char>(s[n - i]);
    if ((c & 0xC0) == 0x80) {
      // Continuation byte, keep looking for the lead byte
      continue;
    }
    size_t needed = 0;
    if ((c & 0xE0) == 0xC0) {
      needed = 2;
    } else if ((c & 0xF0) == 0xE0) {
      needed = 3;
    } else if ((c & 0xF8) == 0xF0) {
      needed = 4;
    } else {
      // ASCII or an invalid lead byte
      return n;
    }
    return (needed > i) ? n - i : n;
  }
  return n;
}

/** @brief Decodes `%XX` escapes and `+` in a URL query component. */
inline string urlDecode(const string &s) {
  string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); i++) {
    char c = s[i];
    if (c == '+') {
      out.push_back(' ');
    } else if (c == '%' && i + 2 < s.size() &&
               isxdigit(static_cast<unsigned char>(s[i + 1])) &&
               isxdigit(static_cast<unsigned char>(s[i + 2]))) {
      out.push_back(static_cast<char>(stoi(s.substr(i + 1, 2), nullptr, 16)));
      i += 2;
    } else {
      out.push_back(c);
    }
  }
  return out;
}

/**
 * @brief Splits a request target such as `/ws?sessionId=a&x=1` into its path
 * and decoded query parameters.
 */
inline string parseRequestTarget(const string &target,
                                 map<string, string> *params) {
  auto queryStart = target.find('?');
  if (queryStart == string::npos) {
    return target;
  }
  for (const auto &pair : split(target.substr(queryStart + 1), '&')) {
    if (pair.empty()) {
      continue;
    }
    auto eq = pair.find('=');
    if (eq == string::npos) {
      (*params)[urlDecode(pair)] = "";
    } else {
      (*params)[urlDecode(pair.substr(0, eq))] = urlDecode(pair.substr(eq + 1));
    }
  }
  return target.substr(0, queryStart);
}
}  // namespace wt

#endif  // __WT_STRING_UTILS__
