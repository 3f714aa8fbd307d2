#ifndef __WT_SCROLLBACK_BUFFER__
#define __WT_SCROLLBACK_BUFFER__

#include "Headers.hpp"

namespace wt {
/**
 * @brief Bounded history of terminal output, kept as lines.
 *
 * Output is appended as it arrives.  A chunk that does not end in a newline
 * leaves the last line open, and the next chunk continues it.  Once the
 * number of lines exceeds the cap, the oldest lines are evicted first.
 */
class ScrollbackBuffer {
 public:
  explicit ScrollbackBuffer(size_t _maxLines = DEFAULT_SCROLLBACK_LINES)
      : maxLines(_maxLines), lastLineOpen(false) {}

  /**
   * @brief Adds a chunk of raw output to the end of the buffer.
   * @param chunk The bytes read from the terminal.
   */
  void append(const string &chunk) {
    if (chunk.empty()) return;
    size_t start = 0;
    while (start <= chunk.size()) {
      size_t newline = chunk.find('\n', start);
      string piece = chunk.substr(
          start, newline == string::npos ? string::npos : newline - start);
      if (lastLineOpen && !lines.empty()) {
        lines.back().append(piece);
      } else {
        lines.push_back(piece);
      }
      if (newline == string::npos) {
        lastLineOpen = true;
        break;
      }
      lastLineOpen = false;
      start = newline + 1;
      if (start == chunk.size()) {
        // The chunk ended on a newline; the next line starts empty and open.
        lines.push_back("");
        lastLineOpen = true;
        break;
      }
    }
    while (lines.size() > maxLines) {
      lines.pop_front();
    }
  }

  /**
   * @brief Returns a copy of the retained lines, oldest first.
   */
  vector<string> snapshot() const {
    return vector<string>(lines.begin(), lines.end());
  }

  size_t size() const { return lines.size(); }

  bool empty() const { return lines.empty(); }

  size_t getMaxLines() const { return maxLines; }

  void clear() {
    lines.clear();
    lastLineOpen = false;
  }

 private:
  std::deque<string> lines;
  size_t maxLines;
  bool lastLineOpen;
};
}  // namespace wt

#endif  // __WT_SCROLLBACK_BUFFER__
