#ifndef INCSH_SOURCE_RANGE_HPP
#define INCSH_SOURCE_RANGE_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace incsh {

/// Zero-based row/column position. Rows count '\n' characters, columns
/// count bytes from the start of the row.
struct Point {
  int row = 0;
  int column = 0;

  bool operator==(const Point& other) const {
    return row == other.row && column == other.column;
  }
  bool operator!=(const Point& other) const { return !(*this == other); }
};

/// A half-open byte range [startByte, endByte) together with the points of
/// both ends.
struct SourceRange {
  std::size_t startByte = 0;
  std::size_t endByte = 0;
  Point start;
  Point end;

  [[nodiscard]] bool empty() const { return startByte == endByte; }
  [[nodiscard]] bool contains(const SourceRange& other) const {
    return startByte <= other.startByte && other.endByte <= endByte;
  }

  bool operator==(const SourceRange& other) const {
    return startByte == other.startByte && endByte == other.endByte &&
           start == other.start && end == other.end;
  }
  bool operator!=(const SourceRange& other) const { return !(*this == other); }
};

/// Maps byte offsets of one text to points.
class LineIndex {
public:
  explicit LineIndex(const std::string& text);

  [[nodiscard]] Point pointAt(std::size_t offset) const;
  [[nodiscard]] SourceRange rangeOf(std::size_t startByte,
                                    std::size_t endByte) const;
  [[nodiscard]] std::size_t lineCount() const { return lineStarts_.size(); }

private:
  std::vector<std::size_t> lineStarts_;
  std::size_t size_;
};

} // namespace incsh

#endif // INCSH_SOURCE_RANGE_HPP
