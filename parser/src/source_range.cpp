#include "parser/source_range.hpp"

#include <algorithm>

namespace incsh {

LineIndex::LineIndex(const std::string& text) : size_(text.size()) {
  lineStarts_.push_back(0);
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\n') {
      lineStarts_.push_back(i + 1);
    }
  }
}

Point LineIndex::pointAt(std::size_t offset) const {
  offset = std::min(offset, size_);
  // First line start strictly greater than offset, then step back one.
  const auto it =
      std::upper_bound(lineStarts_.begin(), lineStarts_.end(), offset);
  const auto row = static_cast<std::size_t>(it - lineStarts_.begin()) - 1;
  Point point;
  point.row = static_cast<int>(row);
  point.column = static_cast<int>(offset - lineStarts_[row]);
  return point;
}

SourceRange LineIndex::rangeOf(std::size_t startByte,
                               std::size_t endByte) const {
  SourceRange range;
  range.startByte = startByte;
  range.endByte = std::max(startByte, endByte);
  range.start = pointAt(range.startByte);
  range.end = pointAt(range.endByte);
  return range;
}

} // namespace incsh
