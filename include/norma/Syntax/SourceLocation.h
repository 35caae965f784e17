//===- SourceLocation.h - Positions and ranges in source text ---*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// Positions carry a 1-based line, a 1-based byte column and a 0-based byte
// offset. Ranges are half-open by offset: [start, end).
//
//===----------------------------------------------------------------------===//

#ifndef NORMA_SYNTAX_SOURCELOCATION_H
#define NORMA_SYNTAX_SOURCELOCATION_H

#include "norma/Support/LLVM.h"

#include <cstddef>

namespace norma {

/// A point in source text.
struct SourcePosition {
  /// 1-based line number.
  unsigned line = 1;
  /// 1-based column, counted in bytes.
  unsigned column = 1;
  /// 0-based byte offset from the start of the text.
  size_t offset = 0;

  SourcePosition() = default;
  SourcePosition(unsigned line, unsigned column, size_t offset)
      : line(line), column(column), offset(offset) {}

  /// Return the position reached after consuming `text` from this position.
  /// Both "\n" and "\r\n" start a new line.
  SourcePosition advance(StringRef text) const;

  bool operator==(const SourcePosition &other) const {
    return offset == other.offset && line == other.line &&
           column == other.column;
  }
  bool operator!=(const SourcePosition &other) const {
    return !(*this == other);
  }
  bool operator<(const SourcePosition &other) const {
    return offset < other.offset;
  }
};

/// A contiguous range of source text. `start.offset <= end.offset` always.
struct SourceRange {
  SourcePosition start;
  SourcePosition end;

  SourceRange() = default;
  SourceRange(SourcePosition start, SourcePosition end)
      : start(start), end(end) {}

  /// Create an empty range located at `pos`.
  static SourceRange getPoint(SourcePosition pos) { return {pos, pos}; }

  size_t size() const { return end.offset - start.offset; }
  bool empty() const { return start.offset == end.offset; }
  bool isValid() const { return start.offset <= end.offset; }

  /// Return true if `other` lies entirely within this range.
  bool contains(const SourceRange &other) const {
    return start.offset <= other.start.offset && other.end.offset <= end.offset;
  }

  /// Return true if the two ranges share at least one byte.
  bool overlaps(const SourceRange &other) const {
    return start.offset < other.end.offset && other.start.offset < end.offset;
  }

  bool operator==(const SourceRange &other) const {
    return start == other.start && end == other.end;
  }
  bool operator!=(const SourceRange &other) const { return !(*this == other); }
};

raw_ostream &operator<<(raw_ostream &os, const SourcePosition &pos);
raw_ostream &operator<<(raw_ostream &os, const SourceRange &range);

} // namespace norma

#endif // NORMA_SYNTAX_SOURCELOCATION_H
