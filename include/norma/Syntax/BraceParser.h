//===- BraceParser.h - Parser for brace-structured source text --*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// A full-fidelity parser for C-family text. It recognizes trivia, directives,
// tokens, bracketed groups and blocks, and splits the token stream into
// statements. It does not know any grammar beyond bracket structure, which is
// all that layout rules need.
//
//===----------------------------------------------------------------------===//

#ifndef NORMA_SYNTAX_BRACEPARSER_H
#define NORMA_SYNTAX_BRACEPARSER_H

#include "norma/Syntax/SyntaxTree.h"

namespace norma {

class BraceParser : public SyntaxParser {
public:
  /// Maximum bracket nesting accepted before parsing fails.
  static constexpr unsigned kDefaultMaxNesting = 256;

  explicit BraceParser(unsigned maxNesting = kDefaultMaxNesting)
      : maxNesting(maxNesting) {}

  Expected<std::unique_ptr<SyntaxTree>>
  parse(StringRef source, StringRef filename) const override;

  /// Return true if `word` is treated as a keyword.
  static bool isKeyword(StringRef word);

private:
  unsigned maxNesting;
};

} // namespace norma

#endif // NORMA_SYNTAX_BRACEPARSER_H
