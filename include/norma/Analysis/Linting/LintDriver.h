//===- LintDriver.h - Per-file lint and fix pipelines -----------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// The driver ties a parser and an active rule set into the two pipelines a
// caller uses: lint (parse, evaluate, canonicalize) and fix (lint, rewrite,
// re-parse, in a bounded loop). Files are independent, so batches of files
// are spread over worker threads.
//
//===----------------------------------------------------------------------===//

#ifndef NORMA_ANALYSIS_LINTING_LINTDRIVER_H
#define NORMA_ANALYSIS_LINTING_LINTDRIVER_H

#include "norma/Analysis/Linting/FixApplier.h"
#include "norma/Analysis/Linting/LintEngine.h"

namespace norma {
namespace lint {

/// Outcome of the fix loop for one file.
struct FixResult {
  std::string filename;

  /// The text after every accepted fix pass.
  std::string correctedText;

  /// Diagnostics of `correctedText`, with notes on fixes that were not
  /// applied.
  std::vector<LintDiagnostic> remainingDiagnostics;

  /// Number of fix passes whose edits were applied.
  unsigned iterationsUsed = 0;

  /// Conflicts that stopped the loop, if any.
  std::vector<FixConflict> conflicts;

  /// Status of `correctedText`.
  LintStatus status = LintStatus::Clean;

  /// Return true if the text was changed.
  bool changed(StringRef original) const { return correctedText != original; }
};

/// A file handed to the batch entry points.
struct SourceFile {
  std::string filename;
  std::string text;
};

class LintDriver {
public:
  LintDriver(const SyntaxParser &parser, const ActiveRuleSet &rules)
      : parser(parser), engine(rules) {}

  /// Lint one file.
  LintReport lint(StringRef text, StringRef filename) const;

  /// Lint `text` and apply fixes until no edits remain, the text stops
  /// changing, a conflict occurs or `maxIterations` passes were applied.
  FixResult fix(StringRef text, StringRef filename,
                unsigned maxIterations) const;

  /// Lint every file of `files` on up to `numThreads` threads. Reports are
  /// returned in input order. Zero threads picks the hardware concurrency.
  std::vector<LintReport> lintFiles(ArrayRef<SourceFile> files,
                                    unsigned numThreads = 0) const;

  /// Fix every file of `files` on up to `numThreads` threads.
  std::vector<FixResult> fixFiles(ArrayRef<SourceFile> files,
                                  unsigned maxIterations,
                                  unsigned numThreads = 0) const;

  const ActiveRuleSet &getRules() const { return engine.getRules(); }

private:
  const SyntaxParser &parser;
  LintEngine engine;
};

} // namespace lint
} // namespace norma

#endif // NORMA_ANALYSIS_LINTING_LINTDRIVER_H
