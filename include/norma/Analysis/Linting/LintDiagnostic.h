//===- LintDiagnostic.h - Canonical lint diagnostics ------------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This header declares the reportable form of rule output. Raw findings from
// one traversal are canonicalized into an ordered, deduplicated sequence of
// LintDiagnostic values and summarized in a LintReport.
//
//===----------------------------------------------------------------------===//

#ifndef NORMA_ANALYSIS_LINTING_LINTDIAGNOSTIC_H
#define NORMA_ANALYSIS_LINTING_LINTDIAGNOSTIC_H

#include "norma/Analysis/Linting/LintRule.h"
#include "llvm/ADT/StringSet.h"
#include "llvm/Support/JSON.h"

#include <tuple>

namespace norma {
namespace lint {

class ActiveRuleSet;

/// Rule name of the diagnostic emitted for a file that failed to parse.
constexpr const char kSyntaxErrorRuleName[] = "syntax-error";

/// Rule name of the diagnostic emitted when a rule fails while checking.
constexpr const char kInternalErrorRuleName[] = "internal-error";

//===----------------------------------------------------------------------===//
// LintDiagnostic
//===----------------------------------------------------------------------===//

/// A canonical, reportable lint violation. Immutable once constructed.
class LintDiagnostic {
public:
  LintDiagnostic(std::string filename, std::string ruleName,
                 LintSeverity severity, SourceRange range, std::string message,
                 std::optional<TextEdit> fix = std::nullopt);

  StringRef getFilename() const { return filename; }
  StringRef getRuleName() const { return ruleName; }
  LintSeverity getSeverity() const { return severity; }
  const SourceRange &getRange() const { return range; }
  StringRef getMessage() const { return message; }
  const std::optional<TextEdit> &getFix() const { return fix; }
  ArrayRef<std::string> getNotes() const { return notes; }

  /// Return a copy of this diagnostic with `note` attached.
  LintDiagnostic withNote(const Twine &note) const;

  /// Key ordering diagnostics by file, start offset and rule name. End offset
  /// and message break the remaining ties.
  std::tuple<StringRef, size_t, StringRef, size_t, StringRef>
  getSortKey() const {
    return std::make_tuple(StringRef(filename), range.start.offset,
                           StringRef(ruleName), range.end.offset,
                           StringRef(message));
  }

  /// Key under which two findings describe the same issue.
  std::tuple<StringRef, size_t, size_t, StringRef> getDedupKey() const {
    return std::make_tuple(StringRef(ruleName), range.start.offset,
                           range.end.offset, StringRef(message));
  }

  /// Print as "file:line:col: severity: message [rule]", one line per note
  /// after it.
  void print(raw_ostream &os) const;

  bool operator==(const LintDiagnostic &other) const;
  bool operator!=(const LintDiagnostic &other) const {
    return !(*this == other);
  }

private:
  std::string filename;
  std::string ruleName;
  LintSeverity severity;
  SourceRange range;
  std::string message;
  std::optional<TextEdit> fix;
  std::vector<std::string> notes;
};

raw_ostream &operator<<(raw_ostream &os, const LintDiagnostic &diag);

/// Serialize the reporter-facing fields of `diag`.
llvm::json::Value toJSON(const LintDiagnostic &diag);

//===----------------------------------------------------------------------===//
// Suppressions
//===----------------------------------------------------------------------===//

/// Lines on which NOLINT comments silence some or all rules.
class SuppressionSet {
public:
  /// Record the markers found in the comment `text` spanning `range`.
  /// Recognized forms are `NOLINT`, `NOLINT(a, b)`, `NOLINTNEXTLINE` and
  /// `NOLINTNEXTLINE(a, b)`. Returns true if a marker was found.
  bool addComment(StringRef text, const SourceRange &range);

  /// Silence `rule` (or every rule when `rule` is empty) on `line`.
  void suppress(unsigned line, StringRef rule = "");

  /// Return true if findings of `rule` starting on `line` are silenced.
  bool isSuppressed(StringRef rule, unsigned line) const;

  bool empty() const { return lines.empty(); }

private:
  struct LineEntry {
    bool allRules = false;
    llvm::StringSet<> rules;
  };
  DenseMap<unsigned, LineEntry> lines;
};

//===----------------------------------------------------------------------===//
// Canonicalization
//===----------------------------------------------------------------------===//

/// Overall result of linting one file.
enum class LintStatus {
  /// No diagnostic at error severity.
  Clean,
  /// At least one diagnostic at error severity.
  Violations,
  /// The file could not be parsed; no rules ran.
  ParseFailed
};

StringRef stringifyLintStatus(LintStatus status);

/// Turn the raw findings of one traversal into ordered diagnostics. Applies
/// the active severity of each rule, drops findings of inactive rules and
/// suppressed findings, removes duplicates and sorts the result.
std::vector<LintDiagnostic>
canonicalizeFindings(StringRef filename, std::vector<LintFinding> findings,
                     const ActiveRuleSet &rules,
                     const SuppressionSet *suppressions = nullptr);

/// Diagnostics and status for one file.
struct LintReport {
  std::string filename;

  /// Diagnostics in canonical order.
  std::vector<LintDiagnostic> diagnostics;

  LintStatus status = LintStatus::Clean;

  /// Number of errors.
  size_t errorCount = 0;

  /// Number of warnings.
  size_t warningCount = 0;

  /// Number of hints.
  size_t hintCount = 0;

  /// Recompute the counters and status from `diagnostics`. A ParseFailed
  /// status is kept.
  void summarize();

  /// Whether linting succeeded (no errors).
  bool success() const { return status == LintStatus::Clean; }
};

/// Build the report for a file whose parse failed with `error`.
LintReport makeParseFailedReport(StringRef filename, Error error);

} // namespace lint
} // namespace norma

#endif // NORMA_ANALYSIS_LINTING_LINTDIAGNOSTIC_H
