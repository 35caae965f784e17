//===- FixApplier.h - Conflict-checked text rewriting -----------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// Applies the edits proposed by auto-fixable rules to a source text in one
// sequential pass. Edits never overlap in an applied batch: any overlap, or two
// edits starting at the same offset, rejects the whole batch.
//
//===----------------------------------------------------------------------===//

#ifndef NORMA_ANALYSIS_LINTING_FIXAPPLIER_H
#define NORMA_ANALYSIS_LINTING_FIXAPPLIER_H

#include "norma/Analysis/Linting/LintDiagnostic.h"

namespace norma {
namespace lint {

class ActiveRuleSet;

/// Two edits that cannot both be applied.
struct FixConflict {
  std::string firstRule;
  std::string secondRule;

  /// The text both edits claim. Empty for two insertions at one point.
  SourceRange range;
};

/// Raised when two edits of a batch overlap or start at the same offset.
class FixConflictError : public llvm::ErrorInfo<FixConflictError> {
public:
  static char ID;

  explicit FixConflictError(FixConflict conflict)
      : conflict(std::move(conflict)) {}

  const FixConflict &getConflict() const { return conflict; }

  void log(raw_ostream &os) const override;
  std::error_code convertToErrorCode() const override;

private:
  FixConflict conflict;
};

/// Raised when an edit reaches past the end of the text.
class InvalidEditError : public llvm::ErrorInfo<InvalidEditError> {
public:
  static char ID;

  explicit InvalidEditError(TextEdit edit) : edit(std::move(edit)) {}

  const TextEdit &getEdit() const { return edit; }

  void log(raw_ostream &os) const override;
  std::error_code convertToErrorCode() const override;

private:
  TextEdit edit;
};

/// Gather the edits of diagnostics whose rule is active and auto-fixable.
std::vector<TextEdit> collectFixes(ArrayRef<LintDiagnostic> diagnostics,
                                   const ActiveRuleSet &rules);

/// Apply `edits` to `text`. Text outside the edited ranges is preserved byte
/// for byte. Identical edits are applied once. Every conflicting pair is
/// reported as a FixConflictError (joined when there are several), and
/// nothing is applied in that case.
Expected<std::string> applyEdits(StringRef text, ArrayRef<TextEdit> edits);

} // namespace lint
} // namespace norma

#endif // NORMA_ANALYSIS_LINTING_FIXAPPLIER_H
