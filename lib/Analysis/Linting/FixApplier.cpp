//===- FixApplier.cpp - Conflict-checked text rewriting -------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "norma/Analysis/Linting/FixApplier.h"
#include "norma/Analysis/Linting/LintRuleRegistry.h"

#include "llvm/Support/Debug.h"
#include "llvm/Support/raw_ostream.h"

#include <algorithm>
#include <tuple>

#define DEBUG_TYPE "norma-fix"

using namespace norma;
using namespace norma::lint;

char FixConflictError::ID = 0;
char InvalidEditError::ID = 0;

void FixConflictError::log(raw_ostream &os) const {
  os << "fix from rule '" << conflict.secondRule
     << "' conflicts with rule '" << conflict.firstRule << "' at "
     << conflict.range;
}

std::error_code FixConflictError::convertToErrorCode() const {
  return llvm::inconvertibleErrorCode();
}

void InvalidEditError::log(raw_ostream &os) const {
  os << "fix from rule '" << edit.ruleName << "' at " << edit.range
     << " lies outside the source text";
}

std::error_code InvalidEditError::convertToErrorCode() const {
  return llvm::inconvertibleErrorCode();
}

std::vector<TextEdit>
norma::lint::collectFixes(ArrayRef<LintDiagnostic> diagnostics,
                          const ActiveRuleSet &rules) {
  std::vector<TextEdit> edits;
  for (const auto &diag : diagnostics) {
    if (!diag.getFix())
      continue;
    const ActiveRule *active = rules.lookup(diag.getRuleName());
    if (!active || !active->rule->isAutoFixable())
      continue;
    edits.push_back(*diag.getFix());
  }
  return edits;
}

Expected<std::string> norma::lint::applyEdits(StringRef text,
                                              ArrayRef<TextEdit> edits) {
  SmallVector<const TextEdit *, 16> sorted;
  sorted.reserve(edits.size());
  for (const TextEdit &edit : edits) {
    if (!edit.range.isValid() || edit.range.end.offset > text.size())
      return llvm::make_error<InvalidEditError>(edit);
    sorted.push_back(&edit);
  }
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const TextEdit *lhs, const TextEdit *rhs) {
                     return std::make_tuple(lhs->range.start.offset,
                                            lhs->range.end.offset,
                                            StringRef(lhs->replacement)) <
                            std::make_tuple(rhs->range.start.offset,
                                            rhs->range.end.offset,
                                            StringRef(rhs->replacement));
                   });
  // Two rules asking for the same rewrite do not conflict.
  sorted.erase(std::unique(sorted.begin(), sorted.end(),
                           [](const TextEdit *lhs, const TextEdit *rhs) {
                             return lhs->range == rhs->range &&
                                    lhs->replacement == rhs->replacement;
                           }),
               sorted.end());

  // One scan over the sorted edits. `reach` is the edit with the furthest end
  // so far; any edit starting before that end, or at the same start as the
  // previous edit, conflicts with it.
  Error conflicts = Error::success();
  const TextEdit *reach = nullptr;
  const TextEdit *prev = nullptr;
  for (const TextEdit *edit : sorted) {
    const TextEdit *other = nullptr;
    if (prev && edit->range.start.offset == prev->range.start.offset)
      other = prev;
    else if (reach && edit->range.start.offset < reach->range.end.offset)
      other = reach;

    if (other) {
      SourcePosition start = edit->range.start;
      SourcePosition end = std::min(edit->range.end, other->range.end);
      LLVM_DEBUG(llvm::dbgs() << "conflict between '" << other->ruleName
                              << "' and '" << edit->ruleName << "' at "
                              << start << "\n");
      conflicts = llvm::joinErrors(
          std::move(conflicts),
          llvm::make_error<FixConflictError>(FixConflict{
              other->ruleName, edit->ruleName, SourceRange(start, end)}));
    }

    if (!reach || reach->range.end.offset < edit->range.end.offset)
      reach = edit;
    prev = edit;
  }
  if (conflicts)
    return std::move(conflicts);

  std::string result;
  result.reserve(text.size());
  size_t cursor = 0;
  for (const TextEdit *edit : sorted) {
    StringRef kept = text.slice(cursor, edit->range.start.offset);
    result.append(kept.data(), kept.size());
    result += edit->replacement;
    cursor = edit->range.end.offset;
  }
  StringRef tail = text.drop_front(cursor);
  result.append(tail.data(), tail.size());

  LLVM_DEBUG(llvm::dbgs() << "applied " << sorted.size() << " edits, "
                          << text.size() << " -> " << result.size()
                          << " bytes\n");
  return std::move(result);
}
