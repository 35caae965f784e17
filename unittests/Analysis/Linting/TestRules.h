//===- TestRules.h - Configurable rules for linting unit tests --*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#ifndef NORMA_UNITTESTS_ANALYSIS_LINTING_TESTRULES_H
#define NORMA_UNITTESTS_ANALYSIS_LINTING_TESTRULES_H

#include "norma/Analysis/Linting/LintRuleRegistry.h"

#include <functional>

namespace norma {
namespace lint {
namespace test {

/// A rule whose check is a callback, for exercising the engine.
class CallbackRule : public LintRule {
public:
  using Callback = std::function<Expected<std::vector<LintFinding>>(
      const CallbackRule &, const SyntaxNode &, const RuleContext &)>;

  CallbackRule(StringRef name, std::vector<NodeKind> kinds, Callback callback,
               bool fixable = false,
               LintSeverity severity = LintSeverity::Warning)
      : LintRule(name, "test rule"), kinds(std::move(kinds)),
        callback(std::move(callback)), fixable(fixable), severity(severity) {}

  LintSeverity getDefaultSeverity() const override { return severity; }
  ArrayRef<NodeKind> getInterestedKinds() const override { return kinds; }
  bool isAutoFixable() const override { return fixable; }

  Expected<std::vector<LintFinding>>
  check(const SyntaxNode &node, const RuleContext &context) const override {
    return callback(*this, node, context);
  }

  LintFinding report(SourceRange range, const Twine &message) const {
    return makeFinding(range, message);
  }

  LintFinding reportWithFix(SourceRange range, const Twine &message,
                            SourceRange editRange,
                            StringRef replacement) const {
    return makeFinding(range, message, editRange, replacement);
  }

private:
  std::vector<NodeKind> kinds;
  Callback callback;
  bool fixable;
  LintSeverity severity;
};

/// A position on the first line of a single-line text.
inline SourcePosition column(size_t offset) {
  return SourcePosition(1, offset + 1, offset);
}

/// The range [begin, end) on the first line of a single-line text.
inline SourceRange span(size_t begin, size_t end) {
  return SourceRange(column(begin), column(end));
}

} // namespace test
} // namespace lint
} // namespace norma

#endif // NORMA_UNITTESTS_ANALYSIS_LINTING_TESTRULES_H
