//===- LintRuleRegistry.h - Style lint rule registry ------------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// The registry owns the rule catalog of a run. Resolving it against a
// LintConfig yields the ActiveRuleSet: the enabled rules with their effective
// severity and options, indexed by the node kinds they subscribe to.
//
//===----------------------------------------------------------------------===//

#ifndef NORMA_ANALYSIS_LINTING_LINTRULEREGISTRY_H
#define NORMA_ANALYSIS_LINTING_LINTRULEREGISTRY_H

#include "norma/Analysis/Linting/LintRule.h"
#include "llvm/ADT/StringMap.h"

#include <array>

namespace norma {
namespace lint {

/// Raised when two rules are registered under the same name.
class DuplicateRuleError : public llvm::ErrorInfo<DuplicateRuleError> {
public:
  static char ID;

  explicit DuplicateRuleError(std::string ruleName)
      : ruleName(std::move(ruleName)) {}

  StringRef getRuleName() const { return ruleName; }

  void log(raw_ostream &os) const override;
  std::error_code convertToErrorCode() const override;

private:
  std::string ruleName;
};

/// Raised when the configuration of a known rule is unusable.
class InvalidConfigError : public llvm::ErrorInfo<InvalidConfigError> {
public:
  static char ID;

  InvalidConfigError(std::string ruleName, std::string msg)
      : ruleName(std::move(ruleName)), msg(std::move(msg)) {}

  StringRef getRuleName() const { return ruleName; }
  StringRef getMessage() const { return msg; }

  void log(raw_ostream &os) const override;
  std::error_code convertToErrorCode() const override;

private:
  std::string ruleName;
  std::string msg;
};

/// A rule selected for a run, with its effective severity and options.
struct ActiveRule {
  const LintRule *rule;
  LintSeverity severity;
  LintRuleConfig config;
};

/// The enabled rules of a run. Read-only once built and safe to share between
/// threads. The registry that produced it must outlive it.
class ActiveRuleSet {
public:
  ActiveRuleSet() = default;

  /// All active rules in registration order.
  ArrayRef<ActiveRule> getRules() const { return rules; }

  /// Indices into getRules() of the rules subscribed to `kind`, in
  /// registration order.
  ArrayRef<unsigned> getRulesFor(NodeKind kind) const {
    return kindIndex[static_cast<size_t>(kind)];
  }

  /// Return the active rule named `name`, or null if it is not active.
  const ActiveRule *lookup(StringRef name) const;

  size_t size() const { return rules.size(); }
  bool empty() const { return rules.empty(); }

private:
  friend class LintRuleRegistry;

  void addRule(ActiveRule rule);

  std::vector<ActiveRule> rules;
  std::array<SmallVector<unsigned, 4>, kNumNodeKinds> kindIndex;
  llvm::StringMap<unsigned> byName;
};

/// Registry for lint rules.
class LintRuleRegistry {
public:
  LintRuleRegistry();
  ~LintRuleRegistry();

  LintRuleRegistry(const LintRuleRegistry &) = delete;
  LintRuleRegistry &operator=(const LintRuleRegistry &) = delete;

  /// Register a new lint rule. Fails with DuplicateRuleError if a rule with
  /// the same name is already registered.
  Error registerRule(std::unique_ptr<LintRule> rule);

  /// Get a rule by name.
  const LintRule *getRule(StringRef name) const;

  /// Get all registered rules, in registration order.
  const std::vector<std::unique_ptr<LintRule>> &getAllRules() const {
    return rules;
  }

  /// Get all rule names.
  std::vector<std::string> getRuleNames() const;

  /// Get rules by category.
  std::vector<const LintRule *> getRulesByCategory(StringRef category) const;

  /// Select the rules enabled by `config`. Configured names that match no
  /// registered rule are appended to `warnings` when it is non-null. Every
  /// enabled rule with rejected options contributes one InvalidConfigError;
  /// the errors are joined in registration order.
  Expected<ActiveRuleSet>
  resolve(const LintConfig &config,
          std::vector<std::string> *warnings = nullptr) const;

private:
  std::vector<std::unique_ptr<LintRule>> rules;
  llvm::StringMap<LintRule *> ruleMap;
};

} // namespace lint
} // namespace norma

#endif // NORMA_ANALYSIS_LINTING_LINTRULEREGISTRY_H
