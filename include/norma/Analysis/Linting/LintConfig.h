//===- LintConfig.h - Style lint configuration ------------------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This header declares the LintConfig class and related types for configuring
// style rules. The configuration can be loaded from YAML files (e.g.
// .norma.yaml) and supports enabling/disabling rules, overriding severity
// levels, and configuring rule-specific options.
//
//===----------------------------------------------------------------------===//

#ifndef NORMA_ANALYSIS_LINTING_LINTCONFIG_H
#define NORMA_ANALYSIS_LINTING_LINTCONFIG_H

#include "norma/Support/LLVM.h"
#include "llvm/ADT/StringMap.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace norma {
namespace lint {

/// Severity levels for lint diagnostics, ordered from least to most severe.
enum class LintSeverity {
  Ignore,  /// Rule is disabled
  Hint,    /// Informational hint
  Warning, /// Warning level
  Error    /// Error level (fails the run)
};

/// Convert severity enum to string.
StringRef severityToString(LintSeverity severity);

/// Parse severity from string.
std::optional<LintSeverity> parseSeverity(StringRef str);

/// Configuration for a single lint rule.
struct LintRuleConfig {
  /// Severity override. Unset means the rule's default severity.
  std::optional<LintSeverity> severity;

  /// Whether the rule is enabled.
  bool enabled = true;

  /// Rule-specific string options (e.g., regex patterns).
  llvm::StringMap<std::string> stringOptions;

  /// Rule-specific integer options.
  llvm::StringMap<int64_t> intOptions;

  /// Rule-specific boolean options.
  llvm::StringMap<bool> boolOptions;
};

/// Main lint configuration class.
class LintConfig {
public:
  /// Iteration cap for the fix loop when the configuration does not set one.
  static constexpr unsigned kDefaultMaxFixIterations = 4;

  LintConfig();
  ~LintConfig();

  /// Load configuration from a YAML file.
  static Expected<std::unique_ptr<LintConfig>> loadFromFile(StringRef filePath);

  /// Load configuration from a YAML string.
  static Expected<std::unique_ptr<LintConfig>>
  loadFromYAML(StringRef yamlContent);

  /// Get the configuration for a specific rule by name.
  /// Returns default configuration if the rule is not explicitly configured.
  const LintRuleConfig &getRuleConfig(StringRef ruleName) const;

  /// Return true if the rule has an explicit entry.
  bool hasRuleConfig(StringRef ruleName) const {
    return ruleConfigs.count(ruleName) != 0;
  }

  /// Set the configuration for a specific rule.
  void setRuleConfig(StringRef ruleName, LintRuleConfig config);

  /// Check if a rule is enabled.
  bool isRuleEnabled(StringRef ruleName) const;

  /// Enable or disable a rule.
  void setRuleEnabled(StringRef ruleName, bool enabled);

  /// Get the severity override for a rule, if any.
  std::optional<LintSeverity> getRuleSeverity(StringRef ruleName) const;

  /// Override the severity for a rule. `Ignore` disables the rule.
  void setRuleSeverity(StringRef ruleName, LintSeverity severity);

  /// Set a rule-specific option.
  void setRuleOption(StringRef ruleName, StringRef option, StringRef value);
  void setRuleOption(StringRef ruleName, StringRef option, int64_t value);
  void setRuleOption(StringRef ruleName, StringRef option, bool value);

  /// Get the list of file patterns to exclude from linting.
  const std::vector<std::string> &getExcludePatterns() const {
    return excludePatterns;
  }

  /// Add a file pattern to exclude from linting.
  void addExcludePattern(StringRef pattern);

  /// Check if a file should be excluded from linting.
  bool shouldExcludeFile(StringRef filePath) const;

  /// Maximum number of fix passes for one file.
  unsigned getMaxFixIterations() const { return maxFixIterations; }
  void setMaxFixIterations(unsigned iterations) {
    maxFixIterations = iterations;
    hasMaxFixIterations = true;
  }

  /// Get all configured rule names, sorted.
  std::vector<std::string> getConfiguredRules() const;

  /// Merge another configuration into this one.
  /// Rules from 'other' take precedence.
  void merge(const LintConfig &other);

  /// Disable all configured rules.
  void disableAllRules();

private:
  /// Rule configurations keyed by rule name.
  llvm::StringMap<LintRuleConfig> ruleConfigs;

  /// Default configuration for unconfigured rules.
  LintRuleConfig defaultConfig;

  /// File patterns to exclude from linting.
  std::vector<std::string> excludePatterns;

  unsigned maxFixIterations = kDefaultMaxFixIterations;
  bool hasMaxFixIterations = false;
};

} // namespace lint
} // namespace norma

#endif // NORMA_ANALYSIS_LINTING_LINTCONFIG_H
