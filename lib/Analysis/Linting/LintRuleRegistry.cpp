//===- LintRuleRegistry.cpp - Style lint rule registry --------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "norma/Analysis/Linting/LintRuleRegistry.h"

#include "llvm/Support/Debug.h"
#include "llvm/Support/raw_ostream.h"

#define DEBUG_TYPE "norma-lint-engine"

using namespace norma;
using namespace norma::lint;

//===----------------------------------------------------------------------===//
// Errors
//===----------------------------------------------------------------------===//

char DuplicateRuleError::ID = 0;
char InvalidConfigError::ID = 0;

void DuplicateRuleError::log(raw_ostream &os) const {
  os << "rule '" << ruleName << "' is already registered";
}

std::error_code DuplicateRuleError::convertToErrorCode() const {
  return llvm::inconvertibleErrorCode();
}

void InvalidConfigError::log(raw_ostream &os) const {
  os << "invalid configuration for rule '" << ruleName << "': " << msg;
}

std::error_code InvalidConfigError::convertToErrorCode() const {
  return llvm::inconvertibleErrorCode();
}

//===----------------------------------------------------------------------===//
// ActiveRuleSet
//===----------------------------------------------------------------------===//

void ActiveRuleSet::addRule(ActiveRule rule) {
  unsigned index = rules.size();
  byName[rule.rule->getName()] = index;
  for (NodeKind kind : rule.rule->getInterestedKinds()) {
    auto &bucket = kindIndex[static_cast<size_t>(kind)];
    // A rule listing a kind twice is still dispatched once per node.
    if (bucket.empty() || bucket.back() != index)
      bucket.push_back(index);
  }
  rules.push_back(std::move(rule));
}

const ActiveRule *ActiveRuleSet::lookup(StringRef name) const {
  auto it = byName.find(name);
  if (it == byName.end())
    return nullptr;
  return &rules[it->second];
}

//===----------------------------------------------------------------------===//
// LintRuleRegistry
//===----------------------------------------------------------------------===//

LintRuleRegistry::LintRuleRegistry() = default;

LintRuleRegistry::~LintRuleRegistry() = default;

Error LintRuleRegistry::registerRule(std::unique_ptr<LintRule> rule) {
  StringRef name = rule->getName();
  if (!ruleMap.try_emplace(name, rule.get()).second)
    return llvm::make_error<DuplicateRuleError>(name.str());
  LLVM_DEBUG(llvm::dbgs() << "registered rule '" << name << "' v"
                          << rule->getVersion() << "\n");
  rules.push_back(std::move(rule));
  return Error::success();
}

const LintRule *LintRuleRegistry::getRule(StringRef name) const {
  auto it = ruleMap.find(name);
  if (it != ruleMap.end())
    return it->second;
  return nullptr;
}

std::vector<std::string> LintRuleRegistry::getRuleNames() const {
  std::vector<std::string> names;
  names.reserve(rules.size());
  for (const auto &rule : rules)
    names.push_back(rule->getName().str());
  return names;
}

std::vector<const LintRule *>
LintRuleRegistry::getRulesByCategory(StringRef category) const {
  std::vector<const LintRule *> result;
  for (const auto &rule : rules) {
    if (rule->getCategory() == category)
      result.push_back(rule.get());
  }
  return result;
}

Expected<ActiveRuleSet>
LintRuleRegistry::resolve(const LintConfig &config,
                          std::vector<std::string> *warnings) const {
  for (const std::string &name : config.getConfiguredRules()) {
    if (ruleMap.count(name))
      continue;
    LLVM_DEBUG(llvm::dbgs() << "unknown rule '" << name
                            << "' in configuration\n");
    if (warnings)
      warnings->push_back("unknown rule '" + name + "' in configuration");
  }

  ActiveRuleSet active;
  Error optionErrors = Error::success();
  for (const auto &rule : rules) {
    StringRef name = rule->getName();
    if (!config.isRuleEnabled(name))
      continue;

    const LintRuleConfig &ruleConfig = config.getRuleConfig(name);
    LintSeverity severity =
        ruleConfig.severity.value_or(rule->getDefaultSeverity());
    if (severity == LintSeverity::Ignore)
      continue;

    if (Error err = rule->validateOptions(ruleConfig)) {
      optionErrors = llvm::joinErrors(
          std::move(optionErrors),
          llvm::make_error<InvalidConfigError>(
              name.str(), llvm::toString(std::move(err))));
      continue;
    }

    active.addRule(ActiveRule{rule.get(), severity, ruleConfig});
  }

  if (optionErrors)
    return std::move(optionErrors);

  LLVM_DEBUG(llvm::dbgs() << "resolved " << active.size() << " of "
                          << rules.size() << " rules\n");
  return std::move(active);
}
