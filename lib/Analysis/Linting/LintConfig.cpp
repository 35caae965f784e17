//===- LintConfig.cpp - Style lint configuration --------------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// Loading, querying and merging of lint configurations. Configurations are
// read from YAML; rule options are typed as they are loaded.
//
//===----------------------------------------------------------------------===//

#include "norma/Analysis/Linting/LintConfig.h"

#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/GlobPattern.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/SourceMgr.h"
#include "llvm/Support/YAMLParser.h"
#include "llvm/Support/raw_ostream.h"

#include <algorithm>
#include <system_error>

using namespace norma;
using namespace norma::lint;

//===----------------------------------------------------------------------===//
// Severity Helpers
//===----------------------------------------------------------------------===//

StringRef norma::lint::severityToString(LintSeverity severity) {
  switch (severity) {
  case LintSeverity::Ignore:
    return "ignore";
  case LintSeverity::Hint:
    return "hint";
  case LintSeverity::Warning:
    return "warning";
  case LintSeverity::Error:
    return "error";
  }
  llvm_unreachable("invalid severity");
}

std::optional<LintSeverity> norma::lint::parseSeverity(StringRef str) {
  auto lower = str.lower();
  if (lower == "ignore" || lower == "off" || lower == "disabled" ||
      lower == "none")
    return LintSeverity::Ignore;
  if (lower == "hint" || lower == "info" || lower == "information")
    return LintSeverity::Hint;
  if (lower == "warning" || lower == "warn")
    return LintSeverity::Warning;
  if (lower == "error" || lower == "err")
    return LintSeverity::Error;
  return std::nullopt;
}

//===----------------------------------------------------------------------===//
// YAML Helpers
//===----------------------------------------------------------------------===//

namespace {

Error configError(const Twine &message) {
  return llvm::createStringError(
      std::make_error_code(std::errc::invalid_argument), message);
}

/// Helper to walk a YAML mapping node. Stops at the first error.
Error walkYAMLMapping(
    llvm::yaml::MappingNode *mapping,
    llvm::function_ref<Error(StringRef, llvm::yaml::Node *)> callback) {
  for (auto &entry : *mapping) {
    auto *keyNode = dyn_cast_or_null<llvm::yaml::ScalarNode>(entry.getKey());
    if (!keyNode)
      return configError("mapping keys must be scalars");

    SmallString<32> keyStorage;
    StringRef key = keyNode->getValue(keyStorage);

    if (Error err = callback(key, entry.getValue()))
      return err;
  }
  return Error::success();
}

/// Get scalar value from a YAML node.
Expected<StringRef> getScalarValue(llvm::yaml::Node *node,
                                   SmallVectorImpl<char> &storage,
                                   const Twine &what) {
  if (auto *scalar = dyn_cast_or_null<llvm::yaml::ScalarNode>(node))
    return scalar->getValue(storage);
  return configError(what + " must be a scalar value");
}

std::optional<bool> parseBool(StringRef str) {
  auto lower = str.lower();
  if (lower == "true" || lower == "yes" || lower == "on" || lower == "1")
    return true;
  if (lower == "false" || lower == "no" || lower == "off" || lower == "0")
    return false;
  return std::nullopt;
}

/// Store an option under the most specific type its text parses as.
void storeOption(LintRuleConfig &config, StringRef key, StringRef value) {
  int64_t intValue;
  if (!value.getAsInteger(10, intValue)) {
    config.intOptions[key] = intValue;
    return;
  }
  auto lower = value.lower();
  if (lower == "true" || lower == "false" || lower == "yes" || lower == "no") {
    config.boolOptions[key] = (lower == "true" || lower == "yes");
    return;
  }
  config.stringOptions[key] = value.str();
}

Error parseRuleEntry(StringRef ruleName, llvm::yaml::Node *value,
                     LintRuleConfig &ruleConfig) {
  // Rule value can be either a severity string or a mapping
  if (auto *scalarNode = dyn_cast<llvm::yaml::ScalarNode>(value)) {
    SmallString<32> valueStorage;
    StringRef text = scalarNode->getValue(valueStorage);
    if (auto severity = parseSeverity(text)) {
      ruleConfig.severity = *severity;
      ruleConfig.enabled = (*severity != LintSeverity::Ignore);
      return Error::success();
    }
    if (auto enabled = parseBool(text)) {
      ruleConfig.enabled = *enabled;
      return Error::success();
    }
    return configError("invalid setting '" + text + "' for rule '" + ruleName +
                       "'");
  }

  auto *mappingNode = dyn_cast<llvm::yaml::MappingNode>(value);
  if (!mappingNode)
    return configError("rule '" + ruleName +
                       "' must map to a severity or a mapping");

  return walkYAMLMapping(
      mappingNode, [&](StringRef optKey, llvm::yaml::Node *optValue) -> Error {
        SmallString<64> optStorage;
        auto textOrErr = getScalarValue(
            optValue, optStorage, "option '" + optKey + "' of rule '" +
                                      ruleName + "'");
        if (!textOrErr)
          return textOrErr.takeError();
        StringRef text = *textOrErr;

        if (optKey == "severity") {
          auto severity = parseSeverity(text);
          if (!severity)
            return configError("invalid severity '" + text + "' for rule '" +
                               ruleName + "'");
          ruleConfig.severity = *severity;
          ruleConfig.enabled = (*severity != LintSeverity::Ignore);
        } else if (optKey == "enabled") {
          auto enabled = parseBool(text);
          if (!enabled)
            return configError("invalid value '" + text +
                               "' for 'enabled' of rule '" + ruleName + "'");
          ruleConfig.enabled = *enabled;
        } else {
          storeOption(ruleConfig, optKey, text);
        }
        return Error::success();
      });
}

} // namespace

//===----------------------------------------------------------------------===//
// LintConfig Implementation
//===----------------------------------------------------------------------===//

LintConfig::LintConfig() = default;
LintConfig::~LintConfig() = default;

Expected<std::unique_ptr<LintConfig>>
LintConfig::loadFromFile(StringRef filePath) {
  auto fileOrErr = llvm::MemoryBuffer::getFile(filePath);
  if (auto ec = fileOrErr.getError())
    return llvm::createStringError(ec, "failed to open lint config file: %s",
                                   filePath.str().c_str());

  return loadFromYAML((*fileOrErr)->getBuffer());
}

Expected<std::unique_ptr<LintConfig>>
LintConfig::loadFromYAML(StringRef yamlContent) {
  auto config = std::make_unique<LintConfig>();

  llvm::SourceMgr srcMgr;
  std::string yamlErrors;
  srcMgr.setDiagHandler(
      [](const llvm::SMDiagnostic &diag, void *context) {
        auto *errors = static_cast<std::string *>(context);
        if (!errors->empty())
          *errors += "; ";
        *errors += diag.getMessage().str();
      },
      &yamlErrors);
  llvm::yaml::Stream stream(yamlContent, srcMgr);

  auto docIt = stream.begin();
  if (docIt == stream.end() || !docIt->getRoot() ||
      isa<llvm::yaml::NullNode>(docIt->getRoot())) {
    if (stream.failed())
      return configError("failed to parse lint configuration: " + yamlErrors);
    return std::move(config); // Empty config is valid
  }

  auto *root = dyn_cast<llvm::yaml::MappingNode>(docIt->getRoot());
  if (!root)
    return configError("lint config root must be a mapping");

  Error err = walkYAMLMapping(
      root, [&](StringRef key, llvm::yaml::Node *value) -> Error {
        if (key == "rules") {
          auto *rulesMap = dyn_cast<llvm::yaml::MappingNode>(value);
          if (!rulesMap)
            return configError("'rules' must be a mapping");

          return walkYAMLMapping(
              rulesMap,
              [&](StringRef ruleName, llvm::yaml::Node *ruleValue) -> Error {
                LintRuleConfig ruleConfig;
                if (Error err = parseRuleEntry(ruleName, ruleValue, ruleConfig))
                  return err;
                config->setRuleConfig(ruleName, std::move(ruleConfig));
                return Error::success();
              });
        }

        if (key == "exclude") {
          auto *excludeSeq = dyn_cast<llvm::yaml::SequenceNode>(value);
          if (!excludeSeq)
            return configError("'exclude' must be a sequence");
          for (auto &item : *excludeSeq) {
            SmallString<128> itemStorage;
            auto patternOrErr =
                getScalarValue(&item, itemStorage, "exclude pattern");
            if (!patternOrErr)
              return patternOrErr.takeError();
            config->addExcludePattern(*patternOrErr);
          }
          return Error::success();
        }

        if (key == "fix") {
          auto *fixMap = dyn_cast<llvm::yaml::MappingNode>(value);
          if (!fixMap)
            return configError("'fix' must be a mapping");
          return walkYAMLMapping(
              fixMap,
              [&](StringRef optKey, llvm::yaml::Node *optValue) -> Error {
                if (optKey != "max_iterations")
                  return configError("unknown fix option '" + optKey + "'");
                SmallString<16> storage;
                auto textOrErr =
                    getScalarValue(optValue, storage, "'max_iterations'");
                if (!textOrErr)
                  return textOrErr.takeError();
                unsigned iterations;
                if (textOrErr->getAsInteger(10, iterations))
                  return configError("'max_iterations' must be a "
                                     "non-negative integer");
                config->setMaxFixIterations(iterations);
                return Error::success();
              });
        }

        // Unknown top-level sections are left for other tools.
        return Error::success();
      });

  if (err)
    return std::move(err);
  if (stream.failed())
    return configError("failed to parse lint configuration: " + yamlErrors);

  return std::move(config);
}

const LintRuleConfig &LintConfig::getRuleConfig(StringRef ruleName) const {
  auto it = ruleConfigs.find(ruleName);
  if (it != ruleConfigs.end())
    return it->second;
  return defaultConfig;
}

void LintConfig::setRuleConfig(StringRef ruleName, LintRuleConfig config) {
  ruleConfigs[ruleName] = std::move(config);
}

bool LintConfig::isRuleEnabled(StringRef ruleName) const {
  return getRuleConfig(ruleName).enabled;
}

void LintConfig::setRuleEnabled(StringRef ruleName, bool enabled) {
  ruleConfigs[ruleName].enabled = enabled;
}

std::optional<LintSeverity>
LintConfig::getRuleSeverity(StringRef ruleName) const {
  return getRuleConfig(ruleName).severity;
}

void LintConfig::setRuleSeverity(StringRef ruleName, LintSeverity severity) {
  ruleConfigs[ruleName].severity = severity;
  ruleConfigs[ruleName].enabled = (severity != LintSeverity::Ignore);
}

void LintConfig::setRuleOption(StringRef ruleName, StringRef option,
                               StringRef value) {
  ruleConfigs[ruleName].stringOptions[option] = value.str();
}

void LintConfig::setRuleOption(StringRef ruleName, StringRef option,
                               int64_t value) {
  ruleConfigs[ruleName].intOptions[option] = value;
}

void LintConfig::setRuleOption(StringRef ruleName, StringRef option,
                               bool value) {
  ruleConfigs[ruleName].boolOptions[option] = value;
}

void LintConfig::addExcludePattern(StringRef pattern) {
  excludePatterns.push_back(pattern.str());
}

bool LintConfig::shouldExcludeFile(StringRef filePath) const {
  for (const auto &pattern : excludePatterns) {
    auto globOrErr = llvm::GlobPattern::create(pattern);
    if (!globOrErr) {
      // A malformed glob still excludes paths that contain it verbatim.
      llvm::consumeError(globOrErr.takeError());
      if (filePath.contains(pattern))
        return true;
      continue;
    }
    if (globOrErr->match(filePath))
      return true;
  }
  return false;
}

std::vector<std::string> LintConfig::getConfiguredRules() const {
  std::vector<std::string> names;
  names.reserve(ruleConfigs.size());
  for (const auto &entry : ruleConfigs)
    names.push_back(entry.first().str());
  std::sort(names.begin(), names.end());
  return names;
}

void LintConfig::merge(const LintConfig &other) {
  // Merge rule configs
  for (const auto &entry : other.ruleConfigs)
    ruleConfigs[entry.first()] = entry.second;

  // Merge exclude patterns
  for (const auto &pattern : other.excludePatterns)
    excludePatterns.push_back(pattern);

  if (other.hasMaxFixIterations)
    setMaxFixIterations(other.maxFixIterations);
}

void LintConfig::disableAllRules() {
  for (auto &entry : ruleConfigs) {
    entry.second.enabled = false;
    entry.second.severity = LintSeverity::Ignore;
  }
  defaultConfig.enabled = false;
}
