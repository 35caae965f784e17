//===- LintDiagnostic.cpp - Canonical lint diagnostics --------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "norma/Analysis/Linting/LintDiagnostic.h"
#include "norma/Analysis/Linting/LintRuleRegistry.h"

#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/raw_ostream.h"

#include <algorithm>

using namespace norma;
using namespace norma::lint;

//===----------------------------------------------------------------------===//
// LintDiagnostic
//===----------------------------------------------------------------------===//

LintDiagnostic::LintDiagnostic(std::string filename, std::string ruleName,
                               LintSeverity severity, SourceRange range,
                               std::string message,
                               std::optional<TextEdit> fix)
    : filename(std::move(filename)), ruleName(std::move(ruleName)),
      severity(severity), range(range), message(std::move(message)),
      fix(std::move(fix)) {}

LintDiagnostic LintDiagnostic::withNote(const Twine &note) const {
  LintDiagnostic copy = *this;
  copy.notes.push_back(note.str());
  return copy;
}

void LintDiagnostic::print(raw_ostream &os) const {
  os << filename << ':' << range.start << ": " << severityToString(severity)
     << ": " << message << " [" << ruleName << "]\n";
  for (const std::string &note : notes)
    os << filename << ':' << range.start << ": note: " << note << '\n';
}

bool LintDiagnostic::operator==(const LintDiagnostic &other) const {
  return filename == other.filename && ruleName == other.ruleName &&
         severity == other.severity && range == other.range &&
         message == other.message && fix == other.fix && notes == other.notes;
}

raw_ostream &norma::lint::operator<<(raw_ostream &os,
                                     const LintDiagnostic &diag) {
  diag.print(os);
  return os;
}

static llvm::json::Object positionToJSON(const SourcePosition &pos) {
  return llvm::json::Object{{"line", pos.line},
                            {"column", pos.column},
                            {"offset", static_cast<int64_t>(pos.offset)}};
}

llvm::json::Value norma::lint::toJSON(const LintDiagnostic &diag) {
  llvm::json::Object obj;
  obj["file"] = diag.getFilename();
  obj["rule"] = diag.getRuleName();
  obj["severity"] = severityToString(diag.getSeverity());
  obj["message"] = diag.getMessage();
  obj["start"] = positionToJSON(diag.getRange().start);
  obj["end"] = positionToJSON(diag.getRange().end);

  if (!diag.getNotes().empty()) {
    llvm::json::Array notes;
    for (const auto &note : diag.getNotes())
      notes.push_back(note);
    obj["notes"] = std::move(notes);
  }

  if (const auto &fix = diag.getFix()) {
    llvm::json::Object fixObj;
    fixObj["start"] = positionToJSON(fix->range.start);
    fixObj["end"] = positionToJSON(fix->range.end);
    fixObj["replacement"] = fix->replacement;
    obj["fix"] = std::move(fixObj);
  }
  return std::move(obj);
}

//===----------------------------------------------------------------------===//
// SuppressionSet
//===----------------------------------------------------------------------===//

static bool isIdentifierChar(char c) { return llvm::isAlnum(c) || c == '_'; }

bool SuppressionSet::addComment(StringRef text, const SourceRange &range) {
  const StringRef marker = "NOLINT";
  bool found = false;
  size_t pos = 0;
  while ((pos = text.find(marker, pos)) != StringRef::npos) {
    pos += marker.size();
    StringRef rest = text.drop_front(pos);
    unsigned line = range.start.line;
    if (rest.consume_front("NEXTLINE"))
      line = range.end.line + 1;
    if (!rest.empty() && isIdentifierChar(rest.front()))
      continue;

    if (!rest.consume_front("(")) {
      suppress(line);
      found = true;
      continue;
    }

    // An unterminated rule list is not a marker.
    size_t close = rest.find(')');
    if (close == StringRef::npos)
      continue;

    SmallVector<StringRef, 4> names;
    rest.take_front(close).split(names, ',', /*MaxSplit=*/-1,
                                 /*KeepEmpty=*/false);
    bool any = false;
    for (StringRef name : names) {
      name = name.trim();
      if (name.empty())
        continue;
      suppress(line, name == "*" ? StringRef() : name);
      any = true;
    }
    if (!any)
      suppress(line);
    found = true;
  }
  return found;
}

void SuppressionSet::suppress(unsigned line, StringRef rule) {
  LineEntry &entry = lines[line];
  if (rule.empty())
    entry.allRules = true;
  else
    entry.rules.insert(rule);
}

bool SuppressionSet::isSuppressed(StringRef rule, unsigned line) const {
  auto it = lines.find(line);
  if (it == lines.end())
    return false;
  return it->second.allRules || it->second.rules.count(rule);
}

//===----------------------------------------------------------------------===//
// Canonicalization
//===----------------------------------------------------------------------===//

StringRef norma::lint::stringifyLintStatus(LintStatus status) {
  switch (status) {
  case LintStatus::Clean:
    return "clean";
  case LintStatus::Violations:
    return "violations";
  case LintStatus::ParseFailed:
    return "parse-failed";
  }
  llvm_unreachable("invalid lint status");
}

/// Findings the engine itself produces. They bypass rule filtering and cannot
/// be suppressed.
static bool isEngineFinding(StringRef ruleName) {
  return ruleName == kInternalErrorRuleName || ruleName == kSyntaxErrorRuleName;
}

std::vector<LintDiagnostic>
norma::lint::canonicalizeFindings(StringRef filename,
                                  std::vector<LintFinding> findings,
                                  const ActiveRuleSet &rules,
                                  const SuppressionSet *suppressions) {
  std::vector<LintDiagnostic> diags;
  diags.reserve(findings.size());
  for (LintFinding &finding : findings) {
    LintSeverity severity = finding.severity;
    if (!isEngineFinding(finding.ruleName)) {
      const ActiveRule *active = rules.lookup(finding.ruleName);
      if (!active)
        continue;
      if (active->config.severity)
        severity = *active->config.severity;
      if (suppressions &&
          suppressions->isSuppressed(finding.ruleName,
                                     finding.range.start.line))
        continue;
    }
    if (severity == LintSeverity::Ignore)
      continue;
    diags.emplace_back(filename.str(), std::move(finding.ruleName), severity,
                       finding.range, std::move(finding.message),
                       std::move(finding.fix));
  }

  // The sort key extends the dedup key, so duplicates end up adjacent and the
  // stable sort keeps the first one in front.
  std::stable_sort(diags.begin(), diags.end(),
                   [](const LintDiagnostic &lhs, const LintDiagnostic &rhs) {
                     return lhs.getSortKey() < rhs.getSortKey();
                   });
  diags.erase(std::unique(diags.begin(), diags.end(),
                          [](const LintDiagnostic &lhs,
                             const LintDiagnostic &rhs) {
                            return lhs.getDedupKey() == rhs.getDedupKey();
                          }),
              diags.end());
  return diags;
}

void LintReport::summarize() {
  errorCount = warningCount = hintCount = 0;
  for (const auto &diag : diagnostics) {
    switch (diag.getSeverity()) {
    case LintSeverity::Error:
      ++errorCount;
      break;
    case LintSeverity::Warning:
      ++warningCount;
      break;
    case LintSeverity::Hint:
      ++hintCount;
      break;
    case LintSeverity::Ignore:
      break;
    }
  }
  if (status == LintStatus::ParseFailed)
    return;
  status = errorCount ? LintStatus::Violations : LintStatus::Clean;
}

LintReport norma::lint::makeParseFailedReport(StringRef filename,
                                              Error error) {
  LintReport report;
  report.filename = filename.str();
  report.status = LintStatus::ParseFailed;
  llvm::handleAllErrors(
      std::move(error),
      [&](const SyntaxError &syntaxError) {
        report.diagnostics.emplace_back(
            filename.str(), kSyntaxErrorRuleName, LintSeverity::Error,
            syntaxError.getRange(), syntaxError.getMessage().str());
      },
      [&](const llvm::ErrorInfoBase &other) {
        report.diagnostics.emplace_back(filename.str(), kSyntaxErrorRuleName,
                                        LintSeverity::Error, SourceRange(),
                                        other.message());
      });
  report.summarize();
  return report;
}
