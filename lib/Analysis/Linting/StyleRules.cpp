//===- StyleRules.cpp - Built-in style rules ------------------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "norma/Analysis/Linting/StyleRules.h"

#include "llvm/ADT/StringExtras.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/Support/Regex.h"

#include <system_error>

using namespace norma;
using namespace norma::lint;

//===----------------------------------------------------------------------===//
// Helpers
//===----------------------------------------------------------------------===//

namespace {

using Findings = std::vector<LintFinding>;

bool isIdentifierChar(char c) { return llvm::isAlnum(c) || c == '_'; }

/// Return true if a line ends right after a node whose next sibling is
/// `next`.
bool isLineEnd(const SyntaxNode *next) {
  return !next || next->getKind() == NodeKind::Newline;
}

/// Position of the byte `offset` bytes into `node`.
SourcePosition positionIn(const SyntaxNode &node, StringRef text,
                          size_t offset) {
  return node.getRange().start.advance(text.take_front(offset));
}

/// If `text` is a `#name` directive, return what follows the name.
std::optional<StringRef> matchDirective(StringRef text, StringRef name) {
  if (!text.consume_front("#"))
    return std::nullopt;
  text = text.ltrim(" \t");
  if (!text.consume_front(name))
    return std::nullopt;
  if (!text.empty() && isIdentifierChar(text.front()))
    return std::nullopt;
  return text.ltrim(" \t");
}

Error optionError(const Twine &message) {
  return llvm::createStringError(
      std::make_error_code(std::errc::invalid_argument), message);
}

/// Check that `option`, if set, is a positive integer.
Error checkPositiveOption(const LintRuleConfig &config, StringRef option) {
  if (config.stringOptions.count(option) || config.boolOptions.count(option))
    return optionError("'" + option + "' must be an integer");
  auto it = config.intOptions.find(option);
  if (it != config.intOptions.end() && it->second <= 0)
    return optionError("'" + option + "' must be positive, got " +
                       Twine(it->second));
  return Error::success();
}

} // namespace

//===----------------------------------------------------------------------===//
// TrailingWhitespaceRule
//===----------------------------------------------------------------------===//

TrailingWhitespaceRule::TrailingWhitespaceRule()
    : LintRule("trailing-whitespace",
               "Detects spaces and tabs at the end of a line") {}

ArrayRef<NodeKind> TrailingWhitespaceRule::getInterestedKinds() const {
  static const NodeKind kinds[] = {NodeKind::Whitespace};
  return kinds;
}

Expected<Findings>
TrailingWhitespaceRule::check(const SyntaxNode &node,
                              const RuleContext &context) const {
  if (!isLineEnd(context.getNextSibling(node)))
    return Findings();
  return Findings{makeFinding(node.getRange(), "trailing whitespace",
                              node.getRange(), "")};
}

//===----------------------------------------------------------------------===//
// NoTabsRule
//===----------------------------------------------------------------------===//

NoTabsRule::NoTabsRule()
    : LintRule("no-tabs", "Detects tab characters used for spacing") {}

ArrayRef<NodeKind> NoTabsRule::getInterestedKinds() const {
  static const NodeKind kinds[] = {NodeKind::Whitespace};
  return kinds;
}

Error NoTabsRule::validateOptions(const LintRuleConfig &config) const {
  return checkPositiveOption(config, "tab_width");
}

Expected<Findings> NoTabsRule::check(const SyntaxNode &node,
                                     const RuleContext &context) const {
  StringRef text = context.getText(node);
  if (!text.contains('\t') || isLineEnd(context.getNextSibling(node)))
    return Findings();

  // Expand each tab to the next tab stop.
  uint64_t tabWidth = context.getIntOption("tab_width", 4);
  uint64_t column = node.getRange().start.column - 1;
  std::string spaces;
  for (char c : text) {
    uint64_t width = c == '\t' ? tabWidth - column % tabWidth : 1;
    spaces.append(width, ' ');
    column += width;
  }
  return Findings{makeFinding(node.getRange(), "tab character used for spacing",
                              node.getRange(), spaces)};
}

//===----------------------------------------------------------------------===//
// FinalNewlineRule
//===----------------------------------------------------------------------===//

FinalNewlineRule::FinalNewlineRule()
    : LintRule("final-newline", "Requires the file to end with a newline") {}

ArrayRef<NodeKind> FinalNewlineRule::getInterestedKinds() const {
  static const NodeKind kinds[] = {NodeKind::TranslationUnit};
  return kinds;
}

Expected<Findings> FinalNewlineRule::check(const SyntaxNode &node,
                                           const RuleContext &context) const {
  StringRef source = context.getSource();
  if (source.empty() || source.back() == '\n')
    return Findings();
  SourceRange end = SourceRange::getPoint(node.getRange().end);
  return Findings{
      makeFinding(end, "file does not end with a newline", end, "\n")};
}

//===----------------------------------------------------------------------===//
// KeywordSpacingRule
//===----------------------------------------------------------------------===//

KeywordSpacingRule::KeywordSpacingRule()
    : LintRule("keyword-spacing",
               "Requires a space between a control keyword and its '('") {}

ArrayRef<NodeKind> KeywordSpacingRule::getInterestedKinds() const {
  static const NodeKind kinds[] = {NodeKind::Keyword};
  return kinds;
}

static bool isControlKeyword(StringRef word) {
  return word == "if" || word == "for" || word == "while" ||
         word == "switch" || word == "catch";
}

Expected<Findings> KeywordSpacingRule::check(const SyntaxNode &node,
                                             const RuleContext &context) const {
  StringRef word = context.getText(node);
  if (!isControlKeyword(word))
    return Findings();
  const SyntaxNode *next = context.getNextSibling(node);
  if (!next || next->getKind() != NodeKind::Group ||
      context.getText(*next).front() != '(')
    return Findings();
  return Findings{makeFinding(node.getRange(),
                              "missing space after '" + word + "'",
                              SourceRange::getPoint(node.getRange().end), " ")};
}

//===----------------------------------------------------------------------===//
// CommentSpacingRule
//===----------------------------------------------------------------------===//

CommentSpacingRule::CommentSpacingRule()
    : LintRule("comment-spacing",
               "Requires a space after the '//' of a line comment") {}

ArrayRef<NodeKind> CommentSpacingRule::getInterestedKinds() const {
  static const NodeKind kinds[] = {NodeKind::Comment};
  return kinds;
}

Expected<Findings> CommentSpacingRule::check(const SyntaxNode &node,
                                             const RuleContext &context) const {
  StringRef text = context.getText(node);
  if (text.size() < 3 || text.substr(0, 2) != "//")
    return Findings();
  // Doc comments ("///", "//!") are left alone.
  char c = text[2];
  if (c == ' ' || c == '\t' || c == '/' || c == '!')
    return Findings();
  SourceRange at = SourceRange::getPoint(positionIn(node, text, 2));
  return Findings{makeFinding(node.getRange(), "missing space after '//'", at,
                              " ")};
}

//===----------------------------------------------------------------------===//
// LineLengthRule
//===----------------------------------------------------------------------===//

LineLengthRule::LineLengthRule()
    : LintRule("line-length", "Limits the length of a line") {}

ArrayRef<NodeKind> LineLengthRule::getInterestedKinds() const {
  static const NodeKind kinds[] = {NodeKind::TranslationUnit};
  return kinds;
}

Error LineLengthRule::validateOptions(const LintRuleConfig &config) const {
  return checkPositiveOption(config, "max_length");
}

Expected<Findings> LineLengthRule::check(const SyntaxNode &node,
                                         const RuleContext &context) const {
  StringRef source = context.getSource();
  uint64_t maxLength = context.getIntOption("max_length", 100);

  Findings findings;
  size_t offset = 0;
  unsigned line = 1;
  while (true) {
    size_t newline = source.find('\n', offset);
    size_t end = newline == StringRef::npos ? source.size() : newline;
    if (end > offset && source[end - 1] == '\r')
      --end;

    uint64_t length = end - offset;
    if (length > maxLength) {
      SourcePosition start(line, maxLength + 1, offset + maxLength);
      SourcePosition stop(line, length + 1, end);
      findings.push_back(makeFinding(
          SourceRange(start, stop), "line is " + Twine(length) +
                                        " characters long, maximum is " +
                                        Twine(maxLength)));
    }

    if (newline == StringRef::npos)
      break;
    offset = newline + 1;
    ++line;
  }
  return std::move(findings);
}

//===----------------------------------------------------------------------===//
// MaxNestingDepthRule
//===----------------------------------------------------------------------===//

MaxNestingDepthRule::MaxNestingDepthRule()
    : LintRule("max-nesting-depth", "Limits how deeply blocks nest") {}

ArrayRef<NodeKind> MaxNestingDepthRule::getInterestedKinds() const {
  static const NodeKind kinds[] = {NodeKind::Block};
  return kinds;
}

Error MaxNestingDepthRule::validateOptions(const LintRuleConfig &config) const {
  return checkPositiveOption(config, "max_depth");
}

Expected<Findings>
MaxNestingDepthRule::check(const SyntaxNode &node,
                           const RuleContext &context) const {
  int64_t maxDepth = context.getIntOption("max_depth", 4);
  int64_t depth = 1;
  for (const SyntaxNode *ancestor : context.getAncestors(node))
    if (ancestor->getKind() == NodeKind::Block)
      ++depth;

  // Only the outermost block past the limit is reported; deeper blocks sit
  // inside it.
  if (depth != maxDepth + 1)
    return Findings();
  return Findings{makeFinding(node.getFirstChild()->getRange(),
                              "block nested " + Twine(depth) +
                                  " levels deep, maximum is " +
                                  Twine(maxDepth))};
}

//===----------------------------------------------------------------------===//
// DuplicateIncludeRule
//===----------------------------------------------------------------------===//

namespace {
struct IncludeScratch : public RuleScratch {
  /// Line of the first inclusion of each header.
  llvm::StringMap<unsigned> seen;
};
} // namespace

DuplicateIncludeRule::DuplicateIncludeRule()
    : LintRule("duplicate-include",
               "Detects a header included more than once") {}

ArrayRef<NodeKind> DuplicateIncludeRule::getInterestedKinds() const {
  static const NodeKind kinds[] = {NodeKind::Directive};
  return kinds;
}

std::unique_ptr<RuleScratch> DuplicateIncludeRule::createScratch() const {
  return std::make_unique<IncludeScratch>();
}

/// Return the `<header>` or `"header"` operand of an include directive.
static StringRef getIncludedHeader(StringRef operand) {
  if (operand.empty())
    return StringRef();
  char close = operand.front() == '<' ? '>' : '"';
  if (operand.front() != '<' && operand.front() != '"')
    return StringRef();
  size_t end = operand.find(close, 1);
  if (end == StringRef::npos)
    return StringRef();
  return operand.take_front(end + 1);
}

Expected<Findings>
DuplicateIncludeRule::check(const SyntaxNode &node,
                            const RuleContext &context) const {
  auto operand = matchDirective(context.getText(node), "include");
  if (!operand)
    return Findings();
  StringRef header = getIncludedHeader(*operand);
  if (header.empty())
    return Findings();

  auto *scratch = context.getScratch<IncludeScratch>();
  auto inserted = scratch->seen.try_emplace(header, node.getRange().start.line);
  if (inserted.second)
    return Findings();

  // Remove the whole line: indentation before the directive and the newline
  // after it.
  SourcePosition start = node.getRange().start;
  SourcePosition end = node.getRange().end;
  if (const SyntaxNode *prev = context.getPrevSibling(node)) {
    if (prev->getKind() == NodeKind::Whitespace &&
        isLineEnd(context.getPrevSibling(*prev)))
      start = prev->getRange().start;
  }
  const SyntaxNode *next = context.getNextSibling(node);
  if (next && next->getKind() == NodeKind::Newline)
    end = next->getRange().end;

  return Findings{makeFinding(node.getRange(),
                              "'" + header + "' is already included on line " +
                                  Twine(inserted.first->second),
                              SourceRange(start, end), "")};
}

//===----------------------------------------------------------------------===//
// MacroNamingRule
//===----------------------------------------------------------------------===//

static constexpr const char kDefaultMacroPattern[] = "^[A-Z][A-Z0-9_]*$";

namespace {
struct MacroNamingScratch : public RuleScratch {
  /// The configured pattern, compiled on first use.
  std::unique_ptr<llvm::Regex> pattern;
};
} // namespace

MacroNamingRule::MacroNamingRule()
    : LintRule("macro-naming",
               "Checks macro names against a configurable pattern") {}

ArrayRef<NodeKind> MacroNamingRule::getInterestedKinds() const {
  static const NodeKind kinds[] = {NodeKind::Directive};
  return kinds;
}

Error MacroNamingRule::validateOptions(const LintRuleConfig &config) const {
  if (config.intOptions.count("pattern") || config.boolOptions.count("pattern"))
    return optionError("'pattern' must be a regular expression");
  auto it = config.stringOptions.find("pattern");
  if (it == config.stringOptions.end())
    return Error::success();
  std::string error;
  if (!llvm::Regex(it->second).isValid(error))
    return optionError("invalid 'pattern' '" + it->second + "': " + error);
  return Error::success();
}

std::unique_ptr<RuleScratch> MacroNamingRule::createScratch() const {
  return std::make_unique<MacroNamingScratch>();
}

Expected<Findings> MacroNamingRule::check(const SyntaxNode &node,
                                          const RuleContext &context) const {
  StringRef text = context.getText(node);
  auto operand = matchDirective(text, "define");
  if (!operand)
    return Findings();
  StringRef macroName = operand->take_while(isIdentifierChar);
  if (macroName.empty())
    return Findings();

  auto *scratch = context.getScratch<MacroNamingScratch>();
  if (!scratch->pattern)
    scratch->pattern = std::make_unique<llvm::Regex>(
        context.getStringOption("pattern", kDefaultMacroPattern));
  std::string error;
  if (!scratch->pattern->isValid(error))
    return optionError("invalid 'pattern': " + error);
  if (scratch->pattern->match(macroName))
    return Findings();

  size_t offset = macroName.data() - text.data();
  SourceRange range(positionIn(node, text, offset),
                    positionIn(node, text, offset + macroName.size()));
  return Findings{makeFinding(range, "macro name '" + macroName +
                                         "' does not match naming convention")};
}

//===----------------------------------------------------------------------===//
// Registration
//===----------------------------------------------------------------------===//

Error norma::lint::registerStyleRules(LintRuleRegistry &registry) {
  std::unique_ptr<LintRule> rules[] = {
      std::make_unique<TrailingWhitespaceRule>(),
      std::make_unique<NoTabsRule>(),
      std::make_unique<LineLengthRule>(),
      std::make_unique<FinalNewlineRule>(),
      std::make_unique<KeywordSpacingRule>(),
      std::make_unique<CommentSpacingRule>(),
      std::make_unique<MaxNestingDepthRule>(),
      std::make_unique<DuplicateIncludeRule>(),
      std::make_unique<MacroNamingRule>(),
  };
  for (auto &rule : rules)
    if (Error err = registry.registerRule(std::move(rule)))
      return err;
  return Error::success();
}
