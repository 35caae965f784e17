//===- BraceParser.cpp - Parser for brace-structured source text ----------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// Parsing happens in two steps. The lexer splits the text into tokens that
// together cover every byte, including trivia. The tree builder then nests
// the tokens by bracket structure and groups them into statements, which end
// at a ';' or after a block.
//
//===----------------------------------------------------------------------===//

#include "norma/Syntax/BraceParser.h"

#include "llvm/ADT/STLExtras.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/raw_ostream.h"

#include <algorithm>
#include <cctype>

#define DEBUG_TYPE "norma-brace-parser"

using namespace norma;

bool BraceParser::isKeyword(StringRef word) {
  // Sorted for binary search.
  static const char *const keywords[] = {
      "auto",     "break",     "case",     "catch",    "char",
      "class",    "const",     "constexpr", "continue", "default",
      "delete",   "do",        "double",   "else",     "enum",
      "explicit", "extern",    "float",    "for",      "goto",
      "if",       "inline",    "int",      "long",     "namespace",
      "new",      "noexcept",  "operator", "private",  "protected",
      "public",   "return",    "short",    "signed",   "sizeof",
      "static",   "struct",    "switch",   "template", "this",
      "throw",    "try",       "typedef",  "typename", "union",
      "unsigned", "using",     "virtual",  "void",     "volatile",
      "while"};
  return std::binary_search(
      std::begin(keywords), std::end(keywords), word,
      [](StringRef lhs, StringRef rhs) { return lhs < rhs; });
}

namespace {

//===----------------------------------------------------------------------===//
// Lexer
//===----------------------------------------------------------------------===//

struct Token {
  NodeKind kind;
  SourceRange range;
  StringRef text;
};

static bool isHorizontalSpace(char c) {
  return c == ' ' || c == '\t' || c == '\v' || c == '\f' || c == '\r';
}

static bool isIdentifierStart(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) || c == '_' ||
         static_cast<unsigned char>(c) >= 0x80;
}

static bool isIdentifierBody(char c) {
  return isIdentifierStart(c) || std::isdigit(static_cast<unsigned char>(c));
}

static bool isDigit(char c) {
  return std::isdigit(static_cast<unsigned char>(c));
}

class Lexer {
public:
  explicit Lexer(StringRef source) : source(source) {}

  /// Tokenize the whole source into `tokens`.
  Error lex(std::vector<Token> &tokens);

  /// Position just past the last byte.
  SourcePosition getEndPosition() const { return pos; }

private:
  char peek(size_t ahead = 0) const {
    size_t i = pos.offset + ahead;
    return i < source.size() ? source[i] : '\0';
  }

  Token consume(NodeKind kind, size_t length) {
    StringRef text = source.substr(pos.offset, length);
    SourcePosition start = pos;
    pos = pos.advance(text);
    return {kind, {start, pos}, text};
  }

  Error errorAt(size_t length, const Twine &message) const {
    StringRef text = source.substr(pos.offset, length);
    return llvm::make_error<SyntaxError>(SourceRange(pos, pos.advance(text)),
                                         message.str());
  }

  /// Length of the current line starting at the cursor, excluding the line
  /// terminator and any trailing horizontal whitespace.
  size_t trimmedLineLength(size_t from) const;

  size_t lexLineComment() const { return trimmedLineLength(pos.offset); }
  Expected<size_t> lexBlockComment() const;
  size_t lexDirective() const;
  size_t lexNumber() const;
  Expected<size_t> lexQuoted(char quote) const;

  StringRef source;
  SourcePosition pos;
  bool atLineStart = true;
};

} // namespace

size_t Lexer::trimmedLineLength(size_t from) const {
  size_t end = source.find('\n', from);
  if (end == StringRef::npos)
    end = source.size();
  if (end > from && source[end - 1] == '\r' && end != source.size())
    --end;
  while (end > from && (source[end - 1] == ' ' || source[end - 1] == '\t'))
    --end;
  return end - pos.offset;
}

Expected<size_t> Lexer::lexBlockComment() const {
  size_t close = source.find("*/", pos.offset + 2);
  if (close == StringRef::npos)
    return errorAt(2, "unterminated block comment");
  return close + 2 - pos.offset;
}

size_t Lexer::lexDirective() const {
  size_t lineStart = pos.offset;
  while (true) {
    size_t newline = source.find('\n', lineStart);
    if (newline == StringRef::npos)
      return trimmedLineLength(lineStart);
    size_t contentEnd = newline;
    if (contentEnd > lineStart && source[contentEnd - 1] == '\r')
      --contentEnd;
    if (contentEnd == lineStart || source[contentEnd - 1] != '\\')
      return trimmedLineLength(lineStart);
    lineStart = newline + 1;
  }
}

size_t Lexer::lexNumber() const {
  size_t i = pos.offset;
  while (i < source.size()) {
    char c = source[i];
    if (isIdentifierBody(c) || c == '.') {
      ++i;
    } else if ((c == '+' || c == '-') &&
               (source[i - 1] == 'e' || source[i - 1] == 'E' ||
                source[i - 1] == 'p' || source[i - 1] == 'P')) {
      ++i;
    } else if (c == '\'' && i + 1 < source.size() &&
               isIdentifierBody(source[i + 1])) {
      ++i;
    } else {
      break;
    }
  }
  return i - pos.offset;
}

Expected<size_t> Lexer::lexQuoted(char quote) const {
  size_t i = pos.offset + 1;
  while (i < source.size()) {
    char c = source[i];
    if (c == '\n')
      break;
    if (c == '\\') {
      i += 2;
      continue;
    }
    if (c == quote)
      return i + 1 - pos.offset;
    ++i;
  }
  size_t length = std::min(i, source.size()) - pos.offset;
  if (length > 1 && source[pos.offset + length - 1] == '\r')
    --length;
  return errorAt(length, quote == '"' ? "unterminated string literal"
                                      : "unterminated character literal");
}

Error Lexer::lex(std::vector<Token> &tokens) {
  while (pos.offset < source.size()) {
    char c = peek();

    if (c == '\n' || (c == '\r' && peek(1) == '\n')) {
      tokens.push_back(consume(NodeKind::Newline, c == '\n' ? 1 : 2));
      atLineStart = true;
      continue;
    }

    if (isHorizontalSpace(c)) {
      size_t length = 1;
      while (isHorizontalSpace(peek(length)) &&
             !(peek(length) == '\r' && peek(length + 1) == '\n'))
        ++length;
      tokens.push_back(consume(NodeKind::Whitespace, length));
      continue;
    }

    bool lineStart = atLineStart;
    atLineStart = false;

    if (c == '/' && peek(1) == '/') {
      tokens.push_back(consume(NodeKind::Comment, lexLineComment()));
      continue;
    }

    if (c == '/' && peek(1) == '*') {
      auto lengthOrErr = lexBlockComment();
      if (!lengthOrErr)
        return lengthOrErr.takeError();
      tokens.push_back(consume(NodeKind::Comment, *lengthOrErr));
      continue;
    }

    if (c == '#' && lineStart) {
      tokens.push_back(consume(NodeKind::Directive, lexDirective()));
      continue;
    }

    if (isIdentifierStart(c)) {
      size_t length = 1;
      while (isIdentifierBody(peek(length)))
        ++length;
      StringRef word = source.substr(pos.offset, length);
      tokens.push_back(consume(BraceParser::isKeyword(word)
                                   ? NodeKind::Keyword
                                   : NodeKind::Identifier,
                               length));
      continue;
    }

    if (isDigit(c) || (c == '.' && isDigit(peek(1)))) {
      tokens.push_back(consume(NodeKind::Number, lexNumber()));
      continue;
    }

    if (c == '"' || c == '\'') {
      auto lengthOrErr = lexQuoted(c);
      if (!lengthOrErr)
        return lengthOrErr.takeError();
      tokens.push_back(consume(c == '"' ? NodeKind::StringLiteral
                                        : NodeKind::CharLiteral,
                               *lengthOrErr));
      continue;
    }

    tokens.push_back(consume(NodeKind::Punctuation, 1));
  }
  return Error::success();
}

//===----------------------------------------------------------------------===//
// Tree Builder
//===----------------------------------------------------------------------===//

namespace {

static bool isPunct(const Token &tok, char c) {
  return tok.kind == NodeKind::Punctuation && tok.text.size() == 1 &&
         tok.text[0] == c;
}

static bool isOpenBracket(const Token &tok) {
  return isPunct(tok, '{') || isPunct(tok, '(') || isPunct(tok, '[');
}

static bool isCloseBracket(const Token &tok) {
  return isPunct(tok, '}') || isPunct(tok, ')') || isPunct(tok, ']');
}

static char getClosingBracket(const Token &open) {
  switch (open.text[0]) {
  case '{':
    return '}';
  case '(':
    return ')';
  default:
    return ']';
  }
}

class TreeBuilder {
public:
  TreeBuilder(ArrayRef<Token> tokens, unsigned maxNesting)
      : tokens(tokens), maxNesting(maxNesting) {}

  Expected<std::unique_ptr<SyntaxNode>> buildUnit(SourcePosition endPos);

private:
  bool atEnd() const { return index == tokens.size(); }
  const Token &peek() const { return tokens[index]; }

  std::unique_ptr<SyntaxNode> takeLeaf() {
    const Token &tok = tokens[index++];
    return std::make_unique<SyntaxNode>(tok.kind, tok.range, tok.text.str());
  }

  static std::unique_ptr<SyntaxNode> makeInterior(NodeKind kind,
                                                  SyntaxNode::ChildList list) {
    SourceRange range(list.front()->getRange().start,
                      list.back()->getRange().end);
    return std::make_unique<SyntaxNode>(kind, range, std::move(list));
  }

  static Error error(const SourceRange &range, const Twine &message) {
    return llvm::make_error<SyntaxError>(range, message.str());
  }

  Error checkDepth(const Token &open, unsigned depth) const {
    if (depth < maxNesting)
      return Error::success();
    return error(open.range, "brackets nested deeper than " +
                                 Twine(maxNesting) + " levels");
  }

  Error parseItems(SyntaxNode::ChildList &items, const Token *open,
                   unsigned depth);
  Expected<std::unique_ptr<SyntaxNode>> parseStatement(unsigned depth);
  Expected<std::unique_ptr<SyntaxNode>> parseBlock(unsigned depth);
  Expected<std::unique_ptr<SyntaxNode>> parseGroup(unsigned depth);

  ArrayRef<Token> tokens;
  size_t index = 0;
  unsigned maxNesting;
};

} // namespace

Error TreeBuilder::parseItems(SyntaxNode::ChildList &items, const Token *open,
                              unsigned depth) {
  while (!atEnd()) {
    const Token &tok = peek();
    if (isCloseBracket(tok)) {
      if (!open)
        return error(tok.range, "unmatched '" + tok.text + "'");
      if (tok.text[0] != getClosingBracket(*open))
        return error(tok.range, "mismatched '" + tok.text + "', expected '" +
                                    Twine(getClosingBracket(*open)) + "'");
      return Error::success();
    }

    if (isTrivia(tok.kind) || tok.kind == NodeKind::Directive) {
      items.push_back(takeLeaf());
      continue;
    }

    auto nodeOrErr =
        isPunct(tok, '{') ? parseBlock(depth) : parseStatement(depth);
    if (!nodeOrErr)
      return nodeOrErr.takeError();
    items.push_back(std::move(*nodeOrErr));
  }

  if (open)
    return error(open->range,
                 "missing '" + Twine(getClosingBracket(*open)) + "' for '" +
                     open->text + "'");
  return Error::success();
}

Expected<std::unique_ptr<SyntaxNode>>
TreeBuilder::parseStatement(unsigned depth) {
  SyntaxNode::ChildList children;
  // Trivia after the last significant element is handed back to the caller.
  size_t keep = 0;
  size_t resumeIndex = index;

  auto markSignificant = [&]() {
    keep = children.size();
    resumeIndex = index;
  };

  while (!atEnd()) {
    const Token &tok = peek();
    if (isCloseBracket(tok))
      break;

    if (isTrivia(tok.kind) || tok.kind == NodeKind::Directive) {
      children.push_back(takeLeaf());
      continue;
    }

    if (isPunct(tok, '{')) {
      auto blockOrErr = parseBlock(depth);
      if (!blockOrErr)
        return blockOrErr.takeError();
      children.push_back(std::move(*blockOrErr));
      markSignificant();
      if (!atEnd() && isPunct(peek(), ';')) {
        children.push_back(takeLeaf());
        markSignificant();
      }
      break;
    }

    if (isOpenBracket(tok)) {
      auto groupOrErr = parseGroup(depth);
      if (!groupOrErr)
        return groupOrErr.takeError();
      children.push_back(std::move(*groupOrErr));
      markSignificant();
      continue;
    }

    bool terminator = isPunct(tok, ';');
    children.push_back(takeLeaf());
    markSignificant();
    if (terminator)
      break;
  }

  children.resize(keep);
  index = resumeIndex;
  return makeInterior(NodeKind::Statement, std::move(children));
}

Expected<std::unique_ptr<SyntaxNode>> TreeBuilder::parseBlock(unsigned depth) {
  const Token &open = peek();
  if (Error err = checkDepth(open, depth))
    return std::move(err);

  SyntaxNode::ChildList children;
  children.push_back(takeLeaf());
  if (Error err = parseItems(children, &open, depth + 1))
    return std::move(err);
  children.push_back(takeLeaf());
  return makeInterior(NodeKind::Block, std::move(children));
}

Expected<std::unique_ptr<SyntaxNode>> TreeBuilder::parseGroup(unsigned depth) {
  const Token &open = peek();
  if (Error err = checkDepth(open, depth))
    return std::move(err);

  SyntaxNode::ChildList children;
  children.push_back(takeLeaf());
  char closing = getClosingBracket(open);
  while (true) {
    if (atEnd())
      return error(open.range, "missing '" + Twine(closing) + "' for '" +
                                   open.text + "'");
    const Token &tok = peek();
    if (isCloseBracket(tok)) {
      if (tok.text[0] != closing)
        return error(tok.range, "mismatched '" + tok.text + "', expected '" +
                                    Twine(closing) + "'");
      children.push_back(takeLeaf());
      break;
    }

    if (isOpenBracket(tok)) {
      auto nodeOrErr = isPunct(tok, '{') ? parseBlock(depth + 1)
                                         : parseGroup(depth + 1);
      if (!nodeOrErr)
        return nodeOrErr.takeError();
      children.push_back(std::move(*nodeOrErr));
      continue;
    }

    children.push_back(takeLeaf());
  }
  return makeInterior(NodeKind::Group, std::move(children));
}

Expected<std::unique_ptr<SyntaxNode>>
TreeBuilder::buildUnit(SourcePosition endPos) {
  SyntaxNode::ChildList items;
  if (Error err = parseItems(items, /*open=*/nullptr, /*depth=*/0))
    return std::move(err);

  SourceRange range(SourcePosition(), endPos);
  if (items.empty())
    return std::make_unique<SyntaxNode>(NodeKind::TranslationUnit, range,
                                        std::string());
  return std::make_unique<SyntaxNode>(NodeKind::TranslationUnit, range,
                                      std::move(items));
}

//===----------------------------------------------------------------------===//
// BraceParser
//===----------------------------------------------------------------------===//

Expected<std::unique_ptr<SyntaxTree>>
BraceParser::parse(StringRef source, StringRef filename) const {
  std::vector<Token> tokens;
  Lexer lexer(source);
  if (Error err = lexer.lex(tokens))
    return std::move(err);

  TreeBuilder builder(tokens, maxNesting);
  auto rootOrErr = builder.buildUnit(lexer.getEndPosition());
  if (!rootOrErr)
    return rootOrErr.takeError();

  LLVM_DEBUG(llvm::dbgs() << "parsed '" << filename << "': " << tokens.size()
                          << " tokens, " << (*rootOrErr)->countNodes()
                          << " nodes\n");
  return std::make_unique<SyntaxTree>(filename.str(), source.str(),
                                      std::move(*rootOrErr));
}
