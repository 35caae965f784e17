//===- LintDriver.cpp - Per-file lint and fix pipelines -------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "norma/Analysis/Linting/LintDriver.h"

#include "llvm/ADT/STLExtras.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/raw_ostream.h"

#include <algorithm>
#include <atomic>
#include <thread>

#define DEBUG_TYPE "norma-lint-driver"

using namespace norma;
using namespace norma::lint;

//===----------------------------------------------------------------------===//
// Lint
//===----------------------------------------------------------------------===//

LintReport LintDriver::lint(StringRef text, StringRef filename) const {
  auto treeOrErr = parser.parse(text, filename);
  if (!treeOrErr) {
    LintReport report = makeParseFailedReport(filename, treeOrErr.takeError());
    LLVM_DEBUG(llvm::dbgs() << filename << ": parse failed\n");
    return report;
  }

#ifndef NDEBUG
  // A parser that breaks the tiling contract cannot be linted safely.
  if (Error err = verifyTiling(**treeOrErr))
    return makeParseFailedReport(filename, std::move(err));
#endif

  LintReport report = engine.run(**treeOrErr);
  LLVM_DEBUG(llvm::dbgs() << filename << ": " << report.diagnostics.size()
                          << " diagnostics, "
                          << stringifyLintStatus(report.status) << "\n");
  return report;
}

//===----------------------------------------------------------------------===//
// Fix
//===----------------------------------------------------------------------===//

/// Return true if the fix of `diag` is one of the two sides of `conflict`.
static bool isInvolvedIn(const LintDiagnostic &diag,
                         const FixConflict &conflict) {
  const auto &fix = diag.getFix();
  if (!fix || (fix->ruleName != conflict.firstRule &&
               fix->ruleName != conflict.secondRule))
    return false;
  // Inclusive bounds so that insertions at the edge of the shared range count.
  return fix->range.start.offset <= conflict.range.end.offset &&
         conflict.range.start.offset <= fix->range.end.offset;
}

/// Attach `note` to `diag` unless it already carries it.
static void addNote(LintDiagnostic &diag, const Twine &note) {
  std::string text = note.str();
  if (llvm::is_contained(diag.getNotes(), text))
    return;
  diag = diag.withNote(text);
}

/// Record why the edits of `diagnostics` could not be applied.
static void annotateRejectedEdits(std::vector<LintDiagnostic> &diagnostics,
                                  Error error,
                                  std::vector<FixConflict> &conflicts) {
  llvm::handleAllErrors(
      std::move(error),
      [&](const FixConflictError &conflictError) {
        const FixConflict &conflict = conflictError.getConflict();
        conflicts.push_back(conflict);
        for (auto &diag : diagnostics) {
          if (!isInvolvedIn(diag, conflict))
            continue;
          StringRef other = diag.getFix()->ruleName == conflict.firstRule
                                ? conflict.secondRule
                                : conflict.firstRule;
          addNote(diag, "fix not applied: conflicts with rule '" + other + "'");
        }
      },
      [&](const InvalidEditError &editError) {
        for (auto &diag : diagnostics)
          if (diag.getFix() && *diag.getFix() == editError.getEdit())
            addNote(diag, "fix not applied: edit lies outside the source text");
      });
}

FixResult LintDriver::fix(StringRef text, StringRef filename,
                          unsigned maxIterations) const {
  FixResult result;
  result.filename = filename.str();
  result.correctedText = text.str();

  const ActiveRuleSet &rules = engine.getRules();
  LintReport report = lint(result.correctedText, filename);
  bool stopped = false;
  while (!stopped && report.status != LintStatus::ParseFailed &&
         result.iterationsUsed < maxIterations) {
    std::vector<TextEdit> edits = collectFixes(report.diagnostics, rules);
    if (edits.empty())
      break;

    auto fixedOrErr = applyEdits(result.correctedText, edits);
    if (!fixedOrErr) {
      annotateRejectedEdits(report.diagnostics, fixedOrErr.takeError(),
                            result.conflicts);
      LLVM_DEBUG(llvm::dbgs() << filename << ": pass "
                              << result.iterationsUsed + 1
                              << " rejected, fixes not applied\n");
      stopped = true;
      break;
    }
    if (*fixedOrErr == result.correctedText)
      break;

    // The rewritten text gets a fresh tree; a pass that breaks the parse is
    // dropped.
    LintReport next = lint(*fixedOrErr, filename);
    if (next.status == LintStatus::ParseFailed) {
      LLVM_DEBUG(llvm::dbgs() << filename << ": pass "
                              << result.iterationsUsed + 1
                              << " produced unparsable text, rolled back\n");
      for (auto &diag : report.diagnostics)
        if (diag.getFix())
          addNote(diag, "fix not applied: corrected text does not parse");
      stopped = true;
      break;
    }

    result.correctedText = std::move(*fixedOrErr);
    report = std::move(next);
    ++result.iterationsUsed;
    LLVM_DEBUG(llvm::dbgs() << filename << ": pass " << result.iterationsUsed
                            << " applied " << edits.size() << " edits\n");
  }

  if (!stopped && result.iterationsUsed >= maxIterations &&
      report.status != LintStatus::ParseFailed) {
    for (auto &diag : report.diagnostics) {
      const ActiveRule *active = rules.lookup(diag.getRuleName());
      if (diag.getFix() && active && active->rule->isAutoFixable())
        addNote(diag, "fix not applied: iteration limit reached");
    }
  }

  result.remainingDiagnostics = std::move(report.diagnostics);
  result.status = report.status;
  return result;
}

//===----------------------------------------------------------------------===//
// Batches
//===----------------------------------------------------------------------===//

/// Run `body` for every index below `count` on up to `numThreads` workers.
/// Each index is handed to exactly one worker.
static void parallelForEach(size_t count, unsigned numThreads,
                            llvm::function_ref<void(size_t)> body) {
  if (numThreads == 0) {
    numThreads = std::thread::hardware_concurrency();
    if (numThreads == 0)
      numThreads = 4;
  }
  numThreads = std::min<size_t>(numThreads, count);
  if (numThreads <= 1) {
    for (size_t i = 0; i != count; ++i)
      body(i);
    return;
  }

  std::atomic<size_t> next{0};
  std::vector<std::thread> threads;
  threads.reserve(numThreads);
  for (unsigned t = 0; t != numThreads; ++t) {
    threads.emplace_back([&]() {
      for (size_t i = next.fetch_add(1); i < count; i = next.fetch_add(1))
        body(i);
    });
  }
  for (auto &thread : threads) {
    if (thread.joinable())
      thread.join();
  }
}

std::vector<LintReport> LintDriver::lintFiles(ArrayRef<SourceFile> files,
                                              unsigned numThreads) const {
  std::vector<LintReport> reports(files.size());
  parallelForEach(files.size(), numThreads, [&](size_t i) {
    reports[i] = lint(files[i].text, files[i].filename);
  });
  return reports;
}

std::vector<FixResult> LintDriver::fixFiles(ArrayRef<SourceFile> files,
                                            unsigned maxIterations,
                                            unsigned numThreads) const {
  std::vector<FixResult> results(files.size());
  parallelForEach(files.size(), numThreads, [&](size_t i) {
    results[i] = fix(files[i].text, files[i].filename, maxIterations);
  });
  return results;
}
