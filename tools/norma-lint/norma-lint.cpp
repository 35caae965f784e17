//===- norma-lint.cpp - Style checker and fixer ---------------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This file implements the 'norma-lint' tool, which checks source files
// against the built-in style rules and optionally rewrites them.
//
// Usage:
//   norma-lint file.c other.c --config=.norma.yaml
//   norma-lint --fix --in-place src/*.c
//   norma-lint --format=json file.c
//   norma-lint --list-rules
//
//===----------------------------------------------------------------------===//

#include "norma/Analysis/Linting/LintConfig.h"
#include "norma/Analysis/Linting/LintDriver.h"
#include "norma/Analysis/Linting/StyleRules.h"
#include "norma/Syntax/BraceParser.h"
#include "llvm/Support/CommandLine.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/InitLLVM.h"
#include "llvm/Support/JSON.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/raw_ostream.h"

namespace cl = llvm::cl;
using namespace norma;
using namespace norma::lint;

//===----------------------------------------------------------------------===//
// Command-line Options
//===----------------------------------------------------------------------===//

static cl::OptionCategory mainCategory("norma-lint Options");

static cl::list<std::string> inputFiles(cl::Positional,
                                        cl::desc("<input files>"),
                                        cl::cat(mainCategory));

static cl::opt<std::string>
    configFile("config", cl::desc("Lint configuration file (YAML)"),
               cl::value_desc("filename"), cl::cat(mainCategory));

static cl::opt<bool> fixMode("fix", cl::desc("Apply automatic fixes"),
                             cl::cat(mainCategory));

static cl::opt<bool>
    inPlace("in-place",
            cl::desc("With --fix, overwrite the input files instead of "
                     "printing the corrected text"),
            cl::cat(mainCategory));

static cl::opt<unsigned> maxFixIterations(
    "max-fix-iterations",
    cl::desc("Maximum number of fix passes per file (default: from the "
             "configuration, else 4)"),
    cl::value_desc("n"), cl::cat(mainCategory));

enum class OutputFormat { Text, JSON };

static cl::opt<OutputFormat> format(
    "format", cl::desc("Output format"),
    cl::values(clEnumValN(OutputFormat::Text, "text", "One line per diagnostic"),
               clEnumValN(OutputFormat::JSON, "json", "JSON report")),
    cl::init(OutputFormat::Text), cl::cat(mainCategory));

static cl::opt<unsigned>
    numThreads("j", cl::desc("Number of files processed in parallel "
                             "(0 = hardware concurrency)"),
               cl::value_desc("n"), cl::init(0), cl::cat(mainCategory));

static cl::opt<bool> listRules("list-rules",
                               cl::desc("List the available rules and exit"),
                               cl::cat(mainCategory));

static cl::opt<bool>
    verbose("v", cl::desc("Verbose output"), cl::cat(mainCategory));

/// Exit codes.
enum ExitCode { ExitClean = 0, ExitViolations = 1, ExitConfigError = 2 };

//===----------------------------------------------------------------------===//
// Helpers
//===----------------------------------------------------------------------===//

static void printRules(const LintRuleRegistry &registry) {
  for (const auto &rule : registry.getAllRules()) {
    llvm::outs() << llvm::formatv("{0,-22} {1,-8} {2,-13} {3}{4}\n",
                                  rule->getName(),
                                  severityToString(rule->getDefaultSeverity()),
                                  rule->getCategory(), rule->getDescription(),
                                  rule->isAutoFixable() ? " (fixable)" : "");
  }
}

static Expected<std::unique_ptr<LintConfig>> loadConfig() {
  if (configFile.empty())
    return std::make_unique<LintConfig>();
  return LintConfig::loadFromFile(configFile);
}

/// Read the input files that are not excluded by `config`.
static bool readInputs(const LintConfig &config,
                       std::vector<SourceFile> &files) {
  for (const std::string &path : inputFiles) {
    if (config.shouldExcludeFile(path)) {
      if (verbose)
        llvm::errs() << "Skipping excluded file " << path << "\n";
      continue;
    }
    auto bufferOrErr = llvm::MemoryBuffer::getFileOrSTDIN(path);
    if (auto ec = bufferOrErr.getError()) {
      llvm::errs() << "Error reading " << path << ": " << ec.message()
                   << "\n";
      return false;
    }
    files.push_back({path, (*bufferOrErr)->getBuffer().str()});
  }
  return true;
}

static bool writeFile(StringRef path, StringRef text) {
  std::error_code ec;
  llvm::raw_fd_ostream os(path, ec, llvm::sys::fs::OF_None);
  if (ec) {
    llvm::errs() << "Error writing " << path << ": " << ec.message() << "\n";
    return false;
  }
  os << text;
  return true;
}

static void printTextDiagnostics(ArrayRef<LintDiagnostic> diagnostics) {
  for (const auto &diag : diagnostics)
    diag.print(llvm::outs());
}

static llvm::json::Array diagnosticsToJSON(ArrayRef<LintDiagnostic> diags) {
  llvm::json::Array array;
  for (const auto &diag : diags)
    array.push_back(toJSON(diag));
  return array;
}

//===----------------------------------------------------------------------===//
// Lint and Fix
//===----------------------------------------------------------------------===//

static int runLint(const LintDriver &driver, ArrayRef<SourceFile> files) {
  std::vector<LintReport> reports = driver.lintFiles(files, numThreads);

  size_t errors = 0, warnings = 0, hints = 0;
  bool clean = true;
  llvm::json::Array jsonReports;
  for (const LintReport &report : reports) {
    errors += report.errorCount;
    warnings += report.warningCount;
    hints += report.hintCount;
    clean &= report.success();

    if (format == OutputFormat::Text) {
      printTextDiagnostics(report.diagnostics);
      continue;
    }
    jsonReports.push_back(llvm::json::Object{
        {"file", report.filename},
        {"status", stringifyLintStatus(report.status)},
        {"diagnostics", diagnosticsToJSON(report.diagnostics)}});
  }

  if (format == OutputFormat::JSON)
    llvm::outs() << llvm::formatv("{0:2}\n",
                                  llvm::json::Value(std::move(jsonReports)));
  if (verbose)
    llvm::errs() << reports.size() << " files: " << errors << " errors, "
                 << warnings << " warnings, " << hints << " hints\n";
  return clean ? ExitClean : ExitViolations;
}

static int runFix(const LintDriver &driver, ArrayRef<SourceFile> files,
                  unsigned iterations) {
  std::vector<FixResult> results =
      driver.fixFiles(files, iterations, numThreads);

  bool clean = true;
  bool ioFailed = false;
  llvm::json::Array jsonResults;
  for (size_t i = 0, e = results.size(); i != e; ++i) {
    const FixResult &result = results[i];
    bool changed = result.changed(files[i].text);
    clean &= result.status == LintStatus::Clean;

    if (inPlace && changed)
      ioFailed |= !writeFile(result.filename, result.correctedText);

    if (verbose)
      llvm::errs() << result.filename << ": " << result.iterationsUsed
                   << " fix passes, " << result.conflicts.size()
                   << " conflicts, " << result.remainingDiagnostics.size()
                   << " remaining diagnostics\n";

    if (format == OutputFormat::Text) {
      if (!inPlace)
        llvm::outs() << result.correctedText;
      // Keep stdout clean for the corrected text.
      for (const auto &diag : result.remainingDiagnostics)
        diag.print(inPlace ? llvm::outs() : llvm::errs());
      continue;
    }

    llvm::json::Object obj{
        {"file", result.filename},
        {"status", stringifyLintStatus(result.status)},
        {"iterations", static_cast<int64_t>(result.iterationsUsed)},
        {"changed", changed},
        {"diagnostics", diagnosticsToJSON(result.remainingDiagnostics)}};
    if (!inPlace)
      obj["correctedText"] = result.correctedText;
    jsonResults.push_back(std::move(obj));
  }

  if (format == OutputFormat::JSON)
    llvm::outs() << llvm::formatv("{0:2}\n",
                                  llvm::json::Value(std::move(jsonResults)));
  if (ioFailed)
    return ExitConfigError;
  return clean ? ExitClean : ExitViolations;
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//

int main(int argc, char **argv) {
  llvm::InitLLVM y(argc, argv);

  cl::HideUnrelatedOptions(mainCategory);
  cl::ParseCommandLineOptions(argc, argv, "norma style checker\n");

  LintRuleRegistry registry;
  if (Error err = registerStyleRules(registry)) {
    llvm::errs() << "Error: " << llvm::toString(std::move(err)) << "\n";
    return ExitConfigError;
  }

  if (listRules) {
    printRules(registry);
    return ExitClean;
  }

  if (inputFiles.empty()) {
    llvm::errs() << "Error: no input files\n";
    return ExitConfigError;
  }
  if (inPlace && !fixMode) {
    llvm::errs() << "Error: --in-place requires --fix\n";
    return ExitConfigError;
  }

  auto configOrErr = loadConfig();
  if (!configOrErr) {
    llvm::errs() << "Error loading " << configFile << ": "
                 << llvm::toString(configOrErr.takeError()) << "\n";
    return ExitConfigError;
  }
  const LintConfig &config = **configOrErr;

  // Configuration problems end the run before any file is read.
  std::vector<std::string> warnings;
  auto rulesOrErr = registry.resolve(config, &warnings);
  for (const std::string &warning : warnings)
    llvm::errs() << "Warning: " << warning << "\n";
  if (!rulesOrErr) {
    llvm::errs() << "Error: " << llvm::toString(rulesOrErr.takeError())
                 << "\n";
    return ExitConfigError;
  }

  std::vector<SourceFile> files;
  if (!readInputs(config, files))
    return ExitConfigError;

  BraceParser parser;
  LintDriver driver(parser, *rulesOrErr);
  if (verbose)
    llvm::errs() << rulesOrErr->size() << " of "
                 << registry.getAllRules().size() << " rules active, "
                 << files.size() << " files\n";

  if (!fixMode)
    return runLint(driver, files);

  unsigned iterations = maxFixIterations.getNumOccurrences()
                            ? unsigned(maxFixIterations)
                            : config.getMaxFixIterations();
  return runFix(driver, files, iterations);
}
