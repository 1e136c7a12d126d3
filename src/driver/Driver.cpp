/***
 * Name: puretop::Driver::run
 * Purpose: Execute the read/lex/parse/annotate/emit pipeline for every input.
 */
#include "driver/Driver.h"
#include "ast/GeometrySummary.h"
#include "ast/Module.h"
#include "cli/ColorMode.h"
#include "cli/Options.h"
#include "codegen/Emitter.h"
#include "config/DenylistLoader.h"
#include "lexer/Lexer.h"
#include "observability/AstPrinter.h"
#include "observability/Metrics.h"
#include "optimizer/PureToplevel.h"
#include "parser/Parser.h"
#include "purity/CallLikeNode.h"
#include "purity/Denylist.h"
#include "purity/Verdict.h"
#include "puretop/exceptions/config_error.h"
#include "puretop/exceptions/file_read_error.h"
#include "puretop/exceptions/file_write_error.h"
#include "puretop/exceptions/parse_error.h"
#include "puretop/support/fs.h"

#include <chrono>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <system_error>
#include <unistd.h>
#include <vector>

namespace puretop {

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitConfig = 2;

bool colorEnabled(const cli::Options& opts) {
  if (opts.color == cli::ColorMode::Always) { return true; }
  if (opts.color == cli::ColorMode::Never) { return false; }
  constexpr int kStderrFd = 2;
  return (isatty(kStderrFd) != 0) || Driver::use_env_color();
}

std::string timestampPrefix() {
  auto tsNow = std::chrono::system_clock::now();
  const std::time_t tsTime = std::chrono::system_clock::to_time_t(tsNow);
  std::tm tmBuf{};
#ifdef _WIN32
  localtime_s(&tmBuf, &tsTime);
#else
  localtime_r(&tsTime, &tmBuf);
#endif
  std::ostringstream timestampStream;
  timestampStream << std::put_time(&tmBuf, "%Y%m%d-%H%M%S");
  return timestampStream.str() + "-";
}

// Log files of one input share the run prefix; later inputs append to them
std::ofstream openLog(const std::string& path) {
  return std::ofstream(path, std::ios::out | std::ios::app);
}

struct Run {
  const cli::Options& opts;
  const purity::Denylist& denylist;
  obs::Metrics& metrics;
  bool color{false};
  bool logsEnabled{false};
  std::string logDir;
  std::string tsPrefix;
  uint64_t annotated{0};

  std::string logFile(const char* name) const { return logDir + "/" + tsPrefix + name; }

  void dumpAst(const ast::Module& mod, const std::string& input, const char* stage, const char* logName) const {
    obs::AstPrinter printer; // NOLINT(misc-const-correctness)
    const auto out = printer.print(mod);
    std::cerr << "== AST (" << stage << ") " << input << " ==\n" << out;
    if (logsEnabled && opts.logAst) {
      auto file = openLog(logFile(logName));
      file << "== " << input << " ==\n" << out;
    }
  }

  void report(const opt::PureToplevel& pass, const std::string& input) const {
    for (const auto& d : pass.decisions()) {
      std::cerr << input << ":" << d.node.line << ":" << d.node.col << ": "
                << purity::to_string(d.node.kind) << " "
                << (d.node.callee ? *d.node.callee : std::string("<unresolved>"))
                << " args=" << d.node.argCount << " "
                << purity::to_string(d.verdict) << " " << purity::to_string(d.outcome) << "\n";
    }
  }

  void writeOutput(const std::string& input, const std::string& text) const {
    std::string err;
    if (opts.inPlace) {
      if (!support::WriteFile(input, text, err)) { throw exceptions::FileWriteError(err); }
    } else if (!opts.outputFile.empty()) {
      if (!support::WriteFile(opts.outputFile, text, err)) { throw exceptions::FileWriteError(err); }
    } else {
      std::cout << text;
      std::cout.flush();
    }
  }

  int processOne(const std::string& input) { // NOLINT(readability-function-size)
    lex::Lexer lexer; // NOLINT(misc-const-correctness)
    lexer.pushFile(input);
    std::unique_ptr<ast::Module> mod;
    try {
      // Lex time includes reading the input
      metrics.start("Lex");
      const auto toks = lexer.tokens();
      metrics.stop("Lex");
      metrics.incCounter("lex.tokens", static_cast<uint64_t>(toks.size()));
      metrics.start("Parse");
      parse::Parser parser(lexer);
      mod = parser.parseModule();
      metrics.stop("Parse");
    } catch (const exceptions::ParseError& ex) {
      Driver::print_error(Diagnostic{std::string("parse error: ") + ex.what(), input, ex.line(), ex.col()},
                          color, opts.diagContext);
      return kExitFailure;
    } catch (const exceptions::FileReadError& ex) {
      Driver::print_error(Diagnostic{ex.what(), {}, 0, 0}, color, opts.diagContext);
      return kExitFailure;
    }
    const auto geom = ast::ComputeGeometry(*mod);
    metrics.incCounter("lex.comments", geom.comments);
    metrics.incCounter("parse.statements", static_cast<uint64_t>(mod->body.size()));
    metrics.setAstGeometry({geom.nodes, geom.maxDepth});

    if (opts.astLog == cli::AstLogMode::Before || opts.astLog == cli::AstLogMode::Both) {
      dumpAst(*mod, input, "before", "ast.before.ast.log");
    }

    metrics.start("PureToplevel");
    opt::PureToplevel pass(denylist); // NOLINT(misc-const-correctness)
    const auto applied = pass.run(*mod);
    metrics.stop("PureToplevel");
    annotated += static_cast<uint64_t>(applied);
    metrics.setOptimizerStat("pure_annotated", annotated);
    for (const auto& [key, count] : pass.stats()) {
      metrics.incCounter("pure." + key, count);
      metrics.incOptimizerBreakdown(pass.name(), key, count);
    }
    if (opts.report) { report(pass, input); }

    if (opts.astLog == cli::AstLogMode::After || opts.astLog == cli::AstLogMode::Both) {
      dumpAst(*mod, input, "after", "ast.after.ast.log");
    }

    metrics.start("Emit");
    const std::string out = codegen::Emitter::emit(lexer.source(), mod->comments);
    metrics.stop("Emit");
    metrics.incCounter("emit.bytes", static_cast<uint64_t>(out.size()));

    if (logsEnabled && opts.logLexer) {
      auto lexFile = openLog(logFile("lexer.lex.log"));
      for (const auto& tok : lexer.tokens()) {
        lexFile << tok.file << ":" << tok.line << ":" << tok.col << " " << to_string(tok.kind) << " " << tok.text << "\n";
      }
    }

    try {
      writeOutput(input, out);
    } catch (const exceptions::FileWriteError& ex) {
      Driver::print_error(Diagnostic{ex.what(), {}, 0, 0}, color, opts.diagContext);
      return kExitFailure;
    }
    return kExitOk;
  }
};

} // namespace

int Driver::run(const cli::Options& opts) { // NOLINT(readability-function-size)
  const bool color = colorEnabled(opts);
  if (opts.inputs.empty()) {
    std::cerr << "puretop: no input files provided\n";
    return kExitConfig;
  }

  purity::Denylist denylist;
  try {
    denylist = config::DenylistLoader::load(
        config::DenylistSource{!opts.noDefaultDeny, opts.denyNames, opts.denyFiles});
  } catch (const exceptions::ConfigError& ex) {
    print_error(Diagnostic{ex.what(), {}, 0, 0}, color, opts.diagContext);
    return kExitConfig;
  } catch (const exceptions::FileReadError& ex) {
    print_error(Diagnostic{std::string("denylist: ") + ex.what(), {}, 0, 0}, color, opts.diagContext);
    return kExitConfig;
  }

  // Optional log directory creation
  const bool wantLogs = opts.logLexer || opts.logAst || opts.metrics || opts.metricsJson;
  bool logsEnabled = wantLogs;
  const std::string logDir = opts.logPath.empty() ? std::string(".") : opts.logPath;
  if (wantLogs) {
    std::error_code errCode;
    namespace fs = std::filesystem;
    if (!fs::exists(logDir, errCode)) {
      if (!fs::create_directories(logDir, errCode) && !fs::exists(logDir)) {
        std::cerr << "puretop: failed to create log directory '" << logDir << "': " << errCode.message() << "\n";
        logsEnabled = false;
      }
    }
  }

  obs::Metrics metrics;
  metrics.setGauge("denylist.size", static_cast<uint64_t>(denylist.size()));
  Run state{opts, denylist, metrics, color, logsEnabled, logDir, timestampPrefix()};

  int status = kExitOk;
  uint64_t failed = 0;
  for (const auto& input : opts.inputs) {
    const int rc = state.processOne(input);
    if (rc != kExitOk) {
      ++failed;
      status = rc;
    }
  }
  metrics.setCounter("driver.inputs", static_cast<uint64_t>(opts.inputs.size()));
  metrics.setCounter("driver.failed_inputs", failed);

  // Metrics go to stderr; stdout carries the annotated source:
  // - With --metrics-json: JSON only
  // - With --metrics: human-readable text, then JSON
  if (opts.metricsJson) {
    std::cerr << metrics.summaryJson();
  } else if (opts.metrics) {
    std::cerr << metrics.summaryText();
    std::cerr << metrics.summaryJson();
  }

  if (logsEnabled && (opts.metrics || opts.metricsJson)) {
    std::ofstream metricsFile(state.logFile("metrics.json"));
    metricsFile << metrics.summaryJson();
  }
  return status;
}

} // namespace puretop
