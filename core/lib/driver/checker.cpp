// flowan/driver/checker.cpp - Analysis driver implementation
//
#include "flowan/driver/checker.hpp"

#include <fmt/format.h>

#include <fstream>
#include <iostream>
#include <sstream>

#include "flowan/ast/ast_context.hpp"
#include "flowan/ast/json_reader.hpp"
#include "flowan/sema/flow/flow_analyzer.hpp"
#include "flowan/sema/flow/flow_json.hpp"
#include "flowan/sema/types/subtype_oracle.hpp"

namespace flowan
{

namespace
{

bool read_file(const std::filesystem::path & path, std::string & out)
{
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return false;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  out = buffer.str();
  return true;
}

/// Attach program text so diagnostics can show snippets.
void load_source(
  CheckResult & result, const std::filesystem::path & path, const CheckOptions & options)
{
  result.source.set_file_path(path);
  std::string text;
  if (!read_file(path, text)) {
    result.diagnostics.report_warning(
      SourceRange{}, "cannot read source file: " + path.string(),
      "diagnostics are shown without snippets");
    return;
  }
  if (options.verbose) {
    std::cerr << fmt::format("Using source text {}\n", path.string());
  }
  result.source.set_source(std::move(text));
}

/// Flow analysis of every function of a loaded unit.
void analyze_unit(
  CheckResult & result, const CompilationUnit & unit, TypeContext & types,
  const ClassHierarchy & classes, const CheckOptions & options)
{
  SubtypeOracle oracle(types, classes);
  FlowAnalyzer analyzer(oracle, options.flow, &result.diagnostics);

  for (const FunctionDecl * fn : unit.functions) {
    if (options.verbose) {
      std::cerr << fmt::format("Analyzing {}\n", fn->name);
    }
    FlowResults flow = analyzer.analyze(*fn);
    if (options.dump_flow) {
      result.flow_dump.push_back(to_json(flow, *fn));
    }
    ++result.function_count;
  }
}

}  // namespace

CheckResult Checker::check_text(
  std::string_view text, const CheckOptions & options, std::string_view name)
{
  CheckResult result;
  result.source.set_file_path(std::string(name));

  AstContext ast;
  TypeContext types;
  ClassHierarchy classes = ClassHierarchy::with_core_library(types);

  UnitLoadResult loaded = load_unit_text(text, ast, types, classes, result.diagnostics);
  if (!loaded.success) {
    result.diagnostics.report_error(SourceRange{}, fmt::format("{}: {}", name, loaded.error));
    return result;
  }

  if (options.source_path) {
    load_source(result, *options.source_path, options);
  }

  analyze_unit(result, *loaded.unit, types, classes, options);
  result.success = !result.diagnostics.has_errors();
  return result;
}

CheckResult Checker::check_file(const std::filesystem::path & file, const CheckOptions & options)
{
  CheckResult result;
  result.source.set_file_path(file);

  namespace fs = std::filesystem;

  if (!fs::exists(file)) {
    result.diagnostics.report_error(SourceRange{}, "file not found: " + file.string());
    return result;
  }

  if (options.verbose) {
    std::cerr << fmt::format("Loading {}\n", file.string());
  }

  AstContext ast;
  TypeContext types;
  ClassHierarchy classes = ClassHierarchy::with_core_library(types);

  UnitLoadResult loaded = load_unit_file(file, ast, types, classes, result.diagnostics);
  if (!loaded.success) {
    result.diagnostics.report_error(
      SourceRange{}, fmt::format("{}: {}", file.string(), loaded.error));
    return result;
  }

  if (options.source_path) {
    load_source(result, *options.source_path, options);
  } else if (!loaded.source_path.empty()) {
    load_source(result, loaded.source_path, options);
  }

  analyze_unit(result, *loaded.unit, types, classes, options);
  result.success = !result.diagnostics.has_errors();

  if (options.verbose) {
    std::cerr << fmt::format(
      "Checked {} function(s), {} diagnostic(s)\n", result.function_count,
      result.diagnostics.size());
  }
  return result;
}

}  // namespace flowan
