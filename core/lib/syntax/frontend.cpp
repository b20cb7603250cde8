// dockspan/syntax/frontend.cpp - High-level parse pipeline
#include "dockspan/syntax/frontend.hpp"

#include <utility>

#include "dockspan/syntax/ast_builder.hpp"
#include "dockspan/syntax/recognizer.hpp"

namespace dockspan
{

namespace
{

constexpr const char * k_terminator_help =
  "the terminator line must repeat the delimiter exactly, on a line of its own";

void report_failure(DiagnosticBag & diags, const ParseError & error)
{
  auto builder = diags.report(error);
  switch (error.kind) {
    case ErrorKind::HeredocTerminatorMismatch:
    case ErrorKind::UnmatchedHeredocDelimiter:
      builder.with_help(k_terminator_help);
      break;
    case ErrorKind::SyntaxError:
      builder.with_help("instructions start with a keyword such as RUN or COPY");
      break;
    default:
      break;
  }
}

}  // namespace

ParseResult<Dockerfile> parse_dockerfile(std::string_view source)
{
  syntax::Recognizer recognizer(source);
  const syntax::RecognizeOutput recognized = recognizer.recognize_document();
  const syntax::Node & document = recognized.document;

  const auto first_syntax_error = [&]() -> const ParseError * {
    return recognized.errors.empty() ? nullptr : &recognized.errors.front();
  }();

  const AstBuilder builder;
  Dockerfile file;
  file.span = document.span();

  for (const auto & item : document.children()) {
    if (
      first_syntax_error != nullptr && first_syntax_error->span &&
      first_syntax_error->span->start() < item.span().start()) {
      return *first_syntax_error;
    }
    if (item.kind() == syntax::RuleKind::Comment) {
      file.comments.emplace_back(item.span(), std::string(item.text()));
      continue;
    }
    auto instruction = builder.build_instruction(item);
    if (!instruction) return instruction.error();
    file.instructions.push_back(std::move(instruction).value());
  }

  if (first_syntax_error != nullptr) {
    return *first_syntax_error;
  }
  return file;
}

RecoveredDockerfile parse_dockerfile_with_recovery(std::string_view source)
{
  syntax::Recognizer recognizer(source);
  syntax::RecognizeOutput recognized = recognizer.recognize_document();

  RecoveredDockerfile out;
  out.dockerfile.span = recognized.document.span();

  for (const auto & error : recognized.errors) {
    report_failure(out.diags, error);
  }
  for (const auto & empty_line : recognized.empty_continuation_lines) {
    out.diags.report_warning(empty_line, "empty continuation line", "blank line inside an instruction")
      .with_code("W0001")
      .with_help("remove the blank line or end the previous line without `\\`");
  }

  const AstBuilder builder;
  for (const auto & item : recognized.document.children()) {
    if (item.kind() == syntax::RuleKind::Comment) {
      out.dockerfile.comments.emplace_back(item.span(), std::string(item.text()));
      continue;
    }
    auto instruction = builder.build_instruction(item);
    if (!instruction) {
      report_failure(out.diags, instruction.error());
      continue;
    }
    out.dockerfile.instructions.push_back(std::move(instruction).value());
  }

  return out;
}

ParseResult<Instruction> parse_instruction(std::string_view source, syntax::RuleKind family)
{
  syntax::Recognizer recognizer(source);
  auto node = recognizer.recognize_instruction(family);
  if (!node) {
    return node.error();
  }
  return AstBuilder().build_instruction(*node);
}

}  // namespace dockspan
