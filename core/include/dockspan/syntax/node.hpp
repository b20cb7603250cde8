// dockspan/syntax/node.hpp - Materialized token tree node
#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "dockspan/basic/error.hpp"
#include "dockspan/basic/span.hpp"
#include "dockspan/syntax/rule_kind.hpp"

namespace dockspan::syntax
{

//------------------------------------------------------------------------------
// Node - one rule match with its span, raw text and children
//------------------------------------------------------------------------------
//
// The tree is fully built before assembly starts (heredoc matching needs to
// see a whole instruction). text() views the caller's source buffer, which
// must outlive the tree.
class Node
{
public:
  Node() = default;
  Node(RuleKind kind, Span span, std::string_view text) : kind_(kind), span_(span), text_(text) {}
  Node(RuleKind kind, Span span, std::string_view text, std::vector<Node> children)
  : kind_(kind), span_(span), text_(text), children_(std::move(children))
  {
  }

  [[nodiscard]] RuleKind kind() const noexcept { return kind_; }
  [[nodiscard]] Span span() const noexcept { return span_; }
  [[nodiscard]] std::string_view text() const noexcept { return text_; }

  [[nodiscard]] const std::vector<Node> & children() const noexcept { return children_; }
  [[nodiscard]] uint32_t child_count() const noexcept
  {
    return static_cast<uint32_t>(children_.size());
  }
  [[nodiscard]] const Node & child(uint32_t i) const { return children_.at(i); }

  void add_child(Node child) { children_.push_back(std::move(child)); }

private:
  RuleKind kind_ = RuleKind::Dockerfile;
  Span span_;
  std::string_view text_;
  std::vector<Node> children_;
};

/// UnexpectedToken error naming the offending node
[[nodiscard]] ParseError unexpected_token(const Node & node);

}  // namespace dockspan::syntax
