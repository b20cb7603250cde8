// dockspan/ast/json_visitor.hpp - JSON serialization for instruction records
//
// Every record becomes an object with a "type" string and a
// "span": {"start", "end"} object holding byte offsets.
//
#pragma once

#include <nlohmann/json.hpp>

#include "dockspan/ast/instructions.hpp"
#include "dockspan/basic/error.hpp"

namespace dockspan
{

/**
 * Serialize a whole Dockerfile: instructions in source order and the
 * top-level comments.
 */
[[nodiscard]] nlohmann::json to_json(const Dockerfile & dockerfile);

/// Serialize any instruction; the "type" names its family record.
[[nodiscard]] nlohmann::json to_json(const Instruction & instruction);

[[nodiscard]] nlohmann::json to_json(const CopyInstruction & copy);
[[nodiscard]] nlohmann::json to_json(const RunInstruction & run);
[[nodiscard]] nlohmann::json to_json(const MiscInstruction & misc);

/// Fragments plus the "effective" text
[[nodiscard]] nlohmann::json to_json(const BreakableString & str);
[[nodiscard]] nlohmann::json to_json(const Heredoc & heredoc);
[[nodiscard]] nlohmann::json to_json(const SpannedString & str);

/// Kind, code, message and span (null when absent)
[[nodiscard]] nlohmann::json to_json(const ParseError & error);

}  // namespace dockspan
