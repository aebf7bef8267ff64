#pragma once

#include <tidy/core/error.hpp>
#include <tidy/pipeline/transform.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace tidy::pipeline {

/// First element of every serialized operation array.
inline constexpr std::string_view kTransformTag = "@transform";

// Operation-array form: ["@transform", op, ...operands]. A pipeline is a JSON
// array of operations and a program is a JSON array of pipelines.

[[nodiscard]] auto to_json(const Transform& op) -> nlohmann::json;
[[nodiscard]] auto to_json(const Pipeline& pipeline) -> nlohmann::json;
[[nodiscard]] auto to_json(const Program& program) -> nlohmann::json;

[[nodiscard]] auto transform_from_json(const nlohmann::json& json) -> Result<Transform>;
[[nodiscard]] auto pipeline_from_json(const nlohmann::json& json) -> Result<Pipeline>;
[[nodiscard]] auto program_from_json(const nlohmann::json& json) -> Result<Program>;

/// Parse JSON text holding either a single pipeline or a program.
/// A single pipeline is returned as a one-element program.
[[nodiscard]] auto parse_program(std::string_view text) -> Result<Program>;

[[nodiscard]] auto serialize(const Pipeline& pipeline) -> std::string;

}  // namespace tidy::pipeline
