#pragma once

#include <tidy/pipeline/manager.hpp>
#include <tidy/pipeline/transform.hpp>
#include <tidy/runtime/source_registry.hpp>

namespace tidy::pipeline {

/// Execute one pipeline left to right.
///
/// The first operation must be a source (`data`, `sequence` or `join`) and no
/// other operation may be. `notify` publishes into `manager` as it goes; those
/// entries stay even if a later operation fails. The outcome is also stored
/// with `manager.set_result`.
auto run(const Pipeline& pipeline, Manager& manager, const runtime::SourceRegistry& sources)
    -> RunResult;

/// Run every pipeline of a program against one manager.
///
/// A pipeline whose joins read names nobody has published yet is deferred
/// until another pipeline publishes them. Pipelines run in program order
/// otherwise. Stops at the first failing pipeline; if the pending pipelines
/// can never be satisfied the result is an UnknownRegistryName error. The
/// result is that of the last pipeline run.
auto run_program(const Program& program, Manager& manager,
                 const runtime::SourceRegistry& sources) -> RunResult;

}  // namespace tidy::pipeline
