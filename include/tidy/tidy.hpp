#pragma once

// Umbrella header: the value model, expressions, pipelines and runtime helpers.

#include <tidy/core/error.hpp>
#include <tidy/core/table.hpp>
#include <tidy/core/time.hpp>
#include <tidy/core/value.hpp>
#include <tidy/expr/evaluate.hpp>
#include <tidy/expr/expr.hpp>
#include <tidy/expr/serialize.hpp>
#include <tidy/pipeline/codec.hpp>
#include <tidy/pipeline/engine.hpp>
#include <tidy/pipeline/manager.hpp>
#include <tidy/pipeline/ops.hpp>
#include <tidy/pipeline/transform.hpp>
#include <tidy/runtime/config.hpp>
#include <tidy/runtime/csv.hpp>
#include <tidy/runtime/datasets.hpp>
#include <tidy/runtime/print.hpp>
#include <tidy/runtime/source_registry.hpp>
