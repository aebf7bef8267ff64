#include <tidy/pipeline/engine.hpp>
#include <tidy/pipeline/ops.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <list>

namespace tidy::pipeline {

namespace {

auto malformed(std::string message) -> std::unexpected<Error> {
    return make_error(ErrorKind::MalformedPipeline, std::move(message));
}

auto require_expr(const expr::ExprPtr& e, std::string_view op) -> Result<const expr::Expr*> {
    if (!e) {
        return make_error(ErrorKind::MalformedExpression,
                          fmt::format("{} has no expression", op));
    }
    return e.get();
}

auto load_source(const Transform& op, const Manager& manager,
                 const runtime::SourceRegistry& sources) -> Result<Table> {
    if (const auto* d = std::get_if<DataOp>(&op)) {
        const auto* source = sources.find(d->name);
        if (source == nullptr) {
            return make_error(ErrorKind::UnknownRegistryName,
                              fmt::format("unknown data source '{}' (known: {})", d->name,
                                          format_columns(sources.names())));
        }
        return (*source)();
    }
    if (const auto* s = std::get_if<SequenceOp>(&op)) {
        if (s->column.empty()) {
            return malformed("sequence requires a column name");
        }
        if (s->count > kMaxSequenceCount) {
            return malformed(fmt::format("sequence count {} exceeds the limit of {}", s->count,
                                         kMaxSequenceCount));
        }
        return ops::sequence(s->column, s->count);
    }
    const auto& j = std::get<JoinOp>(op);
    auto left = manager.lookup(j.left_name);
    if (!left) {
        return std::unexpected(left.error());
    }
    auto right = manager.lookup(j.right_name);
    if (!right) {
        return std::unexpected(right.error());
    }
    return ops::inner_join(**left, j.left_column, **right, j.right_column);
}

auto apply(const Transform& op, const Table& table, Manager& manager) -> Result<Table> {
    return std::visit(
        [&](const auto& o) -> Result<Table> {
            using T = std::decay_t<decltype(o)>;
            if constexpr (std::is_same_v<T, FilterOp>) {
                auto predicate = require_expr(o.predicate, "filter");
                if (!predicate) {
                    return std::unexpected(predicate.error());
                }
                return ops::filter(table, **predicate);
            } else if constexpr (std::is_same_v<T, MutateOp>) {
                auto value = require_expr(o.value, "mutate");
                if (!value) {
                    return std::unexpected(value.error());
                }
                return ops::mutate(table, o.column, **value);
            } else if constexpr (std::is_same_v<T, SelectOp>) {
                return ops::select(table, o.columns);
            } else if constexpr (std::is_same_v<T, SortOp>) {
                return ops::sort(table, o.columns, o.descending);
            } else if constexpr (std::is_same_v<T, GroupByOp>) {
                return ops::group_by(table, o.column);
            } else if constexpr (std::is_same_v<T, UngroupOp>) {
                return ops::ungroup(table);
            } else if constexpr (std::is_same_v<T, SummarizeOp>) {
                return ops::summarize(table, o.aggregates);
            } else if constexpr (std::is_same_v<T, NotifyOp>) {
                if (o.name.empty()) {
                    return malformed("notify requires a name");
                }
                manager.register_table(o.name, table);
                return table;
            } else {
                return malformed(fmt::format("{} is a source and must come first", op_name(op)));
            }
        },
        op);
}

auto execute(const Pipeline& pipeline, Manager& manager, const runtime::SourceRegistry& sources)
    -> Result<Table> {
    if (pipeline.empty()) {
        return malformed("pipeline is empty");
    }
    if (!is_source(pipeline.front())) {
        return malformed(fmt::format("pipeline must start with data, sequence or join, not {}",
                                     op_name(pipeline.front())));
    }
    auto current = load_source(pipeline.front(), manager, sources);
    if (!current) {
        return current;
    }
    spdlog::debug("run: {} -> {} rows", op_name(pipeline.front()), current->rows());

    for (std::size_t i = 1; i < pipeline.size(); ++i) {
        const auto& op = pipeline[i];
        if (is_source(op)) {
            return malformed(
                fmt::format("{} at step {} is a source and must come first", op_name(op), i));
        }
        auto next = apply(op, *current, manager);
        if (!next) {
            return next;
        }
        current = std::move(next);
        spdlog::debug("run: {} -> {} rows", op_name(op), current->rows());
    }
    return current;
}

}  // namespace

auto run(const Pipeline& pipeline, Manager& manager, const runtime::SourceRegistry& sources)
    -> RunResult {
    RunResult result;
    auto table = execute(pipeline, manager, sources);
    if (table) {
        result.table = std::move(*table);
    } else {
        result.error = to_string(table.error());
        spdlog::warn("pipeline failed: {}", result.error);
    }
    manager.set_result(result);
    return result;
}

auto run_program(const Program& program, Manager& manager,
                 const runtime::SourceRegistry& sources) -> RunResult {
    std::list<const Pipeline*> pending;
    for (const auto& pipeline : program) {
        pending.push_back(&pipeline);
    }

    RunResult last;
    while (!pending.empty()) {
        auto ready = std::ranges::find_if(pending, [&](const Pipeline* p) {
            return std::ranges::all_of(join_inputs(*p),
                                       [&](const std::string& n) { return manager.contains(n); });
        });
        if (ready == pending.end()) {
            std::vector<std::string> missing;
            for (const auto* p : pending) {
                for (auto& name : join_inputs(*p)) {
                    bool listed = std::ranges::find(missing, name) != missing.end();
                    if (!manager.contains(name) && !listed) {
                        missing.push_back(std::move(name));
                    }
                }
            }
            last = RunResult{};
            last.error = to_string(Error{
                .kind = ErrorKind::UnknownRegistryName,
                .message = fmt::format("{} pipeline(s) wait on tables never published: {}",
                                       pending.size(), format_columns(missing))});
            spdlog::warn("program stalled: {}", last.error);
            manager.set_result(last);
            return last;
        }
        if (ready != pending.begin()) {
            spdlog::debug("program: deferring {} pipeline(s) until their join inputs exist",
                          std::distance(pending.begin(), ready));
        }
        last = run(**ready, manager, sources);
        pending.erase(ready);
        if (!last.ok()) {
            return last;
        }
    }
    return last;
}

}  // namespace tidy::pipeline
