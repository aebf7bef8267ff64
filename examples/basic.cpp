#include <tidy/tidy.hpp>

#include <fmt/core.h>

namespace ex = tidy::expr;
namespace pl = tidy::pipeline;

auto main() -> int {
    auto sources = tidy::runtime::builtin_sources();
    pl::Manager manager;

    // Keep colors with some red, then average green per blue level
    fmt::print("=== Grouped summary ===\n");

    pl::Pipeline summary;
    summary.push_back(pl::data("colors"));
    summary.push_back(pl::filter(
        ex::binary(ex::BinaryOp::NotEqual, ex::column("red"), ex::number(0.0))));
    summary.push_back(pl::group_by("blue"));
    summary.push_back(pl::summarize({
        pl::AggSpec{.func = pl::AggFunc::Count, .column = "name"},
        pl::AggSpec{.func = pl::AggFunc::Mean, .column = "green"},
    }));

    auto result = pl::run(summary, manager, sources);
    if (!result.ok()) {
        fmt::print("error: {}\n", result.error);
        return 1;
    }
    tidy::runtime::print_table(result.table);

    // The same pipeline in its JSON wire form
    fmt::print("\n=== Wire form ===\n");
    fmt::print("{}\n", pl::serialize(summary));

    return 0;
}
