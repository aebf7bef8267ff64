#include <tidy/tidy.hpp>

#include <CLI/CLI.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>
#include <string>

namespace {

auto read_file(const std::string& path) -> tidy::Result<std::string> {
    std::ifstream in(path);
    if (!in) {
        return tidy::make_error(tidy::ErrorKind::SourceError,
                                fmt::format("cannot open program file '{}'", path));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

}  // namespace

auto main(int argc, char** argv) -> int {
    CLI::App app{"tidy_run - execute JSON table pipelines"};

    tidy::runtime::RunConfig config;
    app.add_option("program", config.program_path,
                   "JSON file holding one pipeline or a program (array of pipelines)")
        ->required();
    app.add_option("-d,--data", config.data,
                   "Bind a CSV file to a data source name: name=path (repeatable)");
    app.add_option("--data-path", config.data_path,
                   "Directory for relative CSV paths. "
                   "Defaults to TIDY_DATA_PATH environment variable.");
    app.add_option("--nulls", config.nulls, "Comma separated CSV null tokens")
        ->capture_default_str();
    app.add_option("-n,--rows", config.max_rows, "Rows to print")->capture_default_str();
    app.add_option("--seed", config.seed, "Seed for the random-variate expressions");
    app.add_flag("--tables", config.list_tables, "List published tables after the run");
    app.add_flag("-v,--verbose", config.verbose, "Enable debug logging");

    CLI11_PARSE(app, argc, argv);

    tidy::runtime::configure_logging(config);
    tidy::runtime::apply_environment(config);

    if (config.seed) {
        tidy::expr::seed_random(*config.seed);
    }

    auto text = read_file(config.program_path);
    if (!text) {
        spdlog::error("{}", tidy::to_string(text.error()));
        return 1;
    }
    auto program = tidy::pipeline::parse_program(*text);
    if (!program) {
        spdlog::error("{}", tidy::to_string(program.error()));
        return 1;
    }
    auto sources = tidy::runtime::build_sources(config);
    if (!sources) {
        spdlog::error("{}", tidy::to_string(sources.error()));
        return 1;
    }

    tidy::pipeline::Manager manager;
    auto result = tidy::pipeline::run_program(*program, manager, *sources);
    if (config.list_tables) {
        tidy::runtime::print_names("tables", manager.names());
    }
    if (!result.ok()) {
        fmt::print(stderr, "error: {}\n", result.error);
        return 1;
    }
    tidy::runtime::print_table(result.table, config.max_rows);
    return 0;
}
