#include <tidy/runtime/config.hpp>
#include <tidy/runtime/csv.hpp>
#include <tidy/runtime/datasets.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <filesystem>

namespace tidy::runtime {

void apply_environment(RunConfig& config) {
    if (config.data_path.empty()) {
        const char* env = std::getenv("TIDY_DATA_PATH");
        if (env != nullptr) {
            config.data_path = env;
        }
    }
}

auto parse_binding(const std::string& binding) -> Result<std::pair<std::string, std::string>> {
    auto eq = binding.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 == binding.size()) {
        return make_error(ErrorKind::SourceError,
                          fmt::format("data binding must look like name=path, got '{}'", binding));
    }
    return std::pair{binding.substr(0, eq), binding.substr(eq + 1)};
}

auto build_sources(const RunConfig& config) -> Result<SourceRegistry> {
    SourceRegistry registry = builtin_sources();
    auto options = parse_null_spec(config.nulls);
    for (const auto& binding : config.data) {
        auto parsed = parse_binding(binding);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        auto [name, path] = std::move(*parsed);
        std::filesystem::path resolved(path);
        if (resolved.is_relative() && !config.data_path.empty()) {
            resolved = std::filesystem::path(config.data_path) / resolved;
        }
        spdlog::debug("source '{}' -> {}", name, resolved.string());
        registry.register_source(name, [file = resolved.string(), options]() {
            return read_csv(file, options);
        });
    }
    return registry;
}

void configure_logging(const RunConfig& config) {
    if (config.verbose) {
        spdlog::set_level(spdlog::level::debug);
        return;
    }
    const char* env = std::getenv("TIDY_LOG_LEVEL");
    if (env != nullptr) {
        spdlog::set_level(spdlog::level::from_str(env));
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

}  // namespace tidy::runtime
