#include <tidy/pipeline/manager.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace tidy::pipeline {

void Manager::register_table(std::string name, Table table) {
    spdlog::debug("manager: register '{}' ({} rows, {} columns)", name, table.rows(),
                  table.columns().size());
    tables_.insert_or_assign(std::move(name), std::move(table));
}

auto Manager::lookup(const std::string& name) const -> Result<const Table*> {
    if (auto it = tables_.find(name); it != tables_.end()) {
        return &it->second;
    }
    auto known = names();
    return make_error(ErrorKind::UnknownRegistryName,
                      fmt::format("no table named '{}' has been published (known: {})", name,
                                  format_columns(known)));
}

auto Manager::names() const -> std::vector<std::string> {
    std::vector<std::string> out;
    out.reserve(tables_.size());
    for (const auto& entry : tables_) {
        out.push_back(entry.first);
    }
    std::ranges::sort(out);
    return out;
}

void Manager::reset() {
    spdlog::debug("manager: reset ({} tables dropped)", tables_.size());
    tables_.clear();
    result_ = RunResult{};
}

}  // namespace tidy::pipeline
