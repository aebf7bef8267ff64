#pragma once

#include <tidy/core/error.hpp>
#include <tidy/core/table.hpp>

#include <algorithm>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tidy::runtime {

/// Produces a fresh table each time `data(name)` runs.
using SourceFn = std::function<Result<Table>()>;

/// Named table providers for the `data` operation.
///
/// Providers are called lazily, so a CSV source is read only when a pipeline
/// actually asks for it.
class SourceRegistry {
   public:
    SourceRegistry() = default;

    /// Register (or replace) a provider.
    void register_source(std::string name, SourceFn func) {
        sources_.insert_or_assign(std::move(name), std::move(func));
    }

    /// Register a fixed table; each load returns a copy.
    void register_table(std::string name, Table table) {
        register_source(std::move(name),
                        [table = std::move(table)]() -> Result<Table> { return table; });
    }

    [[nodiscard]] auto find(const std::string& name) const -> const SourceFn* {
        if (auto it = sources_.find(name); it != sources_.end()) {
            return &it->second;
        }
        return nullptr;
    }

    [[nodiscard]] auto contains(const std::string& name) const -> bool {
        return sources_.contains(name);
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return sources_.size(); }

    [[nodiscard]] auto names() const -> std::vector<std::string> {
        std::vector<std::string> out;
        out.reserve(sources_.size());
        for (const auto& entry : sources_) {
            out.push_back(entry.first);
        }
        std::ranges::sort(out);
        return out;
    }

   private:
    std::unordered_map<std::string, SourceFn> sources_;
};

}  // namespace tidy::runtime
