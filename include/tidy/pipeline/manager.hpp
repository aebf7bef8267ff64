#pragma once

#include <tidy/core/error.hpp>
#include <tidy/core/table.hpp>

#include <string>
#include <unordered_map>
#include <vector>

namespace tidy::pipeline {

/// Outcome of one pipeline run. `error` is empty on success; on failure the
/// table is empty and `error` holds the rendered Error.
struct RunResult {
    Table table;
    std::string error;

    [[nodiscard]] auto ok() const noexcept -> bool { return error.empty(); }
};

/// Explicit run context: named tables published by `notify`, plus the result
/// of the most recent run.
///
/// A manager starts empty and never clears itself; callers `reset()` between
/// independent run cycles. Not synchronized.
class Manager {
   public:
    Manager() = default;

    /// Insert or overwrite a named table.
    void register_table(std::string name, Table table);

    [[nodiscard]] auto lookup(const std::string& name) const -> Result<const Table*>;
    [[nodiscard]] auto contains(const std::string& name) const -> bool {
        return tables_.contains(name);
    }

    /// Registered names in lexicographic order.
    [[nodiscard]] auto names() const -> std::vector<std::string>;
    [[nodiscard]] auto size() const noexcept -> std::size_t { return tables_.size(); }

    void set_result(RunResult result) { result_ = std::move(result); }
    [[nodiscard]] auto result() const noexcept -> const RunResult& { return result_; }

    /// Drop every registered table and the last result.
    void reset();

   private:
    std::unordered_map<std::string, Table> tables_;
    RunResult result_;
};

}  // namespace tidy::pipeline
