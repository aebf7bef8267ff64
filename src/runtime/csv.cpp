#include <tidy/runtime/csv.hpp>

#include <fmt/format.h>
#include <rapidcsv.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <exception>
#include <vector>

namespace tidy::runtime {

namespace {

auto trim(std::string_view text) -> std::string_view {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

auto try_number(const std::string& text, double& out) -> bool {
    char* end_ptr = nullptr;
    out = std::strtod(text.c_str(), &end_ptr);
    return end_ptr != text.c_str() && *end_ptr == '\0';
}

auto try_logical(std::string_view text, bool& out) -> bool {
    if (text == "true") {
        out = true;
        return true;
    }
    if (text == "false") {
        out = false;
        return true;
    }
    return false;
}

auto type_column(const std::vector<std::string>& cells, const CsvReadOptions& options)
    -> std::vector<Value> {
    std::vector<bool> present(cells.size());
    bool all_number = true;
    bool all_logical = true;
    for (std::size_t i = 0; i < cells.size(); ++i) {
        present[i] = !options.null_tokens.contains(std::string(trim(cells[i])));
        if (!present[i]) {
            continue;
        }
        double d{};
        bool b{};
        all_number = all_number && try_number(std::string(trim(cells[i])), d);
        all_logical = all_logical && try_logical(trim(cells[i]), b);
    }

    std::vector<Value> values;
    values.reserve(cells.size());
    for (std::size_t i = 0; i < cells.size(); ++i) {
        if (!present[i]) {
            values.emplace_back(kMissing);
        } else if (all_number) {
            double d{};
            try_number(std::string(trim(cells[i])), d);
            values.push_back(safe_number(d));
        } else if (all_logical) {
            bool b{};
            try_logical(trim(cells[i]), b);
            values.emplace_back(b);
        } else {
            values.emplace_back(cells[i]);
        }
    }
    return values;
}

}  // namespace

auto parse_null_spec(std::string_view spec) -> CsvReadOptions {
    CsvReadOptions options;
    options.null_tokens.clear();
    std::size_t pos = 0;
    while (pos <= spec.size()) {
        std::size_t comma = spec.find(',', pos);
        if (comma == std::string_view::npos) {
            comma = spec.size();
        }
        auto token = trim(spec.substr(pos, comma - pos));
        if (token == "<empty>") {
            options.null_tokens.emplace();
        } else if (!token.empty()) {
            options.null_tokens.emplace(token);
        }
        pos = comma + 1;
    }
    return options;
}

auto read_csv(const std::string& path, const CsvReadOptions& options) -> Result<Table> {
    try {
        rapidcsv::Document doc(path, rapidcsv::LabelParams(0, -1), rapidcsv::SeparatorParams(','));

        Table table;
        for (const auto& name : doc.GetColumnNames()) {
            auto cells = doc.GetColumn<std::string>(name);
            auto added = table.add_column(name, type_column(cells, options));
            if (!added) {
                return make_error(ErrorKind::SourceError,
                                  fmt::format("{}: {}", path, added.error().message));
            }
        }
        spdlog::debug("csv: read {} rows x {} columns from {}", table.rows(),
                      table.columns().size(), path);
        return table;
    } catch (const std::exception& e) {
        return make_error(ErrorKind::SourceError,
                          fmt::format("cannot read CSV '{}': {}", path, e.what()));
    }
}

}  // namespace tidy::runtime
