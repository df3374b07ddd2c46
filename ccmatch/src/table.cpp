#include <ccmatch/table.hpp>
#include <ccmatch/errors.hpp>
#include <algorithm>
#include <sstream>

namespace ccmatch {

Table::Table(std::vector<std::string> columns) {
    for (auto& name : columns) {
        add_column(name);
    }
}

std::size_t Table::add_column(const std::string& name, const Value& fill) {
    if (has_column(name)) {
        throw ConfigurationError("duplicate column '" + name + "'", std::string(), name);
    }

    std::size_t index = columns_.size();
    columns_.push_back(name);
    column_lookup_.emplace(name, index);

    for (auto& row : rows_) {
        row.push_back(fill);
    }
    return index;
}

void Table::add_row(Row row) {
    if (row.size() != columns_.size()) {
        throw ConfigurationError("row has " + std::to_string(row.size()) +
                                 " values but the table has " +
                                 std::to_string(columns_.size()) + " columns");
    }
    rows_.push_back(std::move(row));
}

std::optional<std::size_t> Table::find_column(const std::string& name) const {
    auto it = column_lookup_.find(name);
    if (it == column_lookup_.end()) return std::nullopt;
    return it->second;
}

std::size_t Table::column_index(const std::string& name) const {
    auto it = column_lookup_.find(name);
    if (it == column_lookup_.end()) {
        throw ConfigurationError("no column named '" + name + "'", std::string(), name);
    }
    return it->second;
}

std::string Table::to_string(std::size_t max_rows) const {
    std::size_t shown = std::min(max_rows, rows_.size());

    std::vector<std::size_t> widths(columns_.size());
    for (std::size_t c = 0; c < columns_.size(); ++c) {
        widths[c] = columns_[c].size();
        for (std::size_t r = 0; r < shown; ++r) {
            widths[c] = std::max(widths[c], rows_[r][c].to_string().size());
        }
    }

    std::ostringstream oss;
    auto pad = [&oss](const std::string& text, std::size_t width) {
        oss << text << std::string(width - text.size() + 2, ' ');
    };

    for (std::size_t c = 0; c < columns_.size(); ++c) {
        pad(columns_[c], widths[c]);
    }
    oss << "\n";

    for (std::size_t r = 0; r < shown; ++r) {
        for (std::size_t c = 0; c < columns_.size(); ++c) {
            pad(rows_[r][c].to_string(), widths[c]);
        }
        oss << "\n";
    }

    if (shown < rows_.size()) {
        oss << "... " << (rows_.size() - shown) << " more rows\n";
    }
    return oss.str();
}

} // namespace ccmatch
