#ifndef CCMATCH_TABLE_HPP
#define CCMATCH_TABLE_HPP

#include <ccmatch/value.hpp>
#include <initializer_list>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ccmatch {

using Row = std::vector<Value>;

/**
 * Row-oriented table with a named column schema.
 * Stands in for the data frames the matching engine consumes and produces.
 */
class Table {
private:
    std::vector<std::string> columns_;
    std::unordered_map<std::string, std::size_t> column_lookup_;
    std::vector<Row> rows_;

public:
    Table() = default;
    explicit Table(std::vector<std::string> columns);
    Table(std::initializer_list<std::string> columns)
        : Table(std::vector<std::string>(columns)) {}

    /**
     * Append a column, filling existing rows with `fill`.
     * Returns the new column index; a duplicate name is a ConfigurationError.
     */
    std::size_t add_column(const std::string& name, const Value& fill = Value());

    // Row width must equal num_columns()
    void add_row(Row row);

    void reserve(std::size_t rows) { rows_.reserve(rows); }

    bool has_column(const std::string& name) const {
        return column_lookup_.count(name) != 0;
    }

    std::optional<std::size_t> find_column(const std::string& name) const;

    // Throws ConfigurationError naming the column
    std::size_t column_index(const std::string& name) const;

    const Value& at(std::size_t row, std::size_t column) const { return rows_[row][column]; }
    Value& at(std::size_t row, std::size_t column) { return rows_[row][column]; }

    const Value& get(std::size_t row, const std::string& column) const {
        return rows_[row][column_index(column)];
    }

    const Row& row(std::size_t index) const { return rows_[index]; }
    const std::vector<Row>& rows() const { return rows_; }

    const std::vector<std::string>& columns() const { return columns_; }
    std::size_t num_columns() const { return columns_.size(); }
    std::size_t num_rows() const { return rows_.size(); }
    bool empty() const { return rows_.empty(); }

    // Whitespace-aligned rendering for logs and examples
    std::string to_string(std::size_t max_rows = 50) const;

    bool operator==(const Table& other) const {
        return columns_ == other.columns_ && rows_ == other.rows_;
    }
    bool operator!=(const Table& other) const { return !(*this == other); }
};

} // namespace ccmatch

#endif // CCMATCH_TABLE_HPP
