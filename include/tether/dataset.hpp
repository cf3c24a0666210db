#pragma once

#include "types.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tether
{

    /**
     * In-memory table: a header plus rows of string cells. An empty cell is a
     * missing value. Copying a Dataset copies every cell, so stages that take
     * one by value can never reach back into the caller's table.
     */
    class Dataset
    {
    public:
        using Row = std::vector<std::string>;

        Dataset() = default;

        /** Build a dataset, rejecting duplicate column names and ragged rows */
        static Result<Dataset> create(std::vector<std::string> columns, std::vector<Row> rows = {});

        static Result<Dataset> from_csv(std::string_view text);
        static Result<Dataset> read_csv(const std::filesystem::path &path);

        std::string to_csv() const;
        Result<void> write_csv(const std::filesystem::path &path) const;

        const std::vector<std::string> &columns() const { return columns_; }
        const std::vector<Row> &rows() const { return rows_; }
        std::size_t column_count() const { return columns_.size(); }
        std::size_t row_count() const { return rows_.size(); }

        std::optional<std::size_t> column_index(std::string_view name) const;
        bool has_column(std::string_view name) const { return column_index(name).has_value(); }

        /** Values of one column, top to bottom */
        std::vector<std::string> column_values(std::size_t index) const;

        /** Replace one column's values; the vector must have row_count() entries */
        Result<void> set_column_values(std::size_t index, std::vector<std::string> values);

        /** Remove the named columns; names that are not present are ignored */
        void drop_columns(const std::vector<std::string> &names);

        bool operator==(const Dataset &other) const = default;

    private:
        std::vector<std::string> columns_;
        std::vector<Row> rows_;
    };

    /** Parse a cell as a finite double; empty or non-numeric text gives nullopt */
    std::optional<double> parse_number(std::string_view cell);

} // namespace tether
