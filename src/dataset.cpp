#include "tether/dataset.hpp"
#include <charconv>
#include <cmath>
#include <fstream>
#include <sstream>
#include <unordered_set>

namespace tether
{
    namespace
    {
        std::string trim_unquoted(const std::string &value)
        {
            auto start = value.find_first_not_of(" \t");
            if (start == std::string::npos)
                return "";
            auto end = value.find_last_not_of(" \t");
            return value.substr(start, end - start + 1);
        }

        bool needs_quoting(const std::string &cell)
        {
            if (cell.find_first_of(",\"\r\n") != std::string::npos)
                return true;
            // unquoted fields lose surrounding blanks on read
            auto blank = [](char c)
            { return c == ' ' || c == '\t'; };
            return !cell.empty() && (blank(cell.front()) || blank(cell.back()));
        }

        void write_cell(std::ostringstream &out, const std::string &cell)
        {
            if (!needs_quoting(cell))
            {
                out << cell;
                return;
            }
            out << '"';
            for (char c : cell)
            {
                if (c == '"')
                    out << '"';
                out << c;
            }
            out << '"';
        }

        // RFC 4180 records; quoted fields may span lines
        Result<std::vector<Dataset::Row>> parse_records(std::string_view text)
        {
            std::vector<Dataset::Row> records;
            Dataset::Row row;
            std::string field;
            bool in_quotes = false;
            bool field_quoted = false;
            bool row_has_data = false;
            std::size_t line = 1;

            auto push_field = [&]()
            {
                row.push_back(field_quoted ? field : trim_unquoted(field));
                field.clear();
                field_quoted = false;
            };
            auto push_row = [&]()
            {
                push_field();
                if (row_has_data || row.size() > 1 || !row.front().empty())
                    records.push_back(std::move(row));
                row.clear();
                row_has_data = false;
            };

            for (std::size_t i = 0; i < text.size(); ++i)
            {
                char c = text[i];
                if (in_quotes)
                {
                    if (c == '"')
                    {
                        if (i + 1 < text.size() && text[i + 1] == '"')
                        {
                            field.push_back('"');
                            ++i;
                        }
                        else
                        {
                            in_quotes = false;
                        }
                    }
                    else
                    {
                        if (c == '\n')
                            ++line;
                        field.push_back(c);
                    }
                    continue;
                }

                switch (c)
                {
                case '"':
                    if (!trim_unquoted(field).empty())
                    {
                        return std::unexpected(TetherError::parsing(std::format(
                            "CSV line {}: unexpected quote inside unquoted field", line)));
                    }
                    field.clear();
                    in_quotes = true;
                    field_quoted = true;
                    row_has_data = true;
                    break;
                case ',':
                    push_field();
                    row_has_data = true;
                    break;
                case '\r':
                    break;
                case '\n':
                    push_row();
                    ++line;
                    break;
                default:
                    field.push_back(c);
                    break;
                }
            }

            if (in_quotes)
            {
                return std::unexpected(TetherError::parsing(std::format(
                    "CSV line {}: unterminated quoted field", line)));
            }
            if (!field.empty() || field_quoted || !row.empty())
                push_row();
            return records;
        }
    }

    Result<Dataset> Dataset::create(std::vector<std::string> columns, std::vector<Row> rows)
    {
        std::unordered_set<std::string> seen;
        for (const auto &name : columns)
        {
            if (!seen.insert(name).second)
                return std::unexpected(TetherError::invalid_input("Duplicate column name: " + name));
        }
        for (std::size_t r = 0; r < rows.size(); ++r)
        {
            if (rows[r].size() != columns.size())
            {
                return std::unexpected(TetherError::invalid_input(std::format(
                    "Row {} has {} cells, expected {}", r, rows[r].size(), columns.size())));
            }
        }
        Dataset ds;
        ds.columns_ = std::move(columns);
        ds.rows_ = std::move(rows);
        return ds;
    }

    Result<Dataset> Dataset::from_csv(std::string_view text)
    {
        if (text.starts_with("\xEF\xBB\xBF"))
            text.remove_prefix(3);

        auto records = parse_records(text);
        if (!records)
            return std::unexpected(records.error());
        if (records->empty())
            return std::unexpected(TetherError::parsing("CSV input has no header row"));

        auto header = std::move(records->front());
        std::vector<Row> rows(std::make_move_iterator(records->begin() + 1),
                              std::make_move_iterator(records->end()));
        return create(std::move(header), std::move(rows));
    }

    Result<Dataset> Dataset::read_csv(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open())
            return std::unexpected(TetherError::io("Unable to open dataset: " + path.string()));
        std::stringstream buffer;
        buffer << in.rdbuf();
        return from_csv(buffer.str());
    }

    std::string Dataset::to_csv() const
    {
        std::ostringstream out;
        auto write_row = [&](const Row &row)
        {
            for (std::size_t i = 0; i < row.size(); ++i)
            {
                if (i > 0)
                    out << ',';
                write_cell(out, row[i]);
            }
            out << '\n';
        };
        write_row(columns_);
        for (const auto &row : rows_)
            write_row(row);
        return out.str();
    }

    Result<void> Dataset::write_csv(const std::filesystem::path &path) const
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
            return std::unexpected(TetherError::io("Unable to write dataset: " + path.string()));
        out << to_csv();
        out.flush();
        if (!out)
            return std::unexpected(TetherError::io("Write failed for dataset: " + path.string()));
        return {};
    }

    std::optional<std::size_t> Dataset::column_index(std::string_view name) const
    {
        for (std::size_t i = 0; i < columns_.size(); ++i)
        {
            if (columns_[i] == name)
                return i;
        }
        return std::nullopt;
    }

    std::vector<std::string> Dataset::column_values(std::size_t index) const
    {
        std::vector<std::string> values;
        values.reserve(rows_.size());
        for (const auto &row : rows_)
            values.push_back(row.at(index));
        return values;
    }

    Result<void> Dataset::set_column_values(std::size_t index, std::vector<std::string> values)
    {
        if (index >= columns_.size())
            return std::unexpected(TetherError::invalid_input(std::format("Column index {} out of range", index)));
        if (values.size() != rows_.size())
        {
            return std::unexpected(TetherError::invalid_input(std::format(
                "Column {} expects {} values, got {}", columns_[index], rows_.size(), values.size())));
        }
        for (std::size_t r = 0; r < rows_.size(); ++r)
            rows_[r][index] = std::move(values[r]);
        return {};
    }

    void Dataset::drop_columns(const std::vector<std::string> &names)
    {
        std::unordered_set<std::string> drop(names.begin(), names.end());
        std::vector<bool> keep(columns_.size());
        std::vector<std::string> kept_columns;
        for (std::size_t i = 0; i < columns_.size(); ++i)
        {
            keep[i] = !drop.contains(columns_[i]);
            if (keep[i])
                kept_columns.push_back(columns_[i]);
        }
        for (auto &row : rows_)
        {
            Row kept;
            kept.reserve(kept_columns.size());
            for (std::size_t i = 0; i < row.size(); ++i)
            {
                if (keep[i])
                    kept.push_back(std::move(row[i]));
            }
            row = std::move(kept);
        }
        columns_ = std::move(kept_columns);
    }

    std::optional<double> parse_number(std::string_view cell)
    {
        while (!cell.empty() && (cell.front() == ' ' || cell.front() == '\t'))
            cell.remove_prefix(1);
        while (!cell.empty() && (cell.back() == ' ' || cell.back() == '\t'))
            cell.remove_suffix(1);
        if (cell.empty())
            return std::nullopt;
        if (cell.front() == '+')
            cell.remove_prefix(1);

        double value = 0.0;
        auto [ptr, ec] = std::from_chars(cell.data(), cell.data() + cell.size(), value);
        if (ec != std::errc{} || ptr != cell.data() + cell.size() || !std::isfinite(value))
            return std::nullopt;
        return value;
    }

} // namespace tether
