// include/trade_journal/data/conversion_utils.hpp
#pragma once

#include <arrow/api.h>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "trade_journal/core/error.hpp"
#include "trade_journal/core/types.hpp"

namespace trade_journal {

/**
 * @brief CSV contents loaded into Arrow with every column as a string
 *
 * Column lookup ignores case and surrounding whitespace in header names.
 */
class StringTable {
public:
    StringTable() = default;
    explicit StringTable(std::shared_ptr<arrow::Table> table);

    int64_t num_rows() const;
    std::vector<std::string> column_names() const;
    bool has_column(const std::string& name) const;

    /**
     * @brief Cell text, or nullopt when the column does not exist
     */
    std::optional<std::string> get(const std::string& column, int64_t row) const;

private:
    std::shared_ptr<arrow::Table> table_;
    std::unordered_map<std::string, std::shared_ptr<arrow::StringArray>> columns_;
};

class DataConversionUtils {
public:
    /**
     * @brief Parse CSV text with a header row
     *
     * Column types are not inferred: every cell stays text so that broker
     * formatting ("$1,234.50", "@12.10") reaches the row parser unchanged.
     *
     * @param csv_text Raw CSV including the header line
     * @return Table or CSV_PARSE_ERROR
     */
    static Result<StringTable> read_csv_as_strings(const std::string& csv_text);

    /**
     * @brief Extract string value from Arrow array
     * @param array Arrow array containing strings
     * @param index Row index
     * @return Result containing string value
     */
    static Result<std::string> extract_string(const std::shared_ptr<arrow::Array>& array,
                                              int64_t index);

    /**
     * @brief Parse a broker number, ignoring "$", "," and a leading "@"
     * @return Parsed value or CONVERSION_ERROR
     */
    static Result<double> parse_number(const std::string& text);

    static std::string trim(const std::string& text);
    static std::string to_lower(const std::string& text);
};

}  // namespace trade_journal
