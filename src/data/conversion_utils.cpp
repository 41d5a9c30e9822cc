// src/data/conversion_utils.cpp
#include "trade_journal/data/conversion_utils.hpp"
#include <arrow/csv/api.h>
#include <arrow/io/api.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace trade_journal {

namespace {

std::string column_key(const std::string& name) {
    return DataConversionUtils::to_lower(DataConversionUtils::trim(name));
}

arrow::Result<std::shared_ptr<arrow::Table>> read_table(
    const std::string& csv_text, const arrow::csv::ConvertOptions& convert_options) {
    auto input = std::make_shared<arrow::io::BufferReader>(arrow::Buffer::FromString(csv_text));
    auto read_options = arrow::csv::ReadOptions::Defaults();
    auto parse_options = arrow::csv::ParseOptions::Defaults();
    parse_options.ignore_empty_lines = true;

    ARROW_ASSIGN_OR_RAISE(auto reader, arrow::csv::TableReader::Make(arrow::io::default_io_context(),
                                                                     input, read_options,
                                                                     parse_options, convert_options));
    ARROW_ASSIGN_OR_RAISE(auto table, reader->Read());
    return table->CombineChunks(arrow::default_memory_pool());
}

}  // namespace

// ========== StringTable ==========

StringTable::StringTable(std::shared_ptr<arrow::Table> table) : table_(std::move(table)) {
    if (!table_) {
        return;
    }
    for (int i = 0; i < table_->num_columns(); ++i) {
        auto column = table_->column(i);
        if (column->num_chunks() == 0) {
            continue;
        }
        auto strings = std::dynamic_pointer_cast<arrow::StringArray>(column->chunk(0));
        if (strings) {
            columns_.emplace(column_key(table_->field(i)->name()), strings);
        }
    }
}

int64_t StringTable::num_rows() const {
    return table_ ? table_->num_rows() : 0;
}

std::vector<std::string> StringTable::column_names() const {
    std::vector<std::string> names;
    if (table_) {
        for (const auto& field : table_->schema()->fields()) {
            names.push_back(DataConversionUtils::trim(field->name()));
        }
    }
    return names;
}

bool StringTable::has_column(const std::string& name) const {
    if (!table_) {
        return false;
    }
    const std::string key = column_key(name);
    for (const auto& field : table_->schema()->fields()) {
        if (column_key(field->name()) == key) {
            return true;
        }
    }
    return false;
}

std::optional<std::string> StringTable::get(const std::string& column, int64_t row) const {
    if (!has_column(column)) {
        return std::nullopt;
    }
    auto it = columns_.find(column_key(column));
    if (it == columns_.end()) {
        // Column exists but the table has no rows
        return std::string();
    }
    auto value = DataConversionUtils::extract_string(it->second, row);
    if (value.is_error()) {
        return std::string();
    }
    return DataConversionUtils::trim(value.value());
}

// ========== DataConversionUtils ==========

Result<StringTable> DataConversionUtils::read_csv_as_strings(const std::string& csv_text) {
    if (trim(csv_text).empty()) {
        return make_error<StringTable>(ErrorCode::CSV_PARSE_ERROR, "CSV input is empty",
                                       "DataConversionUtils");
    }

    try {
        // The header line alone gives the column names; the full read forces them to utf8
        const std::string body = csv_text.substr(csv_text.find_first_not_of(" \t\r\n"));
        const std::string header_line = body.substr(0, body.find('\n'));
        auto header_pass = read_table(header_line + "\n", arrow::csv::ConvertOptions::Defaults());
        if (!header_pass.ok()) {
            return make_error<StringTable>(ErrorCode::CSV_PARSE_ERROR,
                                           "Failed to parse CSV: " + header_pass.status().ToString(),
                                           "DataConversionUtils");
        }

        auto convert_options = arrow::csv::ConvertOptions::Defaults();
        convert_options.strings_can_be_null = false;
        convert_options.quoted_strings_can_be_null = false;
        for (const auto& name : (*header_pass)->ColumnNames()) {
            convert_options.column_types[name] = arrow::utf8();
        }

        auto table = read_table(body, convert_options);
        if (!table.ok()) {
            return make_error<StringTable>(ErrorCode::CSV_PARSE_ERROR,
                                           "Failed to parse CSV: " + table.status().ToString(),
                                           "DataConversionUtils");
        }
        return Result<StringTable>(StringTable(*table));

    } catch (const std::exception& e) {
        return make_error<StringTable>(ErrorCode::CSV_PARSE_ERROR,
                                       std::string("Error reading CSV: ") + e.what(),
                                       "DataConversionUtils");
    }
}

Result<std::string> DataConversionUtils::extract_string(const std::shared_ptr<arrow::Array>& array,
                                                        int64_t index) {
    if (!array || index < 0 || index >= array->length()) {
        return make_error<std::string>(ErrorCode::INVALID_ARGUMENT, "Invalid array or index",
                                       "DataConversionUtils");
    }

    auto string_array = std::dynamic_pointer_cast<arrow::StringArray>(array);
    if (!string_array) {
        return make_error<std::string>(ErrorCode::CONVERSION_ERROR,
                                       "Failed to cast to string array", "DataConversionUtils");
    }

    if (string_array->IsNull(index)) {
        return Result<std::string>(std::string());
    }

    return Result<std::string>(string_array->GetString(index));
}

Result<double> DataConversionUtils::parse_number(const std::string& text) {
    std::string cleaned;
    for (char c : trim(text)) {
        if (c != '$' && c != ',') {
            cleaned.push_back(c);
        }
    }
    if (!cleaned.empty() && cleaned.front() == '@') {
        cleaned.erase(0, 1);
    }
    cleaned = trim(cleaned);

    if (cleaned.empty()) {
        return make_error<double>(ErrorCode::CONVERSION_ERROR, "Empty numeric value",
                                  "DataConversionUtils");
    }

    char* end = nullptr;
    const double value = std::strtod(cleaned.c_str(), &end);
    if (end == cleaned.c_str() || *end != '\0' || !std::isfinite(value)) {
        return make_error<double>(ErrorCode::CONVERSION_ERROR, "Invalid numeric value: " + text,
                                  "DataConversionUtils");
    }
    return Result<double>(value);
}

std::string DataConversionUtils::trim(const std::string& text) {
    const auto first = std::find_if_not(text.begin(), text.end(),
                                        [](unsigned char c) { return std::isspace(c); });
    const auto last = std::find_if_not(text.rbegin(), text.rend(),
                                       [](unsigned char c) { return std::isspace(c); })
                          .base();
    return first < last ? std::string(first, last) : std::string();
}

std::string DataConversionUtils::to_lower(const std::string& text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

}  // namespace trade_journal
