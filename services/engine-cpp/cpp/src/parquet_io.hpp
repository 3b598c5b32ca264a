/**
 * @file parquet_io.hpp
 * @brief Column-level helpers for reading and writing Parquet tables.
 *
 * Errors surface as exceptions (parquet::ParquetException from Arrow
 * statuses, RoutingError for schema problems); callers at the persistence
 * boundary catch them and report failure.
 */

#pragma once

#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>
#include <parquet/exception.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "routing_types.hpp"

namespace ch_routing::parquet_io {

/**
 * @brief Write a table to a Snappy-compressed Parquet file.
 */
void write_table(const std::string& path, const std::shared_ptr<arrow::Table>& table);

/**
 * @brief Read a whole Parquet file into memory.
 */
std::shared_ptr<arrow::Table> read_table(const std::string& path);

/**
 * @brief Column by name, or RoutingError(Io) if absent.
 */
std::shared_ptr<arrow::ChunkedArray> require_column(const arrow::Table& table, const std::string& name);

/**
 * @brief Build an Arrow array from plain values.
 */
template <typename BuilderT, typename T>
std::shared_ptr<arrow::Array> build_array(const std::vector<T>& values) {
    BuilderT builder;
    PARQUET_THROW_NOT_OK(builder.Reserve(static_cast<int64_t>(values.size())));
    for (const auto& v : values) {
        PARQUET_THROW_NOT_OK(builder.Append(v));
    }
    std::shared_ptr<arrow::Array> array;
    PARQUET_THROW_NOT_OK(builder.Finish(&array));
    return array;
}

/**
 * @brief Build a nullable double array.
 */
std::shared_ptr<arrow::Array> build_optional_doubles(const std::vector<std::optional<double>>& values);

/**
 * @brief Flatten a column (all chunks) into plain values.
 * @throws RoutingError if the column is missing, has the wrong type or nulls
 */
template <typename ArrayT, typename T>
std::vector<T> column_values(const arrow::Table& table, const std::string& name) {
    auto column = require_column(table, name);
    if (column->type()->id() != ArrayT::TypeClass::type_id) {
        throw RoutingError(ErrorCode::Io, "Column '" + name + "' has type " + column->type()->ToString());
    }

    std::vector<T> out;
    out.reserve(static_cast<size_t>(column->length()));
    for (int chunk = 0; chunk < column->num_chunks(); ++chunk) {
        auto array = std::static_pointer_cast<ArrayT>(column->chunk(chunk));
        for (int64_t i = 0; i < array->length(); ++i) {
            if (array->IsNull(i)) {
                throw RoutingError(ErrorCode::Io, "Column '" + name + "' contains nulls");
            }
            out.push_back(static_cast<T>(array->Value(i)));
        }
    }
    return out;
}

/**
 * @brief Flatten a nullable double column.
 */
std::vector<std::optional<double>> optional_double_values(const arrow::Table& table, const std::string& name);

}  // namespace ch_routing::parquet_io
