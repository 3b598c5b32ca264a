/**
 * @file parquet_io.cpp
 * @brief Parquet table reading and writing.
 */

#include "parquet_io.hpp"

namespace ch_routing::parquet_io {

void write_table(const std::string& path, const std::shared_ptr<arrow::Table>& table) {
    std::shared_ptr<arrow::io::FileOutputStream> outfile;
    PARQUET_ASSIGN_OR_THROW(outfile, arrow::io::FileOutputStream::Open(path));

    std::shared_ptr<parquet::WriterProperties> props =
        parquet::WriterProperties::Builder().compression(parquet::Compression::SNAPPY)->build();

    PARQUET_THROW_NOT_OK(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile,
                                                    64 * 1024, props));
    PARQUET_THROW_NOT_OK(outfile->Close());
}

std::shared_ptr<arrow::Table> read_table(const std::string& path) {
    arrow::MemoryPool* pool = arrow::default_memory_pool();

    std::shared_ptr<arrow::io::ReadableFile> infile;
    PARQUET_ASSIGN_OR_THROW(infile, arrow::io::ReadableFile::Open(path, pool));

    std::unique_ptr<parquet::arrow::FileReader> reader;
    PARQUET_THROW_NOT_OK(parquet::arrow::OpenFile(infile, pool, &reader));

    std::shared_ptr<arrow::Table> table;
    PARQUET_THROW_NOT_OK(reader->ReadTable(&table));
    return table;
}

std::shared_ptr<arrow::ChunkedArray> require_column(const arrow::Table& table, const std::string& name) {
    auto column = table.GetColumnByName(name);
    if (!column) {
        throw RoutingError(ErrorCode::Io, "Missing column '" + name + "'");
    }
    return column;
}

std::shared_ptr<arrow::Array> build_optional_doubles(const std::vector<std::optional<double>>& values) {
    arrow::DoubleBuilder builder;
    PARQUET_THROW_NOT_OK(builder.Reserve(static_cast<int64_t>(values.size())));
    for (const auto& v : values) {
        if (v) {
            PARQUET_THROW_NOT_OK(builder.Append(*v));
        } else {
            PARQUET_THROW_NOT_OK(builder.AppendNull());
        }
    }
    std::shared_ptr<arrow::Array> array;
    PARQUET_THROW_NOT_OK(builder.Finish(&array));
    return array;
}

std::vector<std::optional<double>> optional_double_values(const arrow::Table& table, const std::string& name) {
    auto column = require_column(table, name);
    if (column->type()->id() != arrow::Type::DOUBLE) {
        throw RoutingError(ErrorCode::Io, "Column '" + name + "' has type " + column->type()->ToString());
    }

    std::vector<std::optional<double>> out;
    out.reserve(static_cast<size_t>(column->length()));
    for (int chunk = 0; chunk < column->num_chunks(); ++chunk) {
        auto array = std::static_pointer_cast<arrow::DoubleArray>(column->chunk(chunk));
        for (int64_t i = 0; i < array->length(); ++i) {
            if (array->IsNull(i)) {
                out.push_back(std::nullopt);
            } else {
                out.push_back(array->Value(i));
            }
        }
    }
    return out;
}

}  // namespace ch_routing::parquet_io
