#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "tabsync/errors.hpp"

namespace tabsync {

struct ParquetSchemaElement {
    std::string name;
    int32_t type{-1};        // physical type, -1 for groups
    int32_t numChildren{0};  // 0 for leaves
};

struct ParquetColumnChunk {
    bool hasMetadata{false};
    std::string filePath;    // set when the chunk lives in another file
    int64_t dataPageOffset{0};
    int64_t dictionaryPageOffset{0};
    int64_t totalCompressedSize{0};
    int64_t numValues{0};
};

struct ParquetRowGroup {
    std::vector<ParquetColumnChunk> columns;
    int64_t totalByteSize{0};
    int64_t numRows{0};
};

struct ParquetFooter {
    uint64_t fileSize{0};
    uint32_t metadataLength{0};
    int32_t version{0};
    int64_t numRows{0};
    std::vector<ParquetSchemaElement> schema;
    std::vector<ParquetRowGroup> rowGroups;
    std::string createdBy;
    size_t leafColumns{0};
};

constexpr size_t kParquetMagicSize = 4;
// Leading magic + 4-byte metadata length + trailing magic.
constexpr size_t kParquetMinFileSize = 12;
// Larger footer lengths are treated as corruption rather than allocated.
constexpr uint32_t kParquetMaxMetadataLength = 64u * 1024 * 1024;

// Decode a Thrift-compact FileMetaData blob (without length or magic) and check
// that it describes a well-formed table whose data region ends at dataEnd.
bool parseParquetMetadata(const std::string& blob, uint64_t dataEnd, ParquetFooter& out, ErrorInfo& err);

// Read and check the footer of the Parquet file at path. Structural problems
// are reported as Integrity/CorruptFile, failures to read as Filesystem errors.
bool readParquetFooter(const std::string& path, ParquetFooter& out, ErrorInfo& err);

} // namespace tabsync
