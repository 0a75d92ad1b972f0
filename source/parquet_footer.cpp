#include "tabsync/parquet_footer.hpp"
#include "tabsync/raii.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <limits>
#include <sys/stat.h>
#include <unistd.h>

namespace tabsync {

namespace {

const char kMagic[] = "PAR1";

// Thrift compact protocol type ids.
enum CompactType : uint8_t {
    CT_STOP = 0,
    CT_TRUE = 1,
    CT_FALSE = 2,
    CT_BYTE = 3,
    CT_I16 = 4,
    CT_I32 = 5,
    CT_I64 = 6,
    CT_DOUBLE = 7,
    CT_BINARY = 8,
    CT_LIST = 9,
    CT_SET = 10,
    CT_MAP = 11,
    CT_STRUCT = 12
};

constexpr int kMaxNesting = 32;

class CompactReader {
public:
    explicit CompactReader(const std::string& buf) : buf_(buf) {}

    bool readByte(uint8_t& out) {
        if (pos_ >= buf_.size()) return fail("unexpected end of metadata");
        out = static_cast<uint8_t>(buf_[pos_++]);
        return true;
    }

    bool skip(uint64_t n) {
        if (n > buf_.size() - pos_) return fail("unexpected end of metadata");
        pos_ += static_cast<size_t>(n);
        return true;
    }

    bool readVarint(uint64_t& out) {
        out = 0;
        int shift = 0;
        for (int i = 0; i < 10; ++i) {
            uint8_t b = 0;
            if (!readByte(b)) return false;
            out |= static_cast<uint64_t>(b & 0x7F) << shift;
            if ((b & 0x80) == 0) return true;
            shift += 7;
        }
        return fail("varint too long");
    }

    bool readI64(int64_t& out) {
        uint64_t raw = 0;
        if (!readVarint(raw)) return false;
        out = static_cast<int64_t>((raw >> 1) ^ (~(raw & 1) + 1));
        return true;
    }

    bool readI32(int32_t& out) {
        int64_t v = 0;
        if (!readI64(v)) return false;
        if (v < std::numeric_limits<int32_t>::min() || v > std::numeric_limits<int32_t>::max()) {
            return fail("i32 out of range");
        }
        out = static_cast<int32_t>(v);
        return true;
    }

    bool readBinary(std::string& out) {
        uint64_t len = 0;
        if (!readVarint(len)) return false;
        if (len > buf_.size() - pos_) return fail("string runs past end of metadata");
        out.assign(buf_, pos_, static_cast<size_t>(len));
        pos_ += static_cast<size_t>(len);
        return true;
    }

    // Returns false on error; type CT_STOP marks the end of the struct.
    bool readFieldHeader(int16_t& lastId, int16_t& id, uint8_t& type) {
        uint8_t b = 0;
        if (!readByte(b)) return false;
        type = static_cast<uint8_t>(b & 0x0F);
        if (type == CT_STOP) {
            id = 0;
            return true;
        }
        uint8_t delta = static_cast<uint8_t>(b >> 4);
        if (delta == 0) {
            int32_t full = 0;
            if (!readI32(full)) return false;
            id = static_cast<int16_t>(full);
        } else {
            id = static_cast<int16_t>(lastId + delta);
        }
        lastId = id;
        return true;
    }

    bool readListHeader(uint64_t& size, uint8_t& elemType) {
        uint8_t b = 0;
        if (!readByte(b)) return false;
        elemType = static_cast<uint8_t>(b & 0x0F);
        size = b >> 4;
        if (size == 15 && !readVarint(size)) return false;
        // Every element takes at least one byte, except booleans packed in a list.
        if (elemType != CT_TRUE && elemType != CT_FALSE && size > buf_.size() - pos_) {
            return fail("list longer than metadata");
        }
        return true;
    }

    bool skipValue(uint8_t type, int depth) {
        if (depth > kMaxNesting) return fail("metadata nested too deeply");
        switch (type) {
        case CT_TRUE:
        case CT_FALSE:
            return true;
        case CT_BYTE:
            return skip(1);
        case CT_I16:
        case CT_I32:
        case CT_I64: {
            uint64_t v = 0;
            return readVarint(v);
        }
        case CT_DOUBLE:
            return skip(8);
        case CT_BINARY: {
            uint64_t len = 0;
            return readVarint(len) && skip(len);
        }
        case CT_LIST:
        case CT_SET: {
            uint64_t n = 0;
            uint8_t elem = CT_STOP;
            if (!readListHeader(n, elem)) return false;
            for (uint64_t i = 0; i < n; ++i) {
                // Booleans inside containers take a full byte.
                if ((elem == CT_TRUE || elem == CT_FALSE) ? !skip(1) : !skipValue(elem, depth + 1)) return false;
            }
            return true;
        }
        case CT_MAP: {
            uint64_t n = 0;
            if (!readVarint(n)) return false;
            if (n == 0) return true;
            uint8_t kv = 0;
            if (!readByte(kv)) return false;
            for (uint64_t i = 0; i < n; ++i) {
                if (!skipValue(static_cast<uint8_t>(kv >> 4), depth + 1) ||
                    !skipValue(static_cast<uint8_t>(kv & 0x0F), depth + 1)) {
                    return false;
                }
            }
            return true;
        }
        case CT_STRUCT: {
            int16_t last = 0;
            while (true) {
                int16_t id = 0;
                uint8_t t = CT_STOP;
                if (!readFieldHeader(last, id, t)) return false;
                if (t == CT_STOP) return true;
                if (!skipValue(t, depth + 1)) return false;
            }
        }
        default:
            return fail("unknown compact type " + std::to_string(type));
        }
    }

    bool fail(const std::string& msg) {
        if (error_.empty()) error_ = msg + " at offset " + std::to_string(pos_);
        return false;
    }

    bool expect(uint8_t actual, uint8_t wanted, const char* field) {
        if (actual == wanted) return true;
        return fail(std::string("unexpected type for ") + field);
    }

    size_t pos() const { return pos_; }
    const std::string& error() const { return error_; }

private:
    const std::string& buf_;
    size_t pos_{0};
    std::string error_;
};

bool readSchemaElement(CompactReader& r, ParquetSchemaElement& el) {
    int16_t last = 0;
    while (true) {
        int16_t id = 0;
        uint8_t t = CT_STOP;
        if (!r.readFieldHeader(last, id, t)) return false;
        if (t == CT_STOP) return true;
        if (id == 1 && t == CT_I32) {
            if (!r.readI32(el.type)) return false;
        } else if (id == 4) {
            if (!r.expect(t, CT_BINARY, "SchemaElement.name") || !r.readBinary(el.name)) return false;
        } else if (id == 5 && t == CT_I32) {
            if (!r.readI32(el.numChildren)) return false;
        } else if (!r.skipValue(t, 2)) {
            return false;
        }
    }
}

bool readColumnMetaData(CompactReader& r, ParquetColumnChunk& cc) {
    int16_t last = 0;
    while (true) {
        int16_t id = 0;
        uint8_t t = CT_STOP;
        if (!r.readFieldHeader(last, id, t)) return false;
        if (t == CT_STOP) return true;
        int64_t* target = nullptr;
        switch (id) {
        case 5: target = &cc.numValues; break;
        case 7: target = &cc.totalCompressedSize; break;
        case 9: target = &cc.dataPageOffset; break;
        case 11: target = &cc.dictionaryPageOffset; break;
        default: break;
        }
        if (target) {
            if (!r.expect(t, CT_I64, "ColumnMetaData offset") || !r.readI64(*target)) return false;
        } else if (!r.skipValue(t, 4)) {
            return false;
        }
    }
}

bool readColumnChunk(CompactReader& r, ParquetColumnChunk& cc) {
    int16_t last = 0;
    while (true) {
        int16_t id = 0;
        uint8_t t = CT_STOP;
        if (!r.readFieldHeader(last, id, t)) return false;
        if (t == CT_STOP) return true;
        if (id == 1 && t == CT_BINARY) {
            if (!r.readBinary(cc.filePath)) return false;
        } else if (id == 3) {
            if (!r.expect(t, CT_STRUCT, "ColumnChunk.meta_data") || !readColumnMetaData(r, cc)) return false;
            cc.hasMetadata = true;
        } else if (!r.skipValue(t, 3)) {
            return false;
        }
    }
}

bool readRowGroup(CompactReader& r, ParquetRowGroup& rg) {
    int16_t last = 0;
    bool haveRows = false;
    while (true) {
        int16_t id = 0;
        uint8_t t = CT_STOP;
        if (!r.readFieldHeader(last, id, t)) return false;
        if (t == CT_STOP) break;
        if (id == 1) {
            uint64_t n = 0;
            uint8_t elem = CT_STOP;
            if (!r.expect(t, CT_LIST, "RowGroup.columns") || !r.readListHeader(n, elem)) return false;
            if (!r.expect(elem, CT_STRUCT, "RowGroup.columns element")) return false;
            rg.columns.resize(static_cast<size_t>(n));
            for (auto& cc : rg.columns) {
                if (!readColumnChunk(r, cc)) return false;
            }
        } else if (id == 2 && t == CT_I64) {
            if (!r.readI64(rg.totalByteSize)) return false;
        } else if (id == 3) {
            if (!r.expect(t, CT_I64, "RowGroup.num_rows") || !r.readI64(rg.numRows)) return false;
            haveRows = true;
        } else if (!r.skipValue(t, 2)) {
            return false;
        }
    }
    if (!haveRows) return r.fail("row group without num_rows");
    return true;
}

bool readFileMetaData(CompactReader& r, ParquetFooter& out) {
    int16_t last = 0;
    bool haveVersion = false, haveSchema = false, haveRows = false, haveGroups = false;
    while (true) {
        int16_t id = 0;
        uint8_t t = CT_STOP;
        if (!r.readFieldHeader(last, id, t)) return false;
        if (t == CT_STOP) break;
        switch (id) {
        case 1:
            if (!r.expect(t, CT_I32, "FileMetaData.version") || !r.readI32(out.version)) return false;
            haveVersion = true;
            break;
        case 2: {
            uint64_t n = 0;
            uint8_t elem = CT_STOP;
            if (!r.expect(t, CT_LIST, "FileMetaData.schema") || !r.readListHeader(n, elem)) return false;
            if (!r.expect(elem, CT_STRUCT, "FileMetaData.schema element")) return false;
            out.schema.resize(static_cast<size_t>(n));
            for (auto& el : out.schema) {
                if (!readSchemaElement(r, el)) return false;
            }
            haveSchema = true;
            break;
        }
        case 3:
            if (!r.expect(t, CT_I64, "FileMetaData.num_rows") || !r.readI64(out.numRows)) return false;
            haveRows = true;
            break;
        case 4: {
            uint64_t n = 0;
            uint8_t elem = CT_STOP;
            if (!r.expect(t, CT_LIST, "FileMetaData.row_groups") || !r.readListHeader(n, elem)) return false;
            if (n > 0 && !r.expect(elem, CT_STRUCT, "FileMetaData.row_groups element")) return false;
            out.rowGroups.resize(static_cast<size_t>(n));
            for (auto& rg : out.rowGroups) {
                if (!readRowGroup(r, rg)) return false;
            }
            haveGroups = true;
            break;
        }
        case 6:
            if (!r.expect(t, CT_BINARY, "FileMetaData.created_by") || !r.readBinary(out.createdBy)) return false;
            break;
        default:
            if (!r.skipValue(t, 1)) return false;
            break;
        }
    }
    if (!haveVersion) return r.fail("missing version");
    if (!haveSchema) return r.fail("missing schema");
    if (!haveRows) return r.fail("missing num_rows");
    if (!haveGroups) return r.fail("missing row_groups");
    return true;
}

// Child counts must describe exactly one tree rooted at element 0.
bool checkSchema(ParquetFooter& footer, std::string& problem) {
    if (footer.schema.empty()) {
        problem = "empty schema";
        return false;
    }
    int64_t pending = 1;
    footer.leafColumns = 0;
    for (size_t i = 0; i < footer.schema.size(); ++i) {
        const auto& el = footer.schema[i];
        if (pending == 0) {
            problem = "schema element " + std::to_string(i) + " is outside the schema tree";
            return false;
        }
        if (el.numChildren < 0) {
            problem = "negative child count in schema element " + el.name;
            return false;
        }
        --pending;
        pending += el.numChildren;
        if (i > 0 && el.numChildren == 0) ++footer.leafColumns;
    }
    if (pending != 0) {
        problem = "schema is truncated (" + std::to_string(pending) + " element(s) missing)";
        return false;
    }
    if (footer.leafColumns == 0) {
        problem = "schema has no columns";
        return false;
    }
    return true;
}

bool checkRowGroups(const ParquetFooter& footer, uint64_t dataEnd, std::string& problem) {
    if (footer.numRows < 0) {
        problem = "negative num_rows";
        return false;
    }
    int64_t rows = 0;
    for (size_t g = 0; g < footer.rowGroups.size(); ++g) {
        const auto& rg = footer.rowGroups[g];
        const std::string where = "row group " + std::to_string(g);
        if (rg.numRows < 0 || rg.numRows > std::numeric_limits<int64_t>::max() - rows) {
            problem = where + " has an invalid row count";
            return false;
        }
        rows += rg.numRows;
        if (rg.columns.size() != footer.leafColumns) {
            problem = where + " has " + std::to_string(rg.columns.size()) + " column chunk(s), schema has " +
                      std::to_string(footer.leafColumns);
            return false;
        }
        for (const auto& cc : rg.columns) {
            if (!cc.hasMetadata || !cc.filePath.empty()) continue;
            int64_t start = cc.dataPageOffset;
            if (cc.dictionaryPageOffset > 0 && cc.dictionaryPageOffset < start) start = cc.dictionaryPageOffset;
            if (start < static_cast<int64_t>(kParquetMagicSize) || cc.totalCompressedSize < 0 ||
                static_cast<uint64_t>(start) > dataEnd ||
                static_cast<uint64_t>(cc.totalCompressedSize) > dataEnd - static_cast<uint64_t>(start)) {
                problem = where + " has a column chunk outside the data region";
                return false;
            }
        }
    }
    if (rows != footer.numRows) {
        problem = "row groups hold " + std::to_string(rows) + " rows, footer says " + std::to_string(footer.numRows);
        return false;
    }
    return true;
}

bool preadAll(int fd, char* buf, size_t len, uint64_t offset, const std::string& path, ErrorInfo& err) {
    size_t done = 0;
    while (done < len) {
        ssize_t n = ::pread(fd, buf + done, len - done, static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) continue;
            err = errorFromErrno(errno, "Read failed for " + path);
            return false;
        }
        if (n == 0) {
            err = errorFromErrno(EIO, "Short read for " + path);
            return false;
        }
        done += static_cast<size_t>(n);
    }
    return true;
}

} // namespace

bool parseParquetMetadata(const std::string& blob, uint64_t dataEnd, ParquetFooter& out, ErrorInfo& err) {
    CompactReader reader(blob);
    if (!readFileMetaData(reader, out)) {
        err = corruptFileError("Malformed Parquet metadata: " + reader.error());
        return false;
    }
    std::string problem;
    if (!checkSchema(out, problem) || !checkRowGroups(out, dataEnd, problem)) {
        err = corruptFileError("Inconsistent Parquet metadata: " + problem);
        return false;
    }
    return true;
}

bool readParquetFooter(const std::string& path, ParquetFooter& out, ErrorInfo& err) {
    out = ParquetFooter{};
    UniqueFd fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd) {
        err = errorFromErrno(errno, "Open failed for " + path);
        return false;
    }
    struct stat st {};
    if (::fstat(fd.fd, &st) != 0) {
        err = errorFromErrno(errno, "Stat failed for " + path);
        return false;
    }
    out.fileSize = static_cast<uint64_t>(st.st_size);
    if (out.fileSize < kParquetMinFileSize) {
        err = corruptFileError(path + " is too small to be a Parquet file (" + std::to_string(out.fileSize) + " bytes)");
        return false;
    }

    char head[kParquetMagicSize];
    char tail[8];
    if (!preadAll(fd.fd, head, sizeof(head), 0, path, err)) return false;
    if (!preadAll(fd.fd, tail, sizeof(tail), out.fileSize - sizeof(tail), path, err)) return false;
    if (std::memcmp(head, kMagic, kParquetMagicSize) != 0) {
        err = corruptFileError(path + " does not start with PAR1");
        return false;
    }
    if (std::memcmp(tail + 4, kMagic, kParquetMagicSize) != 0) {
        err = corruptFileError(path + " does not end with PAR1");
        return false;
    }

    const auto* lenBytes = reinterpret_cast<const unsigned char*>(tail);
    out.metadataLength = static_cast<uint32_t>(lenBytes[0]) | (static_cast<uint32_t>(lenBytes[1]) << 8) |
                         (static_cast<uint32_t>(lenBytes[2]) << 16) | (static_cast<uint32_t>(lenBytes[3]) << 24);
    if (out.metadataLength == 0 || out.metadataLength > out.fileSize - kParquetMinFileSize) {
        err = corruptFileError(path + " has an invalid footer length " + std::to_string(out.metadataLength));
        return false;
    }
    if (out.metadataLength > kParquetMaxMetadataLength) {
        err = corruptFileError(path + " has an oversized footer length " + std::to_string(out.metadataLength));
        return false;
    }

    const uint64_t metaStart = out.fileSize - sizeof(tail) - out.metadataLength;
    std::string blob(out.metadataLength, '\0');
    if (!preadAll(fd.fd, &blob[0], blob.size(), metaStart, path, err)) return false;

    if (!parseParquetMetadata(blob, metaStart, out, err)) {
        err.detail = path + ": " + err.detail;
        return false;
    }
    return true;
}

} // namespace tabsync
