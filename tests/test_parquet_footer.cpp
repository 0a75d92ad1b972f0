#include "catch.hpp"
#include "test_support.hpp"
#include "tabsync/parquet_footer.hpp"
#include "tabsync/raii.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

using testsupport::TableShape;
using testsupport::TempDir;

namespace {

bool readFooter(const TempDir& dir, const std::string& bytes, tabsync::ParquetFooter& footer, tabsync::ErrorInfo& err) {
    const std::string path = dir.file("t.parquet");
    if (!testsupport::writeFile(path, bytes)) return false;
    return tabsync::readParquetFooter(path, footer, err);
}

} // namespace

TEST_CASE("readParquetFooter accepts a minimal table") {
    TempDir dir;
    tabsync::ParquetFooter footer;
    tabsync::ErrorInfo err;
    REQUIRE(readFooter(dir, testsupport::minimalParquet(), footer, err));
    REQUIRE(footer.version == 1);
    REQUIRE(footer.numRows == 0);
    REQUIRE(footer.schema.size() == 2);
    REQUIRE(footer.schema[1].name == "id");
    REQUIRE(footer.leafColumns == 1);
    REQUIRE(footer.rowGroups.empty());
    REQUIRE(footer.createdBy == "tabsync tests");
}

TEST_CASE("readParquetFooter decodes row groups and column chunks") {
    TempDir dir;
    tabsync::ParquetFooter footer;
    tabsync::ErrorInfo err;
    REQUIRE(readFooter(dir, testsupport::smallParquet(), footer, err));
    REQUIRE(footer.numRows == 15);
    REQUIRE(footer.leafColumns == 2);
    REQUIRE(footer.rowGroups.size() == 2);
    REQUIRE(footer.rowGroups[0].numRows == 10);
    REQUIRE(footer.rowGroups[1].columns.size() == 2);
    REQUIRE(footer.rowGroups[1].columns[1].dataPageOffset == 4 + 3 * 16);
    REQUIRE(footer.rowGroups[1].columns[1].totalCompressedSize == 16);
}

TEST_CASE("readParquetFooter rejects bad magic and truncation") {
    TempDir dir;
    tabsync::ParquetFooter footer;
    tabsync::ErrorInfo err;
    const std::string good = testsupport::smallParquet();

    REQUIRE_FALSE(readFooter(dir, "PAR1", footer, err));
    REQUIRE(err.category == tabsync::ErrorCategory::Integrity);
    REQUIRE(err.code == tabsync::ErrorCode::CorruptFile);

    std::string badHead = good;
    badHead[0] = 'X';
    REQUIRE_FALSE(readFooter(dir, badHead, footer, err));
    REQUIRE(err.category == tabsync::ErrorCategory::Integrity);

    // A download cut short loses the trailing magic.
    REQUIRE_FALSE(readFooter(dir, good.substr(0, good.size() - 10), footer, err));
    REQUIRE(err.category == tabsync::ErrorCategory::Integrity);

    REQUIRE_FALSE(readFooter(dir, std::string(), footer, err));
    REQUIRE(err.category == tabsync::ErrorCategory::Integrity);
}

TEST_CASE("readParquetFooter rejects impossible footer lengths") {
    TempDir dir;
    tabsync::ParquetFooter footer;
    tabsync::ErrorInfo err;
    REQUIRE_FALSE(readFooter(dir, "PAR1" + std::string(8, 'x') + testsupport::littleEndian32(1000) + "PAR1", footer,
                             err));
    REQUIRE(err.category == tabsync::ErrorCategory::Integrity);
    REQUIRE_FALSE(readFooter(dir, "PAR1" + std::string(8, 'x') + testsupport::littleEndian32(0) + "PAR1", footer, err));
    REQUIRE(err.category == tabsync::ErrorCategory::Integrity);
}

TEST_CASE("readParquetFooter rejects oversized footer lengths without reading them") {
    TempDir dir;
    const std::string path = dir.file("huge.parquet");
    const uint32_t length = tabsync::kParquetMaxMetadataLength + 1;
    // Sparse file large enough that the length alone is not out of range.
    const off_t size = static_cast<off_t>(length) + 64;
    const std::string tail = testsupport::littleEndian32(length) + "PAR1";
    {
        tabsync::UniqueFd fd(::open(path.c_str(), O_CREAT | O_WRONLY | O_TRUNC, 0644));
        REQUIRE(fd.fd >= 0);
        REQUIRE(::ftruncate(fd.fd, size) == 0);
        REQUIRE(::pwrite(fd.fd, "PAR1", 4, 0) == 4);
        REQUIRE(::pwrite(fd.fd, tail.data(), tail.size(), size - static_cast<off_t>(tail.size())) ==
                static_cast<ssize_t>(tail.size()));
    }

    tabsync::ParquetFooter footer;
    tabsync::ErrorInfo err;
    REQUIRE_FALSE(tabsync::readParquetFooter(path, footer, err));
    REQUIRE(err.category == tabsync::ErrorCategory::Integrity);
    REQUIRE(err.detail.find("oversized footer length") != std::string::npos);
}

TEST_CASE("readParquetFooter rejects garbage metadata") {
    TempDir dir;
    tabsync::ParquetFooter footer;
    tabsync::ErrorInfo err;
    REQUIRE_FALSE(readFooter(dir, testsupport::wrapParquet("", std::string(32, '\xff')), footer, err));
    REQUIRE(err.category == tabsync::ErrorCategory::Integrity);

    // Metadata cut in the middle of the schema list.
    std::string meta = testsupport::encodeFileMetaData(TableShape{});
    REQUIRE_FALSE(readFooter(dir, testsupport::wrapParquet("", meta.substr(0, meta.size() / 2)), footer, err));
    REQUIRE(err.category == tabsync::ErrorCategory::Integrity);
    REQUIRE(err.detail.find("Malformed") != std::string::npos);
}

TEST_CASE("readParquetFooter checks metadata consistency") {
    TempDir dir;
    tabsync::ParquetFooter footer;
    tabsync::ErrorInfo err;

    TableShape wrongRows;
    wrongRows.rowGroupRows = {10};
    wrongRows.numRows = 11;
    REQUIRE_FALSE(readFooter(dir, testsupport::buildParquet(wrongRows), footer, err));
    REQUIRE(err.code == tabsync::ErrorCode::CorruptFile);
    REQUIRE(err.detail.find("rows") != std::string::npos);

    TableShape missingChunk;
    missingChunk.columns = {"id", "value"};
    missingChunk.rowGroupRows = {4};
    missingChunk.columnsPerGroup = 1;
    REQUIRE_FALSE(readFooter(dir, testsupport::buildParquet(missingChunk), footer, err));
    REQUIRE(err.code == tabsync::ErrorCode::CorruptFile);

    TableShape outOfRange;
    outOfRange.rowGroupRows = {4};
    outOfRange.chunkOffsetShift = 1000;
    REQUIRE_FALSE(readFooter(dir, testsupport::buildParquet(outOfRange), footer, err));
    REQUIRE(err.code == tabsync::ErrorCode::CorruptFile);

    TableShape noColumns;
    noColumns.columns.clear();
    REQUIRE_FALSE(readFooter(dir, testsupport::buildParquet(noColumns), footer, err));
    REQUIRE(err.code == tabsync::ErrorCode::CorruptFile);
}

TEST_CASE("readParquetFooter reports open failures as filesystem errors") {
    TempDir dir;
    tabsync::ParquetFooter footer;
    tabsync::ErrorInfo err;
    REQUIRE_FALSE(tabsync::readParquetFooter(dir.file("missing.parquet"), footer, err));
    REQUIRE(err.category == tabsync::ErrorCategory::Filesystem);
    REQUIRE(err.code == tabsync::ErrorCode::FileNotFound);

    if (::geteuid() != 0) {
        const std::string path = dir.file("locked.parquet");
        REQUIRE(testsupport::writeFile(path, testsupport::minimalParquet()));
        REQUIRE(::chmod(path.c_str(), 0) == 0);
        REQUIRE_FALSE(tabsync::readParquetFooter(path, footer, err));
        REQUIRE(err.category == tabsync::ErrorCategory::Filesystem);
        REQUIRE(err.code == tabsync::ErrorCode::PermissionDenied);
    }
}
