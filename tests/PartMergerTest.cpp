#include <gtest/gtest.h>

#include "io/PartMerger.h"
#include "TestHelpers.h"

namespace {
std::vector<char> bytes(const std::string& s) {
    return std::vector<char>(s.begin(), s.end());
}
}

TEST(PartMergerTest, ConcatenatesInIndexOrder) {
    TempDir tmp;
    const std::string dest = tmp.file("out.bin");
    const RangeSpec first{ 0, 0, 3 };
    const RangeSpec second{ 1, 4, 7 };

    // Second part written first, as if its fetch finished earlier
    writeFile(partFilePath(dest, second.start), bytes("BBBB"));
    writeFile(partFilePath(dest, first.start), bytes("AAAA"));

    PartMerger merger;
    Status status = merger.merge(dest, { second, first });

    ASSERT_TRUE(status.ok()) << status.message;
    EXPECT_EQ(readFile(dest), bytes("AAAABBBB"));
    EXPECT_EQ(merger.bytesMerged(), 8);
    EXPECT_FALSE(fs::exists(partFilePath(dest, 0)));
    EXPECT_FALSE(fs::exists(partFilePath(dest, 4)));
}

TEST(PartMergerTest, OverwritesExistingDestination) {
    TempDir tmp;
    const std::string dest = tmp.file("out.bin");
    writeFile(dest, bytes("previous content that is longer"));
    writeFile(partFilePath(dest, 0), bytes("xyz"));

    PartMerger merger;
    ASSERT_TRUE(merger.merge(dest, { { 0, 0, 2 } }).ok());
    EXPECT_EQ(readFile(dest), bytes("xyz"));
}

TEST(PartMergerTest, MissingPartStopsAndKeepsRemainingParts) {
    TempDir tmp;
    const std::string dest = tmp.file("out.bin");
    writeFile(partFilePath(dest, 0), bytes("AAAA"));
    writeFile(partFilePath(dest, 8), bytes("CCCC"));

    PartMerger merger;
    Status status = merger.merge(dest, { { 0, 0, 3 }, { 1, 4, 7 }, { 2, 8, 11 } });

    EXPECT_EQ(status.kind, ErrorKind::MissingPart);
    EXPECT_EQ(readFile(dest), bytes("AAAA"));
    EXPECT_FALSE(fs::exists(partFilePath(dest, 0)));
    EXPECT_TRUE(fs::exists(partFilePath(dest, 8)));
}

TEST(PartMergerTest, IncompletePartIsRejected) {
    TempDir tmp;
    const std::string dest = tmp.file("out.bin");
    writeFile(partFilePath(dest, 0), bytes("AAA"));

    PartMerger merger;
    Status status = merger.merge(dest, { { 0, 0, 3 } });

    EXPECT_EQ(status.kind, ErrorKind::MissingPart);
    EXPECT_TRUE(fs::exists(partFilePath(dest, 0)));
}

TEST(PartMergerTest, NoRangesCreatesEmptyFile) {
    TempDir tmp;
    const std::string dest = tmp.file("empty.bin");

    PartMerger merger;
    ASSERT_TRUE(merger.merge(dest, {}).ok());
    EXPECT_TRUE(fs::exists(dest));
    EXPECT_EQ(fs::file_size(dest), 0u);
}

TEST(PartMergerTest, UnwritableDestinationIsIOError) {
    TempDir tmp;
    const std::string dest = tmp.file("no-such-dir/out.bin");

    PartMerger merger;
    EXPECT_EQ(merger.merge(dest, { { 0, 0, 3 } }).kind, ErrorKind::IOError);
}
