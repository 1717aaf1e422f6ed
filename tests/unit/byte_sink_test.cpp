#include <gtest/gtest.h>

#include <string>

#include "models/byte_sink.h"
#include "test_support.h"

using namespace modelfetch;
using namespace modelfetch::test;

TEST(FileSinkTest, SignalsBackpressureAtHighWaterMark) {
    TempDir dir;
    const auto path = dir.path / "out.partial";
    FileSink sink(path, false, 8);

    EXPECT_TRUE(sink.write("abcd", 4));
    EXPECT_FALSE(sink.write("efgh", 4));
    EXPECT_EQ(sink.buffered(), 8u);
    EXPECT_EQ(sink.bytesWritten(), 0u);

    sink.drain();
    EXPECT_EQ(sink.buffered(), 0u);
    EXPECT_EQ(sink.bytesWritten(), 8u);
    EXPECT_EQ(readFile(path), "abcdefgh");
}

TEST(FileSinkTest, AppendKeepsExistingBytes) {
    TempDir dir;
    const auto path = dir.path / "out.partial";
    writeFile(path, "head-");

    {
        FileSink sink(path, true, 1024);
        sink.write("tail", 4);
        sink.close();
        EXPECT_EQ(sink.bytesWritten(), 4u);
    }
    EXPECT_EQ(readFile(path), "head-tail");
}

TEST(FileSinkTest, TruncatesWhenNotAppending) {
    TempDir dir;
    const auto path = dir.path / "out.partial";
    writeFile(path, "stale content");

    {
        FileSink sink(path, false, 1024);
        sink.write("new", 3);
    }  // destructor flushes
    EXPECT_EQ(readFile(path), "new");
}

TEST(FileSinkTest, OpenFailureIsFileSystemError) {
    TempDir dir;
    EXPECT_THROW(FileSink(dir.path / "missing" / "out.partial", false, 16), FileSystemError);
}
