/**
 * @file LangCodecTest.cpp
 * @brief Unit tests for parsing and writing the .lang format
 */

#include <gtest/gtest.h>
#include <QTemporaryDir>

#include "LangCodec.hpp"
#include "TestHelpers.hpp"

// =============================================================================
// parse Tests
// =============================================================================

TEST(LangCodecParseTest, SkipsCommentsAndBlankLines) {
    const auto records = LangCodec::parse("a=1\n#comment\nb=2\n\nc=3\n");

    EXPECT_EQ(records.keys(), QStringList({"a", "b", "c"}));
    EXPECT_EQ(records.value("a"), QString("1"));
    EXPECT_EQ(records.value("b"), QString("2"));
    EXPECT_EQ(records.value("c"), QString("3"));
}

TEST(LangCodecParseTest, IndentedCommentIsSkipped) {
    const auto records = LangCodec::parse("   # not=an entry\nkey=value");

    ASSERT_EQ(records.size(), 1);
    EXPECT_EQ(records.value("key"), QString("value"));
}

TEST(LangCodecParseTest, DuplicateKeyKeepsFirstPosition) {
    const auto records = LangCodec::parse("a=1\nb=x\na=2");

    EXPECT_EQ(records.keys(), QStringList({"a", "b"}));
    EXPECT_EQ(records.value("a"), QString("2"));
}

TEST(LangCodecParseTest, LineWithoutSeparatorIsDropped) {
    const auto records = LangCodec::parse("justtext\nkey=value\n");

    ASSERT_EQ(records.size(), 1);
    EXPECT_FALSE(records.contains("justtext"));
}

TEST(LangCodecParseTest, SplitsAtFirstSeparator) {
    const auto records = LangCodec::parse("url=https://example.com/?a=b");

    EXPECT_EQ(records.value("url"), QString("https://example.com/?a=b"));
}

TEST(LangCodecParseTest, TrimsKeyAndValue) {
    const auto records = LangCodec::parse("  spaced key \t=  spaced value  \r\n");

    EXPECT_EQ(records.keys(), QStringList({"spaced key"}));
    EXPECT_EQ(records.value("spaced key"), QString("spaced value"));
}

TEST(LangCodecParseTest, EmptyValueIsKept) {
    const auto records = LangCodec::parse("empty=\n");

    ASSERT_TRUE(records.contains("empty"));
    EXPECT_TRUE(records.value("empty").isEmpty());
}

TEST(LangCodecParseTest, CrLfLineEndings) {
    const auto records = LangCodec::parse("a=1\r\nb=2\r\n");

    EXPECT_EQ(records.value("a"), QString("1"));
    EXPECT_EQ(records.value("b"), QString("2"));
}

TEST(LangCodecParseTest, NonAsciiText) {
    const auto records = LangCodec::parse(QString::fromUtf8("greeting=こんにちは"));

    EXPECT_EQ(records.value("greeting"), QString::fromUtf8("こんにちは"));
}

// =============================================================================
// serialize Tests
// =============================================================================

TEST(LangCodecSerializeTest, OneLinePerEntryInOrder) {
    RecordStore records;
    records.insert("b", "2");
    records.insert("a", "x=y");

    EXPECT_EQ(LangCodec::serialize(records), QString("b=2\na=x=y\n"));
}

TEST(LangCodecSerializeTest, EmptyStoreGivesEmptyText) {
    EXPECT_TRUE(LangCodec::serialize(RecordStore()).isEmpty());
}

TEST(LangCodecSerializeTest, RoundTrip) {
    RecordStore records;
    records.insert("item.sword.name", "Sword");
    records.insert("item.apple.name", "Apple");
    records.insert("gui.done", "Done");

    EXPECT_EQ(LangCodec::parse(LangCodec::serialize(records)), records);
}

// =============================================================================
// read / write Tests
// =============================================================================

TEST(LangCodecFileTest, ReadMissingFileFails) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    RecordStore records;
    QString error;
    EXPECT_FALSE(LangCodec::read(dir.filePath("missing.lang"), records, error));
    EXPECT_FALSE(error.isEmpty());
}

TEST(LangCodecFileTest, ReadInvalidUtf8Fails) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const auto path = dir.filePath("broken.lang");
    ASSERT_TRUE(writeTestFile(path, QByteArray("key=\xff\xfe value\n")));

    RecordStore records;
    QString error;
    EXPECT_FALSE(LangCodec::read(path, records, error));
    EXPECT_TRUE(error.contains("UTF-8"));
}

TEST(LangCodecFileTest, WriteCreatesParentDirectory) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const auto path = dir.filePath("nested/deeper/out.lang");

    RecordStore records;
    records.insert("a", "1");
    QString error;
    ASSERT_TRUE(LangCodec::write(path, records, error)) << error.toStdString();
    EXPECT_EQ(readTestFile(path), QByteArray("a=1\n"));

    RecordStore loaded;
    ASSERT_TRUE(LangCodec::read(path, loaded, error));
    EXPECT_EQ(loaded, records);
}
