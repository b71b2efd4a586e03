/**
 * @file RecordStoreTest.cpp
 * @brief Unit tests for the insertion-ordered RecordStore
 */

#include <gtest/gtest.h>

#include "RecordStore.hpp"
#include "TestHelpers.hpp"

TEST(RecordStoreTest, EmptyByDefault) {
    RecordStore records;
    EXPECT_TRUE(records.isEmpty());
    EXPECT_EQ(records.size(), 0);
    EXPECT_TRUE(records.keys().isEmpty());
    EXPECT_EQ(records.begin(), records.end());
}

TEST(RecordStoreTest, KeepsInsertionOrder) {
    RecordStore records;
    records.insert("zeta", "1");
    records.insert("alpha", "2");
    records.insert("mu", "3");

    EXPECT_EQ(records.keys(), QStringList({"zeta", "alpha", "mu"}));
    EXPECT_EQ(records.value("alpha"), QString("2"));
}

TEST(RecordStoreTest, DuplicateKeyOverwritesInPlace) {
    RecordStore records;
    records.insert("a", "1");
    records.insert("b", "2");
    records.insert("a", "3");

    ASSERT_EQ(records.size(), 2);
    EXPECT_EQ(records.keys(), QStringList({"a", "b"}));
    EXPECT_EQ(records.value("a"), QString("3"));
}

TEST(RecordStoreTest, MissingKeyReturnsDefault) {
    RecordStore records;
    records.insert("a", "1");

    EXPECT_FALSE(records.contains("b"));
    EXPECT_TRUE(records.value("b").isNull());
    EXPECT_EQ(records.value("b", "fallback"), QString("fallback"));
}

TEST(RecordStoreTest, EqualityDependsOnOrder) {
    RecordStore first;
    first.insert("a", "1");
    first.insert("b", "2");

    RecordStore same;
    same.insert("a", "1");
    same.insert("b", "2");

    RecordStore reversed;
    reversed.insert("b", "2");
    reversed.insert("a", "1");

    EXPECT_TRUE(first == same);
    EXPECT_TRUE(first != reversed);
}

TEST(RecordStoreTest, ClearResetsIndex) {
    RecordStore records;
    records.insert("a", "1");
    records.clear();

    EXPECT_TRUE(records.isEmpty());
    EXPECT_FALSE(records.contains("a"));

    records.insert("b", "2");
    records.insert("a", "3");
    EXPECT_EQ(records.keys(), QStringList({"b", "a"}));
}
