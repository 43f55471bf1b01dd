/*
 * Block extractor tests - Launch-TOML
 * Copyright (c) 2025 iDev srl
 * MIT License.
 */
#include <gtest/gtest.h>
#include <launch-toml/parse/blocks.hpp>
#include <string>

using namespace launchtoml;

TEST(BlockSplitter, NoMarkerNoBlocks) {
    EXPECT_TRUE(split_process_blocks("").empty());
    EXPECT_TRUE(split_process_blocks("[processes]\ntype = \"web\"\n").empty());
}

TEST(BlockSplitter, DropsPreambleAndSplitsInOrder) {
    std::string text = "# header\n[[processes]]\nA\n  [[processes]]  \nB\n";
    auto blocks = split_process_blocks(text);
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(blocks[0], "\nA\n  ");
    EXPECT_EQ(blocks[1], "  \nB\n");
}

TEST(BlockSplitter, MatchesMarkerAnywhere) {
    auto blocks = split_process_blocks("x = 1 # [[processes]]tail[[processes]]");
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(blocks[0], "tail");
    EXPECT_EQ(blocks[1], "");
}

TEST(BlockSplitter, LazyNextExhausts) {
    BlockSplitter sp("[[processes]]one[[processes]]two");
    auto a = sp.next(); auto b = sp.next(); auto c = sp.next();
    ASSERT_TRUE(a && b);
    EXPECT_EQ(*a, "one");
    EXPECT_EQ(*b, "two");
    EXPECT_FALSE(c.has_value());
    EXPECT_FALSE(sp.next().has_value());
}
