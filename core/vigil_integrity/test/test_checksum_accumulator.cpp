// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for ChecksumAccumulator
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <random>
#include <string>
#include <vector>

#include "checksum_accumulator.hpp"

using namespace vigil::integrity;

TEST(ChecksumAccumulatorTest, KnownVector) {
  // Standard CRC-32 check value
  EXPECT_EQ(ChecksumAccumulator::compute("123456789"), 0xCBF43926u);

  ChecksumAccumulator acc;
  acc.update("123456789");
  EXPECT_EQ(acc.finalize(), 0xCBF43926u);
  EXPECT_EQ(acc.bytes(), 9u);
}

TEST(ChecksumAccumulatorTest, FreshAccumulatorIsZero) {
  ChecksumAccumulator acc;
  EXPECT_EQ(acc.finalize(), 0u);
  EXPECT_EQ(acc.bytes(), 0u);
}

TEST(ChecksumAccumulatorTest, TwoChunksEqualOnePass) {
  ChecksumAccumulator acc;
  acc.update("hello, ").update("world");
  EXPECT_EQ(acc.finalize(), ChecksumAccumulator::compute("hello, world"));
}

TEST(ChecksumAccumulatorTest, EmptyChunkIsNoOp) {
  ChecksumAccumulator a;
  a.update("abc");
  uint32_t before = a.finalize();
  a.update(nullptr, 0);
  a.update(std::string());
  EXPECT_EQ(a.finalize(), before);
  EXPECT_EQ(a.bytes(), 3u);
}

TEST(ChecksumAccumulatorTest, FinalizeDoesNotReset) {
  ChecksumAccumulator acc;
  acc.update("abc");
  uint32_t first = acc.finalize();
  EXPECT_EQ(acc.finalize(), first);
  acc.update("def");
  EXPECT_EQ(acc.finalize(), ChecksumAccumulator::compute("abcdef"));
}

TEST(ChecksumAccumulatorTest, ArbitrarySplitsMatchSinglePass) {
  std::mt19937 rng(42);
  std::uniform_int_distribution<int> byte_dist(0, 255);

  std::string data(100000, '\0');
  for (auto& c : data) {
    c = static_cast<char>(byte_dist(rng));
  }
  const uint32_t expected = ChecksumAccumulator::compute(data);

  for (int trial = 0; trial < 20; ++trial) {
    std::uniform_int_distribution<size_t> split_dist(1, 4096);
    ChecksumAccumulator acc;
    size_t offset = 0;
    while (offset < data.size()) {
      size_t n = std::min(split_dist(rng), data.size() - offset);
      acc.update(data.data() + offset, n);
      offset += n;
    }
    EXPECT_EQ(acc.finalize(), expected) << "trial " << trial;
    EXPECT_EQ(acc.bytes(), data.size());
  }
}

TEST(ChecksumAccumulatorTest, SingleByteChunks) {
  const std::string data = "The quick brown fox jumps over the lazy dog";
  ChecksumAccumulator acc;
  for (char c : data) {
    acc.update(&c, 1);
  }
  EXPECT_EQ(acc.finalize(), 0x414FA339u);
}

TEST(ChecksumAccumulatorTest, HexFormatting) {
  EXPECT_EQ(crc_to_hex(0xCBF43926u), "cbf43926");
  EXPECT_EQ(crc_to_hex(0x0000000Au), "0000000a");
  EXPECT_EQ(crc_to_hex(0u), "00000000");
  EXPECT_EQ(crc_to_hex(0xFFFFFFFFu), "ffffffff");
}
