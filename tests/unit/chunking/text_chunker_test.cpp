#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <sstream>
#include <string>
#include <vector>

#include "docrag_core/chunking/text_chunker.hpp"
#include "docrag_core/errors.hpp"

namespace docrag_core {

namespace {

std::string numbered_words(size_t count) {
  std::string text;
  for (size_t i = 0; i < count; ++i) {
    if (i)
      text += ' ';
    text += "w" + std::to_string(i);
  }
  return text;
}

std::vector<std::string> tokens_of(const std::string &chunk) {
  std::istringstream stream(chunk);
  std::vector<std::string> tokens;
  std::string token;
  while (stream >> token)
    tokens.push_back(token);
  return tokens;
}

}  // namespace

TEST(TextChunkerTest, EmptyAndWhitespaceOnlyTextYieldNoChunks) {
  TextChunker chunker(4, 1);
  EXPECT_TRUE(chunker.chunk("").empty());
  EXPECT_TRUE(chunker.chunk("   \n\t  ").empty());
}

TEST(TextChunkerTest, ShortTextFitsInOneChunk) {
  auto chunks = TextChunker::chunk("the cat sat", 512, 50);
  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0], "the cat sat");
}

TEST(TextChunkerTest, CollapsesWhitespaceBetweenTokens) {
  auto chunks = TextChunker::chunk("  alpha\t\tbeta \n gamma  ", 10, 0);
  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0], "alpha beta gamma");
}

TEST(TextChunkerTest, WindowsAdvanceByChunkSizeMinusOverlap) {
  auto chunks = TextChunker::chunk(numbered_words(10), 4, 1);

  // Starts at 0, 3, 6, 9
  ASSERT_EQ(chunks.size(), 4u);
  EXPECT_EQ(chunks[0], "w0 w1 w2 w3");
  EXPECT_EQ(chunks[1], "w3 w4 w5 w6");
  EXPECT_EQ(chunks[2], "w6 w7 w8 w9");
  EXPECT_EQ(chunks[3], "w9");
}

TEST(TextChunkerTest, NoOverlapPartitionsTokens) {
  auto chunks = TextChunker::chunk(numbered_words(6), 3, 0);
  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[0], "w0 w1 w2");
  EXPECT_EQ(chunks[1], "w3 w4 w5");
}

TEST(TextChunkerTest, OverlapNotSmallerThanChunkSizeStillAdvances) {
  TextChunker chunker(3, 5);
  EXPECT_EQ(chunker.stride(), 1u);

  auto chunks = chunker.chunk(numbered_words(4));
  ASSERT_EQ(chunks.size(), 4u);
  EXPECT_EQ(chunks[0], "w0 w1 w2");
  EXPECT_EQ(chunks[1], "w1 w2 w3");
  EXPECT_EQ(chunks[2], "w2 w3");
  EXPECT_EQ(chunks[3], "w3");
}

TEST(TextChunkerTest, ChunkCountMatchesCeilingOfTokensOverStride) {
  const std::vector<std::tuple<size_t, size_t, size_t>> cases = {
      {100, 10, 2}, {7, 3, 1}, {512, 512, 50}, {1000, 512, 50}, {5, 1, 0}};
  for (const auto &[words, size, overlap] : cases) {
    TextChunker chunker(size, overlap);
    const size_t stride = chunker.stride();
    const size_t expected = (words + stride - 1) / stride;
    EXPECT_EQ(chunker.chunk(numbered_words(words)).size(), expected)
        << "words=" << words << " size=" << size << " overlap=" << overlap;
  }
}

TEST(TextChunkerTest, ChunksPreserveTokenOrderAndAreNonEmpty) {
  const std::string text = numbered_words(37);
  TextChunker chunker(8, 3);
  auto chunks = chunker.chunk(text);

  ASSERT_FALSE(chunks.empty());
  for (size_t c = 0; c < chunks.size(); ++c) {
    auto tokens = tokens_of(chunks[c]);
    ASSERT_FALSE(tokens.empty());
    // Each window starts at c * stride and is contiguous
    for (size_t t = 0; t < tokens.size(); ++t) {
      EXPECT_EQ(tokens[t], "w" + std::to_string(c * chunker.stride() + t));
    }
  }
}

TEST(TextChunkerTest, IsDeterministic) {
  const std::string text = numbered_words(50);
  EXPECT_EQ(TextChunker::chunk(text, 7, 2), TextChunker::chunk(text, 7, 2));
}

TEST(TextChunkerTest, ZeroChunkSizeIsInvalid) {
  EXPECT_THROW(TextChunker(0, 0), InvalidInputError);
}

TEST(TextChunkerTest, DefaultsMatchConfiguredWindow) {
  TextChunker chunker;
  EXPECT_EQ(chunker.chunk_size(), 512u);
  EXPECT_EQ(chunker.overlap(), 50u);
  EXPECT_EQ(chunker.stride(), 462u);
}

}  // namespace docrag_core
