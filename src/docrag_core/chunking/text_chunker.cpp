#include "docrag_core/chunking/text_chunker.hpp"

#include <algorithm>
#include <sstream>

#include "docrag_core/errors.hpp"

namespace docrag_core {

TextChunker::TextChunker(size_t chunk_size, size_t overlap)
    : chunk_size_(chunk_size), overlap_(overlap) {
  if (chunk_size_ == 0) {
    throw InvalidInputError("chunk_size must be greater than 0");
  }
}

size_t TextChunker::stride() const {
  return chunk_size_ > overlap_ ? chunk_size_ - overlap_ : 1;
}

std::vector<std::string> TextChunker::chunk(const std::string &text) const {
  std::vector<std::string> words = split_words(text);
  std::vector<std::string> chunks;
  if (words.empty())
    return chunks;

  const size_t step = stride();
  chunks.reserve(words.size() / step + 1);

  for (size_t start = 0; start < words.size(); start += step) {
    const size_t end = std::min(start + chunk_size_, words.size());
    std::string window;
    for (size_t i = start; i < end; ++i) {
      if (i != start)
        window += ' ';
      window += words[i];
    }
    // Words never contain whitespace, so only an empty window can trim to nothing.
    if (!window.empty()) {
      chunks.push_back(std::move(window));
    }
  }

  return chunks;
}

std::vector<std::string> TextChunker::chunk(const std::string &text,
                                            size_t chunk_size,
                                            size_t overlap) {
  return TextChunker(chunk_size, overlap).chunk(text);
}

std::vector<std::string> TextChunker::split_words(const std::string &text) {
  std::vector<std::string> words;
  std::istringstream stream(text);
  std::string word;
  while (stream >> word) {
    words.push_back(std::move(word));
  }
  return words;
}

}  // namespace docrag_core
