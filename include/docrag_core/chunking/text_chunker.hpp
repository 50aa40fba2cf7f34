#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace docrag_core {

class TextChunker {
 public:
  static constexpr size_t DEFAULT_CHUNK_SIZE = 512;
  static constexpr size_t DEFAULT_OVERLAP = 50;

  TextChunker(size_t chunk_size = DEFAULT_CHUNK_SIZE, size_t overlap = DEFAULT_OVERLAP);

  /**
   * @brief Splits text into overlapping word windows.
   *
   * Tokens are whitespace-delimited. Each window holds up to chunk_size tokens joined by a
   * single space, and consecutive windows start max(chunk_size - overlap, 1) tokens apart.
   * Empty input yields no chunks.
   */
  std::vector<std::string> chunk(const std::string &text) const;

  static std::vector<std::string> chunk(const std::string &text, size_t chunk_size, size_t overlap);

  size_t chunk_size() const { return chunk_size_; }
  size_t overlap() const { return overlap_; }
  size_t stride() const;

 private:
  size_t chunk_size_;
  size_t overlap_;

  static std::vector<std::string> split_words(const std::string &text);
};

}  // namespace docrag_core
