#include "docrag_core/services/compression_service.hpp"

#include <zstd.h>

#include "docrag_core/errors.hpp"

namespace docrag_core {

namespace {

size_t checked(size_t zstd_result, const char* stage) {
  if (ZSTD_isError(zstd_result)) {
    throw BackendOperationError(std::string("Chunk text ") + stage +
                                " failed: " + ZSTD_getErrorName(zstd_result));
  }
  return zstd_result;
}

}  // namespace

std::vector<char> CompressionService::compress(std::string_view data, int compression_level) {
  std::vector<char> frame;
  if (data.empty()) {
    return frame;
  }
  frame.resize(ZSTD_compressBound(data.size()));
  const size_t written = checked(
      ZSTD_compress(frame.data(), frame.size(), data.data(), data.size(), compression_level),
      "compression");
  frame.resize(written);
  return frame;
}

std::string CompressionService::decompress(const std::vector<char>& compressed_data) {
  if (compressed_data.empty()) {
    return {};
  }

  // Frames written by compress() always record their content size.
  const unsigned long long expected =
      ZSTD_getFrameContentSize(compressed_data.data(), compressed_data.size());
  if (expected == ZSTD_CONTENTSIZE_ERROR || expected == ZSTD_CONTENTSIZE_UNKNOWN) {
    throw BackendOperationError("Stored chunk content is not a zstd frame");
  }

  std::string text(static_cast<size_t>(expected), '\0');
  const size_t produced = checked(
      ZSTD_decompress(text.data(), text.size(), compressed_data.data(), compressed_data.size()),
      "decompression");
  if (produced != text.size()) {
    throw BackendOperationError("Chunk text decompression produced " + std::to_string(produced) +
                                " bytes, frame header says " + std::to_string(expected));
  }
  return text;
}

std::string CompressionService::decompress(const std::optional<std::vector<char>>& compressed_data) {
  return compressed_data ? decompress(*compressed_data) : std::string();
}

}  // namespace docrag_core
