#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docrag_core {

// Zstandard codec for chunk text stored in the persistent collection.
class CompressionService {
    public:
        /**
         * @brief Compresses a block of data using Zstandard.
         * @param data The data to compress. Empty input gives an empty buffer.
         * @param compression_level The zstd compression level (default is 3).
         * @throws BackendOperationError if zstd reports an error.
         */
        static std::vector<char> compress(std::string_view data, int compression_level = 3);

        /**
         * @brief Decompresses a block of Zstandard-compressed data.
         * @throws BackendOperationError if the data is not a complete zstd frame.
         */
        static std::string decompress(const std::vector<char>& compressed_data);

        // A NULL column decodes to the empty string.
        static std::string decompress(const std::optional<std::vector<char>>& compressed_data);
};
}  // namespace docrag_core
