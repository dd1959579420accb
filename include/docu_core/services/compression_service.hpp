#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace docu_core {

// Chunk text is stored zstd-compressed in the vector store
class CompressionService {
    public:
        /**
         * @brief Compresses a block of text using Zstandard.
         * @param data The data to compress.
         * @param compression_level The zstd compression level (default is 3).
         * @return The compressed frame; empty for empty input.
         * @throw DocuMindError if zstd reports an error.
         */
        static std::vector<char> compress(std::string_view data, int compression_level = 3);

        /**
         * @brief Decompresses a single Zstandard frame produced by compress().
         * @param compressed_data The binary data to decompress.
         * @return The original text; empty for empty input.
         * @throw DocuMindError if the data is not a complete zstd frame.
         */
        static std::string decompress(const std::vector<char>& compressed_data);
};
}
