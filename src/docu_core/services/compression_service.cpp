#include "docu_core/services/compression_service.hpp"
#include <zstd.h>

#include "docu_core/errors.hpp"

namespace docu_core {

std::vector<char> CompressionService::compress(std::string_view data, int compression_level) {
    if (data.empty()) {
        return {};
    }
    std::vector<char> compressed_buffer(ZSTD_compressBound(data.size()));

    size_t const compressed_size = ZSTD_compress(
        compressed_buffer.data(), compressed_buffer.size(),
        data.data(), data.size(),
        compression_level);

    if (ZSTD_isError(compressed_size)) {
        throw DocuMindError("ZSTD compression failed: " + std::string(ZSTD_getErrorName(compressed_size)));
    }

    compressed_buffer.resize(compressed_size);
    return compressed_buffer;
}

std::string CompressionService::decompress(const std::vector<char>& compressed_data) {
    if (compressed_data.empty()) {
        return "";
    }

    unsigned long long const content_size =
        ZSTD_getFrameContentSize(compressed_data.data(), compressed_data.size());
    if (content_size == ZSTD_CONTENTSIZE_ERROR || content_size == ZSTD_CONTENTSIZE_UNKNOWN) {
        throw DocuMindError("Stored chunk text is not a zstd frame with a known size");
    }

    std::string text(content_size, '\0');
    size_t const written = ZSTD_decompress(
        text.data(), text.size(),
        compressed_data.data(), compressed_data.size());

    if (ZSTD_isError(written)) {
        throw DocuMindError("ZSTD decompression failed: " + std::string(ZSTD_getErrorName(written)));
    }
    if (written != content_size) {
        throw DocuMindError("ZSTD decompression produced " + std::to_string(written) +
                            " bytes, expected " + std::to_string(content_size));
    }

    return text;
}

}
