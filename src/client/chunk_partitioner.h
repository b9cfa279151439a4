#pragma once

#include "utils.h"
#include <cstdint>
#include <string>
#include <vector>

namespace chunkpost {

// One contiguous slice of the file's base64 text, digest taken over that text
struct ChunkDescriptor {
    int64_t index = 0;
    std::string payload_base64;
    std::string chunk_sha256;
};

class ChunkPartitioner {
public:
    // Base64 characters per chunk for a raw chunk size: ceil(bytes / 3) * 4, at least 4
    static size_t base64ChunkLength(size_t base_chunk_bytes);

    // Chunk length actually used for a payload, raised when needed so the
    // count stays within max_chunks (a multiple of 4 so slices stay aligned)
    static size_t effectiveChunkLength(size_t payload_length, size_t base_chunk_bytes,
                                       int max_chunks = MAX_TOTAL_CHUNKS);

    static std::vector<ChunkDescriptor> partition(const std::string& payload_base64,
                                                  size_t base_chunk_bytes,
                                                  int max_chunks = MAX_TOTAL_CHUNKS);
};

} // namespace chunkpost
