#include "chunk_partitioner.h"

namespace chunkpost {

size_t ChunkPartitioner::base64ChunkLength(size_t base_chunk_bytes) {
    size_t length = (base_chunk_bytes + 2) / 3 * 4;
    return length < 4 ? 4 : length;
}

size_t ChunkPartitioner::effectiveChunkLength(size_t payload_length, size_t base_chunk_bytes, int max_chunks) {
    size_t length = base64ChunkLength(base_chunk_bytes);
    if (payload_length == 0 || max_chunks < 1) {
        return length;
    }

    size_t limit = static_cast<size_t>(max_chunks);
    size_t tentative = (payload_length + length - 1) / length;
    if (tentative > limit) {
        size_t needed = (payload_length + limit - 1) / limit;
        length = (needed + 3) / 4 * 4;
        Utils::logDebug("Chunk length raised to " + std::to_string(length) + " to stay within " +
                        std::to_string(max_chunks) + " chunks");
    }
    return length;
}

std::vector<ChunkDescriptor> ChunkPartitioner::partition(const std::string& payload_base64,
                                                         size_t base_chunk_bytes,
                                                         int max_chunks) {
    std::vector<ChunkDescriptor> chunks;
    size_t length = effectiveChunkLength(payload_base64.size(), base_chunk_bytes, max_chunks);

    for (size_t offset = 0; offset < payload_base64.size(); offset += length) {
        ChunkDescriptor chunk;
        chunk.index = static_cast<int64_t>(chunks.size());
        chunk.payload_base64 = payload_base64.substr(offset, length);
        chunk.chunk_sha256 = Utils::calculateSHA256(chunk.payload_base64);
        chunks.push_back(std::move(chunk));
    }
    return chunks;
}

} // namespace chunkpost
