#include "upq/queue/chunk_planner.hpp"

#include <algorithm>
#include <limits>
#include <string>

namespace upq::queue {

upq::Result<std::vector<UploadChunk>> plan_chunks(std::uint64_t file_size, std::uint64_t chunk_size) {
    if (chunk_size == 0) {
        return upq::Err<std::vector<UploadChunk>>(std::string("chunk_size must be > 0"));
    }

    const std::uint64_t total_chunks = file_size / chunk_size + (file_size % chunk_size != 0 ? 1 : 0);
    if (total_chunks > std::numeric_limits<std::uint32_t>::max()) {
        return upq::Err<std::vector<UploadChunk>>(std::string("chunk plan exceeds the chunk index range"));
    }

    std::vector<UploadChunk> chunks;
    chunks.reserve(static_cast<std::size_t>(total_chunks));

    for (std::uint64_t i = 0; i < total_chunks; ++i) {
        UploadChunk chunk;
        chunk.index = static_cast<std::uint32_t>(i);
        chunk.start = i * chunk_size;
        chunk.end = std::min(chunk.start + chunk_size, file_size);
        chunk.size = chunk.end - chunk.start;
        chunks.push_back(chunk);
    }

    return upq::Ok(std::move(chunks));
}

upq::Result<void> validate_chunk_plan(const std::vector<UploadChunk>& chunks, std::uint64_t total_bytes) {
    std::uint64_t expected_start = 0;
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        const auto& chunk = chunks[i];
        if (chunk.index != i) {
            return upq::Err<void>("chunk " + std::to_string(i) + " has index " + std::to_string(chunk.index));
        }
        if (chunk.start != expected_start) {
            return upq::Err<void>("chunk " + std::to_string(i) + " starts at " + std::to_string(chunk.start) +
                                  ", expected " + std::to_string(expected_start));
        }
        if (chunk.end <= chunk.start || chunk.size != chunk.end - chunk.start) {
            return upq::Err<void>("chunk " + std::to_string(i) + " has an invalid range");
        }
        expected_start = chunk.end;
    }

    if (expected_start != total_bytes) {
        return upq::Err<void>("chunk plan covers " + std::to_string(expected_start) + " of " +
                              std::to_string(total_bytes) + " bytes");
    }
    return upq::Ok();
}

} // namespace upq::queue
