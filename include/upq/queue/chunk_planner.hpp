#pragma once

#include "upq/core/result.hpp"
#include "upq/queue/types.hpp"

#include <cstdint>
#include <vector>

namespace upq::queue {

/**
 * @brief Split [0, file_size) into ceil(file_size / chunk_size) ordered slices
 *
 * The last chunk may be shorter than chunk_size. An empty file yields no
 * chunks. A zero chunk size is rejected.
 */
upq::Result<std::vector<UploadChunk>> plan_chunks(std::uint64_t file_size, std::uint64_t chunk_size);

/**
 * @brief Check that chunks are indexed in order, contiguous, non-overlapping
 *        and cover exactly [0, total_bytes)
 */
upq::Result<void> validate_chunk_plan(const std::vector<UploadChunk>& chunks, std::uint64_t total_bytes);

} // namespace upq::queue
