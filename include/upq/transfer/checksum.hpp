#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace upq::transfer {

// 64-bit FNV-1a of a buffer, as 16 lowercase hex digits
std::string fnv1a_hex(const void* data, std::size_t size);

/**
 * @brief FNV-1a digest of bytes [offset, offset + length) of a local file
 *
 * Returns nullopt when the path is empty, unreadable or shorter than the
 * requested range.
 */
std::optional<std::string> checksum_file_range(const std::filesystem::path& path,
                                               std::uint64_t offset,
                                               std::uint64_t length);

} // namespace upq::transfer
