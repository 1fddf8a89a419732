#include "upq/transfer/checksum.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace upq::transfer {
namespace {

constexpr std::uint64_t kFnvOffset = 0xcbf29ce484222325ULL;
constexpr std::uint64_t kFnvPrime = 0x100000001b3ULL;

std::uint64_t fnv1a_update(std::uint64_t hash, const unsigned char* bytes, std::size_t size) {
    for (std::size_t i = 0; i < size; ++i) {
        hash ^= static_cast<std::uint64_t>(bytes[i]);
        hash *= kFnvPrime;
    }
    return hash;
}

std::string to_hex(std::uint64_t hash) {
    std::ostringstream oss;
    oss << std::hex << std::setw(sizeof(hash) * 2) << std::setfill('0') << hash;
    return oss.str();
}

} // namespace

std::string fnv1a_hex(const void* data, std::size_t size) {
    return to_hex(fnv1a_update(kFnvOffset, static_cast<const unsigned char*>(data), size));
}

std::optional<std::string> checksum_file_range(const std::filesystem::path& path,
                                               std::uint64_t offset,
                                               std::uint64_t length) {
    if (path.empty()) {
        return std::nullopt;
    }

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        spdlog::debug("[Checksum] cannot open {}", path.string());
        return std::nullopt;
    }
    input.seekg(static_cast<std::streamoff>(offset));
    if (!input) {
        return std::nullopt;
    }

    std::uint64_t hash = kFnvOffset;
    std::uint64_t remaining = length;
    char buffer[4096];
    while (remaining > 0) {
        const auto want = static_cast<std::streamsize>(std::min<std::uint64_t>(remaining, sizeof(buffer)));
        input.read(buffer, want);
        const std::streamsize got = input.gcount();
        if (got <= 0) {
            spdlog::debug("[Checksum] {} ended {} bytes early", path.string(), remaining);
            return std::nullopt;
        }
        hash = fnv1a_update(hash, reinterpret_cast<const unsigned char*>(buffer), static_cast<std::size_t>(got));
        remaining -= static_cast<std::uint64_t>(got);
    }
    return to_hex(hash);
}

} // namespace upq::transfer
