#pragma once

/** \file binary_file.hpp
 *  \brief Checksummed binary artifacts with durable atomic replace.
 *
 * Layout: magic[8] | u16 major | u16 minor | body | "CHKS" | u64 fnv1a
 * where the FNV-1a 64 checksum covers every byte before the trailer mark.
 *
 * commit() writes to "<path>.tmp", fsyncs it, renames over <path> and fsyncs
 * the parent directory, so readers observe either the previous or the new
 * artifact, never a torn one.
 */

#include <array>
#include <cstdint>
#include <cstring>
#include <expected>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "quiver/error.hpp"

namespace quiver::io {

using Magic = std::array<char, 8>;

inline constexpr std::uint64_t FNV_OFFSET = 1469598103934665603ull;
inline constexpr std::uint64_t FNV_PRIME = 1099511628211ull;

inline auto fnv1a(std::uint64_t h, const void* p, std::size_t n) noexcept -> std::uint64_t {
    const auto* b = static_cast<const std::uint8_t*>(p);
    for (std::size_t i = 0; i < n; ++i) { h ^= b[i]; h *= FNV_PRIME; }
    return h;
}

/** \brief Buffers an artifact in memory and commits it atomically. */
class BinaryWriter {
public:
    BinaryWriter(const Magic& magic, std::uint16_t major, std::uint16_t minor);

    auto put_bytes(const void* p, std::size_t n) -> void;

    template <typename T>
    auto put(const T& value) -> void {
        static_assert(std::is_trivially_copyable_v<T>);
        put_bytes(&value, sizeof(T));
    }

    auto put_string(std::string_view s) -> void;
    auto put_floats(std::span<const float> v) -> void;

    /** \brief Append trailer and durably replace `path`. */
    auto commit(const std::filesystem::path& path) -> std::expected<void, core::error>;

private:
    std::string buf_;
};

/** \brief Reads a whole artifact, verifying magic and checksum up front. */
class BinaryReader {
public:
    /** \brief Open and verify.
     *
     * Errors: not_found when the file does not exist; data_integrity on bad
     * magic, unsupported major version, truncation, or checksum mismatch.
     */
    static auto open(const std::filesystem::path& path, const Magic& magic,
                     std::uint16_t major) -> std::expected<BinaryReader, core::error>;

    auto get_bytes(void* p, std::size_t n) -> std::expected<void, core::error>;

    template <typename T>
    auto get() -> std::expected<T, core::error> {
        static_assert(std::is_trivially_copyable_v<T>);
        T value{};
        if (auto r = get_bytes(&value, sizeof(T)); !r) return std::unexpected(r.error());
        return value;
    }

    auto get_string() -> std::expected<std::string, core::error>;
    auto get_floats(std::size_t n) -> std::expected<std::vector<float>, core::error>;

    auto minor_version() const noexcept -> std::uint16_t { return minor_; }
    auto remaining() const noexcept -> std::size_t { return end_ - pos_; }

private:
    BinaryReader() = default;

    std::string buf_;
    std::size_t pos_{0};
    std::size_t end_{0};
    std::uint16_t minor_{0};
    std::string component_;
};

} // namespace quiver::io
