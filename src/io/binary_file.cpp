#include "quiver/io/binary_file.hpp"

#include <fstream>
#include <iterator>
#include <system_error>

#if defined(__linux__) || defined(__APPLE__)
#include <fcntl.h>
#include <unistd.h>
#endif

namespace quiver::io {

namespace {

constexpr char TRAILER_MARK[4] = {'C', 'H', 'K', 'S'};
constexpr std::size_t HEADER_SIZE = sizeof(Magic) + 2 * sizeof(std::uint16_t);
constexpr std::size_t TRAILER_SIZE = sizeof(TRAILER_MARK) + sizeof(std::uint64_t);

auto fsync_path(const std::filesystem::path& p) -> bool {
#if defined(__linux__) || defined(__APPLE__)
    int fd = ::open(p.string().c_str(), O_RDONLY);
    if (fd < 0) return false;
    const bool ok = ::fsync(fd) == 0;
    (void)::close(fd);
    return ok;
#else
    (void)p;
    return true;
#endif
}

} // anonymous namespace

BinaryWriter::BinaryWriter(const Magic& magic, std::uint16_t major, std::uint16_t minor) {
    buf_.reserve(4096);
    put_bytes(magic.data(), magic.size());
    put(major);
    put(minor);
}

auto BinaryWriter::put_bytes(const void* p, std::size_t n) -> void {
    buf_.append(static_cast<const char*>(p), n);
}

auto BinaryWriter::put_string(std::string_view s) -> void {
    put(static_cast<std::uint32_t>(s.size()));
    put_bytes(s.data(), s.size());
}

auto BinaryWriter::put_floats(std::span<const float> v) -> void {
    put_bytes(v.data(), v.size_bytes());
}

auto BinaryWriter::commit(const std::filesystem::path& path) -> std::expected<void, core::error> {
    using core::error; using core::error_code;

    const std::uint64_t checksum = fnv1a(FNV_OFFSET, buf_.data(), buf_.size());
    put_bytes(TRAILER_MARK, sizeof(TRAILER_MARK));
    put(checksum);

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return std::unexpected(error{error_code::io_failed,
                "cannot create directory " + path.parent_path().string(), "io.binary"});
        }
    }

    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.good()) {
            return std::unexpected(error{error_code::io_failed, "open failed: " + tmp.string(), "io.binary"});
        }
        out.write(buf_.data(), static_cast<std::streamsize>(buf_.size()));
        out.flush();
        if (!out.good()) {
            std::filesystem::remove(tmp, ec);
            return std::unexpected(error{error_code::io_failed, "write failed: " + tmp.string(), "io.binary"});
        }
    }
    if (!fsync_path(tmp)) {
        std::filesystem::remove(tmp, ec);
        return std::unexpected(error{error_code::io_failed, "fsync failed: " + tmp.string(), "io.binary"});
    }
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        return std::unexpected(error{error_code::io_failed, "rename failed: " + path.string(), "io.binary"});
    }
    // Best-effort directory flush; the rename itself already succeeded.
    (void)fsync_path(path.has_parent_path() ? path.parent_path() : std::filesystem::path("."));
    return {};
}

auto BinaryReader::open(const std::filesystem::path& path, const Magic& magic,
                        std::uint16_t major) -> std::expected<BinaryReader, core::error> {
    using core::error; using core::error_code;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::unexpected(error{error_code::not_found, "missing artifact: " + path.string(), "io.binary"});
    }
    std::ifstream in(path, std::ios::binary);
    if (!in.good()) {
        return std::unexpected(error{error_code::io_failed, "open failed: " + path.string(), "io.binary"});
    }

    BinaryReader r;
    r.component_ = "io.binary";
    r.buf_.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (r.buf_.size() < HEADER_SIZE + TRAILER_SIZE) {
        return std::unexpected(error{error_code::data_integrity, "truncated artifact: " + path.string(), "io.binary"});
    }

    const std::size_t body_end = r.buf_.size() - TRAILER_SIZE;
    if (std::memcmp(r.buf_.data() + body_end, TRAILER_MARK, sizeof(TRAILER_MARK)) != 0) {
        return std::unexpected(error{error_code::data_integrity, "missing checksum trailer: " + path.string(), "io.binary"});
    }
    std::uint64_t stored = 0;
    std::memcpy(&stored, r.buf_.data() + body_end + sizeof(TRAILER_MARK), sizeof(stored));
    if (fnv1a(FNV_OFFSET, r.buf_.data(), body_end) != stored) {
        return std::unexpected(error{error_code::data_integrity, "checksum mismatch: " + path.string(), "io.binary"});
    }
    if (std::memcmp(r.buf_.data(), magic.data(), magic.size()) != 0) {
        return std::unexpected(error{error_code::data_integrity, "bad magic: " + path.string(), "io.binary"});
    }

    std::uint16_t file_major = 0;
    std::memcpy(&file_major, r.buf_.data() + magic.size(), sizeof(file_major));
    std::memcpy(&r.minor_, r.buf_.data() + magic.size() + sizeof(file_major), sizeof(r.minor_));
    if (file_major != major) {
        return std::unexpected(error{error_code::data_integrity,
            "unsupported version " + std::to_string(file_major) + ": " + path.string(), "io.binary"});
    }

    r.pos_ = HEADER_SIZE;
    r.end_ = body_end;
    return r;
}

auto BinaryReader::get_bytes(void* p, std::size_t n) -> std::expected<void, core::error> {
    if (n > end_ - pos_) {
        return std::unexpected(core::error{core::error_code::data_integrity, "unexpected end of artifact", component_});
    }
    std::memcpy(p, buf_.data() + pos_, n);
    pos_ += n;
    return {};
}

auto BinaryReader::get_string() -> std::expected<std::string, core::error> {
    auto len = get<std::uint32_t>();
    if (!len) return std::unexpected(len.error());
    if (*len > end_ - pos_) {
        return std::unexpected(core::error{core::error_code::data_integrity, "string length out of range", component_});
    }
    std::string s(buf_.data() + pos_, *len);
    pos_ += *len;
    return s;
}

auto BinaryReader::get_floats(std::size_t n) -> std::expected<std::vector<float>, core::error> {
    if (n > (end_ - pos_) / sizeof(float)) {
        return std::unexpected(core::error{core::error_code::data_integrity, "vector length out of range", component_});
    }
    std::vector<float> v(n);
    std::memcpy(v.data(), buf_.data() + pos_, n * sizeof(float));
    pos_ += n * sizeof(float);
    return v;
}

} // namespace quiver::io
