#include "quiver/core/content_hash.hpp"

#include <openssl/evp.h>

namespace quiver::core {

namespace {

constexpr bool is_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

} // anonymous namespace

auto normalize_content(std::string_view text) -> std::string {
    if (text.size() >= 3 && static_cast<unsigned char>(text[0]) == 0xEF &&
        static_cast<unsigned char>(text[1]) == 0xBB && static_cast<unsigned char>(text[2]) == 0xBF) {
        text.remove_prefix(3);
    }

    std::string out;
    out.reserve(text.size());
    bool pending_space = false;
    for (char c : text) {
        if (is_space(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(c);
    }
    return out;
}

auto sha256(std::string_view bytes) -> std::expected<ContentHash, error> {
    ContentHash digest{};
    unsigned int len = 0;
    if (EVP_Digest(bytes.data(), bytes.size(), digest.data(), &len, EVP_sha256(), nullptr) != 1 ||
        len != digest.size()) {
        return std::unexpected(error{error_code::internal, "EVP_Digest(sha256) failed", "core.content_hash"});
    }
    return digest;
}

auto hash_content(std::string_view text) -> std::expected<ContentHash, error> {
    return sha256(normalize_content(text));
}

auto to_hex(const ContentHash& h) -> std::string {
    static constexpr char digits[] = "0123456789abcdef";
    std::string s;
    s.reserve(h.size() * 2);
    for (std::uint8_t b : h) {
        s.push_back(digits[b >> 4]);
        s.push_back(digits[b & 0x0F]);
    }
    return s;
}

} // namespace quiver::core
