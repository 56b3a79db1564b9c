#pragma once

/** \file test_helpers.hpp
 *  \brief Shared fixtures: deterministic vectors, env overrides, temp dirs.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "quiver/core/platform_utils.hpp"

namespace quiver::test {

inline auto random_vectors(std::size_t n, std::size_t dim, std::uint32_t seed = 42)
    -> std::vector<std::vector<float>> {
    std::mt19937 rng(seed);
    std::normal_distribution<float> dist(0.0f, 1.0f);
    std::vector<std::vector<float>> out(n, std::vector<float>(dim));
    for (auto& v : out) {
        for (auto& x : v) x = dist(rng);
    }
    return out;
}

inline auto flatten(const std::vector<std::vector<float>>& vs) -> std::vector<float> {
    std::vector<float> flat;
    for (const auto& v : vs) flat.insert(flat.end(), v.begin(), v.end());
    return flat;
}

inline void set_env_var(const char* name, const char* value) {
#if defined(_WIN32)
    _putenv_s(name, value ? value : "");
#else
    if (value) setenv(name, value, 1); else unsetenv(name);
#endif
}

/** \brief Sets an environment variable for the lifetime of the guard. */
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name), previous_(core::safe_getenv(name)) {
        set_env_var(name, value);
    }
    ~ScopedEnv() { set_env_var(name_, previous_ ? previous_->c_str() : nullptr); }
    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
    const char* name_;
    std::optional<std::string> previous_;
};

/** \brief Unique directory under the system temp dir, removed on scope exit. */
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
                ("quiver_test_" + std::to_string(stamp) + "_" + std::to_string(counter.fetch_add(1)));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    auto path() const -> const std::filesystem::path& { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace quiver::test
