// Test helpers shared by the Catch2 suites

#pragma once

#include <array>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace ragloop::test {

/**
 * @brief Sets (or unsets, with nullopt) an environment variable and restores the previous value
 * on scope exit.
 */
class ScopedEnvVar {
public:
    ScopedEnvVar(std::string key, std::optional<std::string> value)
        : key_(std::move(key)), previous_(read(key_)) {
        assign(key_, value);
    }

    ScopedEnvVar(const ScopedEnvVar&) = delete;
    ScopedEnvVar& operator=(const ScopedEnvVar&) = delete;

    ~ScopedEnvVar() { assign(key_, previous_); }

private:
    static std::optional<std::string> read(const std::string& key) {
        if (const auto* value = std::getenv(key.c_str())) {
            return std::string(value);
        }
        return std::nullopt;
    }

    static void assign(const std::string& key, const std::optional<std::string>& value) {
        if (value) {
            ::setenv(key.c_str(), value->c_str(), 1);
        } else {
            ::unsetenv(key.c_str());
        }
    }

    std::string key_;
    std::optional<std::string> previous_;
};

// Every variable the pipeline loader consults
inline constexpr std::array<const char*, 16> kPipelineEnvVars = {
    "RAGLOOP_CONFIG",      "RAGLOOP_POLICY",          "RETRIEVAL_TOP_K",
    "RERANK_TOP_K",        "FINAL_TOP_K",             "OPENAI_API_KEY",
    "RAGLOOP_LLM_API_KEY", "RAGLOOP_LLM_BASE_URL",    "LLM_MODEL",
    "RAGLOOP_CHAT_MODEL",  "EMBEDDING_MODEL",         "RAGLOOP_EMBEDDING_MODEL",
    "RAGLOOP_QDRANT_URL",  "RAGLOOP_ELASTIC_URL",     "RAGLOOP_LOG_LEVEL",
    "RAGLOOP_MAX_ATTEMPTS"};

/**
 * @brief Unsets all pipeline variables for the lifetime of the object so the host environment
 * cannot leak into config assertions.
 */
class ScopedPipelineEnvironment {
public:
    ScopedPipelineEnvironment() {
        for (const char* var : kPipelineEnvVars) {
            guards_.push_back(std::make_unique<ScopedEnvVar>(var, std::nullopt));
        }
    }

private:
    std::vector<std::unique_ptr<ScopedEnvVar>> guards_;
};

/**
 * @brief Temporary directory for config files, removed with its contents on scope exit.
 */
class ScopedConfigDir {
public:
    explicit ScopedConfigDir(std::string_view prefix = "ragloop_config_") {
        namespace fs = std::filesystem;
        thread_local std::mt19937_64 rng{std::random_device{}()};
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = fs::temp_directory_path() /
                (std::string(prefix) + std::to_string(stamp) + "_" + std::to_string(rng() % 100000));
        fs::create_directories(path_);
    }

    ScopedConfigDir(const ScopedConfigDir&) = delete;
    ScopedConfigDir& operator=(const ScopedConfigDir&) = delete;

    ~ScopedConfigDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path& path() const noexcept { return path_; }

    std::filesystem::path operator/(std::string_view name) const { return path_ / name; }

    // Writes a config file inside the directory and returns its path
    std::filesystem::path write(std::string_view name, std::string_view contents) const {
        auto file = path_ / name;
        std::ofstream stream(file, std::ios::binary | std::ios::trunc);
        stream.write(contents.data(), static_cast<std::streamsize>(contents.size()));
        return file;
    }

private:
    std::filesystem::path path_;
};

} // namespace ragloop::test
