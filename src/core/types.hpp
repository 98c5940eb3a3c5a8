#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>
#include <filesystem>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Named remote cache target, read from ~/.volt/servers/<name>
struct ServerProfile {
    std::string name;
    bool tls = false;
    std::string address;                         // host[:port]
    std::optional<std::string> token;
};

// What the cache client needs to reach a server: nothing more.
struct ServerEndpoint {
    std::string base_url;                        // e.g. "https://cache.example.com:8443"
    std::string authorization;                   // "Bearer <token>", empty when no token
};

// Project configuration (./volt.yaml)
struct ProjectConfig {
    std::string volt_id;                         // cache slot UUID
    std::string server;                          // server profile name
    std::vector<std::string> cache;              // directories synchronized with the server
    std::vector<std::string> hash;               // directories fingerprinted (defaults to cache)
    std::string wrap;                            // build command
    int timeout = 300;                           // transfer timeout in seconds
};

// Cache server configuration (config.yaml next to volt-server)
struct ServerConfig {
    std::string auth_token;
    std::filesystem::path cache_dir;
    std::string address;                         // host:port to listen on
    int threads = 4;
    int idle_timeout = 60;                       // seconds without transfer progress
    std::filesystem::path log_file;              // empty = stderr only
};

// Status callback for long-running operations
using StatusCallback = std::function<void(const std::string&)>;
