#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load project config from <dir>/volt.yaml
    static Result<Config> load(const fs::path& dir = fs::current_path());

    // Load from an explicit file; the project root is its parent directory
    static Result<Config> load_file(const fs::path& path);

    const ProjectConfig& project() const { return project_; }
    const fs::path& project_dir() const { return project_dir_; }

    // Directories fed to the fingerprint: `hash` when set, else `cache`
    const std::vector<std::string>& fingerprint_dirs() const;

public:
    Config() = default;

private:
    ProjectConfig project_;
    fs::path project_dir_;
};

bool project_config_exists(const fs::path& dir = fs::current_path());
fs::path get_project_config_path(const fs::path& dir = fs::current_path());

// Write a fresh volt.yaml with a newly minted slot id. Never overwrites.
// Returns the slot id.
Result<std::string> create_default_project_config(const fs::path& path);

// A configured directory must stay inside the project: relative, no "..",
// not the project root itself.
bool is_safe_relative_dir(const std::string& dir);

struct ListenAddress {
    std::string host;
    unsigned short port = 0;
};

// "host:port" or "[v6addr]:port"
Result<ListenAddress> parse_listen_address(const std::string& address);

// Server side config.yaml. Relative paths resolve against the file's directory.
Result<ServerConfig> load_server_config(const fs::path& path);
