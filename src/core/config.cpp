#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>

namespace fs = std::filesystem;

static const char* DEFAULT_PROJECT_CONFIG = R"(# volt project configuration

# Cache slot for this project. Keep it stable, share it between machines.
volt_id: "{volt_id}"

# Server profile to use (a file in ~/.volt/servers)
server: ""

# Directories synchronized with the cache server
cache:
  - build

# Optional: directories fingerprinted instead of the cache directories
# hash:
#   - src

# Build command wrapped by `volt run`
wrap: ""
)";

bool project_config_exists(const fs::path& dir) {
    return fs::exists(get_project_config_path(dir));
}

fs::path get_project_config_path(const fs::path& dir) {
    return dir / PROJECT_CONFIG_FILE;
}

bool is_safe_relative_dir(const std::string& dir) {
    if (dir.empty()) return false;
    fs::path p(dir);
    if (p.is_absolute() || p.has_root_name() || p.has_root_directory()) return false;

    bool has_component = false;
    for (const auto& part : p) {
        auto s = part.string();
        if (s == "..") return false;
        if (s.empty() || s == ".") continue;
        has_component = true;
    }
    return has_component;
}

const std::vector<std::string>& Config::fingerprint_dirs() const {
    return project_.hash.empty() ? project_.cache : project_.hash;
}

static std::vector<std::string> read_dir_list(const YAML::Node& node) {
    std::vector<std::string> dirs;
    if (!node) return dirs;
    if (node.IsSequence()) {
        for (const auto& d : node) dirs.push_back(d.as<std::string>(""));
    } else if (node.IsScalar()) {
        dirs.push_back(node.as<std::string>(""));
    }
    return dirs;
}

static Result<void> validate_dirs(const char* key, const std::vector<std::string>& dirs) {
    for (const auto& d : dirs) {
        if (!is_safe_relative_dir(d)) {
            return Result<void>::Err(fmt::format(
                "'{}' entry '{}' must be a directory inside the project", key, d));
        }
    }
    return Result<void>::Ok();
}

Result<Config> Config::load(const fs::path& dir) {
    return load_file(get_project_config_path(dir));
}

Result<Config> Config::load_file(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err(fmt::format(
            "No {} found at {} (run `volt init`)", PROJECT_CONFIG_FILE, path.string()));
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
    }

    Config config;
    config.project_dir_ = fs::absolute(path).parent_path();

    auto& p = config.project_;
    try {
        p.volt_id = node["volt_id"].as<std::string>("");
        p.server = node["server"].as<std::string>("");
        p.cache = read_dir_list(node["cache"]);
        p.hash = read_dir_list(node["hash"]);
        p.wrap = node["wrap"].as<std::string>("");
        p.timeout = node["timeout"].as<int>(DEFAULT_TRANSFER_TIMEOUT_SECS);
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(fmt::format("Invalid {}: {}", path.string(), e.what()));
    }

    // Untouched template: everything but the id still at its default
    if (p.server.empty() && p.wrap.empty() && p.hash.empty() &&
        p.cache == std::vector<std::string>{"build"}) {
        return Result<Config>::Err("Configuration matches default template - please edit it.");
    }

    if (!is_valid_uuid(p.volt_id)) {
        return Result<Config>::Err(fmt::format("volt_id '{}' is not a valid UUID", p.volt_id));
    }
    if (p.server.empty()) {
        return Result<Config>::Err("No server profile set (`server:` in volt.yaml)");
    }
    if (p.cache.empty()) {
        return Result<Config>::Err("No cache directories configured (`cache:` in volt.yaml)");
    }
    if (p.timeout <= 0) {
        return Result<Config>::Err("timeout must be a positive number of seconds");
    }

    auto cache_ok = validate_dirs("cache", p.cache);
    if (cache_ok.is_err()) return Result<Config>::Err(cache_ok.error);
    auto hash_ok = validate_dirs("hash", p.hash);
    if (hash_ok.is_err()) return Result<Config>::Err(hash_ok.error);

    return Result<Config>::Ok(config);
}

Result<std::string> create_default_project_config(const fs::path& path) {
    // Don't overwrite existing config
    if (fs::exists(path)) {
        return Result<std::string>::Err(fmt::format("{} already exists", path.string()));
    }

    std::string id = generate_uuid_v4();
    std::string content = DEFAULT_PROJECT_CONFIG;
    content.replace(content.find("{volt_id}"), 9, id);

    try {
        if (path.has_parent_path()) fs::create_directories(path.parent_path());
        std::ofstream out(path);
        if (!out) {
            return Result<std::string>::Err("Failed to create config file at " + path.string());
        }
        out << content;
        out.close();
        return Result<std::string>::Ok(id);
    } catch (const std::exception& e) {
        return Result<std::string>::Err("Failed to write config file: " + std::string(e.what()));
    }
}

Result<ServerConfig> load_server_config(const fs::path& path) {
    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        return Result<ServerConfig>::Err(fmt::format("Failed to load {}: {}", path.string(), e.what()));
    }

    ServerConfig config;
    try {
        config.auth_token = node["auth_token"].as<std::string>("");
        config.cache_dir = node["cache_dir"].as<std::string>("cache");
        config.address = node["address"].as<std::string>(DEFAULT_SERVER_ADDRESS);
        config.threads = node["threads"].as<int>(4);
        config.idle_timeout = node["idle_timeout"].as<int>(DEFAULT_IDLE_TIMEOUT_SECS);
        config.log_file = node["log_file"].as<std::string>("");
    } catch (const YAML::Exception& e) {
        return Result<ServerConfig>::Err(fmt::format("Invalid {}: {}", path.string(), e.what()));
    }

    if (config.auth_token.empty()) {
        return Result<ServerConfig>::Err("auth_token must be set");
    }
    if (config.threads < 1) config.threads = 1;
    if (config.idle_timeout < 1) {
        return Result<ServerConfig>::Err("idle_timeout must be at least 1 second");
    }
    if (config.cache_dir.is_relative()) {
        config.cache_dir = path.parent_path() / config.cache_dir;
    }
    if (!config.log_file.empty() && config.log_file.is_relative()) {
        config.log_file = path.parent_path() / config.log_file;
    }

    auto addr = parse_listen_address(config.address);
    if (addr.is_err()) return Result<ServerConfig>::Err(addr.error);

    return Result<ServerConfig>::Ok(config);
}

Result<ListenAddress> parse_listen_address(const std::string& address) {
    auto bad = [&](const std::string& why) {
        return Result<ListenAddress>::Err(fmt::format("Invalid address '{}': {}", address, why));
    };

    auto colon = address.rfind(':');
    if (colon == std::string::npos) return bad("expected host:port");

    ListenAddress out;
    out.host = address.substr(0, colon);
    if (out.host.size() >= 2 && out.host.front() == '[' && out.host.back() == ']') {
        out.host = out.host.substr(1, out.host.size() - 2);
    }
    if (out.host.empty()) return bad("missing host");

    std::string port = address.substr(colon + 1);
    if (port.empty() || port.size() > 5 ||
        port.find_first_not_of("0123456789") != std::string::npos) {
        return bad("port must be a number");
    }
    int value = safe_stoi(port, -1);
    if (value < 0 || value > 65535) return bad("port out of range");
    out.port = static_cast<unsigned short>(value);

    return Result<ListenAddress>::Ok(out);
}
