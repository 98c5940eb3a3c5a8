#include "profiles.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <fstream>
#include <sstream>
#include <cctype>

fs::path get_servers_dir() {
    return platform::home_dir() / ".volt" / "servers";
}

static bool valid_port(const std::string& port) {
    if (port.empty() || port.size() > 5) return false;
    for (char c : port) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    int n = safe_stoi(port, -1);
    return n > 0 && n <= 65535;
}

Result<ServerProfile> parse_server_profile(const std::string& name,
                                           const std::string& line) {
    std::string rest = line;
    trim(rest);
    if (rest.empty()) {
        return Result<ServerProfile>::Err(fmt::format("server '{}': empty server line", name));
    }

    ServerProfile profile;
    profile.name = name;

    auto scheme_end = rest.find("://");
    if (scheme_end != std::string::npos) {
        std::string scheme = rest.substr(0, scheme_end);
        if (scheme != "tls") {
            return Result<ServerProfile>::Err(
                fmt::format("server '{}': unsupported scheme '{}' (only tls:// is allowed)", name, scheme));
        }
        profile.tls = true;
        rest = rest.substr(scheme_end + 3);
    }

    auto at = rest.rfind('@');
    if (at != std::string::npos) {
        std::string token = rest.substr(0, at);
        if (token.empty()) {
            return Result<ServerProfile>::Err(fmt::format("server '{}': empty token before '@'", name));
        }
        profile.token = token;
        rest = rest.substr(at + 1);
    }

    if (rest.empty()) {
        return Result<ServerProfile>::Err(fmt::format("server '{}': missing address", name));
    }
    for (char c : rest) {
        if (std::isspace(static_cast<unsigned char>(c)) || c == '/' || c == '?' || c == '#') {
            return Result<ServerProfile>::Err(fmt::format("server '{}': malformed address '{}'", name, rest));
        }
    }

    // Bracketed IPv6 literals carry colons of their own
    auto colon = rest.rfind(':');
    auto bracket = rest.rfind(']');
    if (colon != std::string::npos && (bracket == std::string::npos || colon > bracket)) {
        if (colon == 0 || !valid_port(rest.substr(colon + 1))) {
            return Result<ServerProfile>::Err(fmt::format("server '{}': invalid port in '{}'", name, rest));
        }
    }

    profile.address = rest;
    return Result<ServerProfile>::Ok(profile);
}

ProfileStore::ProfileStore(fs::path dir) : dir_(std::move(dir)) {}

Result<std::map<std::string, ServerProfile>> ProfileStore::load_all() const {
    using R = Result<std::map<std::string, ServerProfile>>;
    std::map<std::string, ServerProfile> profiles;

    std::error_code ec;
    if (!fs::is_directory(dir_, ec)) {
        return R::Ok(profiles);
    }

    for (const auto& entry : fs::directory_iterator(dir_, ec)) {
        if (!entry.is_regular_file()) continue;

        std::string name = entry.path().stem().string();
        if (name.empty() || name[0] == '.') continue;

        std::ifstream in(entry.path());
        if (!in) {
            return R::Err(fmt::format("failed to read server file {}", entry.path().string()));
        }
        std::stringstream ss;
        ss << in.rdbuf();

        auto parsed = parse_server_profile(name, ss.str());
        if (parsed.is_err()) return R::Err(parsed.error);
        profiles[name] = parsed.value;
    }
    if (ec) {
        return R::Err(fmt::format("failed to list {}: {}", dir_.string(), ec.message()));
    }

    return R::Ok(profiles);
}

Result<ServerProfile> ProfileStore::get(const std::string& name) const {
    if (name.empty()) {
        return Result<ServerProfile>::Err("no server profile configured");
    }

    auto all = load_all();
    if (all.is_err()) return Result<ServerProfile>::Err(all.error);

    auto it = all.value.find(name);
    if (it == all.value.end()) {
        return Result<ServerProfile>::Err(fmt::format("server '{}' does not exist", name));
    }
    return Result<ServerProfile>::Ok(it->second);
}

ServerEndpoint make_endpoint(const ServerProfile& profile) {
    ServerEndpoint ep;
    ep.base_url = fmt::format("{}://{}", profile.tls ? "https" : "http", profile.address);
    if (profile.token) ep.authorization = "Bearer " + *profile.token;
    return ep;
}
