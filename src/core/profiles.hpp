#pragma once

#include <string>
#include <map>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

// Server profiles live in ~/.volt/servers, one file per profile. The file
// stem is the profile name, the content a single line:
//
//     [tls://][token@]address[:port]
//
Result<ServerProfile> parse_server_profile(const std::string& name,
                                           const std::string& line);

fs::path get_servers_dir();

class ProfileStore {
public:
    explicit ProfileStore(fs::path dir = get_servers_dir());

    // Read every profile file. A malformed file fails the whole load.
    Result<std::map<std::string, ServerProfile>> load_all() const;

    // Look up one profile by name. Unknown names are an error.
    Result<ServerProfile> get(const std::string& name) const;

    const fs::path& dir() const { return dir_; }

private:
    fs::path dir_;
};

// Base URL and Authorization header value for a profile.
ServerEndpoint make_endpoint(const ServerProfile& profile);
