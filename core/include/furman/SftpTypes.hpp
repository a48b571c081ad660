// Basic types for SFTP sessions and remote metadata used by the SFTP backend.
#pragma once
#include <string>
#include <optional>
#include <cstdint>

namespace furman {

struct FileInfo {
    std::string   name;     // base name
    bool          is_dir = false;
    std::uint64_t size  = 0;  // bytes (if applicable)
    std::uint64_t mtime = 0;  // epoch (seconds)
};

struct SessionOptions {
    std::string host;
    std::uint16_t port = 22;
    std::string username;

    std::optional<std::string> password;
    std::optional<std::string> private_key_path;
    std::optional<std::string> private_key_passphrase;
};

} // namespace furman
