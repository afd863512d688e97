/*
 * PeerLink - node configuration
 */

#pragma once

#include "utils.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace peerlink {

// Where the at-rest key lives. Auto prefers the secret service and falls
// back to the key file when no secret service answers.
enum class KeyStoreKind {
    Auto,
    SecretService,
    File
};

struct NodeConfig {
    std::string display_name;
    std::string peer_id;
    uint16_t listen_port = 7780;
    std::string bind_address;
    std::filesystem::path data_dir = "peerlink-data";
    // Empty means <data_dir>/downloads.
    std::filesystem::path download_dir;
    std::size_t chunk_size = 64 * 1024;
    uint32_t heartbeat_interval_ms = 10000;
    uint32_t heartbeat_timeout_ms = 30000;
    uint32_t establish_timeout_ms = 15000;
    uint32_t offer_response_timeout_ms = 30000;
    uint32_t tick_interval_ms = 500;
    bool file_transfer_enabled = true;
    bool chat_enabled = true;
    bool voice_enabled = true;
    KeyStoreKind key_store = KeyStoreKind::Auto;
    LogLevel log_level = LogLevel::Info;
    std::string log_file;

    std::filesystem::path effective_download_dir() const;
};

// Hostname for the display name and a fresh identifier.
NodeConfig default_config();

// Throws std::invalid_argument naming the key when it is unknown or its value
// does not parse.
void apply_config_value(NodeConfig& config, const std::string& key, const std::string& value);

// key=value lines, '#' starts a comment. Throws std::invalid_argument on bad
// lines and std::runtime_error when the file cannot be read.
void load_config_file(NodeConfig& config, const std::filesystem::path& path);

// peerlink_node [config-file] [--key=value ...]; later values win.
NodeConfig parse_command_line(const std::vector<std::string>& args);

} // namespace peerlink
