/*
 * PeerLink - node configuration implementation
 */

#include "config.hpp"

#include "payloads.hpp"

#include <fstream>
#include <limits>
#include <stdexcept>

#include <unistd.h>

namespace peerlink {

namespace {

uint64_t parse_unsigned(const std::string& key, const std::string& value, uint64_t max) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument(key + ": expected a non-negative integer, got '" + value + "'");
    }
    uint64_t parsed = 0;
    try {
        parsed = std::stoull(value);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(key + ": value out of range");
    }
    if (parsed > max) {
        throw std::invalid_argument(key + ": value out of range");
    }
    return parsed;
}

bool parse_bool(const std::string& key, const std::string& value) {
    std::string lowered = to_lower(value);
    if (lowered == "true" || lowered == "yes" || lowered == "on" || lowered == "1") {
        return true;
    }
    if (lowered == "false" || lowered == "no" || lowered == "off" || lowered == "0") {
        return false;
    }
    throw std::invalid_argument(key + ": expected true or false, got '" + value + "'");
}

uint32_t parse_millis(const std::string& key, const std::string& value) {
    auto parsed = parse_unsigned(key, value, std::numeric_limits<uint32_t>::max());
    if (parsed == 0) {
        throw std::invalid_argument(key + ": must be greater than zero");
    }
    return static_cast<uint32_t>(parsed);
}

std::string host_name() {
    char buffer[256] = {};
    if (::gethostname(buffer, sizeof(buffer) - 1) != 0 || buffer[0] == '\0') {
        return "peerlink";
    }
    return buffer;
}

} // namespace

std::filesystem::path NodeConfig::effective_download_dir() const {
    return download_dir.empty() ? data_dir / "downloads" : download_dir;
}

NodeConfig default_config() {
    NodeConfig config;
    config.display_name = host_name();
    config.peer_id = random_uuid();
    return config;
}

void apply_config_value(NodeConfig& config, const std::string& key, const std::string& value) {
    if (key == "display_name") {
        if (value.empty()) {
            throw std::invalid_argument(key + ": must not be empty");
        }
        config.display_name = value;
    } else if (key == "peer_id") {
        if (!is_valid_peer_id(value)) {
            throw std::invalid_argument(key + ": must be 1-" + std::to_string(kMaxPeerIdLength) +
                                        " characters without whitespace");
        }
        config.peer_id = value;
    } else if (key == "listen_port") {
        config.listen_port = static_cast<uint16_t>(parse_unsigned(key, value, 65535));
    } else if (key == "bind_address") {
        config.bind_address = value;
    } else if (key == "data_dir") {
        if (value.empty()) {
            throw std::invalid_argument(key + ": must not be empty");
        }
        config.data_dir = value;
    } else if (key == "download_dir") {
        config.download_dir = value;
    } else if (key == "chunk_size") {
        auto parsed = parse_unsigned(key, value, 16ull * 1024 * 1024);
        if (parsed < 1024) {
            throw std::invalid_argument(key + ": must be at least 1024");
        }
        config.chunk_size = static_cast<std::size_t>(parsed);
    } else if (key == "heartbeat_interval_ms") {
        config.heartbeat_interval_ms = parse_millis(key, value);
    } else if (key == "heartbeat_timeout_ms") {
        config.heartbeat_timeout_ms = parse_millis(key, value);
    } else if (key == "establish_timeout_ms") {
        config.establish_timeout_ms = parse_millis(key, value);
    } else if (key == "offer_response_timeout_ms") {
        config.offer_response_timeout_ms = parse_millis(key, value);
    } else if (key == "tick_interval_ms") {
        config.tick_interval_ms = parse_millis(key, value);
    } else if (key == "file_transfer_enabled") {
        config.file_transfer_enabled = parse_bool(key, value);
    } else if (key == "chat_enabled") {
        config.chat_enabled = parse_bool(key, value);
    } else if (key == "voice_enabled") {
        config.voice_enabled = parse_bool(key, value);
    } else if (key == "key_store") {
        const std::string kind = to_lower(trim(value));
        if (kind == "auto") {
            config.key_store = KeyStoreKind::Auto;
        } else if (kind == "secret_service") {
            config.key_store = KeyStoreKind::SecretService;
        } else if (kind == "file") {
            config.key_store = KeyStoreKind::File;
        } else {
            throw std::invalid_argument(key + ": expected auto, secret_service or file, got '" + value + "'");
        }
    } else if (key == "log_level") {
        auto level = parse_log_level(value);
        if (!level) {
            throw std::invalid_argument(key + ": expected debug, info, warn or error, got '" + value + "'");
        }
        config.log_level = *level;
    } else if (key == "log_file") {
        config.log_file = value;
    } else {
        throw std::invalid_argument("unknown configuration key: " + key);
    }
}

void load_config_file(NodeConfig& config, const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot read configuration file " + path.string());
    }
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(in, line)) {
        ++line_number;
        auto hash = line.find('#');
        if (hash != std::string::npos) {
            line.erase(hash);
        }
        line = trim(line);
        if (line.empty()) {
            continue;
        }
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw std::invalid_argument(path.string() + ":" + std::to_string(line_number) +
                                        ": expected key=value");
        }
        apply_config_value(config, trim(line.substr(0, eq)), trim(line.substr(eq + 1)));
    }
}

NodeConfig parse_command_line(const std::vector<std::string>& args) {
    NodeConfig config = default_config();
    std::size_t index = 0;
    if (!args.empty() && args[0].rfind("--", 0) != 0) {
        load_config_file(config, args[0]);
        index = 1;
    }
    for (; index < args.size(); ++index) {
        const std::string& arg = args[index];
        if (arg.rfind("--", 0) != 0) {
            throw std::invalid_argument("unexpected argument: " + arg);
        }
        auto eq = arg.find('=');
        if (eq == std::string::npos) {
            throw std::invalid_argument(arg.substr(2) + ": expected --key=value");
        }
        apply_config_value(config, arg.substr(2, eq - 2), arg.substr(eq + 1));
    }
    return config;
}

} // namespace peerlink
