/*
 * PeerLink - utility helpers
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace peerlink {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

void set_log_level(LogLevel level);

std::optional<LogLevel> parse_log_level(const std::string& name);

// Tees every log line into the given file. An empty path stops file logging.
void set_log_file(const std::string& path);

void log(LogLevel level, const std::string& message);

inline void log_info(const std::string& message) {
    log(LogLevel::Info, message);
}

inline void log_warn(const std::string& message) {
    log(LogLevel::Warn, message);
}

inline void log_error(const std::string& message) {
    log(LogLevel::Error, message);
}

inline void log_debug(const std::string& message) {
    log(LogLevel::Debug, message);
}

std::vector<uint8_t> random_bytes(std::size_t count);

// Random RFC 4122 version 4 identifier, uppercase like the identifiers peers exchange.
std::string random_uuid();

std::string hex_encode(const std::vector<uint8_t>& data);

std::string hex_encode(const uint8_t* data, std::size_t len);

// Either case. nullopt for odd lengths and non-hex characters.
std::optional<std::vector<uint8_t>> hex_decode(const std::string& hex);

uint64_t monotonic_millis();

int64_t wall_clock_millis();

std::string trim(const std::string& input);

std::string to_lower(std::string input);

std::vector<std::string> split(const std::string& input, char delimiter);

std::string short_id(const std::string& id);

// Writes through a 0600 temp file, fsyncs and renames over the target.
bool atomic_write_file(const std::filesystem::path& path,
                       const std::vector<uint8_t>& data,
                       std::error_code& ec);

std::optional<std::vector<uint8_t>> read_file_bytes(const std::filesystem::path& path);

class FileLogger {
public:
    explicit FileLogger(std::string path);
    ~FileLogger();

    void write(const std::string& line);

private:
    std::string path_;
    std::mutex mutex_;
};

} // namespace peerlink
