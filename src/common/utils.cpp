/*
 * PeerLink - utility helpers implementation
 */

#include "utils.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>
#include <stdexcept>

#include <openssl/rand.h>

namespace peerlink {

namespace {
std::mutex g_log_mutex;
LogLevel g_current_level = LogLevel::Info;
std::unique_ptr<FileLogger> g_file_logger;

std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
        default:
            return "LOG";
    }
}

bool write_all_fd(int fd, const uint8_t* data, std::size_t len) {
    std::size_t total = 0;
    while (total < len) {
        ssize_t written = ::write(fd, data + total, len - total);
        if (written < 0 && errno == EINTR) {
            continue;
        }
        if (written <= 0) {
            return false;
        }
        total += static_cast<std::size_t>(written);
    }
    return true;
}
} // namespace

void set_log_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_current_level = level;
}

std::optional<LogLevel> parse_log_level(const std::string& name) {
    const std::string lowered = to_lower(trim(name));
    if (lowered == "debug") {
        return LogLevel::Debug;
    }
    if (lowered == "info") {
        return LogLevel::Info;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::Warn;
    }
    if (lowered == "error") {
        return LogLevel::Error;
    }
    return std::nullopt;
}

void set_log_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (path.empty()) {
        g_file_logger.reset();
        return;
    }
    g_file_logger = std::make_unique<FileLogger>(path);
}

void log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (static_cast<int>(level) < static_cast<int>(g_current_level)) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto now_time = std::chrono::system_clock::to_time_t(now);
    std::tm tm_now {};
    localtime_r(&now_time, &tm_now);

    std::ostringstream oss;
    oss << "[" << level_to_string(level) << " "
        << std::put_time(&tm_now, "%Y-%m-%d %H:%M:%S") << "] " << message;
    std::cerr << oss.str() << std::endl;

    if (g_file_logger) {
        try {
            g_file_logger->write(oss.str());
        } catch (const std::exception& ex) {
            std::cerr << "[WARN] file logging disabled: " << ex.what() << std::endl;
            g_file_logger.reset();
        }
    }
}

std::vector<uint8_t> random_bytes(std::size_t count) {
    std::vector<uint8_t> buffer(count);
    if (count == 0) {
        return buffer;
    }
    if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return buffer;
}

std::string random_uuid() {
    auto bytes = random_bytes(16);
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);
    std::string hex = hex_encode(bytes);
    std::transform(hex.begin(), hex.end(), hex.begin(), [](unsigned char ch) {
        return static_cast<char>(std::toupper(ch));
    });
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20);
}

std::string hex_encode(const std::vector<uint8_t>& data) {
    return hex_encode(data.data(), data.size());
}

std::string hex_encode(const uint8_t* data, std::size_t len) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        out[i * 2] = kHex[(data[i] >> 4) & 0x0F];
        out[i * 2 + 1] = kHex[data[i] & 0x0F];
    }
    return out;
}

std::optional<std::vector<uint8_t>> hex_decode(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }
    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') {
            return c - '0';
        }
        if (c >= 'a' && c <= 'f') {
            return 10 + (c - 'a');
        }
        if (c >= 'A' && c <= 'F') {
            return 10 + (c - 'A');
        }
        return -1;
    };
    std::vector<uint8_t> out;
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        const int hi = nibble(hex[i]);
        const int lo = nibble(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

uint64_t monotonic_millis() {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
}

int64_t wall_clock_millis() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
}

std::string trim(const std::string& input) {
    auto begin = std::find_if_not(input.begin(), input.end(), [](unsigned char ch) {
        return std::isspace(ch);
    });
    auto end = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char ch) {
        return std::isspace(ch);
    }).base();
    if (begin >= end) {
        return {};
    }
    return std::string(begin, end);
}

std::string to_lower(std::string input) {
    for (auto& ch : input) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return input;
}

std::vector<std::string> split(const std::string& input, char delimiter) {
    std::vector<std::string> parts;
    std::string token;
    std::istringstream iss(input);
    while (std::getline(iss, token, delimiter)) {
        parts.push_back(token);
    }
    return parts;
}

std::string short_id(const std::string& id) {
    return id.size() > 8 ? id.substr(0, 8) : id;
}

bool atomic_write_file(const std::filesystem::path& path,
                       const std::vector<uint8_t>& data,
                       std::error_code& ec) {
    ec.clear();
    if (path.empty()) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }

    std::filesystem::path tmp = path;
    tmp += ".tmp-" + hex_encode(random_bytes(4));
    const int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_TRUNC, 0600);
    if (fd < 0) {
        ec = std::error_code(errno, std::generic_category());
        return false;
    }

    if (!write_all_fd(fd, data.data(), data.size()) || ::fsync(fd) != 0) {
        ec = std::error_code(errno, std::generic_category());
        ::close(fd);
        std::error_code ignore;
        std::filesystem::remove(tmp, ignore);
        return false;
    }
    if (::close(fd) != 0) {
        ec = std::error_code(errno, std::generic_category());
        std::error_code ignore;
        std::filesystem::remove(tmp, ignore);
        return false;
    }
    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        ec = std::error_code(errno, std::generic_category());
        std::error_code ignore;
        std::filesystem::remove(tmp, ignore);
        return false;
    }
    return true;
}

std::optional<std::vector<uint8_t>> read_file_bytes(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)),
                              std::istreambuf_iterator<char>());
    if (in.bad()) {
        return std::nullopt;
    }
    return data;
}

FileLogger::FileLogger(std::string path) : path_(std::move(path)) {}

FileLogger::~FileLogger() = default;

void FileLogger::write(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(path_, std::ios::app);
    if (!out) {
        throw std::runtime_error("Failed to open log file: " + path_);
    }
    out << line << '\n';
    out.flush();
}

} // namespace peerlink
