/*
 * PeerLink node entry point
 */

#include "config.hpp"
#include "node.hpp"
#include "utils.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

using namespace peerlink;

namespace {

std::mutex g_io_mutex;

void print_line(const std::string& text) {
    std::lock_guard<std::mutex> lock(g_io_mutex);
    std::cout << "\n" << text << std::endl;
}

class Console : public SessionObserver, public ChatSink, public CallSink {
public:
    void on_state_changed(const ConnectionState& state) override {
        if (state.status == ConnectionStatus::Transferring) {
            return;
        }
        print_line("* " + state.to_string());
    }

    void on_incoming_request(const PeerIdentity& peer) override {
        std::string text = "* " + peer.display_name + " (" + short_id(peer.id) + ") wants to connect";
        if (peer.certificate_fingerprint) {
            text += "\n  fingerprint " + format_fingerprint(*peer.certificate_fingerprint);
        }
        print_line(text + "\n  /accept or /reject [reason]");
    }

    void on_notice(const std::string& text) override { print_line("* " + text); }

    void on_security_warning(const std::string& text) override { print_line("!! SECURITY WARNING: " + text); }

    void on_batch_complete(const BatchSummary& summary) override {
        print_line("* batch " + short_id(summary.batch_id) + ": " + std::to_string(summary.succeeded) + " ok, " +
                   std::to_string(summary.failed) + " failed");
    }

    void on_text_message(const std::string& peer_id, const TextMessagePayload& message) override {
        std::string sender = message.sender_name ? *message.sender_name : short_id(peer_id);
        print_line("<" + sender + "> " + message.text);
    }

    void on_media_message(const std::string& peer_id, const MediaMessagePayload& message) override {
        print_line("<" + short_id(peer_id) + "> [" + message.mime_type + "] " + message.file_name);
    }

    void on_chat_rejected(const std::optional<std::string>& reason) override {
        print_line("* message rejected" + (reason ? ": " + *reason : std::string()));
    }

    void on_call_request(const std::string& peer_id) override {
        print_line("* incoming call from " + short_id(peer_id) + " - /answer or /hangup");
    }

    void on_call_started(const std::string&) override { print_line("* call started"); }

    void on_call_rejected(const std::optional<std::string>& reason) override {
        print_line("* call declined" + (reason ? ": " + *reason : std::string()));
    }

    void on_call_ended(const std::string&) override { print_line("* call ended"); }
};

void show_help() {
    std::lock_guard<std::mutex> lock(g_io_mutex);
    std::cout << "\nCommands:\n"
              << "  /peer <id> <host> <port> [name] - add a reachable peer\n"
              << "  /connect <id>                   - connect to a peer\n"
              << "  /accept | /reject [reason]      - answer an incoming request\n"
              << "  /send <path>...                 - send files\n"
              << "  /msg <text>                     - send a chat message\n"
              << "  /call | /answer | /hangup       - voice call signaling\n"
              << "  /cancel                         - cancel the running transfer\n"
              << "  /disconnect | /reconnect        - end or retry the session\n"
              << "  /state | /history | /fingerprint\n"
              << "  /quit                           - exit\n"
              << "  <text>                          - same as /msg\n";
}

std::string rest_after(const std::string& line, std::size_t words) {
    std::size_t pos = 0;
    for (std::size_t i = 0; i < words; ++i) {
        pos = line.find(' ', pos);
        if (pos == std::string::npos) {
            return {};
        }
        pos = line.find_first_not_of(' ', pos);
        if (pos == std::string::npos) {
            return {};
        }
    }
    return line.substr(pos);
}

void show_history(const PeerNode& node) {
    auto entries = node.history();
    std::lock_guard<std::mutex> lock(g_io_mutex);
    if (entries.empty()) {
        std::cout << "\nNo transfers yet.\n";
        return;
    }
    std::cout << "\nTransfers (newest first):\n";
    for (const auto& entry : entries) {
        std::cout << "  " << transfer_direction_name(entry.direction) << " " << entry.file_name << " ("
                  << entry.file_size << " bytes) " << short_id(entry.peer_id) << " "
                  << (entry.success ? std::string("ok") : entry.error.value_or("failed")) << "\n";
    }
}

// Returns false when the user asked to quit.
bool process_command(PeerNode& node, const std::string& input) {
    std::string line = trim(input);
    if (line.empty()) {
        return true;
    }
    if (line[0] != '/') {
        node.send_message(line);
        return true;
    }

    auto parts = split(line, ' ');
    parts.erase(std::remove(parts.begin(), parts.end(), std::string()), parts.end());
    const std::string& command = parts[0];

    if (command == "/quit") {
        return false;
    } else if (command == "/help") {
        show_help();
    } else if (command == "/peer") {
        if (parts.size() < 4) {
            print_line("Usage: /peer <id> <host> <port> [name]");
            return true;
        }
        PeerCandidate peer;
        peer.id = parts[1];
        peer.host = parts[2];
        try {
            int port = std::stoi(parts[3]);
            if (port <= 0 || port > 65535) {
                throw std::out_of_range("port");
            }
            peer.port = static_cast<uint16_t>(port);
        } catch (const std::exception&) {
            print_line("Invalid port: " + parts[3]);
            return true;
        }
        peer.display_name = parts.size() >= 5 ? rest_after(line, 4) : short_id(peer.id);
        node.add_peer(peer);
        print_line("* added " + peer.display_name + " at " + peer.host + ":" + std::to_string(peer.port));
    } else if (command == "/connect") {
        if (parts.size() < 2) {
            print_line("Usage: /connect <id>");
            return true;
        }
        node.connect(parts[1]);
    } else if (command == "/accept") {
        node.accept();
    } else if (command == "/reject") {
        std::string reason = rest_after(line, 1);
        node.reject(reason.empty() ? std::nullopt : std::optional<std::string>(reason));
    } else if (command == "/send") {
        if (parts.size() < 2) {
            print_line("Usage: /send <path>...");
            return true;
        }
        std::vector<std::filesystem::path> paths(parts.begin() + 1, parts.end());
        node.send_files(paths);
    } else if (command == "/msg") {
        std::string text = rest_after(line, 1);
        if (text.empty()) {
            print_line("Usage: /msg <text>");
            return true;
        }
        node.send_message(text);
    } else if (command == "/call") {
        node.start_call();
    } else if (command == "/answer") {
        node.accept_call();
    } else if (command == "/hangup") {
        if (node.state().status == ConnectionStatus::VoiceCall) {
            node.end_call();
        } else {
            node.reject_call(std::nullopt);
        }
    } else if (command == "/cancel") {
        node.cancel_transfer();
    } else if (command == "/disconnect") {
        node.disconnect();
    } else if (command == "/reconnect") {
        if (!node.reconnect()) {
            print_line("* cannot reconnect");
        }
    } else if (command == "/state") {
        auto remote = node.remote_peer();
        print_line("* " + node.state().to_string() +
                   (remote ? " with " + remote->display_name + " (" + short_id(remote->id) + ")" : std::string()));
    } else if (command == "/history") {
        show_history(node);
    } else if (command == "/fingerprint") {
        print_line("* " + node.peer_id() + " listening on port " + std::to_string(node.listen_port()) +
                   "\n  fingerprint " + format_fingerprint(node.fingerprint()));
    } else {
        print_line("Unknown command " + command + " - try /help");
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    NodeConfig config;
    try {
        config = parse_command_line(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const std::exception& ex) {
        std::cerr << "Configuration error: " << ex.what() << "\n"
                  << "Usage: peerlink_node [config-file] [--key=value ...]\n";
        return 1;
    }

    set_log_level(config.log_level);
    if (!config.log_file.empty()) {
        set_log_file(config.log_file);
    }

    Console console;
    PeerNode node(config);
    node.set_observer(&console);
    node.set_chat_sink(&console);
    node.set_call_sink(&console);

    try {
        node.start();
    } catch (const std::exception& ex) {
        log_error(std::string("Node error: ") + ex.what());
        return 1;
    }

    std::cout << "PeerLink " << config.display_name << " (" << node.peer_id() << ") on port " << node.listen_port()
              << "\nFingerprint " << format_fingerprint(node.fingerprint()) << "\nType /help for commands.\n";

    std::string line;
    while (std::getline(std::cin, line)) {
        if (!process_command(node, line)) {
            break;
        }
    }

    if (node.state().is_active()) {
        node.disconnect();
        node.wait_for_state(ConnectionStatus::Disconnected, std::chrono::seconds(2));
    }
    node.stop();
    return 0;
}
