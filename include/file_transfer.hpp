/*
 * PeerLink - chunked file transfer
 *
 * Per file: fileOffer(metadata incl. digest) -> fileAccept | fileReject ->
 * fileChunk... in order -> fileComplete(digest). Several files are wrapped in
 * batchStart / batchComplete. One outbound and one inbound transfer may be in
 * flight per session; the receiver relies on arrival order to feed its hash.
 */

#pragma once

#include "hash_verifier.hpp"
#include "payloads.hpp"
#include "protocol.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace peerlink {

constexpr uint64_t kStorageHeadroomBytes = 10ull * 1024 * 1024;

// Reject reasons carried in fileReject.
constexpr const char* kRejectInvalidName = "invalidName";
constexpr const char* kRejectInsufficientStorage = "insufficientStorage";
constexpr const char* kRejectIoError = "ioError";
constexpr const char* kRejectCancelled = "cancelled";

enum class TransferDirection : uint8_t {
    Sent,
    Received
};

const char* transfer_direction_name(TransferDirection direction);

struct TransferRecord {
    std::string id;
    std::string file_name;
    uint64_t file_size = 0;
    TransferDirection direction = TransferDirection::Sent;
    int64_t timestamp_ms = 0;
    bool success = false;
    std::string peer_id;
    std::optional<std::string> error;
    // Final location of a received file.
    std::optional<std::string> local_path;
};

TransferRecord make_transfer_record(const std::string& file_name,
                                    uint64_t file_size,
                                    TransferDirection direction,
                                    const std::string& peer_id);

// History collaborator; records arrive on the session's event thread.
class TransferRecordSink {
public:
    virtual ~TransferRecordSink() = default;
    virtual void record_transfer(const TransferRecord& record) = 0;
};

std::string guess_mime_type(const std::filesystem::path& path);

bool is_safe_file_name(const std::string& name);

class FileChunkReader {
public:
    // Throws PeerLinkError(IoFailure) when the file cannot be opened.
    explicit FileChunkReader(const std::filesystem::path& path, std::size_t chunk_size = kDefaultChunkSize);

    // nullopt at end of file. Throws PeerLinkError(IoFailure) on read errors.
    std::optional<std::vector<uint8_t>> next();

    uint64_t file_size() const { return file_size_; }
    uint64_t bytes_read() const { return bytes_read_; }

private:
    std::filesystem::path path_;
    std::ifstream in_;
    std::size_t chunk_size_;
    uint64_t file_size_ = 0;
    uint64_t bytes_read_ = 0;
};

using EnvelopeSender = std::function<bool(const Envelope&)>;
using ProgressCallback = std::function<void(double)>;

class FileSender {
public:
    FileSender(std::string local_id,
               std::string peer_id,
               EnvelopeSender send,
               std::size_t chunk_size = kDefaultChunkSize,
               std::chrono::milliseconds offer_timeout = std::chrono::seconds(30));

    // Runs on the calling thread until every file is accounted for. Returns
    // one record per path, in order.
    std::vector<TransferRecord> send_files(const std::vector<std::filesystem::path>& paths,
                                           const ProgressCallback& progress);

    // Delivers the peer's answer to the pending fileOffer. False when no offer
    // is waiting for an answer.
    bool resolve_offer(bool accepted, const std::optional<std::string>& reason);

    // Stops between chunks; remaining files are recorded as cancelled.
    void cancel();

    bool is_cancelled() const { return cancelled_.load(); }

private:
    struct OfferResponse {
        bool accepted = false;
        std::optional<std::string> reason;
    };

    std::optional<OfferResponse> await_response();
    TransferRecord send_one(const std::filesystem::path& path,
                            std::optional<uint32_t> file_index,
                            std::optional<uint32_t> total_files,
                            uint64_t& batch_bytes_sent,
                            uint64_t batch_bytes_total,
                            const ProgressCallback& progress,
                            bool& connection_lost);

    std::string local_id_;
    std::string peer_id_;
    EnvelopeSender send_;
    std::size_t chunk_size_;
    std::chrono::milliseconds offer_timeout_;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool awaiting_response_ = false;
    std::optional<OfferResponse> response_;
    std::atomic<bool> cancelled_{false};
};

struct OfferDecision {
    bool accepted = false;
    std::optional<std::string> reason;
    // Set when the offer replaced a transfer that was still in flight.
    std::optional<TransferRecord> superseded;
};

struct ChunkOutcome {
    double progress = 0.0;
    std::optional<TransferRecord> failed;
};

struct BatchSummary {
    std::string batch_id;
    uint32_t total_files = 0;
    uint32_t succeeded = 0;
    uint32_t failed = 0;
};

class FileReceiver {
public:
    FileReceiver(std::filesystem::path download_dir, std::string peer_id);
    ~FileReceiver();

    FileReceiver(const FileReceiver&) = delete;
    FileReceiver& operator=(const FileReceiver&) = delete;

    OfferDecision handle_offer(const TransferMetadata& metadata);

    ChunkOutcome handle_chunk(const std::vector<uint8_t>& chunk);

    // nullopt when no transfer is in flight.
    std::optional<TransferRecord> handle_complete(const std::string& declared_hash);

    // Discards the partial file. nullopt when nothing was in flight.
    std::optional<TransferRecord> abort(const std::string& reason);

    bool has_active_transfer() const { return active_.has_value(); }
    std::optional<TransferMetadata> active_metadata() const;
    double progress() const;

    void begin_batch(const BatchMetadata& batch);

    // Records the batchComplete marker.
    void mark_batch_complete(const std::string& batch_id);

    // Returns the summary exactly once, when the marker has arrived and every
    // declared file has completed, failed or been rejected.
    std::optional<BatchSummary> take_finished_batch();

    // Forgets the current batch, e.g. when the sender cancelled it.
    void clear_batch();

    bool in_batch() const { return batch_.has_value(); }

private:
    struct ActiveTransfer {
        TransferMetadata metadata;
        std::filesystem::path temp_path;
        std::ofstream out;
        HashVerifier hasher;
        uint64_t bytes_received = 0;
    };

    struct BatchState {
        BatchSummary summary;
        bool marker_received = false;
    };

    TransferRecord fail_active(ErrorKind kind, const std::string& detail);
    void account(bool success);
    std::filesystem::path unique_destination(const std::string& file_name) const;

    std::filesystem::path download_dir_;
    std::string peer_id_;
    std::optional<ActiveTransfer> active_;
    std::optional<BatchState> batch_;
};

} // namespace peerlink
