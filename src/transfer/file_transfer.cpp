/*
 * PeerLink - chunked file transfer implementation
 */

#include "file_transfer.hpp"

#include "archive.hpp"
#include "certificate.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <algorithm>
#include <map>
#include <memory>

namespace peerlink {

namespace {
constexpr std::size_t kMaxFileNameLength = 255;

std::string with_reason(const std::string& text, const std::optional<std::string>& reason) {
    if (!reason || reason->empty()) {
        return text;
    }
    return text + ": " + *reason;
}

// Zip of a directory being sent, removed with its scratch directory.
class OutgoingArchive {
public:
    explicit OutgoingArchive(const std::filesystem::path& directory) {
        std::error_code ec;
        scratch_ = std::filesystem::temp_directory_path(ec) / ("peerlink-" + random_uuid());
        if (ec || !std::filesystem::create_directories(scratch_, ec)) {
            throw PeerLinkError(ErrorKind::IoFailure, "Cannot create a scratch directory for " + directory.string());
        }
        path_ = scratch_ / (directory.filename().string() + ".zip");
        try {
            zip_directory(directory, path_);
        } catch (const PeerLinkError&) {
            std::filesystem::remove_all(scratch_, ec);
            throw;
        }
    }

    ~OutgoingArchive() {
        std::error_code ec;
        std::filesystem::remove_all(scratch_, ec);
        if (ec) {
            log_warn("Could not remove " + scratch_.string() + ": " + ec.message());
        }
    }

    OutgoingArchive(const OutgoingArchive&) = delete;
    OutgoingArchive& operator=(const OutgoingArchive&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path scratch_;
    std::filesystem::path path_;
};

// Directory paths end up without a trailing separator so filename() names them.
std::filesystem::path without_trailing_separator(const std::filesystem::path& path) {
    if (path.has_filename() || !path.has_parent_path()) {
        return path;
    }
    return path.parent_path();
}
} // namespace

const char* transfer_direction_name(TransferDirection direction) {
    return direction == TransferDirection::Sent ? "sent" : "received";
}

TransferRecord make_transfer_record(const std::string& file_name,
                                    uint64_t file_size,
                                    TransferDirection direction,
                                    const std::string& peer_id) {
    TransferRecord record;
    record.id = random_uuid();
    record.file_name = file_name;
    record.file_size = file_size;
    record.direction = direction;
    record.timestamp_ms = wall_clock_millis();
    record.peer_id = peer_id;
    return record;
}

std::string guess_mime_type(const std::filesystem::path& path) {
    static const std::map<std::string, std::string> kTypes = {
        {".txt", "text/plain"},       {".html", "text/html"},        {".json", "application/json"},
        {".pdf", "application/pdf"},  {".zip", "application/zip"},   {".png", "image/png"},
        {".jpg", "image/jpeg"},       {".jpeg", "image/jpeg"},       {".gif", "image/gif"},
        {".heic", "image/heic"},      {".mp4", "video/mp4"},         {".mov", "video/quicktime"},
        {".mp3", "audio/mpeg"},       {".m4a", "audio/mp4"},         {".wav", "audio/wav"},
    };
    auto it = kTypes.find(to_lower(path.extension().string()));
    return it == kTypes.end() ? "application/octet-stream" : it->second;
}

bool is_safe_file_name(const std::string& name) {
    if (name.empty() || name == "." || name == ".." || name.size() > kMaxFileNameLength) {
        return false;
    }
    return name.find_first_of(std::string("/\\\0", 3)) == std::string::npos;
}

FileChunkReader::FileChunkReader(const std::filesystem::path& path, std::size_t chunk_size)
    : path_(path), in_(path, std::ios::binary), chunk_size_(chunk_size == 0 ? kDefaultChunkSize : chunk_size) {
    if (!in_) {
        throw PeerLinkError(ErrorKind::IoFailure, "Cannot open " + path.string());
    }
    std::error_code ec;
    file_size_ = std::filesystem::file_size(path, ec);
    if (ec) {
        throw PeerLinkError(ErrorKind::IoFailure, "Cannot stat " + path.string() + ": " + ec.message());
    }
}

std::optional<std::vector<uint8_t>> FileChunkReader::next() {
    std::vector<uint8_t> chunk(chunk_size_);
    in_.read(reinterpret_cast<char*>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
    std::streamsize got = in_.gcount();
    if (in_.bad()) {
        throw PeerLinkError(ErrorKind::IoFailure, "Read error on " + path_.string());
    }
    if (got <= 0) {
        return std::nullopt;
    }
    chunk.resize(static_cast<std::size_t>(got));
    bytes_read_ += static_cast<uint64_t>(got);
    return chunk;
}

FileSender::FileSender(std::string local_id,
                       std::string peer_id,
                       EnvelopeSender send,
                       std::size_t chunk_size,
                       std::chrono::milliseconds offer_timeout)
    : local_id_(std::move(local_id)),
      peer_id_(std::move(peer_id)),
      send_(std::move(send)),
      chunk_size_(chunk_size == 0 ? kDefaultChunkSize : chunk_size),
      offer_timeout_(offer_timeout) {}

std::vector<TransferRecord> FileSender::send_files(const std::vector<std::filesystem::path>& paths,
                                                   const ProgressCallback& progress) {
    std::vector<TransferRecord> records;
    uint64_t total_bytes = 0;
    for (const auto& path : paths) {
        std::error_code ec;
        auto size = std::filesystem::file_size(path, ec);
        if (!ec) {
            total_bytes += size;
        }
    }

    const bool batched = paths.size() > 1;
    const uint32_t total_files = static_cast<uint32_t>(paths.size());
    bool connection_lost = false;
    std::string batch_id;
    if (batched) {
        BatchMetadata batch;
        batch.total_files = total_files;
        batch.batch_id = random_uuid();
        batch_id = batch.batch_id;
        connection_lost = !send_(make_batch_start(local_id_, batch));
        log_info("Starting batch " + short_id(batch_id) + " of " + std::to_string(total_files) + " files");
    }

    uint64_t bytes_sent = 0;
    for (uint32_t i = 0; i < total_files; ++i) {
        const auto& path = paths[i];
        if (connection_lost || cancelled_) {
            TransferRecord record =
                make_transfer_record(path.filename().string(), 0, TransferDirection::Sent, peer_id_);
            record.error = describe(connection_lost ? ErrorKind::NotConnected : ErrorKind::TransferCancelled);
            records.push_back(std::move(record));
            continue;
        }
        std::optional<uint32_t> index;
        std::optional<uint32_t> total;
        if (batched) {
            index = i;
            total = total_files;
        }
        records.push_back(send_one(path, index, total, bytes_sent, total_bytes, progress, connection_lost));
    }

    if (batched && !connection_lost && !cancelled_) {
        connection_lost = !send_(make_batch_complete(local_id_, batch_id));
    }
    if (progress && !connection_lost && !cancelled_) {
        progress(1.0);
    }
    return records;
}

TransferRecord FileSender::send_one(const std::filesystem::path& path,
                                    std::optional<uint32_t> file_index,
                                    std::optional<uint32_t> total_files,
                                    uint64_t& batch_bytes_sent,
                                    uint64_t batch_bytes_total,
                                    const ProgressCallback& progress,
                                    bool& connection_lost) {
    const std::filesystem::path source_path = without_trailing_separator(path);
    const std::string name = source_path.filename().string();
    TransferRecord record = make_transfer_record(name, 0, TransferDirection::Sent, peer_id_);

    TransferMetadata metadata;
    metadata.file_name = name;
    metadata.file_index = file_index;
    metadata.total_files = total_files;

    // A directory is sent as <name>.zip and unpacked by the receiver.
    std::unique_ptr<OutgoingArchive> archive;
    std::filesystem::path send_path = source_path;
    try {
        std::error_code ec;
        if (std::filesystem::is_directory(source_path, ec)) {
            archive = std::make_unique<OutgoingArchive>(source_path);
            send_path = archive->path();
            metadata.file_name = name + ".zip";
            metadata.is_directory = true;
        }
        metadata.mime_type = guess_mime_type(send_path);
        FileChunkReader sizing(send_path, chunk_size_);
        metadata.file_size = sizing.file_size();
        metadata.sha256_hash = sha256_file(send_path, chunk_size_);
    } catch (const PeerLinkError& ex) {
        record.error = ex.what();
        log_warn("Cannot send " + name + ": " + ex.what());
        return record;
    }
    record.file_size = metadata.file_size;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        response_.reset();
        awaiting_response_ = true;
    }
    if (!send_(make_file_offer(local_id_, metadata))) {
        connection_lost = true;
        record.error = describe(ErrorKind::NotConnected);
        return record;
    }

    auto response = await_response();
    if (!response) {
        if (cancelled_) {
            record.error = describe(ErrorKind::TransferCancelled);
        } else {
            record.error = "Peer did not answer the file offer";
            connection_lost = true;
        }
        return record;
    }
    if (!response->accepted) {
        record.error = with_reason(describe(ErrorKind::TransferRejected), response->reason);
        log_info("Peer rejected " + name);
        return record;
    }

    try {
        FileChunkReader reader(send_path, chunk_size_);
        while (auto chunk = reader.next()) {
            if (cancelled_) {
                if (!send_(make_file_reject(local_id_, std::string(kRejectCancelled)))) {
                    connection_lost = true;
                }
                record.error = describe(ErrorKind::TransferCancelled);
                return record;
            }
            const std::size_t chunk_len = chunk->size();
            if (!send_(make_file_chunk(local_id_, std::move(*chunk)))) {
                connection_lost = true;
                record.error = describe(ErrorKind::NotConnected);
                return record;
            }
            batch_bytes_sent += chunk_len;
            if (progress && batch_bytes_total > 0) {
                progress(std::min(1.0, static_cast<double>(batch_bytes_sent) / static_cast<double>(batch_bytes_total)));
            }
        }
    } catch (const PeerLinkError& ex) {
        if (!send_(make_file_reject(local_id_, std::string(kRejectIoError)))) {
            connection_lost = true;
        }
        record.error = ex.what();
        return record;
    }

    if (!send_(make_file_complete(local_id_, metadata.sha256_hash))) {
        connection_lost = true;
        record.error = describe(ErrorKind::NotConnected);
        return record;
    }
    record.success = true;
    log_info("Sent " + name + " (" + std::to_string(metadata.file_size) + " bytes)");
    return record;
}

std::optional<FileSender::OfferResponse> FileSender::await_response() {
    std::unique_lock<std::mutex> lock(mutex_);
    bool answered = cv_.wait_for(lock, offer_timeout_, [this] {
        return response_.has_value() || cancelled_.load();
    });
    awaiting_response_ = false;
    if (!answered || !response_) {
        return std::nullopt;
    }
    auto response = std::move(response_);
    response_.reset();
    return response;
}

bool FileSender::resolve_offer(bool accepted, const std::optional<std::string>& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!awaiting_response_ || response_) {
        log_debug("Ignoring file answer with no offer pending");
        return false;
    }
    OfferResponse response;
    response.accepted = accepted;
    response.reason = reason;
    response_ = std::move(response);
    cv_.notify_all();
    return true;
}

void FileSender::cancel() {
    cancelled_ = true;
    std::lock_guard<std::mutex> lock(mutex_);
    cv_.notify_all();
}

FileReceiver::FileReceiver(std::filesystem::path download_dir, std::string peer_id)
    : download_dir_(std::move(download_dir)), peer_id_(std::move(peer_id)) {}

FileReceiver::~FileReceiver() {
    if (active_) {
        abort("session ended");
    }
}

OfferDecision FileReceiver::handle_offer(const TransferMetadata& metadata) {
    OfferDecision decision;
    if (active_) {
        decision.superseded = fail_active(ErrorKind::TransferCancelled, "superseded by a new offer");
    }

    auto reject = [&](const char* reason) {
        decision.accepted = false;
        decision.reason = std::string(reason);
        account(false);
        log_warn("Rejecting offer for '" + metadata.file_name + "': " + reason);
        return decision;
    };

    if (!is_safe_file_name(metadata.file_name) || !is_safe_file_name(metadata.display_name())) {
        return reject(kRejectInvalidName);
    }

    std::error_code ec;
    std::filesystem::create_directories(download_dir_, ec);
    if (ec) {
        return reject(kRejectIoError);
    }
    auto space = std::filesystem::space(download_dir_, ec);
    if (!ec && (metadata.file_size > space.available ||
                space.available - metadata.file_size < kStorageHeadroomBytes)) {
        return reject(kRejectInsufficientStorage);
    }

    ActiveTransfer& transfer = active_.emplace();
    transfer.metadata = metadata;
    transfer.temp_path = download_dir_ / (".peerlink-" + random_uuid() + ".part");
    transfer.out.open(transfer.temp_path, std::ios::binary | std::ios::trunc);
    if (!transfer.out) {
        active_.reset();
        return reject(kRejectIoError);
    }

    decision.accepted = true;
    log_info("Receiving " + metadata.display_name() + " (" + std::to_string(metadata.file_size) + " bytes)");
    return decision;
}

ChunkOutcome FileReceiver::handle_chunk(const std::vector<uint8_t>& chunk) {
    ChunkOutcome outcome;
    if (!active_) {
        log_debug("Dropping fileChunk with no transfer in flight");
        return outcome;
    }
    ActiveTransfer& transfer = *active_;
    if (transfer.bytes_received + chunk.size() > transfer.metadata.file_size) {
        outcome.failed = fail_active(ErrorKind::SizeExceeded,
                                     "offered " + std::to_string(transfer.metadata.file_size) + " bytes");
        return outcome;
    }

    transfer.out.write(reinterpret_cast<const char*>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
    if (!transfer.out) {
        outcome.failed = fail_active(ErrorKind::IoFailure, "write to temporary file failed");
        return outcome;
    }
    transfer.hasher.update(chunk);
    transfer.bytes_received += chunk.size();
    outcome.progress = progress();
    return outcome;
}

std::optional<TransferRecord> FileReceiver::handle_complete(const std::string& declared_hash) {
    if (!active_) {
        log_debug("Dropping fileComplete with no transfer in flight");
        return std::nullopt;
    }
    ActiveTransfer& transfer = *active_;
    transfer.out.flush();
    bool flushed = static_cast<bool>(transfer.out);
    transfer.out.close();
    if (!flushed) {
        return fail_active(ErrorKind::IoFailure, "flush of temporary file failed");
    }

    if (transfer.bytes_received != transfer.metadata.file_size) {
        return fail_active(ErrorKind::PrematureEnd,
                           "received " + std::to_string(transfer.bytes_received) + " of " +
                               std::to_string(transfer.metadata.file_size) + " bytes");
    }

    const std::string digest = transfer.hasher.finalize();
    if (!fingerprints_equal(digest, transfer.metadata.sha256_hash) || !fingerprints_equal(digest, declared_hash)) {
        return fail_active(ErrorKind::DigestMismatch, "computed " + digest);
    }

    const std::filesystem::path destination = unique_destination(transfer.metadata.display_name());
    std::error_code ec;
    if (transfer.metadata.is_directory) {
        // Unpack next to the archive, then move the finished tree into place.
        const std::filesystem::path staging = download_dir_ / (".peerlink-" + random_uuid() + ".dir");
        uint64_t limit = 0;
        auto space = std::filesystem::space(download_dir_, ec);
        if (!ec && space.available > kStorageHeadroomBytes) {
            limit = space.available - kStorageHeadroomBytes;
        }
        try {
            unzip_archive(transfer.temp_path, staging, limit);
        } catch (const PeerLinkError& ex) {
            return fail_active(ex.kind(), ex.what());
        }
        std::filesystem::rename(staging, destination, ec);
        if (ec) {
            std::error_code cleanup;
            std::filesystem::remove_all(staging, cleanup);
            return fail_active(ErrorKind::IoFailure, "cannot move directory into place: " + ec.message());
        }
        std::filesystem::remove(transfer.temp_path, ec);
        if (ec) {
            log_warn("Could not remove " + transfer.temp_path.string() + ": " + ec.message());
        }
    } else {
        std::filesystem::rename(transfer.temp_path, destination, ec);
        if (ec) {
            return fail_active(ErrorKind::IoFailure, "cannot move file into place: " + ec.message());
        }
    }

    TransferRecord record = make_transfer_record(transfer.metadata.display_name(),
                                                 transfer.metadata.file_size,
                                                 TransferDirection::Received,
                                                 peer_id_);
    record.success = true;
    record.local_path = destination.string();
    log_info("Received " + transfer.metadata.display_name() + ", digest verified");
    active_.reset();
    account(true);
    return record;
}

std::optional<TransferRecord> FileReceiver::abort(const std::string& reason) {
    if (!active_) {
        return std::nullopt;
    }
    return fail_active(ErrorKind::TransferCancelled, reason);
}

std::optional<TransferMetadata> FileReceiver::active_metadata() const {
    if (!active_) {
        return std::nullopt;
    }
    return active_->metadata;
}

double FileReceiver::progress() const {
    if (!active_) {
        return 0.0;
    }
    if (active_->metadata.file_size == 0) {
        return 1.0;
    }
    return std::min(1.0, static_cast<double>(active_->bytes_received) /
                             static_cast<double>(active_->metadata.file_size));
}

void FileReceiver::begin_batch(const BatchMetadata& batch) {
    if (batch_) {
        log_warn("Batch " + short_id(batch_->summary.batch_id) + " replaced before it finished");
    }
    BatchState state;
    state.summary.batch_id = batch.batch_id;
    state.summary.total_files = batch.total_files;
    batch_ = std::move(state);
}

void FileReceiver::mark_batch_complete(const std::string& batch_id) {
    if (!batch_ || batch_->summary.batch_id != batch_id) {
        log_warn("batchComplete for unknown batch " + short_id(batch_id));
        return;
    }
    batch_->marker_received = true;

    // The sender emits the marker after its last file, so files it never
    // offered (unreadable on its side) can no longer arrive.
    BatchSummary& summary = batch_->summary;
    const uint32_t accounted = summary.succeeded + summary.failed;
    if (!active_ && accounted < summary.total_files) {
        log_warn("Batch " + short_id(batch_id) + " closed with " +
                 std::to_string(summary.total_files - accounted) + " file(s) never offered");
        summary.failed += summary.total_files - accounted;
    }
}

std::optional<BatchSummary> FileReceiver::take_finished_batch() {
    if (!batch_ || !batch_->marker_received) {
        return std::nullopt;
    }
    const BatchSummary& summary = batch_->summary;
    if (summary.succeeded + summary.failed < summary.total_files) {
        return std::nullopt;
    }
    BatchSummary finished = summary;
    batch_.reset();
    return finished;
}

void FileReceiver::clear_batch() {
    batch_.reset();
}

TransferRecord FileReceiver::fail_active(ErrorKind kind, const std::string& detail) {
    ActiveTransfer& transfer = *active_;
    if (transfer.out.is_open()) {
        transfer.out.close();
    }
    std::error_code ec;
    std::filesystem::remove(transfer.temp_path, ec);
    if (ec) {
        log_warn("Could not remove partial file " + transfer.temp_path.string() + ": " + ec.message());
    }

    TransferRecord record = make_transfer_record(transfer.metadata.file_name,
                                                 transfer.metadata.file_size,
                                                 TransferDirection::Received,
                                                 peer_id_);
    record.error = describe(kind) + " (" + detail + ")";
    log_warn("Transfer of " + transfer.metadata.file_name + " failed: " + *record.error);
    active_.reset();
    account(false);
    return record;
}

void FileReceiver::account(bool success) {
    if (!batch_) {
        return;
    }
    if (success) {
        ++batch_->summary.succeeded;
    } else {
        ++batch_->summary.failed;
    }
}

std::filesystem::path FileReceiver::unique_destination(const std::string& file_name) const {
    std::filesystem::path candidate = download_dir_ / file_name;
    std::error_code ec;
    if (!std::filesystem::exists(candidate, ec)) {
        return candidate;
    }
    const std::filesystem::path base(file_name);
    const std::string stem = base.stem().string();
    const std::string extension = base.extension().string();
    for (int n = 1;; ++n) {
        candidate = download_dir_ / (stem + " (" + std::to_string(n) + ")" + extension);
        if (!std::filesystem::exists(candidate, ec)) {
            return candidate;
        }
    }
}

} // namespace peerlink
