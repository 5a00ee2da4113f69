#include "transfer_job.hpp"
#include <platform/digest.hpp>

std::string to_string(JobState s) {
    switch (s) {
        case JobState::Pending:          return "pending";
        case JobState::Streaming:        return "streaming";
        case JobState::Retrying:         return "retrying";
        case JobState::Paused:           return "paused";
        case JobState::WaitingOnRestore: return "waiting_on_restore";
        case JobState::Completed:        return "completed";
        case JobState::Failed:           return "failed";
    }
    return "pending";
}

bool parse_job_state(const std::string& s, JobState& out) {
    if (s == "pending")            { out = JobState::Pending;          return true; }
    if (s == "streaming")          { out = JobState::Streaming;        return true; }
    if (s == "retrying")           { out = JobState::Retrying;         return true; }
    if (s == "paused")             { out = JobState::Paused;           return true; }
    if (s == "waiting_on_restore") { out = JobState::WaitingOnRestore; return true; }
    if (s == "completed")          { out = JobState::Completed;        return true; }
    if (s == "failed")             { out = JobState::Failed;           return true; }
    return false;
}

bool is_terminal(JobState s) {
    return s == JobState::Completed || s == JobState::Failed;
}

bool transition_allowed(Direction d, JobState from, JobState to) {
    if (is_terminal(from)) return false;
    if (to == JobState::Failed) return true;
    if (from == to) return from != JobState::Pending;

    bool download = d == Direction::Download;

    switch (from) {
        case JobState::Pending:
            return to == JobState::Streaming || to == JobState::Retrying ||
                   to == JobState::Paused ||
                   (download && to == JobState::WaitingOnRestore);
        case JobState::Streaming:
            return to == JobState::Retrying || to == JobState::Paused ||
                   to == JobState::Completed ||
                   (download && to == JobState::WaitingOnRestore);
        case JobState::Retrying:
            return to == JobState::Streaming || to == JobState::Paused ||
                   (download && to == JobState::WaitingOnRestore);
        case JobState::Paused:
            return to == JobState::Streaming || to == JobState::Retrying ||
                   (download && to == JobState::WaitingOnRestore);
        case JobState::WaitingOnRestore:
            return download && (to == JobState::Streaming || to == JobState::Retrying ||
                                to == JobState::Paused);
        case JobState::Completed:
        case JobState::Failed:
            return false;
    }
    return false;
}

std::string make_job_id(Direction d, const std::string& local_path, const std::string& object_key) {
    std::string h = sha256_hex(to_string(d) + "\n" + local_path + "\n" + object_key);
    return (d == Direction::Upload ? "up-" : "down-") + h.substr(0, 16);
}

TransferJob make_upload_job(const std::string& local_path, const std::string& object_key,
                            StorageClass storage_class, uint64_t size_bytes, TimePoint now) {
    TransferJob job;
    job.id = make_job_id(Direction::Upload, local_path, object_key);
    job.direction = Direction::Upload;
    job.local_path = local_path;
    job.object_key = object_key;
    job.storage_class = storage_class;
    job.size_bytes = size_bytes;
    job.size_known = true;
    job.created_at = now;
    return job;
}

TransferJob make_download_job(const std::string& object_key, const std::string& local_path,
                              TimePoint now) {
    TransferJob job;
    job.id = make_job_id(Direction::Download, local_path, object_key);
    job.direction = Direction::Download;
    job.local_path = local_path;
    job.object_key = object_key;
    job.created_at = now;
    return job;
}
