#pragma once

#include <string>
#include <cstdint>
#include <core/types.hpp>
#include <core/time_utils.hpp>
#include <store/object_store.hpp>

enum class JobState {
    Pending,            // created, nothing transferred yet
    Streaming,          // a pass is moving chunks
    Retrying,           // transient failure, waiting for next_attempt_at
    Paused,             // gate said wait (quota month or schedule window)
    WaitingOnRestore,   // archived object, restore not finished (download only)
    Completed,
    Failed,
};

std::string to_string(JobState s);
bool parse_job_state(const std::string& s, JobState& out);

bool is_terminal(JobState s);

// Per-direction state machines. Re-entering the same non-terminal state is
// allowed (a second transient failure while Retrying, another restore poll).
// Any non-terminal state may move to Failed.
bool transition_allowed(Direction d, JobState from, JobState to);

struct TransferJob {
    std::string id;                  // up-/down- + hash of (direction, local, key)
    Direction direction = Direction::Upload;
    std::string local_path;          // upload source or download destination
    std::string object_key;
    StorageClass storage_class = StorageClass::Standard;  // class to upload into

    uint64_t size_bytes = 0;
    bool size_known = false;         // downloads learn size from the head probe
    uint64_t cursor = 0;             // bytes durably transferred and hashed
    std::string digest_state;        // accumulator over [0, cursor)
    std::string final_digest;        // hex digest once Completed

    JobState state = JobState::Pending;
    int retry_count = 0;             // owned by the retry controller
    TimePoint next_attempt_at;       // epoch = due now

    ErrorClass failure = ErrorClass::None;
    std::string last_error;

    TimePoint created_at;
    TimePoint last_progress_at;
    TimePoint finished_at;
};

// Stable id so that re-submitting the same transfer after a restart finds the
// existing job instead of starting over.
std::string make_job_id(Direction d, const std::string& local_path, const std::string& object_key);

TransferJob make_upload_job(const std::string& local_path, const std::string& object_key,
                            StorageClass storage_class, uint64_t size_bytes, TimePoint now);

TransferJob make_download_job(const std::string& object_key, const std::string& local_path,
                              TimePoint now);
