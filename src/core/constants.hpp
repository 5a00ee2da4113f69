#pragma once

#include <cstdint>

// ── Object store limits ─────────────────────────────────────
// Largest object a single PUT may create (S3: 5 GB).
constexpr uint64_t MAX_SINGLE_OBJECT_BYTES  = 5000000000ULL;

// ── Transfer granularity ────────────────────────────────────
constexpr uint64_t DEFAULT_CHUNK_BYTES      = 64ULL * 1024 * 1024;  // 64 MiB
constexpr int DEFAULT_CONCURRENCY           = 2;

// ── Retry / backoff ─────────────────────────────────────────
constexpr int64_t DEFAULT_RETRY_BASE_MS     = 5000;     // first retry after ~5s
constexpr int64_t DEFAULT_RETRY_CAP_MS      = 900000;   // never wait more than 15 min

// ── Archive restore ─────────────────────────────────────────
// Polling a restore more often than every 30 min only adds request cost.
constexpr int DEFAULT_RESTORE_POLL_SECS     = 1800;
constexpr int DEFAULT_RESTORE_DAYS          = 1;

// ── Quota ───────────────────────────────────────────────────
// Recheck interval while other workers' admitted chunks are still in flight.
constexpr int QUOTA_HOLD_RECHECK_SECS       = 5;

// ── Engine ──────────────────────────────────────────────────
constexpr int ENGINE_MAX_IDLE_WAIT_MS       = 1000;     // queue re-check interval

// ── Buffer sizes ────────────────────────────────────────────
constexpr int FILE_COPY_BUF_SIZE            = 1 << 20;

// ── Service error codes ─────────────────────────────────────
constexpr const char* CODE_RESTORE_IN_PROGRESS = "RestoreAlreadyInProgress";
constexpr const char* CODE_INVALID_OBJECT_STATE = "InvalidObjectState";
constexpr const char* CODE_NO_SUCH_KEY          = "NoSuchKey";
