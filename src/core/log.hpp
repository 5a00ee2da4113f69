#pragma once

#include <string>
#include <filesystem>

// Directory holding coldxfer_debug.log and jobs/<job_id>.log.
// Defaults to <temp_dir>/coldxfer until set from configuration.
void set_log_dir(const std::filesystem::path& dir);
std::filesystem::path log_dir();

// Append a timestamped line ([HH:MM:SS.mmm]) to the process debug log.
void coldxfer_log(const std::string& msg);

// Append a timestamped line ([ISO time]) to a job's persistent log file,
// and mirror it into the debug log.
void append_job_log(const std::string& job_id, const std::string& msg);
