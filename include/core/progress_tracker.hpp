#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief Counters and identity of one scan session
 */
struct ScanSession
{
    std::string session_id;
    std::string output_file;
    size_t total_files = 0;
    size_t processed_files = 0;
    std::optional<std::chrono::system_clock::time_point> start_time;
    std::optional<std::string> last_error;
};

/**
 * @brief Point-in-time view of a session, safe to hand to pollers
 */
struct ProgressSnapshot
{
    size_t total_files = 0;
    size_t processed_files = 0;
    double progress_percentage = 0.0;
    std::string status = "in_progress"; // in_progress / complete / error
    std::optional<std::string> error;
    std::optional<std::string> elapsed_time; // H:MM:SS
    std::optional<double> files_per_second;
    std::optional<std::string> estimated_time_remaining; // H:MM:SS
};

void to_json(nlohmann::json &j, const ProgressSnapshot &snapshot);
void from_json(const nlohmann::json &j, ProgressSnapshot &snapshot);

// Derive the snapshot of a session as seen at `now`
ProgressSnapshot computeSnapshot(const ScanSession &session, std::chrono::system_clock::time_point now);

// H:MM:SS, hours are not wrapped
std::string formatDuration(std::chrono::seconds duration);

/**
 * @brief Owns the live ScanSession and publishes a snapshot after every change
 *
 * All mutators are thread-safe. When a progress file is configured the new snapshot is
 * written to it (indent 2) after each mutation; write failures are logged only.
 */
class ProgressTracker
{
public:
    explicit ProgressTracker(std::string progress_file = "");

    void reset();
    void begin(const std::string &session_id, const std::string &output_file);
    void setTotal(size_t total_files);
    void recordProcessed();
    void recordError(const std::string &message);

    ProgressSnapshot snapshot() const;
    ScanSession session() const;

    const std::string &getProgressFile() const { return progress_file_; }

private:
    void publish() const;

    std::string progress_file_;
    mutable std::mutex mutex_;
    mutable std::mutex file_mutex_;
    ScanSession session_;
};
