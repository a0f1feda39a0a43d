#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "core/file_scanner.hpp"
#include "core/media_probe.hpp"
#include "core/metadata_extractor.hpp"
#include "core/progress_tracker.hpp"
#include "core/result_sink.hpp"
#include "core/scan_config.hpp"
#include "core/video_analyzer.hpp"
#include "core/worker_pool.hpp"

enum class ScanState
{
    IDLE,
    RUNNING,
    COMPLETE,
    ERROR
};

std::string scanStateToString(ScanState state);

/**
 * @brief Runs scan sessions in the background and exposes their progress and results.
 *
 * Error Handling Policy:
 * - Per-file errors are logged and the file is left out; the session continues.
 * - Enumeration errors (missing root, not a directory) and result store failures end the
 *   session with state ERROR; the message appears in the next progress snapshot.
 * - Records flushed before a fatal error stay in the store.
 *
 * Only one session runs at a time. Every session writes its own store
 * <output_dir>/scan_results_<session id>.json.
 */
class ScanOrchestrator
{
public:
    /**
     * @param config Pipeline configuration, copied
     * @param probe Media probe used for video files; must outlive the orchestrator
     */
    ScanOrchestrator(const ScanConfig &config, MediaProbe &probe);
    ~ScanOrchestrator();

    ScanOrchestrator(const ScanOrchestrator &) = delete;
    ScanOrchestrator &operator=(const ScanOrchestrator &) = delete;

    /**
     * @brief Start a new session on a background thread
     * @return Session id, formatted YYYYMMDD_HHMMSS_mmm
     * @throws std::runtime_error if a session is already running
     */
    std::string startScan(const ScanRequest &request);

    // Block until the current session (if any) has finished
    void waitForCompletion();

    ProgressSnapshot getProgress() const;

    /**
     * @brief Records stored so far by the current or most recent session
     * @throws StoreError if the store cannot be read
     */
    std::vector<FileRecord> getResults() const;

    ScanState getState() const { return state_.load(); }
    std::string getResultFile() const;
    std::string getSessionId() const;

    static std::string generateSessionId(std::chrono::system_clock::time_point now);

private:
    void runScan(ScanRequest request, std::shared_ptr<ResultSink> sink);

    ScanConfig config_;
    VideoAnalyzer video_analyzer_;
    MetadataExtractor extractor_;
    WorkerPool pool_;
    ProgressTracker tracker_;

    std::atomic<ScanState> state_{ScanState::IDLE};
    mutable std::mutex mutex_;
    std::shared_ptr<ResultSink> sink_;
    std::string session_id_;
    std::thread scan_thread_;
};
