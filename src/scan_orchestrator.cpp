#include "core/scan_orchestrator.hpp"
#include "core/scan_errors.hpp"
#include "logging/logger.hpp"
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

std::string scanStateToString(ScanState state)
{
    switch (state)
    {
    case ScanState::IDLE:
        return "idle";
    case ScanState::RUNNING:
        return "running";
    case ScanState::COMPLETE:
        return "complete";
    case ScanState::ERROR:
        return "error";
    }
    return "unknown";
}

ScanOrchestrator::ScanOrchestrator(const ScanConfig &config, MediaProbe &probe)
    : config_(config),
      video_analyzer_(probe, config_.video),
      extractor_(config_, video_analyzer_),
      pool_(config_.max_workers),
      tracker_((fs::path(config_.output_dir) / config_.progress_file).string())
{
}

ScanOrchestrator::~ScanOrchestrator()
{
    waitForCompletion();
}

std::string ScanOrchestrator::generateSessionId(std::chrono::system_clock::time_point now)
{
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm_buf{};
    localtime_r(&seconds, &tm_buf);

    std::stringstream ss;
    ss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S") << "_" << std::setw(3) << std::setfill('0') << millis;
    return ss.str();
}

std::string ScanOrchestrator::startScan(const ScanRequest &request)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.load() == ScanState::RUNNING)
    {
        throw std::runtime_error("A scan is already in progress");
    }
    if (scan_thread_.joinable())
    {
        scan_thread_.join();
    }

    const std::string base_id = generateSessionId(std::chrono::system_clock::now());
    auto resultPath = [this](const std::string &id)
    { return fs::path(config_.output_dir) / ("scan_results_" + id + ".json"); };

    // Sessions started within the same millisecond still get distinct stores
    std::string session_id = base_id;
    for (int suffix = 1; fs::exists(resultPath(session_id)); ++suffix)
    {
        session_id = base_id + "_" + std::to_string(suffix);
    }
    const fs::path result_file = resultPath(session_id);

    session_id_ = session_id;
    sink_ = std::make_shared<ResultSink>(result_file.string());
    tracker_.begin(session_id, result_file.string());
    state_.store(ScanState::RUNNING);
    Logger::info("Starting scan session " + session_id + " of " + request.root);

    try
    {
        sink_->initialize();
    }
    catch (const StoreError &e)
    {
        Logger::error("Scan session " + session_id + " failed: " + e.what());
        tracker_.recordError(e.what());
        state_.store(ScanState::ERROR);
        return session_id;
    }

    scan_thread_ = std::thread(&ScanOrchestrator::runScan, this, request, sink_);
    return session_id;
}

void ScanOrchestrator::runScan(ScanRequest request, std::shared_ptr<ResultSink> sink)
{
    bool failed = false;
    std::vector<FileRecord> buffer;

    auto flush = [&]()
    {
        if (buffer.empty())
            return;
        sink->write(buffer, true);
        buffer.clear();
    };

    try
    {
        ScanHooks hooks;
        hooks.on_total = [this](size_t total)
        { tracker_.setTotal(total); };
        hooks.on_processed = [this](const std::string &, bool)
        { tracker_.recordProcessed(); };

        FileScanner scanner(config_, extractor_, pool_);
        scanner.scan(request, hooks)
            .subscribe(
                [&](const FileRecord &record)
                {
                    buffer.push_back(record);
                    if (buffer.size() >= config_.flush_every)
                    {
                        flush();
                    }
                },
                [&](const std::exception &error)
                {
                    failed = true;
                    tracker_.recordError(error.what());
                },
                [&]()
                {
                    flush();
                });
    }
    catch (const std::exception &e)
    {
        failed = true;
        Logger::error("Scan session aborted: " + std::string(e.what()));
        tracker_.recordError(e.what());
    }

    ProgressSnapshot final_snapshot = tracker_.snapshot();
    if (failed || final_snapshot.status == "error")
    {
        state_.store(ScanState::ERROR);
        Logger::error("Scan session finished with error: " + final_snapshot.error.value_or("unknown error"));
    }
    else
    {
        state_.store(ScanState::COMPLETE);
        Logger::info("Scan session complete: " + std::to_string(final_snapshot.processed_files) + " files processed, " +
                     std::to_string(sink->getRecordCount()) + " records stored in " + sink->getPath());
    }
}

void ScanOrchestrator::waitForCompletion()
{
    std::thread finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        finished = std::move(scan_thread_);
    }
    if (finished.joinable())
    {
        finished.join();
    }
}

ProgressSnapshot ScanOrchestrator::getProgress() const
{
    return tracker_.snapshot();
}

std::vector<FileRecord> ScanOrchestrator::getResults() const
{
    std::shared_ptr<ResultSink> sink;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sink = sink_;
    }
    if (!sink)
        return {};
    return sink->readAll();
}

std::string ScanOrchestrator::getResultFile() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return sink_ ? sink_->getPath() : std::string();
}

std::string ScanOrchestrator::getSessionId() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return session_id_;
}
