#include "core/progress_tracker.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace
{
    double roundTo2(double value)
    {
        return std::round(value * 100.0) / 100.0;
    }

    template <typename T>
    nlohmann::json optionalToJson(const std::optional<T> &value)
    {
        if (value)
            return nlohmann::json(*value);
        return nullptr;
    }

    template <typename T>
    std::optional<T> optionalFromJson(const nlohmann::json &j, const std::string &key)
    {
        auto it = j.find(key);
        if (it == j.end() || it->is_null())
            return std::nullopt;
        return it->get<T>();
    }
}

std::string formatDuration(std::chrono::seconds duration)
{
    long long total = std::max<long long>(0, duration.count());
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%lld:%02lld:%02lld", total / 3600, (total / 60) % 60, total % 60);
    return buffer;
}

void to_json(nlohmann::json &j, const ProgressSnapshot &snapshot)
{
    j = nlohmann::json{
        {"total_files", snapshot.total_files},
        {"processed_files", snapshot.processed_files},
        {"progress_percentage", snapshot.progress_percentage},
        {"status", snapshot.status},
        {"error", optionalToJson(snapshot.error)},
        {"elapsed_time", optionalToJson(snapshot.elapsed_time)},
        {"files_per_second", optionalToJson(snapshot.files_per_second)},
        {"estimated_time_remaining", optionalToJson(snapshot.estimated_time_remaining)}};
}

void from_json(const nlohmann::json &j, ProgressSnapshot &snapshot)
{
    snapshot.total_files = j.value("total_files", static_cast<size_t>(0));
    snapshot.processed_files = j.value("processed_files", static_cast<size_t>(0));
    snapshot.progress_percentage = j.value("progress_percentage", 0.0);
    snapshot.status = j.value("status", std::string("in_progress"));
    snapshot.error = optionalFromJson<std::string>(j, "error");
    snapshot.elapsed_time = optionalFromJson<std::string>(j, "elapsed_time");
    snapshot.files_per_second = optionalFromJson<double>(j, "files_per_second");
    snapshot.estimated_time_remaining = optionalFromJson<std::string>(j, "estimated_time_remaining");
}

ProgressSnapshot computeSnapshot(const ScanSession &session, std::chrono::system_clock::time_point now)
{
    ProgressSnapshot snapshot;
    snapshot.total_files = session.total_files;
    snapshot.processed_files = session.processed_files;
    if (session.total_files > 0)
    {
        snapshot.progress_percentage =
            roundTo2(static_cast<double>(session.processed_files) / static_cast<double>(session.total_files) * 100.0);
    }

    if (session.start_time)
    {
        auto elapsed = std::chrono::duration<double>(now - *session.start_time);
        snapshot.elapsed_time = formatDuration(std::chrono::duration_cast<std::chrono::seconds>(elapsed));

        if (session.processed_files > 0 && elapsed.count() > 0.0)
        {
            double files_per_second = static_cast<double>(session.processed_files) / elapsed.count();
            size_t remaining = session.total_files > session.processed_files
                                   ? session.total_files - session.processed_files
                                   : 0;
            double eta_seconds = files_per_second > 0.0 ? static_cast<double>(remaining) / files_per_second : 0.0;
            snapshot.files_per_second = roundTo2(files_per_second);
            snapshot.estimated_time_remaining = formatDuration(std::chrono::seconds(static_cast<long long>(eta_seconds)));
        }
    }

    if (session.last_error)
    {
        snapshot.status = "error";
        snapshot.error = session.last_error;
    }
    else if (session.processed_files >= session.total_files)
    {
        snapshot.status = "complete";
    }
    return snapshot;
}

ProgressTracker::ProgressTracker(std::string progress_file) : progress_file_(std::move(progress_file))
{
}

void ProgressTracker::reset()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session_ = ScanSession{};
    }
    publish();
}

void ProgressTracker::begin(const std::string &session_id, const std::string &output_file)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session_ = ScanSession{};
        session_.session_id = session_id;
        session_.output_file = output_file;
        session_.start_time = std::chrono::system_clock::now();
    }
    publish();
}

void ProgressTracker::setTotal(size_t total_files)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session_.total_files = total_files;
        session_.processed_files = 0;
    }
    publish();
}

void ProgressTracker::recordProcessed()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session_.processed_files++;
    }
    publish();
}

void ProgressTracker::recordError(const std::string &message)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session_.last_error = message;
    }
    publish();
}

ProgressSnapshot ProgressTracker::snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return computeSnapshot(session_, std::chrono::system_clock::now());
}

ScanSession ProgressTracker::session() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return session_;
}

void ProgressTracker::publish() const
{
    if (progress_file_.empty())
        return;

    std::lock_guard<std::mutex> lock(file_mutex_);
    try
    {
        // Recompute under the file lock so a stale snapshot never overwrites a newer one
        ScanSession latest;
        {
            std::lock_guard<std::mutex> session_lock(mutex_);
            latest = session_;
        }
        const nlohmann::json progress = computeSnapshot(latest, std::chrono::system_clock::now());

        std::filesystem::path path(progress_file_);
        if (path.has_parent_path())
            std::filesystem::create_directories(path.parent_path());

        // Readers only ever see a complete document: write aside, then rename over the target
        const std::string temp_path = progress_file_ + ".tmp";
        {
            std::ofstream file(temp_path, std::ios::trunc);
            if (!file.is_open())
            {
                Logger::error("Error updating progress file: cannot open " + temp_path);
                return;
            }
            file << progress.dump(2);
            file.flush();
            if (!file)
            {
                Logger::error("Error updating progress file: write failed for " + temp_path);
                return;
            }
        }

        std::error_code ec;
        std::filesystem::rename(temp_path, progress_file_, ec);
        if (ec)
            Logger::error("Error updating progress file: cannot replace " + progress_file_ + ": " + ec.message());
    }
    catch (const std::exception &e)
    {
        Logger::error("Error updating progress file: " + std::string(e.what()));
    }
}
