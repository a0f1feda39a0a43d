#include "core/config_manager.hpp"
#include "core/media_probe.hpp"
#include "core/scan_analytics.hpp"
#include "core/scan_errors.hpp"
#include "core/scan_orchestrator.hpp"
#include "logging/logger.hpp"
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace
{
    void printUsage(const char *program)
    {
        std::cout << "Disk Explorer - directory scanner and analyzer" << std::endl;
        std::cout << "Usage: " << program << " [--config FILE] <command> [arguments]" << std::endl;
        std::cout << "Commands:" << std::endl;
        std::cout << "  scan <root> [--no-hash] [--artifacts] [--exclude-dir NAME]... [--exclude-pattern GLOB]..."
                  << std::endl;
        std::cout << "  insights <root>" << std::endl;
        std::cout << "  duplicates <root>" << std::endl;
        std::cout << "  aging <root> <days> [accessed|modified]" << std::endl;
        std::cout << "  search <root> [--min-size N] [--max-size N] [--type EXT]... [--low-quality] [--top N]"
                  << " [--duplicates] [--no-preview]" << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --config FILE     Load configuration from a JSON or YAML file" << std::endl;
        std::cout << "  --help, -h        Show this help message" << std::endl;
    }

    // Value following a flag, or throws if missing
    std::string requireValue(const std::vector<std::string> &args, size_t &i)
    {
        if (i + 1 >= args.size())
            throw std::invalid_argument("Missing value for " + args[i]);
        return args[++i];
    }

    int runScan(const ScanConfig &config, MediaProbe &probe, const std::vector<std::string> &args)
    {
        if (args.empty())
            throw std::invalid_argument("scan requires a root directory");

        ScanRequest request;
        request.root = args[0];
        request.generate_video_artifacts = false;
        for (size_t i = 1; i < args.size(); i++)
        {
            if (args[i] == "--no-hash")
                request.include_hash = false;
            else if (args[i] == "--artifacts")
                request.generate_video_artifacts = true;
            else if (args[i] == "--exclude-dir")
                request.exclude_dirs.push_back(requireValue(args, i));
            else if (args[i] == "--exclude-pattern")
                request.exclude_patterns.push_back(requireValue(args, i));
            else
                throw std::invalid_argument("Unknown scan option: " + args[i]);
        }

        ScanOrchestrator orchestrator(config, probe);
        const std::string session_id = orchestrator.startScan(request);
        while (orchestrator.getState() == ScanState::RUNNING)
        {
            std::this_thread::sleep_for(std::chrono::seconds(1));
            ProgressSnapshot progress = orchestrator.getProgress();
            Logger::info("Progress: " + std::to_string(progress.processed_files) + "/" +
                         std::to_string(progress.total_files) + " (" +
                         std::to_string(progress.progress_percentage) + "%)");
        }
        orchestrator.waitForCompletion();

        const ProgressSnapshot progress = orchestrator.getProgress();
        std::cout << nlohmann::json(progress).dump(2) << std::endl;
        if (orchestrator.getState() == ScanState::ERROR)
        {
            Logger::error("Scan " + session_id + " failed: " + progress.error.value_or("unknown error"));
            return 1;
        }
        Logger::info("Scan " + session_id + " results written to " + orchestrator.getResultFile());
        return 0;
    }

    int runSearch(const ScanConfig &config, ScanAnalytics &analytics, const std::vector<std::string> &args)
    {
        if (args.empty())
            throw std::invalid_argument("search requires a root directory");

        SearchFilters filters;
        for (size_t i = 1; i < args.size(); i++)
        {
            if (args[i] == "--min-size")
                filters.min_size = std::stoull(requireValue(args, i));
            else if (args[i] == "--max-size")
                filters.max_size = std::stoull(requireValue(args, i));
            else if (args[i] == "--type")
                filters.file_types.push_back(requireValue(args, i));
            else if (args[i] == "--low-quality")
                filters.low_quality_videos = true;
            else if (args[i] == "--top")
                filters.top_n = static_cast<size_t>(std::stoul(requireValue(args, i)));
            else if (args[i] == "--duplicates")
                filters.include_duplicates = true;
            else if (args[i] == "--no-preview")
                filters.preview_image = false;
            else
                throw std::invalid_argument("Unknown search option: " + args[i]);
        }

        const std::string output_file =
            (std::filesystem::path(config.output_dir) /
             ("search_results_" + ScanOrchestrator::generateSessionId(std::chrono::system_clock::now()) + ".json"))
                .string();
        auto results = analytics.search(args[0], filters, output_file);
        std::cout << nlohmann::json(results).dump(2) << std::endl;
        return 0;
    }

    int runAnalytics(const std::string &command, const ScanConfig &config, MediaProbe &probe,
                     const std::vector<std::string> &args)
    {
        ScanAnalytics analytics(config, probe);
        if (command == "search")
            return runSearch(config, analytics, args);

        if (args.empty())
            throw std::invalid_argument(command + " requires a root directory");

        if (command == "insights")
        {
            std::cout << nlohmann::json(analytics.getInsights(args[0])).dump(2) << std::endl;
        }
        else if (command == "duplicates")
        {
            std::cout << nlohmann::json(analytics.findDuplicates(args[0])).dump(2) << std::endl;
        }
        else if (command == "aging")
        {
            if (args.size() < 2)
                throw std::invalid_argument("aging requires a number of days");
            const int days = std::stoi(args[1]);
            AgingMode mode = AgingMode::ACCESSED;
            if (args.size() > 2)
            {
                if (args[2] == "modified")
                    mode = AgingMode::MODIFIED;
                else if (args[2] != "accessed")
                    throw std::invalid_argument("Unknown aging mode: " + args[2]);
            }
            std::cout << nlohmann::json(analytics.findAgingFiles(args[0], days, mode)).dump(2) << std::endl;
        }
        else
        {
            throw std::invalid_argument("Unknown command: " + command);
        }
        return 0;
    }
}

int main(int argc, char *argv[])
{
    std::string config_path;
    std::string command;
    std::vector<std::string> command_args;

    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        if (command.empty() && (arg == "--help" || arg == "-h"))
        {
            printUsage(argv[0]);
            return 0;
        }
        else if (command.empty() && arg == "--config")
        {
            if (i + 1 >= argc)
            {
                std::cerr << "Error: --config requires a file name" << std::endl;
                return 1;
            }
            config_path = argv[++i];
        }
        else if (command.empty())
        {
            command = arg;
        }
        else
        {
            command_args.push_back(arg);
        }
    }

    if (command.empty())
    {
        printUsage(argv[0]);
        return 1;
    }

    ConfigManager config_manager;
    if (!config_path.empty() && !config_manager.load(config_path))
    {
        std::cerr << "Error: could not load configuration from " << config_path << std::endl;
        return 1;
    }
    Logger::init(config_manager.getLogLevel());

    const ScanConfig config = config_manager.getScanConfig();
    FfmpegMediaProbe probe(config.video.probe_retries);

    try
    {
        if (command == "scan")
            return runScan(config, probe, command_args);
        return runAnalytics(command, config, probe, command_args);
    }
    catch (const ScanError &e)
    {
        Logger::error(e.what());
        return 1;
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        printUsage(argv[0]);
        return 1;
    }
    catch (const std::exception &e)
    {
        Logger::error("Unexpected error: " + std::string(e.what()));
        return 1;
    }
}
