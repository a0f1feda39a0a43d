#include "core/config_manager.hpp"
#include "logging/logger.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

using Poco::AutoPtr;
using Poco::Util::JSONConfiguration;

namespace
{
    nlohmann::json yamlNodeToJson(const YAML::Node &node)
    {
        switch (node.Type())
        {
        case YAML::NodeType::Map:
        {
            nlohmann::json object = nlohmann::json::object();
            for (auto it = node.begin(); it != node.end(); ++it)
            {
                object[it->first.as<std::string>()] = yamlNodeToJson(it->second);
            }
            return object;
        }
        case YAML::NodeType::Sequence:
        {
            nlohmann::json array = nlohmann::json::array();
            for (const auto &item : node)
            {
                array.push_back(yamlNodeToJson(item));
            }
            return array;
        }
        case YAML::NodeType::Scalar:
        {
            // Quoted scalars keep their string type
            if (node.Tag() == "!")
                return node.as<std::string>();
            int64_t int_value;
            if (YAML::convert<int64_t>::decode(node, int_value))
                return int_value;
            double double_value;
            if (YAML::convert<double>::decode(node, double_value))
                return double_value;
            bool bool_value;
            if (YAML::convert<bool>::decode(node, bool_value))
                return bool_value;
            return node.as<std::string>();
        }
        default:
            return nullptr;
        }
    }

    std::string lowerExtension(const std::string &path)
    {
        std::string ext = std::filesystem::path(path).extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return ext;
    }
}

ConfigManager::ConfigManager()
{
    cfg_ = new JSONConfiguration();
    initializeDefaultConfig();
}

nlohmann::json ConfigManager::defaultConfig()
{
    return nlohmann::json::parse(R"({
        "log_level": "INFO",
        "output_dir": "scan_output",
        "progress_file": "scan_progress.json",
        "threading": {
            "max_workers": 0
        },
        "scan": {
            "hash_chunk_size": 8192,
            "min_batch_size": 100,
            "max_batch_size": 1000,
            "flush_every": 100,
            "skip_hidden": false,
            "exclude_dirs": [".git", "node_modules", "__pycache__"],
            "exclude_patterns": [".DS_Store", "*.tmp", "*.log"],
            "video_extensions": [".mp4", ".avi", ".mov", ".mkv", ".wmv", ".flv"]
        },
        "video": {
            "screenshot_dir": "scan_output/screenshots",
            "screenshot_count": 3,
            "analyze_frame_quality": true,
            "sample_interval_seconds": 1.0,
            "roi_fraction": 0.3,
            "probe_retries": 1,
            "low_quality": {
                "min_height": 480,
                "min_fps": 24.0,
                "min_bitrate": 500000,
                "min_byte_rate": 102400.0,
                "score_threshold": 40,
                "min_aspect_ratio": 0.5,
                "max_aspect_ratio": 2.5,
                "modern_codecs": ["h264", "hevc", "h265", "vp9", "av1"],
                "bitrate_by_height": {
                    "240": 300000,
                    "360": 500000,
                    "480": 800000,
                    "720": 1500000,
                    "1080": 3000000
                }
            }
        }
    })");
}

void ConfigManager::initializeDefaultConfig()
{
    replaceConfig(defaultConfig());
}

void ConfigManager::replaceConfig(const nlohmann::json &config)
{
    std::stringstream ss(config.dump());
    AutoPtr<JSONConfiguration> tmp = new JSONConfiguration();
    tmp->load(ss);
    std::lock_guard<std::mutex> lock(mutex_);
    cfg_ = tmp;
}

nlohmann::json ConfigManager::yamlFileToJson(const std::string &path)
{
    return yamlNodeToJson(YAML::LoadFile(path));
}

bool ConfigManager::load(const std::string &path)
{
    std::ifstream in(path);
    if (!in.good())
    {
        Logger::warn("Configuration file not found: " + path);
        return false;
    }

    try
    {
        nlohmann::json overrides;
        const std::string ext = lowerExtension(path);
        if (ext == ".yaml" || ext == ".yml")
        {
            overrides = yamlFileToJson(path);
        }
        else
        {
            overrides = nlohmann::json::parse(in);
        }

        if (!overrides.is_object())
        {
            Logger::error("Configuration root must be an object: " + path);
            return false;
        }

        nlohmann::json merged = defaultConfig();
        merged.merge_patch(overrides);
        if (!validateConfig(merged))
        {
            Logger::error("Invalid configuration in file: " + path);
            return false;
        }

        replaceConfig(merged);
        Logger::info("Configuration loaded from: " + path);
        return true;
    }
    catch (const std::exception &e)
    {
        Logger::error("Error loading config " + path + ": " + std::string(e.what()));
        return false;
    }
}

bool ConfigManager::save(const std::string &path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(path);
    if (!out.is_open())
        return false;
    cfg_->save(out);
    return true;
}

nlohmann::json ConfigManager::getAll() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::stringstream ss;
    cfg_->save(ss);
    return nlohmann::json::parse(ss.str());
}

void ConfigManager::update(const nlohmann::json &patch)
{
    nlohmann::json merged = getAll();
    merged.merge_patch(patch);
    if (!validateConfig(merged))
    {
        throw std::invalid_argument("Configuration update rejected: " + patch.dump());
    }
    replaceConfig(merged);
}

std::string ConfigManager::getString(const std::string &key, const std::string &def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getString(key, def);
}

int ConfigManager::getInt(const std::string &key, int def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getInt(key, def);
}

bool ConfigManager::getBool(const std::string &key, bool def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getBool(key, def);
}

double ConfigManager::getDouble(const std::string &key, double def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getDouble(key, def);
}

std::vector<std::string> ConfigManager::getStringList(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> values;
    for (size_t i = 0;; ++i)
    {
        const std::string item_key = key + "[" + std::to_string(i) + "]";
        if (!cfg_->has(item_key))
            break;
        values.push_back(cfg_->getString(item_key));
    }
    return values;
}

bool ConfigManager::hasKey(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->has(key);
}

std::string ConfigManager::getLogLevel() const
{
    return getString("log_level", "INFO");
}

std::string ConfigManager::getOutputDir() const
{
    return getString("output_dir", "scan_output");
}

int ConfigManager::getMaxWorkers() const
{
    return getInt("threading.max_workers", 0);
}

ScanConfig ConfigManager::getScanConfig() const
{
    ScanConfig config;
    config.log_level = getLogLevel();
    config.output_dir = getOutputDir();
    config.progress_file = getString("progress_file", config.progress_file);
    config.max_workers = static_cast<size_t>(std::max(0, getMaxWorkers()));
    config.hash_chunk_size = static_cast<size_t>(getInt("scan.hash_chunk_size", 8192));
    config.min_batch_size = static_cast<size_t>(getInt("scan.min_batch_size", 100));
    config.max_batch_size = static_cast<size_t>(getInt("scan.max_batch_size", 1000));
    config.flush_every = static_cast<size_t>(getInt("scan.flush_every", 100));
    config.enumeration.skip_hidden = getBool("scan.skip_hidden", false);
    config.enumeration.exclude_dirs = getStringList("scan.exclude_dirs");
    config.enumeration.exclude_patterns = getStringList("scan.exclude_patterns");
    config.video_extensions = getStringList("scan.video_extensions");

    VideoConfig &video = config.video;
    video.screenshot_dir = getString("video.screenshot_dir", video.screenshot_dir);
    video.screenshot_count = getInt("video.screenshot_count", video.screenshot_count);
    video.analyze_frame_quality = getBool("video.analyze_frame_quality", video.analyze_frame_quality);
    video.sample_interval_seconds = getDouble("video.sample_interval_seconds", video.sample_interval_seconds);
    video.roi_fraction = getDouble("video.roi_fraction", video.roi_fraction);
    video.probe_retries = getInt("video.probe_retries", video.probe_retries);

    LowQualityThresholds &lq = video.low_quality;
    lq.min_height = getInt("video.low_quality.min_height", lq.min_height);
    lq.min_fps = getDouble("video.low_quality.min_fps", lq.min_fps);
    lq.min_bitrate = getInt("video.low_quality.min_bitrate", static_cast<int>(lq.min_bitrate));
    lq.min_byte_rate = getDouble("video.low_quality.min_byte_rate", lq.min_byte_rate);
    lq.score_threshold = getInt("video.low_quality.score_threshold", lq.score_threshold);
    lq.min_aspect_ratio = getDouble("video.low_quality.min_aspect_ratio", lq.min_aspect_ratio);
    lq.max_aspect_ratio = getDouble("video.low_quality.max_aspect_ratio", lq.max_aspect_ratio);
    lq.modern_codecs = getStringList("video.low_quality.modern_codecs");

    // Poco flattens keys with dots, numeric object keys are read back through the JSON view
    const nlohmann::json all = getAll();
    const auto buckets = all.at("video").at("low_quality").value("bitrate_by_height", nlohmann::json::object());
    if (buckets.is_object() && !buckets.empty())
    {
        lq.bitrate_by_height.clear();
        for (auto it = buckets.begin(); it != buckets.end(); ++it)
        {
            lq.bitrate_by_height[std::stoi(it.key())] = it.value().get<int64_t>();
        }
    }

    return config;
}

bool ConfigManager::validateConfig() const
{
    return validateConfig(getAll());
}

bool ConfigManager::validateConfig(const nlohmann::json &config)
{
    try
    {
        const std::string log_level = config.at("log_level").get<std::string>();
        if (!Logger::isValidLevel(log_level))
        {
            Logger::error("Invalid log level: " + log_level);
            return false;
        }

        const auto &scan = config.at("scan");
        const int min_batch = scan.at("min_batch_size").get<int>();
        const int max_batch = scan.at("max_batch_size").get<int>();
        if (min_batch <= 0 || max_batch < min_batch)
        {
            Logger::error("Invalid batch size range: " + std::to_string(min_batch) + "-" + std::to_string(max_batch));
            return false;
        }
        if (scan.at("flush_every").get<int>() <= 0 || scan.at("hash_chunk_size").get<int>() <= 0)
        {
            Logger::error("flush_every and hash_chunk_size must be positive");
            return false;
        }

        if (config.at("threading").at("max_workers").get<int>() < 0)
        {
            Logger::error("threading.max_workers must not be negative");
            return false;
        }

        const auto &video = config.at("video");
        const double roi = video.at("roi_fraction").get<double>();
        if (roi <= 0.0 || roi > 1.0)
        {
            Logger::error("Invalid roi_fraction: " + std::to_string(roi));
            return false;
        }
        if (video.at("sample_interval_seconds").get<double>() <= 0.0)
        {
            Logger::error("sample_interval_seconds must be positive");
            return false;
        }
        if (video.at("screenshot_count").get<int>() < 0)
        {
            Logger::error("screenshot_count must not be negative");
            return false;
        }
    }
    catch (const nlohmann::json::exception &e)
    {
        Logger::error("Missing or mistyped config field: " + std::string(e.what()));
        return false;
    }
    return true;
}
