#pragma once

#include <Poco/Util/JSONConfiguration.h>
#include <Poco/AutoPtr.h>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/scan_config.hpp"

/**
 * @brief JSON/YAML backed configuration store
 *
 * Values live in a Poco JSONConfiguration seeded with defaults. Files only need to
 * carry the keys they override. The pipeline never reads this object directly; it
 * receives the ScanConfig value produced by getScanConfig().
 */
class ConfigManager
{
public:
    ConfigManager();
    ConfigManager(const ConfigManager &) = delete;
    ConfigManager &operator=(const ConfigManager &) = delete;

    /**
     * @brief Load overrides from a .json file (or .yaml / .yml via yaml-cpp)
     * @return false if the file is missing, unparsable or fails validation; the
     *         previous configuration is kept in that case
     */
    bool load(const std::string &path);
    bool save(const std::string &path) const;
    void update(const nlohmann::json &patch);
    nlohmann::json getAll() const;

    std::string getString(const std::string &key, const std::string &def = "") const;
    int getInt(const std::string &key, int def = 0) const;
    bool getBool(const std::string &key, bool def = false) const;
    double getDouble(const std::string &key, double def = 0.0) const;
    std::vector<std::string> getStringList(const std::string &key) const;
    bool hasKey(const std::string &key) const;

    std::string getLogLevel() const;
    std::string getOutputDir() const;
    int getMaxWorkers() const;

    ScanConfig getScanConfig() const;

    bool validateConfig() const;
    static bool validateConfig(const nlohmann::json &config);

    void initializeDefaultConfig();

private:
    static nlohmann::json defaultConfig();
    static nlohmann::json yamlFileToJson(const std::string &path);
    void replaceConfig(const nlohmann::json &config);

    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;
};
