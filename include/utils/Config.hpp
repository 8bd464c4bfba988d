#pragma once
#include "utils/Error.hpp"
#include <string>

namespace DryDock {

// Application settings persisted as JSON under the user config dir.
// Read once at startup; setters only change the in-memory copy.
class Config {
public:
    static Config& getInstance();

    // Missing file: defaults are kept and written out.
    Error load();
    Error loadFromFile(const std::string& path);
    Error save() const;
    Error saveToFile(const std::string& path) const;
    void resetDefaults();

    std::string getAppName() const { return appName_; }
    std::string getVersion() const { return version_; }

    // Empty setting resolves to defaultDatabasePath()
    std::string getDatabasePath() const;
    void setDatabasePath(const std::string& path) { databasePath_ = path; }

    int getSyncIntervalSeconds() const { return syncIntervalSeconds_; }
    void setSyncIntervalSeconds(int seconds);

    int getHttpTimeoutSeconds() const { return httpTimeoutSeconds_; }
    int getMaxRedirects() const { return maxRedirects_; }
    std::string getUserAgent() const { return userAgent_; }

    int getPoolMaxConnections() const { return poolMaxConnections_; }
    int getPoolAcquireTimeoutMs() const { return poolAcquireTimeoutMs_; }

    std::string getAssistantUrl() const { return assistantUrl_; }
    std::string getAssistantModel() const { return assistantModel_; }
    int getAssistantTimeoutSeconds() const { return assistantTimeoutSeconds_; }

    std::string getLogLevel() const { return logLevel_; }
    void setLogLevel(const std::string& level) { logLevel_ = level; }

    static std::string getConfigPath();
    static std::string defaultDatabasePath();

private:
    Config();
    ~Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    std::string appName_;
    std::string version_;
    std::string databasePath_;
    int syncIntervalSeconds_;
    int httpTimeoutSeconds_;
    int maxRedirects_;
    std::string userAgent_;
    int poolMaxConnections_;
    int poolAcquireTimeoutMs_;
    std::string assistantUrl_;
    std::string assistantModel_;
    int assistantTimeoutSeconds_;
    std::string logLevel_;
};

}
