#include "utils/Config.hpp"
#include "utils/HttpClient.hpp"
#include <json-glib/json-glib.h>
#include <glib.h>

namespace DryDock {

namespace {

std::string readString(JsonObject* obj, const char* name, const std::string& fallback) {
    if (!json_object_has_member(obj, name)) return fallback;
    const char* value = json_object_get_string_member(obj, name);
    return value ? value : fallback;
}

// Non-positive or missing values keep the default
int readPositiveInt(JsonObject* obj, const char* name, int fallback) {
    if (!json_object_has_member(obj, name)) return fallback;
    gint64 value = json_object_get_int_member(obj, name);
    return value > 0 ? static_cast<int>(value) : fallback;
}

}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

Config::Config() {
    resetDefaults();
}

void Config::resetDefaults() {
    appName_ = "DryDock";
    version_ = "0.1.0";
    databasePath_.clear();
    syncIntervalSeconds_ = 300;
    httpTimeoutSeconds_ = 30;
    maxRedirects_ = 10;
    userAgent_ = HttpClient::defaultUserAgent();
    poolMaxConnections_ = 10;
    poolAcquireTimeoutMs_ = 5000;
    assistantUrl_ = "http://localhost:11434";
    assistantModel_ = "gemma3";
    assistantTimeoutSeconds_ = 60;
    logLevel_ = "info";
}

std::string Config::getConfigPath() {
    gchar* path = g_build_filename(g_get_user_config_dir(), "drydock", "config.json", nullptr);
    std::string result(path);
    g_free(path);
    return result;
}

std::string Config::defaultDatabasePath() {
    gchar* path = g_build_filename(g_get_user_data_dir(), "DryDock", "database.db", nullptr);
    std::string result(path);
    g_free(path);
    return result;
}

std::string Config::getDatabasePath() const {
    return databasePath_.empty() ? defaultDatabasePath() : databasePath_;
}

void Config::setSyncIntervalSeconds(int seconds) {
    if (seconds > 0) syncIntervalSeconds_ = seconds;
}

Error Config::load() {
    return loadFromFile(getConfigPath());
}

Error Config::loadFromFile(const std::string& path) {
    if (!g_file_test(path.c_str(), G_FILE_TEST_EXISTS)) {
        return saveToFile(path);
    }

    JsonParser* parser = json_parser_new();
    GError* error = nullptr;

    if (!json_parser_load_from_file(parser, path.c_str(), &error)) {
        Error result(ErrorCode::InvalidArgument,
                     "Failed to read config '" + path + "': " + (error ? error->message : "unknown error"));
        if (error) g_error_free(error);
        g_object_unref(parser);
        return result;
    }

    JsonNode* root = json_parser_get_root(parser);
    if (!root || !JSON_NODE_HOLDS_OBJECT(root)) {
        g_object_unref(parser);
        return Error(ErrorCode::InvalidArgument, "Config '" + path + "' is not a JSON object");
    }

    JsonObject* obj = json_node_get_object(root);

    appName_ = readString(obj, "appName", appName_);
    version_ = readString(obj, "version", version_);
    databasePath_ = readString(obj, "databasePath", databasePath_);
    syncIntervalSeconds_ = readPositiveInt(obj, "syncIntervalSeconds", syncIntervalSeconds_);
    httpTimeoutSeconds_ = readPositiveInt(obj, "httpTimeoutSeconds", httpTimeoutSeconds_);
    maxRedirects_ = readPositiveInt(obj, "maxRedirects", maxRedirects_);
    userAgent_ = readString(obj, "userAgent", userAgent_);
    poolMaxConnections_ = readPositiveInt(obj, "poolMaxConnections", poolMaxConnections_);
    poolAcquireTimeoutMs_ = readPositiveInt(obj, "poolAcquireTimeoutMs", poolAcquireTimeoutMs_);
    assistantUrl_ = readString(obj, "assistantUrl", assistantUrl_);
    assistantModel_ = readString(obj, "assistantModel", assistantModel_);
    assistantTimeoutSeconds_ = readPositiveInt(obj, "assistantTimeoutSeconds", assistantTimeoutSeconds_);
    logLevel_ = readString(obj, "logLevel", logLevel_);

    g_object_unref(parser);
    return Error();
}

Error Config::save() const {
    return saveToFile(getConfigPath());
}

Error Config::saveToFile(const std::string& path) const {
    gchar* dir = g_path_get_dirname(path.c_str());
    int rc = g_mkdir_with_parents(dir, 0755);
    g_free(dir);
    if (rc != 0) {
        return Error(ErrorCode::InvalidArgument, "Cannot create directory for config '" + path + "'");
    }

    JsonBuilder* builder = json_builder_new();
    json_builder_begin_object(builder);

    json_builder_set_member_name(builder, "appName");
    json_builder_add_string_value(builder, appName_.c_str());
    json_builder_set_member_name(builder, "version");
    json_builder_add_string_value(builder, version_.c_str());
    json_builder_set_member_name(builder, "databasePath");
    json_builder_add_string_value(builder, databasePath_.c_str());

    json_builder_set_member_name(builder, "syncIntervalSeconds");
    json_builder_add_int_value(builder, syncIntervalSeconds_);
    json_builder_set_member_name(builder, "httpTimeoutSeconds");
    json_builder_add_int_value(builder, httpTimeoutSeconds_);
    json_builder_set_member_name(builder, "maxRedirects");
    json_builder_add_int_value(builder, maxRedirects_);
    json_builder_set_member_name(builder, "userAgent");
    json_builder_add_string_value(builder, userAgent_.c_str());

    json_builder_set_member_name(builder, "poolMaxConnections");
    json_builder_add_int_value(builder, poolMaxConnections_);
    json_builder_set_member_name(builder, "poolAcquireTimeoutMs");
    json_builder_add_int_value(builder, poolAcquireTimeoutMs_);

    json_builder_set_member_name(builder, "assistantUrl");
    json_builder_add_string_value(builder, assistantUrl_.c_str());
    json_builder_set_member_name(builder, "assistantModel");
    json_builder_add_string_value(builder, assistantModel_.c_str());
    json_builder_set_member_name(builder, "assistantTimeoutSeconds");
    json_builder_add_int_value(builder, assistantTimeoutSeconds_);

    json_builder_set_member_name(builder, "logLevel");
    json_builder_add_string_value(builder, logLevel_.c_str());

    json_builder_end_object(builder);

    JsonGenerator* gen = json_generator_new();
    json_generator_set_pretty(gen, TRUE);
    JsonNode* rootNode = json_builder_get_root(builder);
    json_generator_set_root(gen, rootNode);

    GError* error = nullptr;
    Error result;
    if (!json_generator_to_file(gen, path.c_str(), &error)) {
        result = Error(ErrorCode::InvalidArgument,
                       "Failed to write config '" + path + "': " + (error ? error->message : "unknown error"));
    }
    if (error) g_error_free(error);

    json_node_unref(rootNode);
    g_object_unref(gen);
    g_object_unref(builder);
    return result;
}

}
