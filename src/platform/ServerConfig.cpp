// vidstream/src/platform/ServerConfig.cpp
#include "vidstream/platform/ServerConfig.h"
#include "vidstream/json/JsonParser.h"
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace Vidstream {
namespace Platform {

namespace {

std::string read_string(const Json::JsonValue& doc, const std::string& key, const std::string& fallback) {
    const Json::JsonValue* value = doc.find(key);
    if (!value) {
        return fallback;
    }
    if (!value->is_string()) {
        throw std::runtime_error("Invalid value for config key '" + key + "': expected a string");
    }
    return value->get_string();
}

long long read_integer(const Json::JsonValue& doc, const std::string& key, long long fallback) {
    const Json::JsonValue* value = doc.find(key);
    if (!value) {
        return fallback;
    }
    try {
        return value->get_integer();
    } catch (const std::runtime_error& e) {
        throw std::runtime_error("Invalid value for config key '" + key + "': " + e.what());
    }
}

size_t read_size(const Json::JsonValue& doc, const std::string& key, size_t fallback) {
    long long value = read_integer(doc, key, static_cast<long long>(fallback));
    if (value < 0) {
        throw std::runtime_error("Invalid value for config key '" + key + "': must not be negative");
    }
    return static_cast<size_t>(value);
}

int read_int(const Json::JsonValue& doc, const std::string& key, int fallback) {
    long long value = read_integer(doc, key, fallback);
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        throw std::runtime_error("Invalid value for config key '" + key + "': out of range");
    }
    return static_cast<int>(value);
}

} // namespace

ServerConfig ServerConfig::from_json(const Json::JsonValue& doc) {
    if (!doc.is_object()) {
        throw std::runtime_error("Config must be a JSON object");
    }

    ServerConfig config;
    config.host = read_string(doc, "host", config.host);
    config.port = read_int(doc, "port", config.port);
    config.thread_pool_size = read_size(doc, "thread_pool_size", config.thread_pool_size);
    config.media_root = read_string(doc, "media_root", config.media_root);
    config.stream_chunk_size = read_size(doc, "stream_chunk_size", config.stream_chunk_size);
    config.idle_timeout_seconds = read_int(doc, "idle_timeout_seconds", config.idle_timeout_seconds);

    if (const Json::JsonValue* videos = doc.find("videos")) {
        if (!videos->is_array()) {
            throw std::runtime_error("Invalid value for config key 'videos': expected an array");
        }
        std::vector<Catalog::Video> parsed;
        for (const Json::JsonValue& entry : videos->get_array()) {
            parsed.push_back(Catalog::video_from_json(entry));
        }
        config.videos = std::move(parsed);
    }
    return config;
}

ServerConfig ServerConfig::load_file(const std::string& path) {
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open config file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    Json::JsonValue doc;
    try {
        doc = Json::JsonParser::parse(buffer.str());
    } catch (const std::runtime_error& e) {
        throw std::runtime_error("Could not parse config file " + path + ": " + e.what());
    }
    return from_json(doc);
}

void ServerConfig::apply_environment() {
    const char* port_env = std::getenv("PORT");
    if (port_env == nullptr || *port_env == '\0') {
        return;
    }
    try {
        size_t consumed = 0;
        int value = std::stoi(port_env, &consumed);
        if (port_env[consumed] != '\0') {
            throw std::invalid_argument("trailing characters");
        }
        port = value;
    } catch (const std::exception&) {
        throw std::runtime_error(std::string("Invalid PORT environment variable: ") + port_env);
    }
}

void ServerConfig::validate() const {
    if (port < 0 || port > 65535) {
        throw std::runtime_error("port must be between 0 and 65535, got " + std::to_string(port));
    }
    if (stream_chunk_size == 0) {
        throw std::runtime_error("stream_chunk_size must be greater than zero");
    }
    if (idle_timeout_seconds <= 0) {
        throw std::runtime_error("idle_timeout_seconds must be greater than zero");
    }
    if (host.empty()) {
        throw std::runtime_error("host must not be empty");
    }
}

} // namespace Platform
} // namespace Vidstream
