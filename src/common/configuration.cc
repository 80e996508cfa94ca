#include "configuration.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Meridian {

namespace {

// Returns the length of a unit in microseconds, or 0 if the unit is unknown.
double UnitMicros(const std::string& unit) {
    if (unit == "ns") return 1e-3;
    if (unit == "us" || unit == "\xC2\xB5s" || unit == "\xCE\xBCs") return 1;
    if (unit == "ms" || unit.empty()) return 1e3;
    if (unit == "s") return 1e6;
    if (unit == "m") return 60e6;
    if (unit == "h") return 3600e6;
    return 0;
}

bool ReadDuration(const YAML::Node& node, const char* key, ConfigValue<Duration>& out) {
    if (!node[key]) return true;
    std::string text = node[key].as<std::string>();
    auto d = ParseDuration(text);
    if (!d.has_value()) {
        LOG(ERROR) << "Invalid duration for " << key << ": " << text;
        return false;
    }
    out.set(*d);
    return true;
}

} // namespace

std::optional<Duration> ParseDuration(const std::string& text) {
    size_t pos = 0;
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) pos++;
    size_t end = text.size();
    while (end > pos && std::isspace(static_cast<unsigned char>(text[end - 1]))) end--;
    if (pos == end) return std::nullopt;

    double total_us = 0;
    bool first = true;
    while (pos < end) {
        size_t num_start = pos;
        while (pos < end && (std::isdigit(static_cast<unsigned char>(text[pos])) || text[pos] == '.')) pos++;
        if (pos == num_start) return std::nullopt;
        double value = 0;
        try {
            value = std::stod(text.substr(num_start, pos - num_start));
        } catch (const std::exception&) {
            return std::nullopt;
        }
        size_t unit_start = pos;
        while (pos < end && !std::isdigit(static_cast<unsigned char>(text[pos])) && text[pos] != '.') pos++;
        std::string unit = text.substr(unit_start, pos - unit_start);
        // A bare number is only accepted on its own
        if (unit.empty() && !(first && pos == end)) return std::nullopt;
        double scale = UnitMicros(unit);
        if (scale == 0) return std::nullopt;
        total_us += value * scale;
        first = false;
    }
    return Duration(static_cast<int64_t>(total_us));
}

std::string FormatDuration(Duration d) {
    std::ostringstream os;
    int64_t us = d.count();
    if (us != 0 && us % 3600000000LL == 0) {
        os << us / 3600000000LL << "h";
    } else if (us != 0 && us % 60000000LL == 0) {
        os << us / 60000000LL << "m";
    } else if (us != 0 && us % 1000000LL == 0) {
        os << us / 1000000LL << "s";
    } else if (us % 1000LL == 0) {
        os << us / 1000LL << "ms";
    } else {
        os << us << "us";
    }
    return os.str();
}

Duration MeridianConfig::Tso::EffectiveUpdatePhysicalInterval() const {
    const Duration min_interval = std::chrono::milliseconds(tso_min_update_physical_interval_ms);
    const Duration max_interval = std::chrono::milliseconds(tso_max_update_physical_interval_ms);
    return std::clamp(update_physical_interval.get(), min_interval, max_interval);
}

Duration MeridianConfig::Tso::EffectivePersistMargin() const {
    Duration margin = persist_margin.get();
    if (margin <= Duration::zero()) {
        margin = save_interval.get();
    }
    return margin;
}

// Template specializations for environment variable parsing
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoi(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        return std::string(env_val);
    }
    return std::nullopt;
}

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        std::string val(env_val);
        std::transform(val.begin(), val.end(), val.begin(), ::tolower);
        if (val == "true" || val == "1" || val == "yes" || val == "on") {
            return true;
        } else if (val == "false" || val == "0" || val == "no" || val == "off") {
            return false;
        }
        LOG(WARNING) << "Invalid boolean value for env var " << env_var_ << ": " << env_val;
    }
    return std::nullopt;
}

template<>
std::optional<Duration> ConfigValue<Duration>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        auto d = ParseDuration(env_val);
        if (d.has_value()) {
            return d;
        }
        LOG(WARNING) << "Invalid duration value for env var " << env_var_ << ": " << env_val;
    }
    return std::nullopt;
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        return loadFromNode(YAML::LoadFile(filename));
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        return loadFromNode(YAML::Load(yaml_content));
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

bool Configuration::loadFromNode(const YAML::Node& yaml) {
    bool ok = true;
    if (yaml["meridian"]) {
        auto root = yaml["meridian"];

        // Server
        if (root["server"]) {
            auto server = root["server"];
            if (server["name"]) config_.server.name.set(server["name"].as<std::string>());
            if (server["backend_endpoints"]) config_.server.backend_endpoints.set(server["backend_endpoints"].as<std::string>());
            if (server["listen_addr"]) config_.server.listen_addr.set(server["listen_addr"].as<std::string>());
        }

        // Timestamp oracle
        if (root["tso"]) {
            auto tso = root["tso"];
            ok &= ReadDuration(tso, "update_physical_interval", config_.tso.update_physical_interval);
            ok &= ReadDuration(tso, "save_interval", config_.tso.save_interval);
            ok &= ReadDuration(tso, "max_gap_reset_ts", config_.tso.max_gap_reset_ts);
            ok &= ReadDuration(tso, "persist_margin", config_.tso.persist_margin);
            ok &= ReadDuration(tso, "update_timestamp_guard", config_.tso.update_timestamp_guard);
            ok &= ReadDuration(tso, "save_retry_backoff", config_.tso.save_retry_backoff);
            if (tso["save_retry_limit"]) config_.tso.save_retry_limit.set(tso["save_retry_limit"].as<int>());
            if (tso["max_count_per_request"]) config_.tso.max_count_per_request.set(tso["max_count_per_request"].as<int>());
            if (tso["enable_local_tso"]) config_.tso.enable_local_tso.set(tso["enable_local_tso"].as<bool>());
            if (tso["local_regions"]) {
                config_.tso.local_regions.clear();
                for (const auto& region : tso["local_regions"]) {
                    config_.tso.local_regions.push_back(region.as<std::string>());
                }
            }
        }

        // Log
        if (root["log"]) {
            auto log = root["log"];
            if (log["level"]) config_.log.level.set(log["level"].as<int>());
            if (log["file"]) config_.log.file.set(log["file"].as<std::string>());
        }

        // Security
        if (root["security"]) {
            auto security = root["security"];
            if (security["cacert"]) config_.security.cacert.set(security["cacert"].as<std::string>());
            if (security["cert"]) config_.security.cert.set(security["cert"].as<std::string>());
            if (security["key"]) config_.security.key.set(security["key"].as<std::string>());
        }
    }

    if (!ok) {
        return false;
    }
    if (!validate()) {
        for (const auto& error : validation_errors_) {
            LOG(ERROR) << "Invalid configuration: " << error;
        }
        return false;
    }
    return true;
}

bool Configuration::validate() const {
    validation_errors_.clear();

    const auto& tso = config_.tso;
    if (tso.update_physical_interval.get() <= Duration::zero()) {
        validation_errors_.push_back("tso.update_physical_interval must be positive");
    }
    if (tso.save_interval.get() <= Duration::zero()) {
        validation_errors_.push_back("tso.save_interval must be positive");
    }
    if (tso.max_gap_reset_ts.get() < Duration::zero()) {
        validation_errors_.push_back("tso.max_gap_reset_ts cannot be negative");
    }
    if (tso.EffectivePersistMargin() <= tso.update_timestamp_guard.get()) {
        validation_errors_.push_back("tso.persist_margin must exceed tso.update_timestamp_guard");
    }
    if (tso.save_retry_limit.get() < 1) {
        validation_errors_.push_back("tso.save_retry_limit must be at least 1");
    }
    if (tso.max_count_per_request.get() < 1 || tso.max_count_per_request.get() >= (1 << 18)) {
        validation_errors_.push_back("tso.max_count_per_request must be in [1, 262143]");
    }
    if (tso.enable_local_tso.get() && tso.local_regions.empty()) {
        validation_errors_.push_back("tso.enable_local_tso requires at least one entry in tso.local_regions");
    }
    for (const auto& region : tso.local_regions) {
        if (region.empty() || region == "global" || region.find('/') != std::string::npos) {
            validation_errors_.push_back("Invalid local region name: '" + region + "'");
        }
    }

    // Both or neither of cert/key
    if (config_.security.cert.get().empty() != config_.security.key.get().empty()) {
        validation_errors_.push_back("security.cert and security.key must be set together");
    }

    if (config_.server.listen_addr.get().empty()) {
        validation_errors_.push_back("server.listen_addr cannot be empty");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace Meridian
