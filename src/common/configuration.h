#ifndef MERIDIAN_CONFIGURATION_H_
#define MERIDIAN_CONFIGURATION_H_

#include <string>
#include <chrono>
#include <optional>
#include <vector>
#include <cstdint>

#include "common/config.h"

namespace YAML {
class Node;
}

namespace Meridian {

using Duration = std::chrono::microseconds;

/**
 * Parses a duration string such as "50ms", "500us", "3s" or "1m30s".
 * A bare number is read as milliseconds.
 */
std::optional<Duration> ParseDuration(const std::string& text);

/**
 * Formats a duration with the largest unit that keeps it exact.
 */
std::string FormatDuration(Duration d);

/**
 * Configuration value that can be overridden by environment variables
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), env_var_(env_var) {}

    T get() const {
        if (!env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    void set(T value) { value_ = value; }
    const std::string& env_var() const { return env_var_; }

private:
    T value_{};
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

/**
 * Main configuration structure
 */
struct MeridianConfig {
    struct Server {
        ConfigValue<std::string> name{"meridian", "MERIDIAN_SERVER_NAME"};
        // memory:// or file://<directory>
        ConfigValue<std::string> backend_endpoints{MERIDIAN_DEFAULT_BACKEND, "MERIDIAN_BACKEND_ENDPOINTS"};
        ConfigValue<std::string> listen_addr{MERIDIAN_DEFAULT_LISTEN_ADDR, "MERIDIAN_LISTEN_ADDR"};
    } server;

    struct Tso {
        // At most 1<<18 timestamps can be generated per physical tick. Only valid
        // in [1ms, 10s]; values outside are clamped by EffectiveUpdatePhysicalInterval().
        ConfigValue<Duration> update_physical_interval{
            std::chrono::milliseconds(tso_update_physical_interval_ms), "MERIDIAN_TSO_UPDATE_PHYSICAL_INTERVAL"};
        ConfigValue<Duration> save_interval{
            std::chrono::milliseconds(tso_save_interval_ms), "MERIDIAN_TSO_SAVE_INTERVAL"};
        ConfigValue<Duration> max_gap_reset_ts{
            std::chrono::milliseconds(tso_max_gap_reset_ts_ms), "MERIDIAN_TSO_MAX_GAP_RESET_TS"};
        // Zero means "same as save_interval".
        ConfigValue<Duration> persist_margin{Duration::zero(), "MERIDIAN_TSO_PERSIST_MARGIN"};
        ConfigValue<Duration> update_timestamp_guard{
            std::chrono::milliseconds(tso_update_timestamp_guard_ms), "MERIDIAN_TSO_UPDATE_TIMESTAMP_GUARD"};
        ConfigValue<int> save_retry_limit{static_cast<int>(tso_save_retry_limit), "MERIDIAN_TSO_SAVE_RETRY_LIMIT"};
        ConfigValue<Duration> save_retry_backoff{
            std::chrono::milliseconds(tso_save_retry_backoff_ms), "MERIDIAN_TSO_SAVE_RETRY_BACKOFF"};
        ConfigValue<int> max_count_per_request{
            static_cast<int>(tso_max_count_per_request), "MERIDIAN_TSO_MAX_COUNT_PER_REQUEST"};
        ConfigValue<bool> enable_local_tso{false, "MERIDIAN_ENABLE_LOCAL_TSO"};
        std::vector<std::string> local_regions;

        Duration EffectiveUpdatePhysicalInterval() const;
        Duration EffectivePersistMargin() const;
    } tso;

    struct Log {
        ConfigValue<int> level{0, "MERIDIAN_LOG_LEVEL"};
        ConfigValue<std::string> file{"", "MERIDIAN_LOG_FILE"};
    } log;

    struct Security {
        ConfigValue<std::string> cacert{""};
        ConfigValue<std::string> cert{""};
        ConfigValue<std::string> key{""};
    } security;
};

/**
 * Configuration manager
 */
class Configuration {
public:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    static Configuration& getInstance();

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Get the configuration
    const MeridianConfig& config() const { return config_; }
    MeridianConfig& config() { return config_; }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    MeridianConfig config_;
    mutable std::vector<std::string> validation_errors_;

    bool loadFromNode(const YAML::Node& yaml);
};

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

template<>
std::optional<Duration> ConfigValue<Duration>::getEnvValue() const;

} // namespace Meridian

#endif // MERIDIAN_CONFIGURATION_H_
