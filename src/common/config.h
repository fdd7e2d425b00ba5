#pragma once

/// @file config.h
/// @brief kpiwatch configuration management

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include <absl/status/statusor.h>
#include <yaml-cpp/yaml.h>

namespace kpiwatch {

/// @brief Configuration value that can hold different types
using ConfigValue = std::variant<
    bool,
    int64_t,
    double,
    std::string,
    std::vector<std::string>,
    std::unordered_map<std::string, double>
>;

/// @brief Hierarchical configuration backed by a YAML document
///
/// Keys use dot notation ("alert_thresholds.critical"). Missing or
/// ill-typed values fall back to the supplied default.
class Config {
public:
    /// @brief Default constructor creates empty configuration
    Config() = default;

    /// @brief Load configuration from a YAML file
    static absl::StatusOr<Config> LoadFromFile(const std::filesystem::path& path);

    /// @brief Load configuration from a YAML string
    static absl::StatusOr<Config> LoadFromString(std::string_view yaml_content);

    /// @brief Load configuration from environment variables with a prefix
    /// @param prefix Environment variable prefix (e.g., "KPIWATCH_")
    static Config LoadFromEnvironment(std::string_view prefix = "KPIWATCH_");

    /// @brief Load a file (optional) and overlay the environment on top of it
    static absl::StatusOr<Config> LoadLayered(
        const std::optional<std::filesystem::path>& path,
        std::string_view env_prefix = "KPIWATCH_");

    /// @brief Merge another configuration into this one (other takes precedence)
    void Merge(const Config& other);

    std::string GetString(std::string_view key, std::string_view default_value = "") const;
    int64_t GetInt(std::string_view key, int64_t default_value = 0) const;
    double GetDouble(std::string_view key, double default_value = 0.0) const;
    bool GetBool(std::string_view key, bool default_value = false) const;

    /// @brief Get a list of strings
    std::vector<std::string> GetStringList(std::string_view key) const;

    /// @brief Get a map of numeric values (e.g. "entities.sales.weights")
    ///
    /// Entries whose value is not numeric are skipped.
    std::unordered_map<std::string, double> GetDoubleMap(std::string_view key) const;

    /// @brief Names of the children of a map node, in document order
    std::vector<std::string> GetChildKeys(std::string_view key) const;

    /// @brief Check if a key exists
    bool HasKey(std::string_view key) const;

    /// @brief Set a configuration value
    void Set(std::string_view key, ConfigValue value);

    /// @brief Get the underlying YAML node for advanced access
    const YAML::Node& GetNode() const { return root_; }

private:
    YAML::Node root_;

    /// @brief Navigate to a nested node using dot notation
    std::optional<YAML::Node> GetNestedNode(std::string_view key) const;
};

}  // namespace kpiwatch
