#include "config.h"

#include <cstdlib>
#include <functional>
#include <type_traits>

#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>

namespace kpiwatch {

namespace {

/// Environment variable suffix -> configuration key
struct EnvBinding {
    const char* suffix;
    const char* key;
    enum class Type { kInt, kDouble, kString } type;
};

constexpr EnvBinding kEnvBindings[] = {
    {"UPDATE_INTERVAL_MS", "engine.update_interval_ms", EnvBinding::Type::kInt},
    {"TREND_INTERVAL_MS", "engine.trend_interval_ms", EnvBinding::Type::kInt},
    {"WORKER_THREADS", "engine.worker_threads", EnvBinding::Type::kInt},
    {"TREND_WINDOW_SIZE", "trend.window_size", EnvBinding::Type::kInt},
    {"TREND_EMIT_EPSILON", "trend.emit_epsilon", EnvBinding::Type::kDouble},
    {"ALERT_INFO", "alert_thresholds.info", EnvBinding::Type::kDouble},
    {"ALERT_WARNING", "alert_thresholds.warning", EnvBinding::Type::kDouble},
    {"ALERT_CRITICAL", "alert_thresholds.critical", EnvBinding::Type::kDouble},
    {"LOG_LEVEL", "logging.level", EnvBinding::Type::kString},
    {"LOG_FILE", "logging.file", EnvBinding::Type::kString},
};

}  // namespace

absl::StatusOr<Config> Config::LoadFromFile(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return absl::NotFoundError(
            absl::StrCat("Configuration file not found: ", path.string()));
    }

    try {
        Config config;
        config.root_ = YAML::LoadFile(path.string());
        return config;
    } catch (const YAML::Exception& e) {
        return absl::InvalidArgumentError(
            absl::StrCat("Failed to parse YAML configuration: ", e.what()));
    }
}

absl::StatusOr<Config> Config::LoadFromString(std::string_view yaml_content) {
    try {
        Config config;
        config.root_ = YAML::Load(std::string(yaml_content));
        return config;
    } catch (const YAML::Exception& e) {
        return absl::InvalidArgumentError(
            absl::StrCat("Failed to parse YAML content: ", e.what()));
    }
}

Config Config::LoadFromEnvironment(std::string_view prefix) {
    Config config;

    for (const auto& binding : kEnvBindings) {
        std::string name = absl::StrCat(absl::string_view(prefix.data(), prefix.size()), binding.suffix);
        const char* value = std::getenv(name.c_str());
        if (value == nullptr || *value == '\0') {
            continue;
        }

        switch (binding.type) {
            case EnvBinding::Type::kInt: {
                int64_t parsed = 0;
                if (absl::SimpleAtoi(value, &parsed)) {
                    config.Set(binding.key, parsed);
                }
                break;
            }
            case EnvBinding::Type::kDouble: {
                double parsed = 0.0;
                if (absl::SimpleAtod(value, &parsed)) {
                    config.Set(binding.key, parsed);
                }
                break;
            }
            case EnvBinding::Type::kString:
                config.Set(binding.key, std::string(value));
                break;
        }
    }

    return config;
}

absl::StatusOr<Config> Config::LoadLayered(
    const std::optional<std::filesystem::path>& path,
    std::string_view env_prefix) {

    Config config;
    if (path.has_value()) {
        auto file_config = LoadFromFile(*path);
        if (!file_config.ok()) {
            return file_config.status();
        }
        config = std::move(*file_config);
    }

    // Environment variables have the highest priority
    config.Merge(LoadFromEnvironment(env_prefix));
    return config;
}

void Config::Merge(const Config& other) {
    std::function<void(YAML::Node&, const YAML::Node&)> merge_nodes;
    merge_nodes = [&merge_nodes](YAML::Node& base, const YAML::Node& overlay) {
        if (!overlay.IsMap()) {
            return;
        }
        for (const auto& kv : overlay) {
            const std::string key = kv.first.as<std::string>();
            if (base[key] && base[key].IsMap() && kv.second.IsMap()) {
                YAML::Node base_child = base[key];
                merge_nodes(base_child, kv.second);
            } else {
                base[key] = kv.second;
            }
        }
    };

    merge_nodes(root_, other.root_);
}

std::optional<YAML::Node> Config::GetNestedNode(std::string_view key) const {
    std::vector<std::string> parts = absl::StrSplit(absl::string_view(key.data(), key.size()), '.');

    // Node::operator= assigns through to the referenced node, so walk the
    // tree with reset() to leave root_ untouched.
    YAML::Node current;
    current.reset(root_);

    for (const auto& part : parts) {
        const YAML::Node& parent = current;
        if (!parent || !parent.IsMap()) {
            return std::nullopt;
        }
        YAML::Node child = parent[part];
        if (!child) {
            return std::nullopt;
        }
        current.reset(child);
    }

    if (!current || current.IsNull()) {
        return std::nullopt;
    }

    return current;
}

std::string Config::GetString(std::string_view key, std::string_view default_value) const {
    auto node = GetNestedNode(key);
    if (node && node->IsScalar()) {
        return node->as<std::string>();
    }
    return std::string(default_value);
}

int64_t Config::GetInt(std::string_view key, int64_t default_value) const {
    auto node = GetNestedNode(key);
    if (node && node->IsScalar()) {
        try {
            return node->as<int64_t>();
        } catch (const YAML::Exception&) {
            return default_value;
        }
    }
    return default_value;
}

double Config::GetDouble(std::string_view key, double default_value) const {
    auto node = GetNestedNode(key);
    if (node && node->IsScalar()) {
        try {
            return node->as<double>();
        } catch (const YAML::Exception&) {
            return default_value;
        }
    }
    return default_value;
}

bool Config::GetBool(std::string_view key, bool default_value) const {
    auto node = GetNestedNode(key);
    if (node && node->IsScalar()) {
        try {
            return node->as<bool>();
        } catch (const YAML::Exception&) {
            return default_value;
        }
    }
    return default_value;
}

std::vector<std::string> Config::GetStringList(std::string_view key) const {
    std::vector<std::string> result;
    auto node = GetNestedNode(key);
    if (node && node->IsSequence()) {
        for (const auto& item : *node) {
            if (item.IsScalar()) {
                result.push_back(item.as<std::string>());
            }
        }
    }
    return result;
}

std::unordered_map<std::string, double> Config::GetDoubleMap(std::string_view key) const {
    std::unordered_map<std::string, double> result;
    auto node = GetNestedNode(key);
    if (!node || !node->IsMap()) {
        return result;
    }

    for (const auto& kv : *node) {
        if (!kv.second.IsScalar()) {
            continue;
        }
        try {
            result[kv.first.as<std::string>()] = kv.second.as<double>();
        } catch (const YAML::Exception&) {
            // Non-numeric entry, skipped
        }
    }
    return result;
}

std::vector<std::string> Config::GetChildKeys(std::string_view key) const {
    std::vector<std::string> keys;
    auto node = GetNestedNode(key);
    if (node && node->IsMap()) {
        for (const auto& kv : *node) {
            keys.push_back(kv.first.as<std::string>());
        }
    }
    return keys;
}

bool Config::HasKey(std::string_view key) const {
    return GetNestedNode(key).has_value();
}

void Config::Set(std::string_view key, ConfigValue value) {
    std::vector<std::string> parts = absl::StrSplit(absl::string_view(key.data(), key.size()), '.');

    if (!root_.IsMap()) {
        root_ = YAML::Node(YAML::NodeType::Map);
    }

    YAML::Node current;
    current.reset(root_);
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        if (!current[parts[i]] || !current[parts[i]].IsMap()) {
            current[parts[i]] = YAML::Node(YAML::NodeType::Map);
        }
        YAML::Node child = current[parts[i]];
        current.reset(child);
    }

    std::visit([&](auto&& val) {
        using T = std::decay_t<decltype(val)>;
        if constexpr (std::is_same_v<T, std::vector<std::string>>) {
            YAML::Node seq(YAML::NodeType::Sequence);
            for (const auto& item : val) {
                seq.push_back(item);
            }
            current[parts.back()] = seq;
        } else if constexpr (std::is_same_v<T, std::unordered_map<std::string, double>>) {
            YAML::Node map(YAML::NodeType::Map);
            for (const auto& [k, v] : val) {
                map[k] = v;
            }
            current[parts.back()] = map;
        } else {
            current[parts.back()] = val;
        }
    }, value);
}

}  // namespace kpiwatch
