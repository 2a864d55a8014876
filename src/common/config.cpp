#include "config.h"

#include <cstdlib>
#include <functional>

#include <absl/strings/ascii.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>
#include <absl/strings/strip.h>

#include "logging.h"

namespace tracekeep {

namespace {

nlohmann::json NodeToJson(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Map: {
            nlohmann::json obj = nlohmann::json::object();
            for (const auto& kv : node) {
                obj[kv.first.as<std::string>()] = NodeToJson(kv.second);
            }
            return obj;
        }
        case YAML::NodeType::Sequence: {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& item : node) {
                arr.push_back(NodeToJson(item));
            }
            return arr;
        }
        case YAML::NodeType::Scalar: {
            const std::string& text = node.Scalar();
            int64_t int_value = 0;
            double double_value = 0.0;
            bool bool_value = false;
            if (absl::SimpleAtoi(text, &int_value)) {
                return int_value;
            }
            if (absl::SimpleAtod(text, &double_value)) {
                return double_value;
            }
            if (absl::SimpleAtob(text, &bool_value)) {
                return bool_value;
            }
            return text;
        }
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
        default:
            return nullptr;
    }
}

// Const lookups never insert into the shared tree
std::optional<YAML::Node> LookupPath(const YAML::Node& node,
                                     const std::vector<std::string>& parts,
                                     size_t index) {
    if (index == parts.size()) {
        if (!node || node.IsNull()) {
            return std::nullopt;
        }
        return node;
    }
    if (!node || !node.IsMap()) {
        return std::nullopt;
    }
    return LookupPath(node[parts[index]], parts, index + 1);
}

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

    auto get_env = [&prefix](const char* suffix) -> std::optional<std::string> {
        std::string key = absl::StrCat(absl::string_view(prefix.data(), prefix.size()), suffix);
        const char* value = std::getenv(key.c_str());
        if (value != nullptr) {
            return std::string(value);
        }
        return std::nullopt;
    };

    if (auto val = get_env("SAMPLER")) {
        config.Set("sampling.strategy", *val);
    }
    if (auto val = get_env("SAMPLE_RATE")) {
        double rate = 0.0;
        if (absl::SimpleAtod(*val, &rate)) {
            config.Set("sampling.sample_rate", rate);
        } else {
            TRACEKEEP_LOG_WARN("Ignoring non-numeric {}SAMPLE_RATE='{}'", prefix, *val);
        }
    }
    if (auto val = get_env("SLOW_THRESHOLD_MS")) {
        double threshold = 0.0;
        if (absl::SimpleAtod(*val, &threshold)) {
            config.Set("sampling.adaptive.slow_threshold_ms", threshold);
        } else {
            TRACEKEEP_LOG_WARN("Ignoring non-numeric {}SLOW_THRESHOLD_MS='{}'", prefix, *val);
        }
    }
    if (auto val = get_env("PROPAGATORS")) {
        std::vector<std::string> formats =
            absl::StrSplit(*val, ',', absl::SkipWhitespace());
        for (auto& format : formats) {
            format = std::string(absl::StripAsciiWhitespace(format));
        }
        config.Set("propagation.formats", formats);
    }
    if (auto val = get_env("LOG_LEVEL")) {
        config.Set("logging.level", *val);
    }

    return config;
}

void Config::Merge(const Config& other) {
    // Deep merge YAML nodes
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
    return LookupPath(root_, parts, 0);
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
    if (!node) {
        return result;
    }
    if (node->IsSequence()) {
        for (const auto& item : *node) {
            if (item.IsScalar()) {
                result.push_back(item.as<std::string>());
            }
        }
    } else if (node->IsScalar()) {
        for (absl::string_view part :
             absl::StrSplit(node->Scalar(), ',', absl::SkipWhitespace())) {
            result.emplace_back(absl::StripAsciiWhitespace(part));
        }
    }
    return result;
}

bool Config::HasKey(std::string_view key) const {
    return GetNestedNode(key).has_value();
}

void Config::Set(std::string_view key, ConfigValue value) {
    std::vector<std::string> parts = absl::StrSplit(absl::string_view(key.data(), key.size()), '.');

    if (!root_ || !root_.IsMap()) {
        root_ = YAML::Node(YAML::NodeType::Map);
    }

    // YAML::Node has reference semantics; reassigning `current` rebinds it
    YAML::Node current = root_;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        if (!current[parts[i]].IsMap()) {
            current[parts[i]] = YAML::Node(YAML::NodeType::Map);
        }
        current.reset(current[parts[i]]);
    }

    std::visit([&](auto&& val) {
        using T = std::decay_t<decltype(val)>;
        if constexpr (std::is_same_v<T, std::vector<std::string>>) {
            YAML::Node seq(YAML::NodeType::Sequence);
            for (const auto& item : val) {
                seq.push_back(item);
            }
            current[parts.back()] = seq;
        } else if constexpr (std::is_same_v<T, std::unordered_map<std::string, std::string>>) {
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

nlohmann::json Config::ToJson() const {
    return NodeToJson(root_);
}

absl::StatusOr<Config> LoadConfig(
    const std::optional<std::filesystem::path>& config_path,
    std::string_view env_prefix
) {
    Config config;

    if (config_path.has_value()) {
        auto file_config = Config::LoadFromFile(*config_path);
        if (!file_config.ok()) {
            return file_config.status();
        }
        config.Merge(*file_config);
    }

    // Environment variables have the highest priority
    config.Merge(Config::LoadFromEnvironment(env_prefix));

    return config;
}

}  // namespace tracekeep
