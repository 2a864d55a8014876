/// @file inspect_main.cpp
/// @brief tracekeep-inspect: decode trace-context headers into JSON

#include <filesystem>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include "src/common/config.h"
#include "src/common/logging.h"
#include "src/propagation/batch_links.h"
#include "src/propagation/extractor.h"
#include "src/sampling/sampler_factory.h"

namespace {

using tracekeep::trace::HeaderMap;

nlohmann::json ContextToJson(const tracekeep::trace::SpanContext& context) {
    nlohmann::json j;
    j["trace_id"] = context.trace_id;
    j["span_id"] = context.span_id;
    j["trace_flags"] = context.trace_flags;
    j["sampled"] = context.IsSampled();
    j["is_remote"] = context.is_remote;
    if (!context.trace_state.empty()) {
        j["trace_state"] = context.trace_state;
    }
    return j;
}

nlohmann::json AttributesToJson(const tracekeep::trace::Attributes& attributes) {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& entry : attributes) {
        const std::string& key = entry.first;
        std::visit([&j, &key](const auto& v) { j[key] = v; }, entry.second);
    }
    return j;
}

HeaderMap ToHeaderMap(const YAML::Node& node) {
    HeaderMap headers;
    for (const auto& entry : node) {
        headers[entry.first.as<std::string>()] = entry.second.as<std::string>();
    }
    return headers;
}

}  // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"tracekeep-inspect - decode trace-context headers and preview sampling setup"};

    std::string config_path;
    std::string headers_path;
    std::vector<std::string> formats;
    std::string log_level = "warn";
    bool show_config = false;

    app.add_option("-c,--config", config_path, "Path to YAML configuration file");
    app.add_option("-H,--headers", headers_path,
                   "YAML file holding one header map, or a list of maps for a batch")
        ->required();
    app.add_option("-f,--formats", formats, "Propagation formats to try (w3c, b3, datadog, xray)")
        ->delimiter(',');
    app.add_option("--log-level", log_level, "Log level (trace, debug, info, warn, error)");
    app.add_flag("--show-config", show_config, "Include the effective configuration in the output");

    CLI11_PARSE(app, argc, argv);

    tracekeep::LogConfig log_config;
    log_config.name = "tracekeep-inspect";
    log_config.level = tracekeep::ParseLogLevel(log_level);
    log_config.console_to_stderr = true;
    tracekeep::InitLogging(log_config);

    std::optional<std::filesystem::path> path;
    if (!config_path.empty()) {
        path = config_path;
    }
    auto config_or = tracekeep::LoadConfig(path);
    if (!config_or.ok()) {
        TRACEKEEP_LOG_ERROR("Failed to load config: {}", config_or.status().message());
        return 1;
    }
    tracekeep::Config config = std::move(*config_or);
    if (app.count("--log-level") == 0 && config.HasKey("logging.level")) {
        tracekeep::SetLogLevel(tracekeep::ParseLogLevel(config.GetString("logging.level")));
    }
    if (!formats.empty()) {
        config.Set("propagation.formats", formats);
    }

    auto propagation_config = tracekeep::propagation::PropagationConfig::FromConfig(config);
    auto extractor_or = tracekeep::propagation::CreateExtractor(propagation_config);
    if (!extractor_or.ok()) {
        TRACEKEEP_LOG_ERROR("Invalid propagation setup: {}", extractor_or.status().message());
        return 1;
    }
    const auto& extractor = **extractor_or;

    auto sampler_config = tracekeep::sampling::SamplerConfig::FromConfig(config);
    if (!sampler_config.ok()) {
        TRACEKEEP_LOG_ERROR("Invalid sampling setup: {}", sampler_config.status().message());
        return 1;
    }
    auto sampler_or = tracekeep::sampling::CreateSampler(*sampler_config);
    if (!sampler_or.ok()) {
        TRACEKEEP_LOG_ERROR("Invalid sampling setup: {}", sampler_or.status().message());
        return 1;
    }

    YAML::Node document;
    try {
        document = YAML::LoadFile(headers_path);
    } catch (const YAML::Exception& e) {
        TRACEKEEP_LOG_ERROR("Failed to read headers from {}: {}", headers_path, e.what());
        return 1;
    }

    nlohmann::json output;
    output["extractor"] = extractor.Name();
    output["sampler"] = (*sampler_or)->Name();
    output["tail_sampling"] = (*sampler_or)->NeedsTailSampling();

    try {
        if (document.IsSequence()) {
            std::vector<HeaderMap> batch;
            for (const auto& message : document) {
                batch.push_back(message.IsMap() ? ToHeaderMap(message) : HeaderMap{});
            }
            auto links = tracekeep::propagation::ExtractLinksFromHeaderBatch(batch, extractor);

            output["attributes"] = AttributesToJson(
                tracekeep::propagation::BatchLinkAttributes(batch.size()));
            output["links"] = nlohmann::json::array();
            for (const auto& link : links) {
                output["links"].push_back({{"context", ContextToJson(link.context)},
                                           {"attributes", AttributesToJson(link.attributes)}});
            }
        } else if (document.IsMap()) {
            auto context = extractor.Extract(ToHeaderMap(document));
            output["context"] = context ? ContextToJson(*context) : nlohmann::json(nullptr);
        } else {
            TRACEKEEP_LOG_ERROR("{} must hold a header map or a list of header maps",
                                headers_path);
            return 1;
        }
    } catch (const YAML::Exception& e) {
        TRACEKEEP_LOG_ERROR("Malformed header map in {}: {}", headers_path, e.what());
        return 1;
    }

    if (show_config) {
        output["config"] = config.ToJson();
    }

    std::cout << output.dump(2) << std::endl;
    tracekeep::ShutdownLogging();
    return 0;
}
