#include "llmgate/models/model.hpp"
#include "llmgate/core/logger.hpp"

namespace llmgate::models {

void to_json(json& j, const ModelPricing& p) {
    j = json{{"input", p.input}, {"output", p.output}};
    if (p.cached_input) j["cachedInput"] = *p.cached_input;
    if (p.cache_creation) j["cacheCreation"] = *p.cache_creation;
}

void from_json(const json& j, ModelPricing& p) {
    p.input = j.value("input", "0");
    p.output = j.value("output", "0");
    if (j.contains("cachedInput") && j["cachedInput"].is_string())
        p.cached_input = j["cachedInput"].get<std::string>();
    if (j.contains("cacheCreation") && j["cacheCreation"].is_string())
        p.cache_creation = j["cacheCreation"].get<std::string>();
}

void to_json(json& j, const ModelDescriptor& m) {
    j = json{
        {"name", m.name},
        {"imageInput", m.image_input},
        {"imageOutput", m.image_output},
        {"audioInput", m.audio_input},
        {"videoInput", m.video_input},
        {"interleaved", m.interleaved},
        {"providers", m.providers},
    };
    if (!m.provider_mappings.empty()) j["providerMappings"] = m.provider_mappings;
    if (m.pricing) j["pricing"] = *m.pricing;
    if (m.context_length) j["context_length"] = *m.context_length;
}

void from_json(const json& j, ModelDescriptor& m) {
    m.name = j.at("name").get<std::string>();
    m.image_input = j.value("imageInput", false);
    m.image_output = j.value("imageOutput", false);
    m.audio_input = j.value("audioInput", false);
    m.video_input = j.value("videoInput", false);
    m.interleaved = j.value("interleaved", false);
    m.providers = j.at("providers").get<std::vector<std::string>>();
    if (j.contains("providerMappings") && j["providerMappings"].is_object())
        m.provider_mappings = j["providerMappings"].get<std::map<std::string, std::string>>();
    if (j.contains("pricing") && j["pricing"].is_object())
        m.pricing = j["pricing"].get<ModelPricing>();
    if (j.contains("context_length") && j["context_length"].is_number_unsigned())
        m.context_length = j["context_length"].get<uint32_t>();
}

void to_json(json& j, const ModelsConfiguration& c) {
    j = json::object();
    j["version"] = c.version;
    j["models"] = json::object();
    for (const auto& [key, model] : c.models) {
        j["models"][key] = model;
    }
}

void from_json(const json& j, ModelsConfiguration& c) {
    c.version = j.value("version", "");
    if (!j.contains("models") || !j["models"].is_object()) {
        return;
    }
    for (auto& [key, val] : j["models"].items()) {
        try {
            c.models[key] = val.get<ModelDescriptor>();
        } catch (const json::exception& e) {
            LOG_WARN("Skipping malformed model '{}': {}", key, e.what());
        }
    }
}

void to_json(json& j, const AvailableModel& m) {
    j = json{
        {"key", m.key},
        {"name", m.name},
        {"provider", m.provider},
        {"providerName", m.provider_name},
        {"imageInput", m.image_input},
        {"imageOutput", m.image_output},
        {"audioInput", m.audio_input},
        {"videoInput", m.video_input},
    };
    if (m.input_pricing) j["inputPricing"] = *m.input_pricing;
}

void from_json(const json& j, AvailableModel& m) {
    m.key = j.at("key").get<std::string>();
    m.name = j.value("name", m.key);
    m.provider = j.at("provider").get<std::string>();
    m.provider_name = j.value("providerName", m.provider);
    m.image_input = j.value("imageInput", false);
    m.image_output = j.value("imageOutput", false);
    m.audio_input = j.value("audioInput", false);
    m.video_input = j.value("videoInput", false);
    if (j.contains("inputPricing") && j["inputPricing"].is_string())
        m.input_pricing = j["inputPricing"].get<std::string>();
}

} // namespace llmgate::models
