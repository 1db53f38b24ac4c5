#include "llmgate/models/catalog.hpp"
#include "llmgate/core/logger.hpp"

namespace llmgate::models {

namespace {

constexpr auto kBuiltinModels = R"json({
  "version": "2025-10-01",
  "models": {
    "claude-sonnet-4.5": {
      "name": "Claude Sonnet 4.5",
      "imageInput": true,
      "providers": ["anthropic", "openRouter", "aiGateway", "github_copilot"],
      "providerMappings": {
        "anthropic": "claude-sonnet-4-5",
        "openRouter": "anthropic/claude-sonnet-4.5",
        "aiGateway": "anthropic/claude-sonnet-4.5"
      },
      "pricing": {"input": "0.000003", "output": "0.000015",
                  "cachedInput": "0.0000003", "cacheCreation": "0.00000375"},
      "context_length": 200000
    },
    "claude-haiku-4.5": {
      "name": "Claude Haiku 4.5",
      "imageInput": true,
      "providers": ["anthropic", "openRouter", "aiGateway"],
      "providerMappings": {
        "anthropic": "claude-haiku-4-5",
        "openRouter": "anthropic/claude-haiku-4.5",
        "aiGateway": "anthropic/claude-haiku-4.5"
      },
      "pricing": {"input": "0.000001", "output": "0.000005"},
      "context_length": 200000
    },
    "gpt-5": {
      "name": "GPT-5",
      "imageInput": true,
      "providers": ["openai", "github_copilot", "openRouter", "aiGateway"],
      "providerMappings": {
        "openRouter": "openai/gpt-5",
        "aiGateway": "openai/gpt-5"
      },
      "pricing": {"input": "0.00000125", "output": "0.00001", "cachedInput": "0.000000125"},
      "context_length": 400000
    },
    "gpt-5-mini": {
      "name": "GPT-5 Mini",
      "imageInput": true,
      "providers": ["openai", "openRouter"],
      "providerMappings": {"openRouter": "openai/gpt-5-mini"},
      "pricing": {"input": "0.00000025", "output": "0.000002"},
      "context_length": 400000
    },
    "gemini-2.5-pro": {
      "name": "Gemini 2.5 Pro",
      "imageInput": true,
      "audioInput": true,
      "videoInput": true,
      "providers": ["google", "openRouter", "aiGateway"],
      "providerMappings": {
        "openRouter": "google/gemini-2.5-pro",
        "aiGateway": "google/gemini-2.5-pro"
      },
      "pricing": {"input": "0.00000125", "output": "0.00001"},
      "context_length": 1048576
    },
    "gemini-2.5-flash-lite": {
      "name": "Gemini 2.5 Flash Lite",
      "imageInput": true,
      "audioInput": true,
      "videoInput": true,
      "providers": ["google", "openRouter"],
      "providerMappings": {"openRouter": "google/gemini-2.5-flash-lite"},
      "pricing": {"input": "0.0000001", "output": "0.0000004"},
      "context_length": 1048576
    },
    "deepseek-chat": {
      "name": "DeepSeek V3.2",
      "providers": ["deepseek", "openRouter"],
      "providerMappings": {"openRouter": "deepseek/deepseek-v3.2-exp"},
      "pricing": {"input": "0.00000028", "output": "0.00000042"},
      "context_length": 128000
    },
    "kimi-k2": {
      "name": "Kimi K2",
      "providers": ["moonshot", "kimi_coding", "openRouter"],
      "providerMappings": {
        "moonshot": "kimi-k2-0905-preview",
        "kimi_coding": "kimi-for-coding",
        "openRouter": "moonshotai/kimi-k2-0905"
      },
      "pricing": {"input": "0.0000006", "output": "0.0000025"},
      "context_length": 262144
    },
    "minimax-m2.5": {
      "name": "MiniMax M2.5",
      "interleaved": true,
      "providers": ["MiniMax", "openRouter"],
      "providerMappings": {
        "MiniMax": "MiniMax-M2.5",
        "openRouter": "minimax/minimax-m2.5"
      },
      "pricing": {"input": "0.0000003", "output": "0.0000012"},
      "context_length": 204800
    },
    "glm-4.6": {
      "name": "GLM 4.6",
      "providers": ["zhipu", "zai", "openRouter"],
      "providerMappings": {"openRouter": "z-ai/glm-4.6"},
      "pricing": {"input": "0.0000006", "output": "0.0000022"},
      "context_length": 200000
    },
    "llama-3.3-70b": {
      "name": "Llama 3.3 70B",
      "providers": ["groq", "ollama", "lmstudio"],
      "providerMappings": {
        "groq": "llama-3.3-70b-versatile",
        "ollama": "llama3.3:70b"
      },
      "pricing": {"input": "0.00000059", "output": "0.00000079"},
      "context_length": 131072
    },
    "qwen3-coder": {
      "name": "Qwen3 Coder",
      "providers": ["ollama", "lmstudio", "openRouter"],
      "providerMappings": {
        "ollama": "qwen3-coder:30b",
        "openRouter": "qwen/qwen3-coder"
      },
      "context_length": 262144
    }
  }
})json";

} // anonymous namespace

auto builtin_model_catalog() -> const ModelsConfiguration& {
    static const ModelsConfiguration catalog = [] {
        auto parsed = parse_models_configuration(kBuiltinModels);
        if (!parsed) {
            LOG_ERROR("Built-in model catalog is invalid: {}", parsed.error().what());
            return ModelsConfiguration{};
        }
        return std::move(*parsed);
    }();
    return catalog;
}

auto parse_models_configuration(std::string_view text) -> Result<ModelsConfiguration> {
    try {
        auto j = json::parse(text);
        if (!j.is_object()) {
            return std::unexpected(make_error(ErrorCode::SerializationError,
                                              "Models configuration must be a JSON object"));
        }
        return j.get<ModelsConfiguration>();
    } catch (const json::exception& e) {
        return std::unexpected(make_error(ErrorCode::SerializationError,
                                          "Invalid models configuration", e.what()));
    }
}

auto merge_model_catalog(const ModelCatalog& base, const ModelCatalog& custom) -> ModelCatalog {
    ModelCatalog merged = base;
    for (const auto& [key, model] : custom) {
        merged.insert_or_assign(key, model);
    }
    return merged;
}

} // namespace llmgate::models
