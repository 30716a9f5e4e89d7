#pragma once

#include "plan_request.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

// Black-box text generator. Implementations hold no retry policy: a failure
// is reported once and the caller decides what to do.
class PlanGenerationClient {
public:
  virtual ~PlanGenerationClient() = default;

  // Raw model output. Throws GenerationUnavailable or GenerationTimeout.
  virtual std::string generate(const PlanRequest& request) = 0;
};

struct OllamaSettings {
  std::string host = "127.0.0.1";
  uint16_t port = 11434;
};

// Client for a local Ollama-compatible service (POST /api/chat).
class OllamaGenerationClient : public PlanGenerationClient {
public:
  explicit OllamaGenerationClient(OllamaSettings settings);

  std::string generate(const PlanRequest& request) override;

private:
  OllamaSettings settings_;
};

// {"model", "messages", "format": "json", "stream": false, "options"}
nlohmann::json buildChatRequestBody(const PlanRequest& request);

// Pulls message.content out of an /api/chat reply. Throws GenerationUnavailable
// on a non-2xx status (404 names the missing model) or a reply without content.
std::string extractChatContent(unsigned status, const std::string& body, const std::string& model);
