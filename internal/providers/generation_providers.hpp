#pragma once

#include <future>
#include <memory>
#include <string>
#include <vector>

#include "reel/orchestrator/v1.hpp"

namespace reel::providers {

/*
  Generative capabilities consumed by the task runner. Every call is
  asynchronous; failures arrive through the future as
  util::ProviderTransient (retryable) or util::ProviderPermanent.

  Asset producing calls return an opaque asset reference already written
  to the asset store.
*/
class GenerationProviders {
 public:
  virtual ~GenerationProviders() = default;

  virtual std::future<orchestrator::v1::PromptAnalysis> AnalyzePrompt(const std::string&                  prompt,
                                                                      const orchestrator::v1::TaskConfig& config) = 0;

  virtual std::future<std::vector<orchestrator::v1::SceneDraft>> BreakdownScenes(const std::string&                      prompt,
                                                                                 const orchestrator::v1::PromptAnalysis& analysis,
                                                                                 const orchestrator::v1::TaskConfig&     config) = 0;

  virtual std::future<std::string> GenerateImage(const std::string& visual_prompt, const orchestrator::v1::TaskConfig& config) = 0;

  virtual std::future<std::string> SynthesizeSpeech(const std::string& text, const std::string& voice_prompt) = 0;

  virtual std::future<std::string> SynthesizeMusic(const std::string& prompt, double duration_s) = 0;

  virtual std::future<std::string> GenerateVideo(const std::string& image_ref, const std::string& prompt, double duration_s,
                                                 const orchestrator::v1::TaskConfig& config) = 0;
};

using GenerationProvidersPtr = std::shared_ptr<GenerationProviders>;

} // namespace reel::providers
