#pragma once

#include <grpcpp/channel.h>
#include <grpcpp/support/status.h>

#include <chrono>
#include <memory>

#include "internal/providers/call_group.hpp"
#include "internal/providers/generation_providers.hpp"
#include "internal/storage/asset_store.hpp"
#include "reel/provider/v1/provider_service.grpc.pb.h"

namespace reel::providers {

/*
  GenerationProviders backed by a remote reel.provider.v1.ProviderGateway.
  Each call runs on a thread owned by a CallGroup with a per-call
  deadline; destroying the gateway cancels in-flight calls and joins
  them. Returned asset bytes are written to the asset store.
*/
class GrpcProviderGateway final : public GenerationProviders {
 public:
  GrpcProviderGateway(std::shared_ptr<::grpc::Channel> channel, storage::AssetStorePtr store, std::chrono::milliseconds call_timeout);

  std::future<orchestrator::v1::PromptAnalysis> AnalyzePrompt(const std::string& prompt, const orchestrator::v1::TaskConfig& config) override;

  std::future<std::vector<orchestrator::v1::SceneDraft>> BreakdownScenes(const std::string&                      prompt,
                                                                         const orchestrator::v1::PromptAnalysis& analysis,
                                                                         const orchestrator::v1::TaskConfig&     config) override;

  std::future<std::string> GenerateImage(const std::string& visual_prompt, const orchestrator::v1::TaskConfig& config) override;

  std::future<std::string> SynthesizeSpeech(const std::string& text, const std::string& voice_prompt) override;

  std::future<std::string> SynthesizeMusic(const std::string& prompt, double duration_s) override;

  std::future<std::string> GenerateVideo(const std::string& image_ref, const std::string& prompt, double duration_s,
                                         const orchestrator::v1::TaskConfig& config) override;

 private:
  std::shared_ptr<provider::v1::ProviderGateway::Stub> stub_;
  storage::AssetStorePtr                               store_;
  std::chrono::milliseconds                            call_timeout_;
  // Last member: joined before the stub and store go away.
  CallGroup calls_;
};

// Transient: UNAVAILABLE, DEADLINE_EXCEEDED, RESOURCE_EXHAUSTED, ABORTED.
bool IsTransientStatus(const ::grpc::Status& status);

// Throws ProviderTransient or ProviderPermanent for a non-OK status.
void ThrowIfFailed(const ::grpc::Status& status, const char* operation);

} // namespace reel::providers
