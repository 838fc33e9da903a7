#include "grpc_provider_gateway.hpp"

#include <grpcpp/client_context.h>

#include "internal/util/errors.hpp"

namespace reel::providers {

namespace {

using orchestrator::v1::TaskConfig;

void SetDeadline(::grpc::ClientContext& context, std::chrono::milliseconds timeout) {
  context.set_deadline(std::chrono::system_clock::now() + timeout);
}

std::string StorePayload(const storage::AssetStorePtr& store, const provider::v1::AssetPayload& payload) {
  if (payload.data().empty()) {
    throw util::ProviderPermanent("provider returned an empty asset");
  }
  return store->Put(payload.data(), payload.extension().empty() ? "bin" : payload.extension());
}

} // namespace

bool IsTransientStatus(const ::grpc::Status& status) {
  switch (status.error_code()) {
    case ::grpc::StatusCode::UNAVAILABLE:
    case ::grpc::StatusCode::DEADLINE_EXCEEDED:
    case ::grpc::StatusCode::RESOURCE_EXHAUSTED:
    case ::grpc::StatusCode::ABORTED:
      return true;
    default:
      return false;
  }
}

void ThrowIfFailed(const ::grpc::Status& status, const char* operation) {
  if (status.ok()) {
    return;
  }
  const std::string message = std::string(operation) + ": " + status.error_message();
  if (IsTransientStatus(status)) {
    throw util::ProviderTransient(message);
  }
  throw util::ProviderPermanent(message);
}

GrpcProviderGateway::GrpcProviderGateway(std::shared_ptr<::grpc::Channel> channel, storage::AssetStorePtr store,
                                         std::chrono::milliseconds call_timeout)
    : stub_(provider::v1::ProviderGateway::NewStub(std::move(channel))), store_(std::move(store)), call_timeout_(call_timeout) {
}

std::future<orchestrator::v1::PromptAnalysis> GrpcProviderGateway::AnalyzePrompt(const std::string& prompt, const TaskConfig& config) {
  provider::v1::AnalyzePromptRequest req;
  req.set_prompt(prompt);
  *req.mutable_config() = config;

  return calls_.Launch([stub = stub_, timeout = call_timeout_, req = std::move(req)](CallGroup::Call& call) {
    ::grpc::ClientContext ctx;
    SetDeadline(ctx, timeout);
    const auto cancel = call.OnCancel([&ctx] { ctx.TryCancel(); });
    orchestrator::v1::PromptAnalysis resp;
    ThrowIfFailed(stub->AnalyzePrompt(&ctx, req, &resp), "AnalyzePrompt");
    return resp;
  });
}

std::future<std::vector<orchestrator::v1::SceneDraft>> GrpcProviderGateway::BreakdownScenes(const std::string&                      prompt,
                                                                                            const orchestrator::v1::PromptAnalysis& analysis,
                                                                                            const TaskConfig&                       config) {
  provider::v1::BreakdownScenesRequest req;
  req.set_prompt(prompt);
  *req.mutable_analysis() = analysis;
  *req.mutable_config()   = config;

  return calls_.Launch([stub = stub_, timeout = call_timeout_, req = std::move(req)](CallGroup::Call& call) {
    ::grpc::ClientContext ctx;
    SetDeadline(ctx, timeout);
    const auto cancel = call.OnCancel([&ctx] { ctx.TryCancel(); });
    provider::v1::BreakdownScenesResponse resp;
    ThrowIfFailed(stub->BreakdownScenes(&ctx, req, &resp), "BreakdownScenes");
    return std::vector<orchestrator::v1::SceneDraft>(resp.scenes().begin(), resp.scenes().end());
  });
}

std::future<std::string> GrpcProviderGateway::GenerateImage(const std::string& visual_prompt, const TaskConfig& config) {
  provider::v1::GenerateImageRequest req;
  req.set_visual_prompt(visual_prompt);
  req.set_aspect_ratio(config.aspect_ratio());
  req.set_style(config.style());

  return calls_.Launch([stub = stub_, store = store_, timeout = call_timeout_, req = std::move(req)](CallGroup::Call& call) {
    ::grpc::ClientContext ctx;
    SetDeadline(ctx, timeout);
    const auto cancel = call.OnCancel([&ctx] { ctx.TryCancel(); });
    provider::v1::AssetPayload resp;
    ThrowIfFailed(stub->GenerateImage(&ctx, req, &resp), "GenerateImage");
    return StorePayload(store, resp);
  });
}

std::future<std::string> GrpcProviderGateway::SynthesizeSpeech(const std::string& text, const std::string& voice_prompt) {
  provider::v1::SynthesizeSpeechRequest req;
  req.set_text(text);
  req.set_voice_prompt(voice_prompt);

  return calls_.Launch([stub = stub_, store = store_, timeout = call_timeout_, req = std::move(req)](CallGroup::Call& call) {
    ::grpc::ClientContext ctx;
    SetDeadline(ctx, timeout);
    const auto cancel = call.OnCancel([&ctx] { ctx.TryCancel(); });
    provider::v1::AssetPayload resp;
    ThrowIfFailed(stub->SynthesizeSpeech(&ctx, req, &resp), "SynthesizeSpeech");
    return StorePayload(store, resp);
  });
}

std::future<std::string> GrpcProviderGateway::SynthesizeMusic(const std::string& prompt, double duration_s) {
  provider::v1::SynthesizeMusicRequest req;
  req.set_prompt(prompt);
  req.set_duration_s(duration_s);

  return calls_.Launch([stub = stub_, store = store_, timeout = call_timeout_, req = std::move(req)](CallGroup::Call& call) {
    ::grpc::ClientContext ctx;
    SetDeadline(ctx, timeout);
    const auto cancel = call.OnCancel([&ctx] { ctx.TryCancel(); });
    provider::v1::AssetPayload resp;
    ThrowIfFailed(stub->SynthesizeMusic(&ctx, req, &resp), "SynthesizeMusic");
    return StorePayload(store, resp);
  });
}

std::future<std::string> GrpcProviderGateway::GenerateVideo(const std::string& image_ref, const std::string& prompt, double duration_s,
                                                            const TaskConfig& config) {
  provider::v1::GenerateVideoRequest req;
  req.set_image(store_->Get(image_ref));
  req.set_prompt(prompt);
  req.set_duration_s(duration_s);
  req.set_aspect_ratio(config.aspect_ratio());

  return calls_.Launch([stub = stub_, store = store_, timeout = call_timeout_, req = std::move(req)](CallGroup::Call& call) {
    ::grpc::ClientContext ctx;
    SetDeadline(ctx, timeout);
    const auto cancel = call.OnCancel([&ctx] { ctx.TryCancel(); });
    provider::v1::AssetPayload resp;
    ThrowIfFailed(stub->GenerateVideo(&ctx, req, &resp), "GenerateVideo");
    return StorePayload(store, resp);
  });
}

} // namespace reel::providers
