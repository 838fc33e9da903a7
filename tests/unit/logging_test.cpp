#include "internal/observability/logging.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

namespace {

using reel::observability::FormatFields;
using reel::observability::IntField;
using reel::observability::StringField;
using reel::observability::TaskLogScope;

void TestPlainFields() {
  assert(FormatFields({}).empty());
  assert(FormatFields({StringField("ref", "asset-1"), IntField("attempt", 2)}) == "ref=asset-1 attempt=2");
}

void TestValuesWithSpacesAreQuoted() {
  assert(FormatFields({StringField("error", "provider said \"no\"")}) == R"(error="provider said \"no\"")");
  assert(FormatFields({StringField("video_ref", "")}) == R"(video_ref="")");
}

void TestScopeTagsTaskStageAndScene() {
  {
    TaskLogScope task("task-1");
    assert(FormatFields({}) == "task_id=task-1");

    task.SetStage("generating_audio");
    assert(FormatFields({IntField("attempt", 1)}) == "task_id=task-1 stage=generating_audio attempt=1");

    {
      TaskLogScope scene({}, "generating_audio", 3);
      assert(FormatFields({}) == "task_id=task-1 stage=generating_audio scene=3");
    }
    assert(FormatFields({}) == "task_id=task-1 stage=generating_audio");
  }
  assert(FormatFields({}).empty());
}

void TestCurrentTaskContext() {
  assert(reel::observability::CurrentTaskContext().task_id.empty());
  TaskLogScope scope("task-3", "generating_images", 1);
  const auto   context = reel::observability::CurrentTaskContext();
  assert(context.task_id == "task-3");
  assert(context.stage == "generating_images");
  assert(context.scene == 1);
}

void TestExplicitFieldsWinOverScope() {
  TaskLogScope scope("task-1", "assembling_video");
  assert(FormatFields({StringField("task_id", "task-2")}) == "stage=assembling_video task_id=task-2");
}

void TestScopeIsPerThread() {
  TaskLogScope scope("task-1");
  std::string  other;
  std::thread  worker([&] { other = FormatFields({}); });
  worker.join();
  assert(other.empty());
}

void TestLogLineCarriesContext() {
  std::ostringstream out;
  auto               sink   = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
  auto               logger = std::make_shared<spdlog::logger>("reel-logging-test", sink);
  logger->set_pattern("%v");
  auto previous = spdlog::default_logger();
  spdlog::set_default_logger(logger);

  {
    TaskLogScope scope("task-7", "generating_music");
    REEL_LOG_WARN("retrying after transient failure", {IntField("attempt", 2)});
  }
  REEL_LOG_INFO("idle");

  spdlog::set_default_logger(previous);
  assert(out.str() == "retrying after transient failure task_id=task-7 stage=generating_music attempt=2\nidle\n");
}

} // namespace

int main() {
  TestPlainFields();
  TestValuesWithSpacesAreQuoted();
  TestScopeTagsTaskStageAndScene();
  TestCurrentTaskContext();
  TestExplicitFieldsWinOverScope();
  TestScopeIsPerThread();
  TestLogLineCarriesContext();

  std::cout << "reel_unit_logging: pass\n";
  return 0;
}
