#include "../common/assertions.hpp"
#include "camera/frame_hub.hpp"
#include "core/logging/logger.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

namespace {

camctl::camera::FramePtr MakeFrame(const std::uint64_t sequence) {
  auto frame = std::make_shared<camctl::camera::Frame>();
  frame->sequence = sequence;
  frame->width = 4U;
  frame->height = 2U;
  frame->pixel_format = "YUYV";
  frame->data.assign(16U, static_cast<std::uint8_t>(sequence & 0xFFU));
  return frame;
}

} // namespace

int main() {
  using camctl::camera::ConsumerKind;
  using camctl::camera::FrameHub;
  using camctl::camera::FramePtr;
  using camctl::camera::OverflowPolicy;
  using camctl::camera::PopStatus;
  using camctl::core::logging::Logger;
  using camctl::core::logging::LogLevel;
  using camctl::tests::common::Fail;
  using camctl::tests::common::WaitUntil;

  Logger logger(LogLevel::kError);

  // Queue policies per consumer kind.
  {
    FrameHub hub(logger);
    const auto preview = hub.Attach(ConsumerKind::kPreview);
    const auto recorder = hub.Attach(ConsumerKind::kRecorder);
    const auto timelapse = hub.Attach(ConsumerKind::kTimelapse);
    if (!preview || !recorder || !timelapse) {
      Fail("attach returned null on an open hub");
    }
    if (preview->Capacity() != FrameHub::kPreviewCapacity ||
        preview->Policy() != OverflowPolicy::kReplaceOldest) {
      Fail("preview queue must be latest-only");
    }
    if (recorder->Capacity() != FrameHub::kDefaultQueueCapacity ||
        recorder->Policy() != OverflowPolicy::kDropNewest) {
      Fail("recorder queue must be bounded drop-newest");
    }
    if (hub.SubscriberCount() != 3U) {
      Fail("expected three subscribers");
    }

    for (std::uint64_t i = 0U; i < 40U; ++i) {
      hub.Publish(MakeFrame(i));
    }
    if (hub.PublishedCount() != 40U) {
      Fail("published count mismatch");
    }

    FramePtr frame;
    if (preview->Pop(frame, std::chrono::milliseconds(10)) != PopStatus::kFrame ||
        frame->sequence != 39U) {
      Fail("preview must hold only the newest frame");
    }
    if (preview->Pop(frame, std::chrono::milliseconds(10)) != PopStatus::kTimeout) {
      Fail("preview queue must be empty after one pop");
    }
    if (preview->Dropped() != 39U) {
      Fail("preview must count replaced frames as dropped");
    }

    if (recorder->Size() != 32U || recorder->Dropped() != 8U) {
      Fail("recorder must keep its backlog and drop the overflow");
    }
    if (recorder->Pop(frame, std::chrono::milliseconds(10)) != PopStatus::kFrame ||
        frame->sequence != 0U) {
      Fail("recorder must deliver in publication order starting at the oldest kept frame");
    }

    hub.DrainStale(1U);
    if (recorder->Size() != 0U || timelapse->Size() != 0U) {
      Fail("drain must discard buffered frames");
    }
    if (recorder->IsClosed()) {
      Fail("drain must not close queues");
    }

    // Frames stamped before the drain are refused even if published after it.
    hub.Publish(MakeFrame(100U));
    if (recorder->Size() != 0U || hub.StaleDroppedCount() != 1U || hub.PublishedCount() != 40U) {
      Fail("a frame from an older format generation must not be published");
    }
    auto current = std::make_shared<camctl::camera::Frame>(*MakeFrame(101U));
    current->format_generation = 1U;
    hub.Publish(current);
    if (recorder->Size() != 1U || hub.PublishedCount() != 41U) {
      Fail("a frame from the current generation must be published");
    }

    // Unsubscribing keeps the backlog poppable and stops new deliveries.
    if (!hub.Unsubscribe(recorder) || hub.Unsubscribe(recorder)) {
      Fail("unsubscribe must succeed exactly once");
    }
    hub.Publish(current);
    if (recorder->IsClosed() || recorder->Size() != 1U || recorder->Accepted() != 33U) {
      Fail("an unsubscribed queue must keep its backlog and receive nothing new");
    }
    if (recorder->Pop(frame, std::chrono::milliseconds(10)) != PopStatus::kFrame ||
        frame->sequence != 101U) {
      Fail("backlog must stay poppable after unsubscribe");
    }

    hub.Detach(timelapse);
    if (!timelapse->IsClosed() || hub.SubscriberCount() != 1U) {
      Fail("detach must close and unregister the queue");
    }
    if (timelapse->Pop(frame, std::chrono::milliseconds(10)) != PopStatus::kClosed) {
      Fail("pop on a detached queue must report closed");
    }

    hub.Detach(recorder);
    if (!recorder->IsClosed()) {
      Fail("detach must close an already unsubscribed queue");
    }

    hub.CloseAll();
    if (!preview->IsClosed()) {
      Fail("close-all must close every queue");
    }
    if (hub.Attach(ConsumerKind::kProbe) != nullptr) {
      Fail("attach after close-all must return null");
    }
  }

  // Custom capacity from the session options.
  {
    FrameHub hub(logger, 4U);
    const auto probe = hub.Attach(ConsumerKind::kProbe);
    if (probe->Capacity() != 4U) {
      Fail("configured queue capacity not honored");
    }
  }

  // A stalled consumer does not hold back the producer or the others.
  {
    FrameHub hub(logger, 2U);
    const auto stalled = hub.Attach(ConsumerKind::kRecorder);
    const auto preview = hub.Attach(ConsumerKind::kPreview);

    std::atomic<std::uint64_t> next{0U};
    std::string error;
    const bool started = hub.StartProduction(
        [&next](FramePtr& frame) {
          frame = MakeFrame(next.fetch_add(1U));
          std::this_thread::sleep_for(std::chrono::milliseconds(1));
          return FrameHub::ProduceResult::kFrame;
        },
        error);
    if (!started) {
      Fail("start production failed: " + error);
    }
    if (hub.StartProduction([](FramePtr&) { return FrameHub::ProduceResult::kNoFrame; }, error)) {
      Fail("second start must fail while the loop runs");
    }

    if (!WaitUntil([&hub] { return hub.PublishedCount() >= 50U; },
                   std::chrono::milliseconds(3000))) {
      Fail("producer stalled behind a consumer that never pops");
    }
    FramePtr frame;
    if (preview->Pop(frame, std::chrono::milliseconds(200)) != PopStatus::kFrame ||
        frame->sequence < 40U) {
      Fail("preview must see recent frames while another consumer stalls");
    }
    if (stalled->Size() != 2U || stalled->Dropped() == 0U) {
      Fail("stalled consumer must lose only its own overflow");
    }

    hub.StopProduction();
    hub.StopProduction();
    if (hub.IsProducing()) {
      Fail("stop must end production");
    }
  }

  // Producer can end the loop itself.
  {
    FrameHub hub(logger);
    std::string error;
    if (!hub.StartProduction([](FramePtr&) { return FrameHub::ProduceResult::kStop; }, error)) {
      Fail("start production failed: " + error);
    }
    if (!WaitUntil([&hub] { return !hub.IsProducing(); }, std::chrono::milliseconds(1000))) {
      Fail("kStop must end the production loop");
    }
    hub.StopProduction();
  }

  return 0;
}
