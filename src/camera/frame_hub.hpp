#pragma once

#include "camera/frame.hpp"
#include "core/logging/logger.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace camctl::camera {

enum class ConsumerKind {
  kPreview = 0,
  kTimelapse,
  kRecorder,
  // One-shot readers (still capture, diagnostics).
  kProbe,
};

const char* ToString(ConsumerKind kind);

// What a full queue does with an incoming frame.
//
// - `kReplaceOldest`: evict the stale frame, keep the newest (latest-only)
// - `kDropNewest`: keep the backlog, drop the incoming frame for this
//   consumer only
enum class OverflowPolicy {
  kReplaceOldest = 0,
  kDropNewest,
};

enum class PopStatus {
  kFrame = 0,
  kTimeout,
  kClosed,
};

// Bounded single-consumer delivery channel.
//
// `Push` never blocks. `Pop` blocks at most `timeout` so consumer loops can
// observe their stop flag. Once closed, remaining frames are discarded and
// every `Pop` returns `kClosed` immediately.
class DeliveryQueue {
public:
  DeliveryQueue(ConsumerKind kind, std::size_t capacity, OverflowPolicy policy);

  DeliveryQueue(const DeliveryQueue&) = delete;
  DeliveryQueue& operator=(const DeliveryQueue&) = delete;

  // Returns false when the frame was not enqueued (queue closed or full under
  // `kDropNewest`).
  bool Push(FramePtr frame);
  PopStatus Pop(FramePtr& frame, std::chrono::milliseconds timeout);

  // Discards buffered frames without closing.
  void Clear();
  void Close();

  bool IsClosed() const;
  std::size_t Size() const;
  ConsumerKind Kind() const;
  std::size_t Capacity() const;
  OverflowPolicy Policy() const;
  // Frames popped by the consumer.
  std::uint64_t Delivered() const;
  // Frames enqueued, whether or not they were later popped.
  std::uint64_t Accepted() const;
  std::uint64_t Dropped() const;

private:
  const ConsumerKind kind_;
  const std::size_t capacity_;
  const OverflowPolicy policy_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<FramePtr> frames_;
  bool closed_ = false;
  std::uint64_t delivered_ = 0U;
  std::uint64_t accepted_ = 0U;
  std::uint64_t dropped_ = 0U;
};

using DeliveryHandle = std::shared_ptr<DeliveryQueue>;

// Fan-out from the single producer loop to independent consumer queues.
//
// The hub owns the production thread but holds no device state: frames come
// from an injected `ProduceFn`, which must return within a bounded time so
// `StopProduction` stays responsive. A slow consumer only ever loses frames
// from its own queue; the producer and the other consumers are unaffected.
class FrameHub {
public:
  enum class ProduceResult {
    kFrame = 0,
    // Nothing this round (timeout, tolerated failure); loop again.
    kNoFrame,
    // Producer cannot continue (for example after a failed reinitialize).
    kStop,
  };

  using ProduceFn = std::function<ProduceResult(FramePtr& frame)>;

  static constexpr std::size_t kPreviewCapacity = 1U;
  static constexpr std::size_t kDefaultQueueCapacity = 32U;

  explicit FrameHub(core::logging::Logger& logger,
                    std::size_t queue_capacity = kDefaultQueueCapacity);
  ~FrameHub();

  FrameHub(const FrameHub&) = delete;
  FrameHub& operator=(const FrameHub&) = delete;

  // Preview gets a latest-only queue; every other kind gets a bounded
  // drop-newest queue of the configured capacity. Returns nullptr after
  // `CloseAll`.
  DeliveryHandle Attach(ConsumerKind kind);
  DeliveryHandle Attach(ConsumerKind kind, std::size_t capacity, OverflowPolicy policy);

  // Closes and unregisters the queue. Unknown handles are ignored.
  void Detach(const DeliveryHandle& handle);

  // Pushes to every registered queue in registration order. A frame whose
  // `format_generation` predates the last drain is dropped instead; the check
  // and the pushes run under the registry lock, so a drain is never followed
  // by a frame from before it.
  void Publish(FramePtr frame);

  // Discards frames buffered in every queue and raises the minimum accepted
  // format generation to `generation` (called after a format change).
  void DrainStale(std::uint64_t generation);

  // Returns false when `handle` was not registered. The queue stays open so
  // its owner can drain the backlog; `Detach` closes it afterwards.
  bool Unsubscribe(const DeliveryHandle& handle);

  // Closes every queue, unregisters it, and refuses later attachments.
  void CloseAll();

  bool StartProduction(ProduceFn produce, std::string& error);
  // Signals the production loop and joins it. Idempotent.
  void StopProduction();
  bool IsProducing() const;

  std::size_t SubscriberCount() const;
  std::uint64_t PublishedCount() const;
  // Frames refused because they predate the last format change.
  std::uint64_t StaleDroppedCount() const;

private:
  void ProductionLoop(ProduceFn produce);

  core::logging::Logger& logger_;
  const std::size_t queue_capacity_;

  mutable std::mutex mu_;
  std::vector<DeliveryHandle> subscribers_;
  bool closed_ = false;
  std::uint64_t min_generation_ = 0U;

  std::atomic<bool> stop_requested_{false};
  std::atomic<bool> producing_{false};
  std::atomic<std::uint64_t> published_{0U};
  std::atomic<std::uint64_t> stale_dropped_{0U};
  std::thread producer_;
};

} // namespace camctl::camera
