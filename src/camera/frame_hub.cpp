#include "camera/frame_hub.hpp"

#include <algorithm>
#include <utility>

namespace camctl::camera {

const char* ToString(const ConsumerKind kind) {
  switch (kind) {
  case ConsumerKind::kPreview:
    return "preview";
  case ConsumerKind::kTimelapse:
    return "timelapse";
  case ConsumerKind::kRecorder:
    return "recorder";
  case ConsumerKind::kProbe:
    return "probe";
  }
  return "probe";
}

DeliveryQueue::DeliveryQueue(const ConsumerKind kind, const std::size_t capacity,
                             const OverflowPolicy policy)
    : kind_(kind), capacity_(std::max<std::size_t>(capacity, 1U)), policy_(policy) {}

bool DeliveryQueue::Push(FramePtr frame) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (closed_) {
      return false;
    }
    if (frames_.size() >= capacity_) {
      if (policy_ == OverflowPolicy::kDropNewest) {
        ++dropped_;
        return false;
      }
      frames_.pop_front();
      ++dropped_;
    }
    frames_.push_back(std::move(frame));
    ++accepted_;
  }
  cv_.notify_one();
  return true;
}

PopStatus DeliveryQueue::Pop(FramePtr& frame, const std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mu_);
  cv_.wait_for(lock, timeout, [this] { return closed_ || !frames_.empty(); });
  if (closed_) {
    return PopStatus::kClosed;
  }
  if (frames_.empty()) {
    return PopStatus::kTimeout;
  }
  frame = std::move(frames_.front());
  frames_.pop_front();
  ++delivered_;
  return PopStatus::kFrame;
}

void DeliveryQueue::Clear() {
  std::lock_guard<std::mutex> lock(mu_);
  frames_.clear();
}

void DeliveryQueue::Close() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    closed_ = true;
    frames_.clear();
  }
  cv_.notify_all();
}

bool DeliveryQueue::IsClosed() const {
  std::lock_guard<std::mutex> lock(mu_);
  return closed_;
}

std::size_t DeliveryQueue::Size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return frames_.size();
}

ConsumerKind DeliveryQueue::Kind() const {
  return kind_;
}

std::size_t DeliveryQueue::Capacity() const {
  return capacity_;
}

OverflowPolicy DeliveryQueue::Policy() const {
  return policy_;
}

std::uint64_t DeliveryQueue::Delivered() const {
  std::lock_guard<std::mutex> lock(mu_);
  return delivered_;
}

std::uint64_t DeliveryQueue::Accepted() const {
  std::lock_guard<std::mutex> lock(mu_);
  return accepted_;
}

std::uint64_t DeliveryQueue::Dropped() const {
  std::lock_guard<std::mutex> lock(mu_);
  return dropped_;
}

FrameHub::FrameHub(core::logging::Logger& logger, const std::size_t queue_capacity)
    : logger_(logger), queue_capacity_(std::max<std::size_t>(queue_capacity, 1U)) {}

FrameHub::~FrameHub() {
  StopProduction();
  CloseAll();
}

DeliveryHandle FrameHub::Attach(const ConsumerKind kind) {
  if (kind == ConsumerKind::kPreview) {
    return Attach(kind, kPreviewCapacity, OverflowPolicy::kReplaceOldest);
  }
  return Attach(kind, queue_capacity_, OverflowPolicy::kDropNewest);
}

DeliveryHandle FrameHub::Attach(const ConsumerKind kind, const std::size_t capacity,
                                const OverflowPolicy policy) {
  auto handle = std::make_shared<DeliveryQueue>(kind, capacity, policy);
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (closed_) {
      return nullptr;
    }
    subscribers_.push_back(handle);
  }
  logger_.Debug("consumer attached", {{"consumer", ToString(kind)},
                                      {"capacity", std::to_string(handle->Capacity())}});
  return handle;
}

bool FrameHub::Unsubscribe(const DeliveryHandle& handle) {
  if (!handle) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = std::find(subscribers_.begin(), subscribers_.end(), handle);
  if (it == subscribers_.end()) {
    return false;
  }
  subscribers_.erase(it);
  return true;
}

void FrameHub::Detach(const DeliveryHandle& handle) {
  if (!handle) {
    return;
  }
  const bool removed = Unsubscribe(handle);
  handle->Close();
  if (removed) {
    logger_.Debug("consumer detached", {{"consumer", ToString(handle->Kind())},
                                        {"delivered", std::to_string(handle->Delivered())},
                                        {"dropped", std::to_string(handle->Dropped())}});
  }
}

void FrameHub::Publish(FramePtr frame) {
  if (!frame) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (frame->format_generation < min_generation_) {
      const std::uint64_t stale = stale_dropped_.fetch_add(1U) + 1U;
      logger_.Debug("stale frame dropped", {{"sequence", std::to_string(frame->sequence)},
                                            {"stale_total", std::to_string(stale)}});
      return;
    }
    for (const DeliveryHandle& target : subscribers_) {
      (void)target->Push(frame);
    }
  }
  published_.fetch_add(1U);
}

void FrameHub::DrainStale(const std::uint64_t generation) {
  std::lock_guard<std::mutex> lock(mu_);
  min_generation_ = std::max(min_generation_, generation);
  for (const DeliveryHandle& subscriber : subscribers_) {
    subscriber->Clear();
  }
}

void FrameHub::CloseAll() {
  std::vector<DeliveryHandle> closing;
  {
    std::lock_guard<std::mutex> lock(mu_);
    closed_ = true;
    closing.swap(subscribers_);
  }
  for (const DeliveryHandle& handle : closing) {
    handle->Close();
  }
}

bool FrameHub::StartProduction(ProduceFn produce, std::string& error) {
  error.clear();
  if (!produce) {
    error = "produce function is empty";
    return false;
  }
  if (producer_.joinable()) {
    error = "production loop is already running";
    return false;
  }
  stop_requested_.store(false);
  producing_.store(true);
  producer_ = std::thread([this, produce = std::move(produce)]() mutable {
    ProductionLoop(std::move(produce));
  });
  return true;
}

void FrameHub::StopProduction() {
  stop_requested_.store(true);
  if (producer_.joinable() && producer_.get_id() != std::this_thread::get_id()) {
    producer_.join();
  }
  producing_.store(false);
}

bool FrameHub::IsProducing() const {
  return producing_.load();
}

std::size_t FrameHub::SubscriberCount() const {
  std::lock_guard<std::mutex> lock(mu_);
  return subscribers_.size();
}

std::uint64_t FrameHub::PublishedCount() const {
  return published_.load();
}

std::uint64_t FrameHub::StaleDroppedCount() const {
  return stale_dropped_.load();
}

void FrameHub::ProductionLoop(ProduceFn produce) {
  const core::logging::ScopedThreadTag tag("producer");
  while (!stop_requested_.load()) {
    FramePtr frame;
    const ProduceResult result = produce(frame);
    if (result == ProduceResult::kStop) {
      logger_.Warn("production loop stopped by producer");
      break;
    }
    if (result == ProduceResult::kFrame && frame) {
      Publish(std::move(frame));
    }
  }
  producing_.store(false);
}

} // namespace camctl::camera
