#include "camera/preview_encoder.hpp"

#include "core/errors/camera_errors.hpp"

#include <utility>

namespace camctl::camera {

namespace {

constexpr auto kPopTimeout = std::chrono::milliseconds(200);

} // namespace

PreviewEncoder::PreviewEncoder(FrameHub& hub, media::IImageEncoder& encoder,
                               core::logging::Logger& logger, const int jpeg_quality)
    : hub_(hub), encoder_(encoder), logger_(logger), jpeg_quality_(jpeg_quality) {}

PreviewEncoder::~PreviewEncoder() {
  Stop();
}

bool PreviewEncoder::Start(std::string& error) {
  error.clear();
  if (running_.load()) {
    return true;
  }
  if (worker_.joinable()) {
    worker_.join();
  }

  queue_ = hub_.Attach(ConsumerKind::kPreview);
  if (!queue_) {
    error = core::errors::FormatCameraError(core::errors::CameraErrorCode::kSessionNotOpen,
                                            "frame hub is closed");
    return false;
  }

  stop_requested_.store(false);
  running_.store(true);
  worker_ = std::thread([this, queue = queue_]() { Loop(queue); });
  logger_.Debug("preview encoder started", {{"quality", std::to_string(jpeg_quality_)}});
  return true;
}

void PreviewEncoder::Stop() {
  stop_requested_.store(true);
  if (worker_.joinable()) {
    worker_.join();
  }
  if (queue_) {
    hub_.Detach(queue_);
    queue_.reset();
  }
  running_.store(false);
  frame_cv_.notify_all();
}

bool PreviewEncoder::IsRunning() const {
  return running_.load();
}

EncodedFramePtr PreviewEncoder::CurrentFrame() const {
  std::lock_guard<std::mutex> lock(mu_);
  return latest_;
}

EncodedFramePtr PreviewEncoder::WaitForNewerFrame(const std::optional<std::uint64_t> after_sequence,
                                                  const std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mu_);
  frame_cv_.wait_for(lock, timeout, [&] {
    if (!running_.load()) {
      return true;
    }
    if (!latest_) {
      return false;
    }
    return !after_sequence.has_value() || latest_->sequence > after_sequence.value();
  });
  return latest_;
}

std::uint64_t PreviewEncoder::EncodedCount() const {
  return encoded_.load();
}

std::uint64_t PreviewEncoder::EncodeFailures() const {
  return failures_.load();
}

void PreviewEncoder::Loop(DeliveryHandle queue) {
  const core::logging::ScopedThreadTag tag("preview");
  while (!stop_requested_.load()) {
    FramePtr frame;
    const PopStatus status = queue->Pop(frame, kPopTimeout);
    if (status == PopStatus::kClosed) {
      break;
    }
    if (status == PopStatus::kTimeout) {
      continue;
    }

    auto encoded = std::make_shared<EncodedFrame>();
    std::string error;
    if (!encoder_.EncodeJpeg(*frame, jpeg_quality_, encoded->jpeg, error)) {
      // First failure and every hundredth after it.
      const std::uint64_t failures = failures_.fetch_add(1U) + 1U;
      if (failures == 1U || failures % 100U == 0U) {
        logger_.Warn("preview encode failed",
                     {{"error", error}, {"failures", std::to_string(failures)}});
      }
      continue;
    }
    encoded->sequence = frame->sequence;
    encoded->timestamp = frame->timestamp;
    encoded->width = frame->width;
    encoded->height = frame->height;

    {
      std::lock_guard<std::mutex> lock(mu_);
      latest_ = std::move(encoded);
    }
    encoded_.fetch_add(1U);
    frame_cv_.notify_all();
  }
  running_.store(false);
  frame_cv_.notify_all();
}

} // namespace camctl::camera
