#pragma once

#include "camera/frame_hub.hpp"
#include "core/logging/logger.hpp"
#include "media/image_codec.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace camctl::camera {

// Last compressed preview image.
struct EncodedFrame {
  std::uint64_t sequence = 0U;
  std::chrono::system_clock::time_point timestamp{};
  std::uint32_t width = 0U;
  std::uint32_t height = 0U;
  std::vector<std::uint8_t> jpeg;
};

using EncodedFramePtr = std::shared_ptr<const EncodedFrame>;

// Latest-only JPEG encoder behind the live preview.
//
// Consumes the hub's capacity-1 replace-oldest queue, so backlog never builds
// up; each delivered frame replaces the published image. `CurrentFrame` is an
// idempotent peek: repeated calls without a new delivery return the same
// image and never block.
class PreviewEncoder {
public:
  static constexpr int kDefaultJpegQuality = 70;

  PreviewEncoder(FrameHub& hub, media::IImageEncoder& encoder, core::logging::Logger& logger,
                 int jpeg_quality = kDefaultJpegQuality);
  ~PreviewEncoder();

  PreviewEncoder(const PreviewEncoder&) = delete;
  PreviewEncoder& operator=(const PreviewEncoder&) = delete;

  // No-op when already running.
  bool Start(std::string& error);
  void Stop();
  bool IsRunning() const;

  // nullptr until the first frame has been encoded.
  EncodedFramePtr CurrentFrame() const;

  // Blocks at most `timeout` for an image newer than `after_sequence` (any
  // image when empty). Returns the current image, possibly nullptr, on
  // timeout.
  EncodedFramePtr WaitForNewerFrame(std::optional<std::uint64_t> after_sequence,
                                    std::chrono::milliseconds timeout) const;

  std::uint64_t EncodedCount() const;
  std::uint64_t EncodeFailures() const;

private:
  void Loop(DeliveryHandle queue);

  FrameHub& hub_;
  media::IImageEncoder& encoder_;
  core::logging::Logger& logger_;
  const int jpeg_quality_;

  mutable std::mutex mu_;
  mutable std::condition_variable frame_cv_;
  EncodedFramePtr latest_;

  DeliveryHandle queue_;
  std::thread worker_;
  std::atomic<bool> stop_requested_{false};
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> encoded_{0U};
  std::atomic<std::uint64_t> failures_{0U};
};

} // namespace camctl::camera
