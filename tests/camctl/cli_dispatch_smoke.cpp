#include "../common/assertions.hpp"
#include "../common/cli_dispatch.hpp"
#include "../common/temp_dir.hpp"
#include "media/opencv_codec.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace {

using camctl::tests::common::AssertContains;
using camctl::tests::common::DispatchArgs;
using camctl::tests::common::DispatchWithCapturedStdout;
using camctl::tests::common::Fail;

void ExpectExit(const std::vector<std::string>& argv, const int expected, const std::string& label) {
  const int exit_code = DispatchArgs(argv);
  if (exit_code != expected) {
    Fail(label + ": expected exit " + std::to_string(expected) + ", got " +
         std::to_string(exit_code));
  }
}

void WriteConfig(const std::filesystem::path& path, const std::filesystem::path& root) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    Fail("failed to write config: " + path.string());
  }
  out << "{\n"
      << "  \"image_output\": \"" << (root / "images").generic_string() << "\",\n"
      << "  \"video_output\": \"" << (root / "videos").generic_string() << "\",\n"
      << "  \"capture_fps\": 30,\n"
      << "  \"reopen_delay_ms\": 10\n"
      << "}\n";
}

} // namespace

int main() {
  using camctl::tests::common::ReadFileToString;
  using camctl::tests::common::ScopedTempDir;

  const ScopedTempDir temp("camctl-cli");
  const std::filesystem::path config_path = temp.path() / "config.json";
  WriteConfig(config_path, temp.path());
  const std::string config = config_path.string();

  std::string out;
  if (DispatchWithCapturedStdout({"camctl", "version"}, out) != 0) {
    Fail("version must succeed");
  }
  AssertContains(out, "camctl 0.1.0");

  ExpectExit({"camctl"}, 2, "no subcommand");
  ExpectExit({"camctl", "frobnicate"}, 2, "unknown subcommand");
  ExpectExit({"camctl", "status", "--backend", "uvc"}, 2, "unknown backend");
  ExpectExit({"camctl", "status", "--log-level"}, 2, "missing flag value");
  ExpectExit({"camctl", "set-control", "brightness", "--backend", "sim", "--config", config}, 2,
             "set-control missing value");
  ExpectExit({"camctl", "set-control", "brightness", "bright", "--backend", "sim"}, 2,
             "set-control non-integer");
  ExpectExit({"camctl", "timelapse", "--interval", "1", "--backend", "sim"}, 2,
             "timelapse without duration");
  ExpectExit({"camctl", "snapshot", "--backend", "sim"}, 2, "snapshot without --out");

  if (DispatchWithCapturedStdout({"camctl", "list-devices", "--backend", "sim"}, out) != 0) {
    Fail("list-devices must succeed on the sim backend");
  }
  AssertContains(out, "/dev/video0");
  AssertContains(out, "devices: 1");

  if (DispatchWithCapturedStdout(
          {"camctl", "status", "--backend", "sim", "--config", config}, out) != 0) {
    Fail("status must succeed on the sim backend");
  }
  AssertContains(out, "\"device\":\"/dev/video0\"");
  AssertContains(out, "\"stored_defaults\":");
  AssertContains(out, "\"original_hardware_defaults\":");

  ExpectExit({"camctl", "status", "--backend", "sim", "--config", config, "--device",
              "/dev/nope"},
             20, "unknown device");
  ExpectExit({"camctl", "set-control", "brightness", "999", "--backend", "sim", "--config",
              config},
             1, "out-of-range control");
  ExpectExit({"camctl", "set-control", "zoom", "1", "--backend", "sim", "--config", config}, 1,
             "unknown control");

  if (DispatchWithCapturedStdout({"camctl", "set-control", "gain", "64", "--backend", "sim",
                                  "--config", config},
                                 out) != 0) {
    Fail("set-control must succeed");
  }
  AssertContains(out, "control: gain=64");

  if (DispatchWithCapturedStdout({"camctl", "set-resolution", "640", "480", "MJPG", "--backend",
                                  "sim", "--config", config},
                                 out) != 0) {
    Fail("set-resolution must succeed");
  }
  AssertContains(out, "resolution: MJPG 640x480");
  ExpectExit({"camctl", "set-resolution", "800", "600", "--backend", "sim", "--config", config}, 1,
             "unsupported resolution");

  if (DispatchWithCapturedStdout(
          {"camctl", "reset-controls", "--backend", "sim", "--config", config}, out) != 0) {
    Fail("reset-controls must succeed");
  }
  AssertContains(out, "control: contrast=47");

  if (DispatchWithCapturedStdout(
          {"camctl", "save-config", "--backend", "sim", "--config", config}, out) != 0) {
    Fail("save-config must succeed");
  }
  const std::string saved = ReadFileToString(config_path);
  AssertContains(saved, "/dev/video0");
  AssertContains(saved, "\"controls\"");
  AssertContains(saved, (temp.path() / "images").generic_string());

  const std::string photo = (temp.path() / "shot.jpg").string();
  const int snapshot_exit = DispatchArgs(
      {"camctl", "snapshot", "--out", photo, "--backend", "sim", "--config", config});
  if (camctl::media::IsOpenCvCodecEnabled()) {
    if (snapshot_exit != 0 || !std::filesystem::exists(photo)) {
      Fail("snapshot must write the photo when the codec is available");
    }
  } else if (snapshot_exit != 1) {
    Fail("snapshot must fail cleanly without the codec");
  }
  return 0;
}
