// Repository: Whipcast
// Component: Frame Compositor Contract Tests
// Purpose: Verify source switching, ownership of the camera, mirroring,
//          letterboxing and the frame-producing capture track.
// Copyright (c) 2025 Whipcast

#include <gtest/gtest.h>

#include <cstdlib>
#include <memory>

#include "fixtures/FakeCaptureDevices.hpp"
#include "fixtures/StubMedia.hpp"
#include "support/ManualScheduler.hpp"
#include "whipcast/compositor/CaptureTrack.hpp"
#include "whipcast/compositor/FrameCompositor.hpp"

namespace whipcast::compositor::testing {
namespace {

using tests::fixtures::FakeCaptureDevices;
using tests::fixtures::MakeSolidFrame;
using tests::fixtures::MakeSplitFrame;
using tests::fixtures::StubFrameSource;

constexpr int kSize = 64;

CompositorConfig MakeConfig(FitMode fit = FitMode::kCover) {
  CompositorConfig config;
  config.size = kSize;
  config.fit = fit;
  config.blank_color = {1, 2, 3, 255};
  config.clear_color = {0, 0, 0, 255};
  return config;
}

int Red(const media::VideoFrame& frame, int x, int y) {
  return frame.PixelAt(x, y)[0];
}

// Test the default source is blank and fills with the blank color
TEST(FrameCompositorTest, BlankFillsWithBlankColor) {
  FakeCaptureDevices devices;
  FrameCompositor compositor(devices, MakeConfig());

  const media::VideoFrame& out = compositor.Tick();
  EXPECT_EQ(out.width, kSize);
  EXPECT_EQ(out.height, kSize);
  EXPECT_EQ(out.PixelAt(10, 10)[0], 1);
  EXPECT_EQ(out.PixelAt(10, 10)[1], 2);
  EXPECT_EQ(out.PixelAt(10, 10)[2], 3);
  EXPECT_TRUE(std::holds_alternative<BlankSource>(compositor.ActiveSource()));
}

// Test output stays size x size for non-square input
TEST(FrameCompositorTest, OutputIsAlwaysSquare) {
  FakeCaptureDevices devices;
  FrameCompositor compositor(devices, MakeConfig());
  auto stream = std::make_shared<StubFrameSource>(MakeSolidFrame(160, 90, 50, 60, 70));
  ASSERT_TRUE(compositor.SetSource(ExternalStreamSource{stream}).success);

  const media::VideoFrame& out = compositor.Tick();
  EXPECT_EQ(out.width, kSize);
  EXPECT_EQ(out.height, kSize);
  EXPECT_NEAR(Red(out, kSize / 2, kSize / 2), 50, 2);
  EXPECT_EQ(compositor.FramesDrawn(), 1u);
}

// Test a source with no frame yet leaves the surface untouched
TEST(FrameCompositorTest, NoFrameReadyKeepsPreviousSurface) {
  FakeCaptureDevices devices;
  FrameCompositor compositor(devices, MakeConfig());
  compositor.Tick();

  auto stream = std::make_shared<StubFrameSource>();
  ASSERT_TRUE(compositor.SetSource(ExternalStreamSource{stream}).success);
  const media::VideoFrame& out = compositor.Tick();
  EXPECT_EQ(out.PixelAt(0, 0)[0], 1);
  EXPECT_EQ(compositor.TicksSkipped(), 1u);
  EXPECT_EQ(compositor.FramesDrawn(), 0u);
}

// Test a zero-sized frame is skipped for the tick
TEST(FrameCompositorTest, ZeroSizedFrameIsSkipped) {
  FakeCaptureDevices devices;
  FrameCompositor compositor(devices, MakeConfig());
  auto stream = std::make_shared<StubFrameSource>(media::VideoFrame{});
  ASSERT_TRUE(compositor.SetSource(ExternalSurfaceSource{stream}).success);
  compositor.Tick();
  EXPECT_EQ(compositor.TicksSkipped(), 1u);
}

// Test contain leaves clear-colored bars around a wide frame
TEST(FrameCompositorTest, ContainLetterboxesWithClearColor) {
  FakeCaptureDevices devices;
  FrameCompositor compositor(devices, MakeConfig(FitMode::kContain));
  auto stream = std::make_shared<StubFrameSource>(MakeSolidFrame(64, 32, 220, 0, 0));
  ASSERT_TRUE(compositor.SetSource(ExternalStreamSource{stream}).success);

  const media::VideoFrame& out = compositor.Tick();
  EXPECT_EQ(Red(out, 32, 2), 0);
  EXPECT_EQ(Red(out, 32, kSize - 3), 0);
  EXPECT_NEAR(Red(out, 32, 32), 220, 2);
}

// Test the camera degrades to blank when it cannot be opened
TEST(FrameCompositorTest, CameraDeniedFallsBackToBlank) {
  FakeCaptureDevices devices;
  devices.camera_available = false;
  FrameCompositor compositor(devices, MakeConfig());

  const runtime::CallResult result = compositor.SetSource(CameraSource{});
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.kind, runtime::ErrorKind::kDeviceUnavailable);
  EXPECT_TRUE(std::holds_alternative<BlankSource>(compositor.ActiveSource()));
  EXPECT_EQ(compositor.Tick().PixelAt(5, 5)[0], 1);
}

// Test the camera request carries the configured capture format and facing
TEST(FrameCompositorTest, CameraRequestUsesConfiguredFormat) {
  FakeCaptureDevices devices;
  CompositorConfig config = MakeConfig();
  config.camera_width = 640;
  config.camera_height = 480;
  config.camera_fps = 30;
  FrameCompositor compositor(devices, config);

  CameraSource back;
  back.facing = capture::CameraFacing::kBack;
  ASSERT_TRUE(compositor.SetSource(back).success);
  ASSERT_EQ(devices.camera_requests.size(), 1u);
  EXPECT_EQ(devices.camera_requests[0].facing, capture::CameraFacing::kBack);
  EXPECT_EQ(devices.camera_requests[0].width, 640);
  EXPECT_EQ(devices.camera_requests[0].height, 480);
  EXPECT_EQ(devices.camera_requests[0].fps, 30);
}

// Test an owned camera is stopped on source change, external sources never
TEST(FrameCompositorTest, StopsOwnedCameraButNeverExternalSources) {
  FakeCaptureDevices devices;
  FrameCompositor compositor(devices, MakeConfig());

  ASSERT_TRUE(compositor.SetSource(CameraSource{}).success);
  ASSERT_EQ(devices.cameras.size(), 1u);
  auto camera = devices.cameras[0];

  auto stream = std::make_shared<StubFrameSource>(MakeSolidFrame(8, 8, 9, 9, 9));
  ASSERT_TRUE(compositor.SetSource(ExternalStreamSource{stream}).success);
  EXPECT_TRUE(camera->IsStopped());

  ASSERT_TRUE(compositor.SetSource(BlankSource{}).success);
  compositor.ReleaseSource();
  EXPECT_FALSE(stream->IsStopped());
}

// Test ReleaseSource stops the camera exactly once and reverts to blank
TEST(FrameCompositorTest, ReleaseSourceIsIdempotent) {
  FakeCaptureDevices devices;
  FrameCompositor compositor(devices, MakeConfig());
  ASSERT_TRUE(compositor.SetSource(CameraSource{}).success);

  compositor.ReleaseSource();
  compositor.ReleaseSource();
  EXPECT_EQ(devices.cameras[0]->stop_calls(), 1);
  EXPECT_TRUE(std::holds_alternative<BlankSource>(compositor.ActiveSource()));
}

// Test only a front camera with mirror set is flipped
TEST(FrameCompositorTest, MirrorsFrontCameraOnly) {
  FakeCaptureDevices devices;
  devices.camera_frame = MakeSplitFrame(kSize, kSize, 200, 10);
  FrameCompositor compositor(devices, MakeConfig());

  CameraSource front;
  front.facing = capture::CameraFacing::kFront;
  front.mirror = true;
  ASSERT_TRUE(compositor.SetSource(front).success);
  EXPECT_TRUE(compositor.IsMirroring());
  const media::VideoFrame& mirrored = compositor.Tick();
  EXPECT_NEAR(Red(mirrored, 4, 32), 10, 2);
  EXPECT_NEAR(Red(mirrored, kSize - 5, 32), 200, 2);

  CameraSource front_plain;
  front_plain.facing = capture::CameraFacing::kFront;
  front_plain.mirror = false;
  ASSERT_TRUE(compositor.SetSource(front_plain).success);
  EXPECT_FALSE(compositor.IsMirroring());
  const media::VideoFrame& unflipped = compositor.Tick();
  EXPECT_NEAR(Red(unflipped, 4, 32), 200, 2);
  EXPECT_NEAR(Red(unflipped, kSize - 5, 32), 10, 2);

  CameraSource back;
  back.facing = capture::CameraFacing::kBack;
  back.mirror = true;
  ASSERT_TRUE(compositor.SetSource(back).success);
  EXPECT_FALSE(compositor.IsMirroring());
  const media::VideoFrame& straight = compositor.Tick();
  EXPECT_NEAR(Red(straight, 4, 32), 200, 2);

  auto stream = std::make_shared<StubFrameSource>(MakeSplitFrame(kSize, kSize, 200, 10));
  ASSERT_TRUE(compositor.SetSource(ExternalStreamSource{stream}).success);
  EXPECT_FALSE(compositor.IsMirroring());
}

// Test mirroring keeps an uneven letterbox bar on its own side
TEST(FrameCompositorTest, MirrorKeepsLetterboxInPlace) {
  FakeCaptureDevices devices;
  // 63 wide into 64 leaves a single clear column on the right.
  devices.camera_frame = MakeSolidFrame(kSize - 1, kSize, 200, 0, 0);
  FrameCompositor compositor(devices, MakeConfig(FitMode::kContain));

  CameraSource front;
  front.facing = capture::CameraFacing::kFront;
  front.mirror = true;
  ASSERT_TRUE(compositor.SetSource(front).success);
  const media::VideoFrame& out = compositor.Tick();
  EXPECT_NEAR(Red(out, 0, 32), 200, 2);
  EXPECT_NEAR(Red(out, kSize - 2, 32), 200, 2);
  EXPECT_EQ(Red(out, kSize - 1, 32), 0);
}

// Test PushFrame rejects an empty frame and draws a real one
TEST(FrameCompositorTest, PushFrameDrawsWithConfiguredFit) {
  FakeCaptureDevices devices;
  FrameCompositor compositor(devices, MakeConfig());
  EXPECT_FALSE(compositor.PushFrame(media::VideoFrame{}));
  EXPECT_TRUE(compositor.PushFrame(MakeSolidFrame(32, 32, 90, 0, 0)));
  EXPECT_NEAR(Red(compositor.Surface(), 10, 10), 90, 2);
}

// Test Configure resizes the surface and ignores non-positive sizes
TEST(FrameCompositorTest, ConfigureResizesSurface) {
  FakeCaptureDevices devices;
  FrameCompositor compositor(devices, MakeConfig());
  compositor.Configure(32, FitMode::kContain);
  EXPECT_EQ(compositor.Size(), 32);
  EXPECT_EQ(compositor.Fit(), FitMode::kContain);
  EXPECT_EQ(compositor.Tick().width, 32);

  compositor.Configure(0, FitMode::kCover);
  EXPECT_EQ(compositor.Size(), 32);
}

// Test the capture track ticks at its frame rate and stops cleanly
TEST(CaptureTrackTest, DeliversFramesAtFrameRate) {
  ManualScheduler scheduler;
  FakeCaptureDevices devices;
  FrameCompositor compositor(devices, MakeConfig());

  auto track = compositor.StartCapture(scheduler, 10);
  int frames = 0;
  int64_t last_pts = -1;
  track->SetFrameSink([&](const media::VideoFrame& frame) {
    ++frames;
    EXPECT_EQ(frame.width, kSize);
    EXPECT_GT(frame.pts_ms, last_pts);
    last_pts = frame.pts_ms;
  });
  EXPECT_EQ(track->Width(), kSize);
  EXPECT_EQ(track->Fps(), 10);

  scheduler.AdvanceBy(1000);
  EXPECT_EQ(frames, 11);  // ticks at 0, 100, ..., 1000

  track->Stop();
  EXPECT_TRUE(track->IsStopped());
  scheduler.AdvanceBy(1000);
  EXPECT_EQ(frames, 11);
}

}  // namespace
}  // namespace whipcast::compositor::testing
