// Repository: PeerLink
// Component: InputEvent Tests
// Purpose: Text codec validation and the injecting sink.
// Copyright (c) 2026 PeerLink

#include "peerlink/input/InputEvent.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "peerlink/input/InputInjector.hpp"

namespace peerlink::input::testing {
namespace {

class RecordingInjector : public IInputInjector {
 public:
  bool Inject(const InputEvent& event, std::string* error) override {
    if (fail) {
      *error = "device gone";
      return false;
    }
    events.push_back(Encode(event));
    return true;
  }

  bool fail = false;
  std::vector<std::string> events;
};

TEST(InputEventTest, DecodesEveryVerb) {
  std::string error;
  auto key = Decode("kp 65", &error);
  ASSERT_TRUE(key.has_value()) << error;
  EXPECT_EQ(key->kind, InputKind::kKeyPress);
  EXPECT_EQ(key->code, 65);

  auto release = Decode("kr 255", &error);
  ASSERT_TRUE(release.has_value());
  EXPECT_EQ(release->kind, InputKind::kKeyRelease);

  auto button = Decode("  mp 4 ", &error);
  ASSERT_TRUE(button.has_value());
  EXPECT_EQ(button->kind, InputKind::kMousePress);
  EXPECT_EQ(button->code, 4);

  auto move = Decode("mm 10 -4", &error);
  ASSERT_TRUE(move.has_value());
  EXPECT_EQ(move->kind, InputKind::kMouseMove);
  EXPECT_EQ(move->dx, 10);
  EXPECT_EQ(move->dy, -4);
  EXPECT_EQ(Encode(*move), "mm 10 -4");
}

TEST(InputEventTest, RejectsMalformedEvents) {
  std::string error;
  EXPECT_FALSE(Decode("", &error).has_value());
  EXPECT_FALSE(Decode("zz 1", &error).has_value());
  EXPECT_FALSE(Decode("kp", &error).has_value());
  EXPECT_FALSE(Decode("kp 256", &error).has_value());
  EXPECT_FALSE(Decode("kp -1", &error).has_value());
  EXPECT_FALSE(Decode("kp 1 2", &error).has_value());
  EXPECT_FALSE(Decode("mp 5", &error).has_value());
  EXPECT_FALSE(Decode("mm 1", &error).has_value());
  EXPECT_FALSE(Decode("mm 1 x", &error).has_value());
  EXPECT_FALSE(Decode("mm 100001 0", &error).has_value());
  EXPECT_FALSE(error.empty());
}

TEST(InputEventTest, ZeroMouseMoveIsNoOp) {
  std::string error;
  auto move = Decode("mm 0 0", &error);
  ASSERT_TRUE(move.has_value());
  EXPECT_TRUE(move->IsNoOp());
  EXPECT_FALSE(Decode("kp 0", &error)->IsNoOp());
}

TEST(InjectingSinkTest, InjectsDecodedEvents) {
  auto injector = std::make_shared<RecordingInjector>();
  InjectingSink sink(injector);

  EXPECT_TRUE(sink.TryPut(core::Frame::FromString("kp 65")).ok);
  EXPECT_TRUE(sink.TryPut(core::Frame::FromString("mm 0 0")).ok);
  EXPECT_TRUE(sink.TryPut(core::Frame::FromString("mr 1")).ok);
  EXPECT_EQ(injector->events, (std::vector<std::string>{"kp 65", "mr 1"}));
}

TEST(InjectingSinkTest, MalformedFrameAndInjectorFailureAreFailures) {
  auto injector = std::make_shared<RecordingInjector>();
  InjectingSink sink(injector);

  EXPECT_FALSE(sink.TryPut(core::Frame::FromString("garbage")).ok);
  injector->fail = true;
  const pump::PutResult result = sink.TryPut(core::Frame::FromString("kp 1"));
  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.error, "inject: device gone");
}

TEST(InjectingSinkTest, LoggingInjectorCounts) {
  auto injector = std::make_shared<LoggingInputInjector>();
  InjectingSink sink(injector);
  EXPECT_TRUE(sink.TryPut(core::Frame::FromString("kp 1")).ok);
  EXPECT_EQ(injector->injected(), 1u);
}

}  // namespace
}  // namespace peerlink::input::testing
