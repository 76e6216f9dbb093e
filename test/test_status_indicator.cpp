#include <gtest/gtest.h>
#include "status_indicator.h"
#include "fake_ports.h"

using namespace passthrough;

TEST(StatusIndicator, ConnectionStates){
  FakePixel pixel;
  FakeLight light;
  StatusIndicator indicator(pixel, light, 255);

  indicator.set_state(CONN_DISCONNECTED);
  EXPECT_EQ(APPEARANCE_WAITING, indicator.appearance());
  EXPECT_EQ(255, pixel.last.r);
  EXPECT_EQ(255, pixel.last.g);
  EXPECT_EQ(255, pixel.last.b);

  indicator.set_state(CONN_CONNECTED);
  EXPECT_EQ(APPEARANCE_IDLE, indicator.appearance());
  EXPECT_EQ(0, pixel.last.r);
  EXPECT_EQ(0, pixel.last.g);
  EXPECT_EQ(255, pixel.last.b);
}

TEST(StatusIndicator, ActivityColors){
  FakePixel pixel;
  FakeLight light;
  StatusIndicator indicator(pixel, light, 255);

  indicator.set_state(ACTIVITY_HOST);
  EXPECT_EQ(APPEARANCE_HOST, indicator.appearance());
  EXPECT_EQ(255, pixel.last.g);
  EXPECT_EQ(0, pixel.last.r);

  indicator.set_state(ACTIVITY_DEVICE);
  EXPECT_EQ(APPEARANCE_DEVICE, indicator.appearance());
  EXPECT_EQ(255, pixel.last.r);
  EXPECT_EQ(0, pixel.last.g);

  indicator.set_state(ACTIVITY_IDLE);
  EXPECT_EQ(APPEARANCE_IDLE, indicator.appearance());
  EXPECT_EQ(255, pixel.last.b);
}

TEST(StatusIndicator, ScalesBrightness){
  FakePixel pixel;
  FakeLight light;
  StatusIndicator indicator(pixel, light, 26);

  indicator.set_state(CONN_DISCONNECTED);
  EXPECT_EQ(26, pixel.last.r);
  EXPECT_EQ(26, pixel.last.g);
  EXPECT_EQ(26, pixel.last.b);
}

TEST(StatusIndicator, SkipsUnchangedWrites){
  FakePixel pixel;
  FakeLight light;
  StatusIndicator indicator(pixel, light, 255);

  indicator.set_state(CONN_CONNECTED);
  indicator.set_state(CONN_CONNECTED);
  indicator.set_state(ACTIVITY_IDLE);
  EXPECT_EQ(1, pixel.writes);

  indicator.set_state(ACTIVITY_HOST);
  indicator.set_state(CONN_CONNECTED);
  EXPECT_EQ(3, pixel.writes);
}

TEST(StatusIndicator, WriteFailuresAreSwallowed){
  FakePixel pixel;
  FakeLight light;
  StatusIndicator indicator(pixel, light, 255);

  pixel.fail = true;
  indicator.set_state(ACTIVITY_DEVICE);
  EXPECT_EQ(APPEARANCE_DEVICE, indicator.appearance());
  EXPECT_EQ(1u, indicator.write_failures());
  EXPECT_EQ(1, pixel.writes);

  // Same state again is not written even once the pixel works
  pixel.fail = false;
  indicator.set_state(ACTIVITY_DEVICE);
  EXPECT_EQ(1, pixel.writes);

  // The next state change writes again
  indicator.set_state(ACTIVITY_HOST);
  EXPECT_EQ(2, pixel.writes);
  EXPECT_EQ(255, pixel.last.g);
  EXPECT_EQ(1u, indicator.write_failures());
}

TEST(StatusIndicator, FailedWriteNotRepeatedEveryPoll){
  FakePixel pixel;
  FakeLight light;
  StatusIndicator indicator(pixel, light, 255);

  pixel.fail = true;
  for(int i = 0; i < 10; i++){
    indicator.set_state(CONN_CONNECTED);
  }
  EXPECT_EQ(1, pixel.writes);
  EXPECT_EQ(1u, indicator.write_failures());
}

TEST(StatusIndicator, ActivityLight){
  FakePixel pixel;
  FakeLight light;
  StatusIndicator indicator(pixel, light, 255);

  indicator.activity_on();
  EXPECT_TRUE(light.on);
  indicator.activity_off();
  EXPECT_FALSE(light.on);
  EXPECT_EQ(2, light.toggles);
  EXPECT_EQ(0, pixel.writes);
}

TEST(StatusIndicator, ColorTable){
  Rgb none = StatusIndicator::color_of(APPEARANCE_NONE);
  EXPECT_EQ(0, none.r + none.g + none.b);
  Rgb waiting = StatusIndicator::color_of(APPEARANCE_WAITING);
  EXPECT_EQ(255 * 3, waiting.r + waiting.g + waiting.b);
}
