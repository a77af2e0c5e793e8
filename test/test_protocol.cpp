#include <gtest/gtest.h>

#include <ArduinoJson.h>

#include <memory>
#include <string>

#include "comms/Protocol.h"
#include "comms/SerialLink.h"
#include "hardware/BackendFactory.h"

namespace {

/*=============================================================================
  Protocol
=============================================================================*/

TEST(ProtocolTest, ActionLineIsOneJsonObject) {
  ActionFrame f;
  f.seq = 17;
  f.action = BoardAction::RESTORE_TARGETS;
  f.team = Team::GREEN;
  f.hits = 4;

  std::string line;
  protocol::encodeActionLine(f, line);
  ASSERT_FALSE(line.empty());
  EXPECT_EQ('\n', line[line.size() - 1]);
  EXPECT_EQ(line.size() - 1, line.find('\n'));

  StaticJsonDocument<256> doc;
  ASSERT_FALSE(deserializeJson(doc, line));
  EXPECT_STREQ("cmd", doc["type"].as<const char*>());
  EXPECT_EQ(17u, doc["seq"].as<uint32_t>());
  EXPECT_STREQ("restore_targets", doc["action"].as<const char*>());
  EXPECT_STREQ("Green", doc["team"].as<const char*>());
  EXPECT_EQ(4, doc["hits"].as<int>());
}

TEST(ProtocolTest, OnlyActionFieldsAreWritten) {
  ActionFrame f;
  f.action = BoardAction::DROP_GATE;
  f.target = 5;

  std::string line;
  protocol::encodeActionLine(f, line);

  StaticJsonDocument<256> doc;
  ASSERT_FALSE(deserializeJson(doc, line));
  EXPECT_STREQ("drop_gate", doc["action"].as<const char*>());
  EXPECT_FALSE(doc.containsKey("target"));
  EXPECT_FALSE(doc.containsKey("team"));
}

TEST(ProtocolTest, ServoAndLedFields) {
  ActionFrame servo;
  servo.action = BoardAction::SERVO;
  servo.servo_id = 2;
  servo.servo_deg = 45.5f;

  std::string line;
  protocol::encodeActionLine(servo, line);
  StaticJsonDocument<256> doc;
  ASSERT_FALSE(deserializeJson(doc, line));
  EXPECT_EQ(2, doc["id"].as<int>());
  EXPECT_FLOAT_EQ(45.5f, doc["deg"].as<float>());

  ActionFrame led;
  led.action = BoardAction::SET_TARGET_LED;
  led.target = 6;
  led.color = LedColor::RED;
  line.clear();
  protocol::encodeActionLine(led, line);
  ASSERT_FALSE(deserializeJson(doc, line));
  EXPECT_EQ(6, doc["target"].as<int>());
  EXPECT_STREQ("red", doc["color"].as<const char*>());
}

TEST(ProtocolTest, DecodesTelemetry) {
  TelemetryFrame t;
  ASSERT_TRUE(protocol::decodeTelemetryLine(
      "{\"type\":\"telemetry\",\"board_time_ms\":1234,"
      "\"analog\":[10,600,1023],\"digital\":[true,0,1]}", t));

  EXPECT_TRUE(t.valid);
  EXPECT_EQ(1234u, t.board_time_ms);
  ASSERT_EQ(3, t.analog_count);
  EXPECT_EQ(600, t.analog[1]);
  ASSERT_EQ(3, t.digital_count);
  EXPECT_TRUE(t.digital[0]);
  EXPECT_FALSE(t.digital[1]);
  EXPECT_TRUE(t.digital[2]);
}

TEST(ProtocolTest, RejectsBadTelemetry) {
  TelemetryFrame t;
  EXPECT_FALSE(protocol::decodeTelemetryLine(nullptr, t));
  EXPECT_FALSE(protocol::decodeTelemetryLine("", t));
  EXPECT_FALSE(protocol::decodeTelemetryLine("{\"type\":\"cmd\",\"board_time_ms\":1}", t));
  EXPECT_FALSE(protocol::decodeTelemetryLine("{\"type\":\"telemetry\"}", t));
  EXPECT_FALSE(protocol::decodeTelemetryLine(
      "{\"type\":\"telemetry\",\"board_time_ms\":1,\"analog\":[\"x\"]}", t));
  EXPECT_FALSE(protocol::decodeTelemetryLine("{\"type\":\"telemetry\",", t));
  EXPECT_FALSE(t.valid);
}

/*=============================================================================
  SerialLink line handling
=============================================================================*/

const char kFrame[] = "{\"type\":\"telemetry\",\"board_time_ms\":5,\"analog\":[700],\"digital\":[1]}";

TEST(SerialLinkTest, AssemblesLinesAcrossChunks) {
  SerialLink link("", SERIAL_DEFAULT_BAUD);
  const std::string data = std::string(kFrame) + "\r\n";

  link.consume(data.data(), 10, 100);
  EXPECT_FALSE(link.hasTelemetry());
  link.consume(data.data() + 10, data.size() - 10, 100);

  ASSERT_TRUE(link.hasTelemetry());
  EXPECT_EQ(700, link.latestTelemetry().analog[0]);
  EXPECT_EQ(1u, link.rxOk());
  EXPECT_FALSE(link.telemetryStale(100 + TELEMETRY_STALE_MS));
  EXPECT_TRUE(link.telemetryStale(101 + TELEMETRY_STALE_MS));
}

TEST(SerialLinkTest, OverflowDropsUntilNewline) {
  SerialLink link("", SERIAL_DEFAULT_BAUD);

  const std::string junk(SERIAL_LINE_BUFFER_BYTES + 50, 'x');
  link.consume(junk.data(), junk.size(), 0);
  const std::string tail = std::string("still junk\n") + kFrame + "\n";
  link.consume(tail.data(), tail.size(), 10);

  EXPECT_EQ(1u, link.rxOverflow());
  EXPECT_EQ(1u, link.rxOk());
  EXPECT_EQ(0u, link.rxFail());
  EXPECT_TRUE(link.hasTelemetry());
}

TEST(SerialLinkTest, GarbageLineCountsAsFailure) {
  SerialLink link("", SERIAL_DEFAULT_BAUD);
  const std::string data = "hello board\n";
  link.consume(data.data(), data.size(), 0);

  EXPECT_EQ(1u, link.rxFail());
  EXPECT_FALSE(link.hasTelemetry());
  EXPECT_TRUE(link.telemetryStale(0));
}

TEST(SerialLinkTest, ClosedPortCannotWrite) {
  SerialLink link("", SERIAL_DEFAULT_BAUD);
  EXPECT_FALSE(link.isOpen());
  EXPECT_FALSE(link.writeLine("{}\n"));
}

/*=============================================================================
  Backend selection
=============================================================================*/

TEST(BackendFactoryTest, EmptyDeviceIsSimulated) {
  std::unique_ptr<HardwareBackend> hw = makeBackend("", SERIAL_DEFAULT_BAUD);
  ASSERT_NE(nullptr, hw);
  EXPECT_STREQ("simulated", hw->name());
}

TEST(BackendFactoryTest, MissingDeviceFallsBackToSimulated) {
  std::unique_ptr<HardwareBackend> hw = makeBackend("/dev/does-not-exist-castles", SERIAL_DEFAULT_BAUD);
  ASSERT_NE(nullptr, hw);
  EXPECT_STREQ("simulated", hw->name());
}

}  // namespace
