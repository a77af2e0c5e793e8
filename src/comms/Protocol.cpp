#include "comms/Protocol.h"

/*
===============================================================================
  Protocol.cpp
===============================================================================

  PURPOSE
  -------
  Implements newline-delimited JSON protocol helpers.

  Wire format:
    - One JSON object per line
    - Host -> Board: type="cmd"
    - Board -> Host: type="telemetry"

  Notes:
  - Both directions go through ArduinoJson so the host and the board
    firmware share one parser.
===============================================================================
*/

#include <ArduinoJson.h>
#include <string.h>


namespace protocol {

const char* actionName(BoardAction action) {
  switch (action) {
    case BoardAction::BLOW_FAN:            return "blow_fan";
    case BoardAction::START_CHUG:          return "start_chug";
    case BoardAction::STOP_CHUG:           return "stop_chug";
    case BoardAction::HIT_TARGET:          return "hit_target";
    case BoardAction::DROP_GATE:           return "drop_gate";
    case BoardAction::DISPENSE:            return "dispense";
    case BoardAction::ACTIVATE_TUNNEL:     return "activate_tunnel";
    case BoardAction::LAUNCH_PLUNGER:      return "launch_plunger";
    case BoardAction::RESTORE_TARGETS:     return "restore_targets";
    case BoardAction::PLAY_SOUND:          return "play_sound";
    case BoardAction::SET_TARGET_LED:      return "set_target_led";
    case BoardAction::SET_THEME_LIGHTING:  return "set_theme_lighting";
    case BoardAction::RAISE_PONG_PLATFORM: return "raise_pong_platform";
    case BoardAction::SERVO:               return "servo";
  }
  return "unknown";
}

/*=============================================================================
  ENCODE (Host -> Board)
=============================================================================*/

void encodeActionLine(const ActionFrame& a, std::string& out) {
  StaticJsonDocument<256> doc;

  doc["type"] = "cmd";
  doc["seq"] = a.seq;
  doc["action"] = actionName(a.action);

  switch (a.action) {
    case BoardAction::BLOW_FAN:
      doc["duration_ms"] = a.duration_ms;
      break;

    case BoardAction::START_CHUG:
    case BoardAction::STOP_CHUG:
    case BoardAction::DISPENSE:
    case BoardAction::SET_THEME_LIGHTING:
      doc["team"] = teamName(a.team);
      break;

    case BoardAction::RESTORE_TARGETS:
      doc["team"] = teamName(a.team);
      doc["hits"] = a.hits;
      break;

    case BoardAction::HIT_TARGET:
      doc["target"] = a.target;
      break;

    case BoardAction::ACTIVATE_TUNNEL:
      doc["tunnel"] = a.tunnel;
      break;

    case BoardAction::PLAY_SOUND:
      doc["effect"] = soundName(a.sound);
      break;

    case BoardAction::SET_TARGET_LED:
      doc["target"] = a.target;
      doc["color"] = colorName(a.color);
      break;

    case BoardAction::SERVO:
      doc["id"] = a.servo_id;
      doc["deg"] = a.servo_deg;
      break;

    case BoardAction::DROP_GATE:
    case BoardAction::LAUNCH_PLUNGER:
    case BoardAction::RAISE_PONG_PLATFORM:
      break;
  }

  serializeJson(doc, out);
  out += '\n';
}


/*=============================================================================
  DECODE (Board -> Host)
=============================================================================*/

bool decodeTelemetryLine(const char* line, TelemetryFrame& out) {
  out = TelemetryFrame();   // reset everything
  if (!line) return false;

  StaticJsonDocument<SERIAL_JSON_DOC_BYTES> doc;

  if (deserializeJson(doc, line)) {
    return false;
  }

  JsonObject obj = doc.as<JsonObject>();
  if (obj.isNull()) return false;

  // Must be telemetry
  const char* type = obj["type"];
  if (!type || strcmp(type, "telemetry") != 0) return false;

  // Required fields
  if (!obj.containsKey("board_time_ms")) return false;

  out.board_time_ms = obj["board_time_ms"].as<uint32_t>();

  // analog: array of ints (missing = no analog channels)
  JsonArray analog = obj["analog"].as<JsonArray>();
  if (!analog.isNull()) {
    for (JsonVariant v : analog) {
      if (out.analog_count >= TELEMETRY_MAX_ANALOG) break;
      if (!v.is<int>()) return false;
      out.analog[out.analog_count++] = v.as<int>();
    }
  }

  // digital: array of 0/1 or booleans
  JsonArray digital = obj["digital"].as<JsonArray>();
  if (!digital.isNull()) {
    for (JsonVariant v : digital) {
      if (out.digital_count >= TELEMETRY_MAX_DIGITAL) break;
      if (v.is<bool>()) {
        out.digital[out.digital_count++] = v.as<bool>();
      } else if (v.is<int>()) {
        out.digital[out.digital_count++] = (v.as<int>() != 0);
      } else {
        return false;
      }
    }
  }

  out.valid = true;
  return true;
}

}  // namespace protocol
