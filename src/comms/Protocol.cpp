#include "comms/Protocol.h"
#include <math.h>

/*
===============================================================================
  Protocol.cpp
===============================================================================

  PURPOSE
  -------
  Implements the newline-delimited JSON telemetry encoder.

  Notes:
  - Encoding uses ArduinoJson so the output is always valid JSON, even when
    a debug note contains quotes.
  - Non-finite numbers are written as null.
===============================================================================
*/

#include <ArduinoJson.h>


/*=============================================================================
  SMALL HELPERS
=============================================================================*/

// root + motors + ultrasonic + link members; keys and values are not copied
static constexpr size_t kTelemetryCapacity =
    JSON_OBJECT_SIZE(10) + JSON_OBJECT_SIZE(3) + JSON_OBJECT_SIZE(2) + JSON_OBJECT_SIZE(5);

static void setNullable(JsonObject obj, const char* key, float v) {
  if (isfinite(v))
    obj[key] = v;
  else
    obj[key] = nullptr;
}


namespace protocol {

/*=============================================================================
  ENCODE (Robot -> Serial monitor)
=============================================================================*/

size_t encodeTelemetryLine(const TelemetryFrame& t, char* out, size_t out_len) {
  if (!out || out_len < 2) return 0;

  StaticJsonDocument<kTelemetryCapacity> doc;

  doc["type"] = "telemetry";
  doc["time_ms"] = t.time_ms;
  doc["mode"] = t.mode;

  if (t.behavior)
    doc["behavior"] = t.behavior;
  else
    doc["behavior"] = nullptr;

  // motors
  JsonObject motors = doc.createNestedObject("motors");
  motors["left"] = t.motors.left;
  motors["right"] = t.motors.right;
  motors["command"] = t.motors.command;

  // ultrasonic
  JsonObject us = doc.createNestedObject("ultrasonic");
  us["valid"] = t.ultrasonic.valid;
  if (t.ultrasonic.valid && isfinite(t.ultrasonic.distance_cm))
    us["distance_cm"] = t.ultrasonic.distance_cm;
  else
    us["distance_cm"] = nullptr;

  // link
  JsonObject link = doc.createNestedObject("link");
  link["rx_ok"] = t.link.rx_ok;
  link["rx_fail"] = t.link.rx_fail;
  link["rx_overflow"] = t.link.rx_overflow;
  link["rx_max_len"] = t.link.rx_max_len;
  link["client"] = t.link.client_connected;

  setNullable(doc.as<JsonObject>(), "remote_age_ms", t.remote_age_ms);
  doc["avoid_count"] = t.avoid_count;

  if (t.note)
    doc["note"] = t.note;
  else
    doc["note"] = nullptr;

  if (doc.overflowed()) return 0;

  // Room for the JSON, '\n' and the NUL
  const size_t needed = measureJson(doc);
  if (needed + 2 > out_len) return 0;

  const size_t n = serializeJson(doc, out, out_len);
  out[n] = '\n';
  out[n + 1] = '\0';
  return n + 1;
}

}  // namespace protocol
