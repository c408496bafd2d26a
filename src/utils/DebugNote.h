#pragma once

#include <stdint.h>
#include <stddef.h>

/*
  DebugNote

  Short human readable status line owned by one component. The firmware
  copies the freshest note into telemetry and echoes new ones to the serial
  monitor, so this is the robot's log.

  A note stays visible for HOLD_MS after it is written. sequence() bumps on
  every write so a reader can print each note exactly once.
*/

class DebugNote {
public:
  static constexpr uint32_t HOLD_MS = 1500;
  static constexpr size_t MAX_LEN = 96;

  DebugNote();

#if defined(__GNUC__)
  void set(uint32_t now_ms, const char* fmt, ...) __attribute__((format(printf, 3, 4)));
#else
  void set(uint32_t now_ms, const char* fmt, ...);
#endif

  // Note text while fresh, nullptr once expired or never written
  const char* get(uint32_t now_ms) const;

  // Last text regardless of age ("" if never written)
  const char* text() const { return _buf; }

  uint32_t sequence() const { return _seq; }
  uint32_t writtenMs() const { return _written_ms; }

  void clear();

private:
  char _buf[MAX_LEN];
  uint32_t _written_ms = 0;
  uint32_t _seq = 0;
};
