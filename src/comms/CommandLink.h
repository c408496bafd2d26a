#pragma once
#include <stdint.h>
#include <stddef.h>

#include "Params.h"
#include "comms/Messages.h"
#include "comms/TankMixer.h"
#include "control/CommandSlot.h"
#include "sensors/DistanceSensor.h"
#include "utils/DebugNote.h"

/*
===============================================================================
  CommandLink.h
===============================================================================

  PURPOSE
  -------
  Robot-side handler for the phone app byte stream:

    - Accumulate bytes into a newline-delimited line buffer
    - Decode each line (AppProtocol) and answer it through a ReplySink
    - Mix motor requests into a TankCommand and publish it to CommandSlot
    - Answer distance/status queries from the latest sensor state

  This is the only writer of the CommandSlot in remote mode. It never looks
  at ControlLoop; during an avoidance maneuver its commands are simply
  discarded on the other side of the slot.

  IMPORTANT
  ---------
  On RX buffer overflow, this class will DISCARD bytes until the next '\n'
  to resynchronize cleanly. This prevents "tail fragments" from being decoded.

===============================================================================
*/

// Where reply lines go (the TCP client in the firmware, a recorder in tests)
class ReplySink {
public:
  virtual ~ReplySink() {}

  // line has no trailing newline; the sink adds it
  virtual void sendLine(const char* line) = 0;
};

class CommandLink {
public:
  CommandLink(CommandSlot& slot,
              const DistanceSensor& sensor,
              const JoystickConfig& joystick = JoystickConfig());

  void begin();

  // Feed received bytes. Complete lines are handled immediately.
  void feed(char ch, uint32_t now_ms, ReplySink& reply);
  void feed(const char* data, size_t len, uint32_t now_ms, ReplySink& reply);

  // Client went away: drop the partial line and stop the robot
  void onDisconnect(uint32_t now_ms);

  // True if at least one motor request has been accepted since begin()
  bool hasCommand() const { return _has_cmd; }

  // Latest motor command published to the slot
  const TankCommand& latestCommand() const { return _latest_cmd; }
  uint32_t lastCommandMs() const { return _last_cmd_ms; }

  const DebugNote& note() const { return _note; }

  // RX stats
  uint32_t rxLines() const { return _lines; }
  uint32_t rxOk() const { return _ok; }
  uint32_t rxFail() const { return _fail; }
  uint32_t rxOverflow() const { return _ovf; }
  uint16_t rxMaxLenSeen() const { return _max_len_seen; }

private:
  void handleLine_(uint32_t now_ms, ReplySink& reply);
  int distanceForReply_() const;

  CommandSlot& _slot;
  const DistanceSensor& _sensor;
  TankMixer _mixer;

  static constexpr size_t RX_BUF_SIZE = APP_LINE_BUFFER_BYTES;
  char _rx_buf[RX_BUF_SIZE];
  size_t _rx_len = 0;

  // When true, we are discarding bytes until newline due to overflow
  bool _dropping = false;

  TankCommand _latest_cmd;
  bool _has_cmd = false;
  uint32_t _last_cmd_ms = 0;

  // RX debug stats
  uint32_t _lines = 0;
  uint32_t _ok = 0;
  uint32_t _fail = 0;
  uint32_t _ovf = 0;
  uint16_t _max_len_seen = 0;

  DebugNote _note;
};
