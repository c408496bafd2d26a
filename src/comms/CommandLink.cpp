#include "comms/CommandLink.h"

#include <ctype.h>
#include <string.h>

#include "comms/AppProtocol.h"

/*
===============================================================================
  CommandLink.cpp
===============================================================================

  Key behavior:
  - Ignores '\r'
  - '\n' ends a request; surrounding spaces are trimmed, empty lines ignored
  - If RX buffer would overflow, enters "dropping" mode until next '\n'
  - Every non-empty line gets exactly one reply
===============================================================================
*/

constexpr size_t CommandLink::RX_BUF_SIZE;

CommandLink::CommandLink(CommandSlot& slot,
                         const DistanceSensor& sensor,
                         const JoystickConfig& joystick)
: _slot(slot),
  _sensor(sensor),
  _mixer(joystick)
{
  memset(_rx_buf, 0, sizeof(_rx_buf));
}

void CommandLink::begin() {
  _rx_len = 0;
  _dropping = false;

  _has_cmd = false;
  _last_cmd_ms = 0;
  _latest_cmd = TankCommand();
  _mixer.reset();

  _lines = _ok = _fail = _ovf = 0;
  _max_len_seen = 0;

  memset(_rx_buf, 0, sizeof(_rx_buf));
  _note.clear();
}

void CommandLink::feed(const char* data, size_t len, uint32_t now_ms, ReplySink& reply) {
  for (size_t i = 0; i < len; ++i) {
    feed(data[i], now_ms, reply);
  }
}

void CommandLink::feed(char ch, uint32_t now_ms, ReplySink& reply) {
  if (ch == '\r') return;

  if (_dropping) {
    // We overflowed earlier; discard until newline to resync
    if (ch == '\n') {
      _dropping = false;
      _rx_len = 0;
    }
    return;
  }

  if (ch == '\n') {
    _rx_buf[_rx_len] = '\0';

    if (_rx_len > _max_len_seen) _max_len_seen = (uint16_t)_rx_len;

    handleLine_(now_ms, reply);

    _rx_len = 0;
    return;
  }

  // Append to buffer if there is room (leave space for '\0')
  if (_rx_len + 1 < RX_BUF_SIZE) {
    _rx_buf[_rx_len++] = ch;
    return;
  }

  // Buffer overflow: discard remainder until newline
  _ovf++;
  _dropping = true;

  _rx_buf[RX_BUF_SIZE - 1] = '\0';
  _note.set(now_ms, "RX OVERFLOW ovf=%lu len=%u head=%.24s",
            (unsigned long)_ovf,
            (unsigned)_rx_len,
            _rx_buf);

  _rx_len = 0;
  reply.sendLine("ERROR");
}

void CommandLink::onDisconnect(uint32_t now_ms) {
  _rx_len = 0;
  _dropping = false;
  _mixer.reset();

  _latest_cmd = TankCommand();
  _slot.publish(DriveCommand::STOP);

  _note.set(now_ms, "APP DISCONNECTED, stop published");
}

int CommandLink::distanceForReply_() const {
  const DistanceSensor::State& s = _sensor.getState();
  if (!s.has_reading) return 0;
  return (int)s.distance_cm;
}

void CommandLink::handleLine_(uint32_t now_ms, ReplySink& reply) {
  // Trim surrounding whitespace in place
  char* line = _rx_buf;
  while (*line && isspace((unsigned char)*line)) line++;
  size_t n = strlen(line);
  while (n > 0 && isspace((unsigned char)line[n - 1])) line[--n] = '\0';

  if (line[0] == '\0') return;

  _lines++;

  AppRequest req;
  if (!app_protocol::decodeRequestLine(line, req) || !req.valid) {
    _fail++;
    _note.set(now_ms, "RX FAIL (lines=%lu ok=%lu fail=%lu) head=%.24s",
              (unsigned long)_lines,
              (unsigned long)_ok,
              (unsigned long)_fail,
              line);
    reply.sendLine("ERROR");
    return;
  }

  _ok++;

  char out[48];

  switch (req.type) {
    case AppRequestType::MOTOR: {
      _latest_cmd = _mixer.mix(req.left, req.right);
      _has_cmd = true;
      _last_cmd_ms = now_ms;
      _slot.publish(_latest_cmd);
      reply.sendLine("OK");
      break;
    }

    case AppRequestType::CONTROL:
      if (req.control_mode == 3) {
        app_protocol::formatDistanceReply(distanceForReply_(), out, sizeof(out));
        reply.sendLine(out);
      } else {
        reply.sendLine("OK");
      }
      break;

    case AppRequestType::DISTANCE_QUERY:
      app_protocol::formatDistanceReply(distanceForReply_(), out, sizeof(out));
      reply.sendLine(out);
      break;

    case AppRequestType::STATUS_QUERY:
      app_protocol::formatStatusReply(distanceForReply_(), out, sizeof(out));
      reply.sendLine(out);
      break;

    case AppRequestType::UNKNOWN:
    default:
      reply.sendLine("ERROR");
      break;
  }
}
