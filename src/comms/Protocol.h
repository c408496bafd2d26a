#pragma once
#include <stddef.h>

#include "comms/Messages.h"

/*
===============================================================================
  Protocol.h
===============================================================================

  PURPOSE
  -------
  Encode helper for the robot -> serial monitor telemetry stream.

  Wire format:
    - Newline-delimited JSON (one object per line), type="telemetry"
===============================================================================
*/

namespace protocol {

/*
  Writes one telemetry JSON line (includes trailing '\n', NUL terminated).

  Returns:
    - number of bytes written, excluding the NUL
    - 0 if the line did not fit in out_len (nothing usable is written)
*/
size_t encodeTelemetryLine(const TelemetryFrame& t, char* out, size_t out_len);

}  // namespace protocol
