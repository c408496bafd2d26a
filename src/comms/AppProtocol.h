#pragma once
#include <stddef.h>

#include "comms/Messages.h"

/*
===============================================================================
  AppProtocol.h
===============================================================================

  PURPOSE
  -------
  Decode/format helpers for the Freenove app text protocol.

  Wire format:
    - One request per line, '\n' terminated
    - One reply line per request: "OK", "ERROR", "SONIC:<cm>",
      "STATUS:OK,DISTANCE:<cm>"
===============================================================================
*/

namespace app_protocol {

/*
  Attempts to decode one request line (no trailing newline).

  Returns:
    - true if decoded into out_req (and out_req.valid will be true)
    - false for unknown requests and malformed motor values
*/
bool decodeRequestLine(const char* line, AppRequest& out_req);

// "SONIC:<cm>" with cm truncated to an integer
void formatDistanceReply(int distance_cm, char* out, size_t out_len);

// "STATUS:OK,DISTANCE:<cm>"
void formatStatusReply(int distance_cm, char* out, size_t out_len);

}  // namespace app_protocol
