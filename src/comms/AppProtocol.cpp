#include "comms/AppProtocol.h"

#include <ctype.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

/*
===============================================================================
  AppProtocol.cpp
===============================================================================

  Requests understood (checked in this order):
    - "M#<left>#<right>#"  joystick values, integers, clamped to -100..100
    - "C#<mode>#"          control mode; mode 3 asks for the distance
    - *SONIC* / *DISTANCE* / *SONAR* (any case)  distance query
    - *STATUS* (any case)  status query

  Everything else is UNKNOWN and the caller answers "ERROR".
===============================================================================
*/


/*=============================================================================
  SMALL HELPERS
=============================================================================*/

// Parses [begin, end) as a base 10 integer, surrounding spaces allowed
static bool parseIntField(const char* begin, const char* end, long& out) {
  while (begin < end && isspace((unsigned char)*begin)) begin++;
  while (end > begin && isspace((unsigned char)end[-1])) end--;
  if (begin == end) return false;

  char buf[32];
  const size_t n = (size_t)(end - begin);
  if (n >= sizeof(buf)) return false;

  memcpy(buf, begin, n);
  buf[n] = '\0';

  char* stop = nullptr;
  const long v = strtol(buf, &stop, 10);
  if (stop == buf || *stop != '\0') return false;

  out = v;
  return true;
}

static int clampJoystick(long v) {
  if (v > 100) return 100;
  if (v < -100) return -100;
  return (int)v;
}

// Case-insensitive substring search for an upper case keyword
static bool containsKeyword(const char* line, const char* keyword) {
  const size_t klen = strlen(keyword);
  for (const char* p = line; *p; ++p) {
    size_t i = 0;
    while (i < klen && p[i] && toupper((unsigned char)p[i]) == keyword[i]) i++;
    if (i == klen) return true;
  }
  return false;
}

static bool decodeMotor(const char* line, AppRequest& out_req) {
  // Body between the "M#" prefix and any trailing '#'
  const char* begin = line + 2;
  const char* end = line + strlen(line);
  while (begin < end && *begin == '#') begin++;
  while (end > begin && end[-1] == '#') end--;

  const char* sep = (const char*)memchr(begin, '#', (size_t)(end - begin));
  if (!sep) return false;

  const char* second_end = (const char*)memchr(sep + 1, '#', (size_t)(end - (sep + 1)));
  if (!second_end) second_end = end;

  long left = 0;
  long right = 0;
  if (!parseIntField(begin, sep, left)) return false;
  if (!parseIntField(sep + 1, second_end, right)) return false;

  out_req.type = AppRequestType::MOTOR;
  out_req.left = clampJoystick(left);
  out_req.right = clampJoystick(right);
  return true;
}

static void decodeControl(const char* line, AppRequest& out_req) {
  const char* begin = line + 2;
  const char* end = strchr(begin, '#');
  if (!end) end = begin + strlen(begin);

  long mode = -1;
  if (!parseIntField(begin, end, mode)) mode = -1;

  out_req.type = AppRequestType::CONTROL;
  out_req.control_mode = (int)mode;
}


namespace app_protocol {

/*=============================================================================
  DECODE (Phone -> Robot)
=============================================================================*/

bool decodeRequestLine(const char* line, AppRequest& out_req) {
  out_req = AppRequest();   // reset everything
  if (!line || line[0] == '\0') return false;

  if (strncmp(line, "M#", 2) == 0) {
    if (!decodeMotor(line, out_req)) return false;
  } else if (strncmp(line, "C#", 2) == 0) {
    decodeControl(line, out_req);
  } else if (containsKeyword(line, "SONIC") ||
             containsKeyword(line, "DISTANCE") ||
             containsKeyword(line, "SONAR")) {
    out_req.type = AppRequestType::DISTANCE_QUERY;
  } else if (containsKeyword(line, "STATUS")) {
    out_req.type = AppRequestType::STATUS_QUERY;
  } else {
    return false;
  }

  out_req.valid = true;
  return true;
}


/*=============================================================================
  REPLIES (Robot -> Phone)
=============================================================================*/

void formatDistanceReply(int distance_cm, char* out, size_t out_len) {
  snprintf(out, out_len, "SONIC:%d", distance_cm);
}

void formatStatusReply(int distance_cm, char* out, size_t out_len) {
  snprintf(out, out_len, "STATUS:OK,DISTANCE:%d", distance_cm);
}

}  // namespace app_protocol
