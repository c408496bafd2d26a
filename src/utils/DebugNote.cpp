#include "utils/DebugNote.h"

#include <string.h>
#include <stdio.h>
#include <stdarg.h>

constexpr uint32_t DebugNote::HOLD_MS;
constexpr size_t DebugNote::MAX_LEN;

DebugNote::DebugNote() {
  memset(_buf, 0, sizeof(_buf));
}

void DebugNote::set(uint32_t now_ms, const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  vsnprintf(_buf, sizeof(_buf), fmt, args);
  va_end(args);

  _written_ms = now_ms;
  _seq++;
}

const char* DebugNote::get(uint32_t now_ms) const {
  if (_seq == 0) return nullptr;
  return ((now_ms - _written_ms) <= HOLD_MS) ? _buf : nullptr;
}

void DebugNote::clear() {
  memset(_buf, 0, sizeof(_buf));
  _written_ms = 0;
  _seq = 0;
}
