#pragma once

#include <stdint.h>
#include <atomic>

#include "control/DriveTypes.h"

/*
===============================================================================
  CommandSlot.h
===============================================================================

  PURPOSE
  -------
  The single "latest remote command" cell between a command source (app
  link or behavior sequencer) and ControlLoop.

    - Exactly one writer calls publish(), exactly one reader calls take()
    - Last write wins; nothing is queued
    - take() empties the slot, so each command is seen at most once

  The whole command packs into one byte, so the cell is a plain lock-free
  atomic and neither side ever blocks.
===============================================================================
*/

class CommandSlot {
public:
  CommandSlot() : _cell(EMPTY) {}

  void publish(const TankCommand& cmd) {
    _cell.store(encode_(cmd), std::memory_order_release);
    _published.fetch_add(1, std::memory_order_relaxed);
  }

  void publish(DriveCommand cmd) { publish(toTank(cmd)); }

  // Moves the pending command into out. Returns false if nothing is pending.
  bool take(TankCommand& out) {
    const uint8_t v = _cell.exchange(EMPTY, std::memory_order_acquire);
    if (v == EMPTY) return false;
    out = decode_(v);
    return true;
  }

  // Empties the slot. Returns true if a command was thrown away.
  bool discard() {
    return _cell.exchange(EMPTY, std::memory_order_acquire) != EMPTY;
  }

  bool pending() const { return _cell.load(std::memory_order_acquire) != EMPTY; }

  uint32_t publishedCount() const { return _published.load(std::memory_order_relaxed); }

private:
  static constexpr uint8_t EMPTY = 0x00;
  static constexpr uint8_t PRESENT = 0x80;

  // bits 0-1 left, bits 2-3 right: 0 = OFF, 1 = FORWARD, 2 = REVERSE
  static uint8_t sideBits_(SideDirection d) {
    if (d == SideDirection::FORWARD) return 1;
    if (d == SideDirection::REVERSE) return 2;
    return 0;
  }

  static SideDirection sideFromBits_(uint8_t b) {
    if (b == 1) return SideDirection::FORWARD;
    if (b == 2) return SideDirection::REVERSE;
    return SideDirection::OFF;
  }

  static uint8_t encode_(const TankCommand& cmd) {
    return (uint8_t)(PRESENT | sideBits_(cmd.left) | (sideBits_(cmd.right) << 2));
  }

  static TankCommand decode_(uint8_t v) {
    return TankCommand(sideFromBits_(v & 0x03), sideFromBits_((v >> 2) & 0x03));
  }

  std::atomic<uint8_t> _cell;
  std::atomic<uint32_t> _published{0};
};
