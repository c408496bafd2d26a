#pragma once
#include <Arduino.h>

/*
  Pins.h

  Purpose:
  Central location for all Pico W pin assignments for the 4WD robot.
  Keeps hardware mapping explicit, readable, and easy to modify.

  Board:
  Raspberry Pi Pico W (numbers are GPxx, not physical pin numbers)

  Notes:
  - Motor drivers are dual H-bridges with only IN1..IN4 wired.
    The enable pins are tied high, so motors run at full speed when on.
  - IN1 HIGH / IN2 LOW = forward, IN1 LOW / IN2 HIGH = reverse,
    both LOW = coast
*/

/* ============================================================================
   H-BRIDGE DIRECTION PINS
============================================================================ */

// Front left
constexpr uint8_t PIN_FRONT_LEFT_IN1  = 8;
constexpr uint8_t PIN_FRONT_LEFT_IN2  = 9;

// Front right
constexpr uint8_t PIN_FRONT_RIGHT_IN3 = 11;
constexpr uint8_t PIN_FRONT_RIGHT_IN4 = 12;

// Rear left
constexpr uint8_t PIN_REAR_LEFT_IN1   = 5;
constexpr uint8_t PIN_REAR_LEFT_IN2   = 6;

// Rear right
constexpr uint8_t PIN_REAR_RIGHT_IN3  = 2;
constexpr uint8_t PIN_REAR_RIGHT_IN4  = 3;

/* ============================================================================
   ULTRASONIC DISTANCE SENSOR (HC-SR04)
============================================================================ */

constexpr uint8_t PIN_ULTRASONIC_TRIG = 14;
constexpr uint8_t PIN_ULTRASONIC_ECHO = 15;

/* ============================================================================
   STATUS LED
============================================================================ */

// On-board LED (routed through the CYW43 radio on the Pico W)
constexpr uint8_t PIN_STATUS_LED = LED_BUILTIN;

/* ============================================================================
   SERIAL INTERFACES
============================================================================ */

// USB Serial (Thonny / serial monitor)
#define SERIAL_USB Serial
