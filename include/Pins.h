#pragma once

#include <cstdint>

/*
  Pins.h

  Purpose:
  Central location for every I/O channel the game reads or drives.
  Keeps the hardware mapping explicit, readable, and easy to modify.

  Notes:
  - Analog channels are ADC inputs on the I/O board (pressure pads)
  - Digital lines are IR beam breaks and panel buttons, active high
  - Servo ids are the indices the I/O board uses for its PWM outputs
*/

/* ============================================================================
   PRESSURE PADS (analog)
   Target n is read from analog channel PRESSURE_CHANNEL_FOR_TARGET[n - 1]
============================================================================ */

constexpr uint8_t NUM_PRESSURE_CHANNELS = 7;
constexpr uint8_t PRESSURE_CHANNEL_FOR_TARGET[NUM_PRESSURE_CHANNELS] = {0, 1, 2, 3, 4, 5, 6};

/* ============================================================================
   IR BEAMS + BUTTONS (digital)
============================================================================ */

constexpr uint8_t LINE_TARGET1_IR       = 0;  // confirms the two-stage target
constexpr uint8_t LINE_TUNNEL_IR        = 1;
constexpr uint8_t LINE_BALL_RETURN_IR   = 2;
constexpr uint8_t LINE_BTN_START        = 3;
constexpr uint8_t LINE_BTN_NEXT         = 4;
constexpr uint8_t LINE_BTN_LAUNCH       = 5;
constexpr uint8_t LINE_BTN_DISPENSE_RED = 6;
constexpr uint8_t LINE_BTN_DISPENSE_GRN = 7;

constexpr uint8_t NUM_DIGITAL_LINES = 8;

/* ============================================================================
   SERVOS
============================================================================ */

constexpr uint8_t SERVO_REVEAL       = 0;  // door over target 1 (auto-returns)
constexpr uint8_t SERVO_DOOR_RED     = 1;  // red keg door (auto-returns)
constexpr uint8_t SERVO_DOOR_GREEN   = 2;  // green keg door (auto-returns)
constexpr uint8_t SERVO_TUNNEL_FLAP  = 3;  // holds position

constexpr uint8_t NUM_SERVOS = 4;
