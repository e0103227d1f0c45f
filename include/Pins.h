#pragma once
#include <stdint.h>

/*
  Pins.h

  Purpose:
  Central location for all GPIO assignments of the mecanum rover.
  Keeps hardware mapping explicit, readable, and easy to modify.

  Board:
  Raspberry Pi 4 (40-pin header), BCM numbering on gpiochip0

  Notes:
  - Each wheel goes through one L298N channel: IN_A/IN_B = direction, EN = PWM
  - EN jumpers must be removed on the L298N boards, otherwise speed is fixed
  - Ultrasonic ECHO is 5V on the HC-SR04, use a divider down to 3.3V
*/

/* ============================================================================
   L298N MOTOR DRIVER PINS
   IN_A / IN_B = Direction
   EN          = PWM (software PWM)
============================================================================ */

// Left Front Wheel
constexpr uint8_t PIN_LF_IN_A = 18;   // IN1
constexpr uint8_t PIN_LF_IN_B = 23;   // IN2
constexpr uint8_t PIN_LF_EN   = 6;    // ENA (board 1)

// Left Back Wheel
constexpr uint8_t PIN_LB_IN_A = 24;   // IN3
constexpr uint8_t PIN_LB_IN_B = 25;   // IN4
constexpr uint8_t PIN_LB_EN   = 13;   // ENB (board 1)

// Right Front Wheel
constexpr uint8_t PIN_RF_IN_A = 12;   // IN5
constexpr uint8_t PIN_RF_IN_B = 16;   // IN6
constexpr uint8_t PIN_RF_EN   = 26;   // ENB (board 2)

// Right Back Wheel
constexpr uint8_t PIN_RB_IN_A = 20;   // IN7
constexpr uint8_t PIN_RB_IN_B = 21;   // IN8
constexpr uint8_t PIN_RB_EN   = 19;   // ENA (board 2)

/* ============================================================================
   ULTRASONIC DISTANCE SENSOR (HC-SR04)
============================================================================ */

constexpr uint8_t PIN_ULTRASONIC_TRIG = 4;
constexpr uint8_t PIN_ULTRASONIC_ECHO = 17;

/* ============================================================================
   GPIO CHIP
============================================================================ */

// Character device exposing the 40-pin header lines
#define GPIO_CHIP_NAME "gpiochip0"
