/*
  ==============================================================================
    Source/Services/EffectCodec.h
    Role: Unit conversion between backend effect parameters and EffectCommand.
    decode() normalizes whatever the host handed us; encode() produces the
    wheel's native 16-bit parameters, so the encode step never depends on
    which virtual pad backend produced the command.
  ==============================================================================
*/
#pragma once
#include "../Devices/VirtualGamepad.h"
#include "EffectCommand.h"

class EffectCodec {
public:
  static EffectCommand decode(const BackendEffectParams &params);

  /** False for Stop, which has no native form. gain scales every level. */
  static bool encode(const EffectCommand &command, float gain, NativeEffect &out);

  // 16-bit direction <-> degrees
  static double directionToDegrees(uint16_t direction);
  static uint16_t degreesToDirection(double degrees);

  // Signed levels (-0x7fff..0x7fff) and unsigned fractions (0..0xffff)
  static float levelToNormalized(int level);
  static int16_t normalizedToLevel(float value);
  static float fractionFromU16(uint16_t value);
  static uint16_t fractionToU16(float value);

  // Rumble decodes to a constant force towards +X (strong) or -X (weak)
  static constexpr double rumbleDirectionDeg = 270.0;
};
