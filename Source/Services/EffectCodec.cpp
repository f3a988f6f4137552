#include "EffectCodec.h"
#include <cmath>

double EffectCodec::directionToDegrees(uint16_t direction) {
  return (double)direction * 360.0 / 65536.0;
}

uint16_t EffectCodec::degreesToDirection(double degrees) {
  double d = std::fmod(degrees, 360.0);
  if (d < 0.0)
    d += 360.0;
  return (uint16_t)((long)std::lround(d * 65536.0 / 360.0) & 0xffff);
}

float EffectCodec::levelToNormalized(int level) {
  return juce::jlimit(-1.0f, 1.0f, (float)level / 32767.0f);
}

int16_t EffectCodec::normalizedToLevel(float value) {
  return (int16_t)juce::roundToInt(juce::jlimit(-1.0f, 1.0f, value) * 32767.0f);
}

float EffectCodec::fractionFromU16(uint16_t value) { return (float)value / 65535.0f; }

uint16_t EffectCodec::fractionToU16(float value) {
  return (uint16_t)juce::roundToInt(juce::jlimit(0.0f, 1.0f, value) * 65535.0f);
}

namespace {
EffectCommand rumbleCommand(float strong, float weak) {
  EffectCommand c;
  if (strong <= 0.0f && weak <= 0.0f) {
    c.kind = EffectKind::Stop;
    return c;
  }
  c.kind = EffectKind::ConstantForce;
  c.magnitude = juce::jlimit(-1.0f, 1.0f, strong - weak);
  c.directionDeg = EffectCodec::rumbleDirectionDeg;
  return c;
}
} // namespace

EffectCommand EffectCodec::decode(const BackendEffectParams &params) {
  if (params.format == BackendEffectParams::Format::XInputRumble)
    return rumbleCommand(params.largeMotor / 255.0f, params.smallMotor / 255.0f);

  const NativeEffect &n = params.native;
  if (n.type == NativeEffectType::Rumble)
    return rumbleCommand(fractionFromU16(n.strongMagnitude), fractionFromU16(n.weakMagnitude));

  EffectCommand c;
  c.directionDeg = directionToDegrees(n.direction);
  c.magnitude = levelToNormalized(n.level);
  c.delayMs = n.replayDelay;
  if (n.replayLength != 0)
    c.durationMs = (int)n.replayLength;

  switch (n.type) {
  case NativeEffectType::Constant:
    c.kind = EffectKind::ConstantForce;
    break;
  case NativeEffectType::Periodic:
    c.kind = EffectKind::Periodic;
    c.waveform = n.waveform;
    c.periodMs = n.period;
    c.offset = levelToNormalized(n.offset);
    break;
  case NativeEffectType::Spring:
  case NativeEffectType::Damper:
    c.kind = EffectKind::Spring;
    c.damper = n.type == NativeEffectType::Damper;
    c.saturation = fractionFromU16(n.saturation);
    c.deadband = fractionFromU16(n.deadband);
    c.center = levelToNormalized(n.center);
    break;
  case NativeEffectType::Ramp:
    c.kind = EffectKind::Ramp;
    c.endMagnitude = levelToNormalized(n.endLevel);
    break;
  case NativeEffectType::Rumble:
    break;
  }

  // Conditions carry no envelope
  if (n.hasEnvelope() && c.kind != EffectKind::Spring) {
    EffectEnvelope env;
    env.attackMs = n.attackLength;
    env.attackLevel = fractionFromU16((uint16_t)juce::jmin(0xffff, n.attackLevel * 2));
    env.sustainLevel = std::abs(c.magnitude);
    env.releaseMs = n.fadeLength;
    env.releaseLevel = fractionFromU16((uint16_t)juce::jmin(0xffff, n.fadeLevel * 2));
    c.envelope = env;
  }
  return c;
}

bool EffectCodec::encode(const EffectCommand &command, float gain, NativeEffect &out) {
  if (command.kind == EffectKind::Stop)
    return false;

  const float g = juce::jlimit(0.0f, 1.0f, gain);
  NativeEffect n;
  n.direction = degreesToDirection(command.directionDeg);
  n.level = normalizedToLevel(command.magnitude * g);
  n.replayDelay = (uint16_t)juce::jlimit(0, 0xffff, command.delayMs);
  n.replayLength = command.durationMs ? (uint16_t)juce::jlimit(1, 0xffff, *command.durationMs) : 0;

  switch (command.kind) {
  case EffectKind::ConstantForce:
    n.type = NativeEffectType::Constant;
    break;
  case EffectKind::Periodic:
    n.type = NativeEffectType::Periodic;
    n.waveform = command.waveform;
    n.period = (uint16_t)juce::jlimit(0, 0xffff, command.periodMs);
    n.offset = normalizedToLevel(command.offset * g);
    break;
  case EffectKind::Spring:
    n.type = command.damper ? NativeEffectType::Damper : NativeEffectType::Spring;
    n.saturation = fractionToU16(command.saturation);
    n.deadband = fractionToU16(command.deadband);
    n.center = normalizedToLevel(command.center);
    break;
  case EffectKind::Ramp:
    n.type = NativeEffectType::Ramp;
    n.endLevel = normalizedToLevel(command.endMagnitude * g);
    break;
  case EffectKind::Stop:
    return false;
  }

  if (command.envelope && command.kind != EffectKind::Spring) {
    // Envelope levels are 0..0x7fff on the wire
    const auto &env = *command.envelope;
    n.attackLength = (uint16_t)juce::jlimit(0, 0xffff, env.attackMs);
    n.attackLevel = (uint16_t)(fractionToU16(env.attackLevel * g) / 2);
    n.fadeLength = (uint16_t)juce::jlimit(0, 0xffff, env.releaseMs);
    n.fadeLevel = (uint16_t)(fractionToU16(env.releaseLevel * g) / 2);
  }

  out = n;
  return true;
}
