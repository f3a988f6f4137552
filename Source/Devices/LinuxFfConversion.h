/*
  ==============================================================================
    Source/Devices/LinuxFfConversion.h
    Role: NativeEffect <-> struct ff_effect. Shared by the evdev wheel backend
    (outbound) and the uinput virtual pad (inbound).
  ==============================================================================
*/
#pragma once

#include <juce_core/juce_core.h>

#if JUCE_LINUX
#include "DeviceTypes.h"
#include <cstring>
#include <linux/input.h>

inline bool isSupportedKernelEffect(__u16 type) {
  return type == FF_CONSTANT || type == FF_PERIODIC || type == FF_SPRING ||
         type == FF_DAMPER || type == FF_RAMP || type == FF_RUMBLE;
}

inline ff_effect toKernelEffect(const NativeEffect &e, int id) {
  ff_effect fx;
  std::memset(&fx, 0, sizeof(fx));
  fx.id = (__s16)id;
  fx.direction = e.direction;
  fx.replay.length = e.replayLength;
  fx.replay.delay = e.replayDelay;

  ff_envelope env;
  env.attack_length = e.attackLength;
  env.attack_level = e.attackLevel;
  env.fade_length = e.fadeLength;
  env.fade_level = e.fadeLevel;

  switch (e.type) {
  case NativeEffectType::Constant:
    fx.type = FF_CONSTANT;
    fx.u.constant.level = e.level;
    fx.u.constant.envelope = env;
    break;
  case NativeEffectType::Periodic: {
    fx.type = FF_PERIODIC;
    static const __u16 waveforms[] = {FF_SINE, FF_SQUARE, FF_TRIANGLE, FF_SAW_UP, FF_SAW_DOWN};
    fx.u.periodic.waveform = waveforms[(int)e.waveform];
    fx.u.periodic.period = e.period;
    fx.u.periodic.magnitude = e.level;
    fx.u.periodic.offset = e.offset;
    fx.u.periodic.envelope = env;
    break;
  }
  case NativeEffectType::Spring:
  case NativeEffectType::Damper:
    fx.type = e.type == NativeEffectType::Spring ? FF_SPRING : FF_DAMPER;
    for (auto &c : fx.u.condition) {
      c.right_saturation = e.saturation;
      c.left_saturation = e.saturation;
      c.right_coeff = e.level;
      c.left_coeff = e.level;
      c.deadband = e.deadband;
      c.center = e.center;
    }
    break;
  case NativeEffectType::Ramp:
    fx.type = FF_RAMP;
    fx.u.ramp.start_level = e.level;
    fx.u.ramp.end_level = e.endLevel;
    fx.u.ramp.envelope = env;
    break;
  case NativeEffectType::Rumble:
    fx.type = FF_RUMBLE;
    fx.u.rumble.strong_magnitude = e.strongMagnitude;
    fx.u.rumble.weak_magnitude = e.weakMagnitude;
    break;
  }
  return fx;
}

/** Caller checks isSupportedKernelEffect first. Asymmetric conditions use the right side. */
inline NativeEffect fromKernelEffect(const ff_effect &fx) {
  NativeEffect e;
  e.direction = fx.direction;
  e.replayLength = fx.replay.length;
  e.replayDelay = fx.replay.delay;

  auto takeEnvelope = [&e](const ff_envelope &env) {
    e.attackLength = env.attack_length;
    e.attackLevel = env.attack_level;
    e.fadeLength = env.fade_length;
    e.fadeLevel = env.fade_level;
  };

  switch (fx.type) {
  case FF_CONSTANT:
    e.type = NativeEffectType::Constant;
    e.level = fx.u.constant.level;
    takeEnvelope(fx.u.constant.envelope);
    break;
  case FF_PERIODIC:
    e.type = NativeEffectType::Periodic;
    switch (fx.u.periodic.waveform) {
    case FF_SQUARE:   e.waveform = Waveform::Square; break;
    case FF_TRIANGLE: e.waveform = Waveform::Triangle; break;
    case FF_SAW_UP:   e.waveform = Waveform::SawUp; break;
    case FF_SAW_DOWN: e.waveform = Waveform::SawDown; break;
    default:          e.waveform = Waveform::Sine; break;
    }
    e.period = fx.u.periodic.period;
    e.level = fx.u.periodic.magnitude;
    e.offset = fx.u.periodic.offset;
    takeEnvelope(fx.u.periodic.envelope);
    break;
  case FF_SPRING:
  case FF_DAMPER:
    e.type = fx.type == FF_SPRING ? NativeEffectType::Spring : NativeEffectType::Damper;
    e.level = fx.u.condition[0].right_coeff;
    e.saturation = fx.u.condition[0].right_saturation;
    e.deadband = fx.u.condition[0].deadband;
    e.center = fx.u.condition[0].center;
    break;
  case FF_RAMP:
    e.type = NativeEffectType::Ramp;
    e.level = fx.u.ramp.start_level;
    e.endLevel = fx.u.ramp.end_level;
    takeEnvelope(fx.u.ramp.envelope);
    break;
  case FF_RUMBLE:
  default:
    e.type = NativeEffectType::Rumble;
    e.strongMagnitude = fx.u.rumble.strong_magnitude;
    e.weakMagnitude = fx.u.rumble.weak_magnitude;
    break;
  }
  return e;
}
#endif
