#include "InputTranslator.h"
#include "GamepadLayout.h"

GamepadState InputTranslator::translate(const RawSample &sample,
                                        const CalibrationProfile &profile,
                                        bool dedicatedSteering) {
  GamepadState state;
  state.frame = sample.sequence;

  const size_t numAxes = juce::jmin(profile.axes.size(), (size_t)sample.numAxes);
  for (size_t i = 0; i < numAxes; ++i) {
    const auto &cal = profile.axes[i];
    const int target = GamepadLayout::axisForRole(cal.role, dedicatedSteering);
    if (target < 0)
      continue;
    const int32_t raw = sample.axes[i];
    state.axes[(size_t)target] = isPedalRole(cal.role) ? normalizePedal(cal, raw)
                                                       : normalizeAxis(cal, raw);
  }

  for (int i = 0; i < kMaxButtons; ++i) {
    if (!sample.buttons[(size_t)i])
      continue;
    if (i == profile.shiftUpButton)
      state.setButton(GamepadLayout::shiftUpTarget, true);
    else if (i == profile.shiftDownButton)
      state.setButton(GamepadLayout::shiftDownTarget, true);
    else
      state.setButton(GamepadLayout::passThroughButton(i), true);
  }
  return state;
}
