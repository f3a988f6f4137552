/*
  ==============================================================================
    Source/Services/InputTranslator.h
    Role: One raw wheel sample + calibration profile -> one GamepadState.
    Pure function of its inputs; called once per polling tick.
  ==============================================================================
*/
#pragma once
#include "../Devices/GamepadState.h"
#include "CalibrationProfile.h"

class InputTranslator {
public:
  static GamepadState translate(const RawSample &sample, const CalibrationProfile &profile,
                                bool dedicatedSteering);
};
