/*
  ==============================================================================
    Source/Services/CalibrationStore.h
    Role: JSON persistence of calibration profiles, one per wheel model
    ("vvvv:pppp"), so a known wheel can skip calibration.
  ==============================================================================
*/
#pragma once
#include "CalibrationProfile.h"
#include <functional>
#include <juce_core/juce_core.h>

class CalibrationStore {
public:
  /** Default location: <userAppData>/WheelBridge/calibrations.json */
  CalibrationStore();
  explicit CalibrationStore(juce::File file) : storeFile(std::move(file)) {}

  /** False when no usable profile is stored for this model. */
  bool load(const DeviceIdentity &device, CalibrationProfile &out) const;

  /** Replaces any profile stored for the same model. */
  bool save(const CalibrationProfile &profile);

  bool remove(const DeviceIdentity &device);

  juce::StringArray getStoredModels() const;

  juce::File getFile() const { return storeFile; }

  std::function<void(juce::String, bool)> onLog;

private:
  juce::var readAll() const;
  bool writeAll(const juce::var &root);

  juce::File storeFile;
  mutable juce::CriticalSection fileLock;
};
