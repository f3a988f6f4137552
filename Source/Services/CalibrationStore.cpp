#include "CalibrationStore.h"

CalibrationStore::CalibrationStore() {
  storeFile = juce::File::getSpecialLocation(juce::File::userApplicationDataDirectory)
                  .getChildFile("WheelBridge")
                  .getChildFile("calibrations.json");
}

juce::var CalibrationStore::readAll() const {
  if (!storeFile.existsAsFile())
    return juce::var(new juce::DynamicObject());

  auto data = juce::JSON::parse(storeFile.loadFileAsString());
  if (data.getDynamicObject() == nullptr) {
    if (onLog)
      onLog("Calibration file is invalid or corrupted; starting fresh: " +
                storeFile.getFullPathName(),
            true);
    return juce::var(new juce::DynamicObject());
  }
  return data;
}

bool CalibrationStore::writeAll(const juce::var &root) {
  juce::File parent = storeFile.getParentDirectory();
  if (!parent.exists() && !parent.createDirectory()) {
    if (onLog)
      onLog("Could not create calibration folder. Check path or permissions.", true);
    return false;
  }
  juce::File tempFile = storeFile.withFileExtension(".tmp");
  bool ok = tempFile.replaceWithText(juce::JSON::toString(root)) && tempFile.moveFileTo(storeFile);
  if (!ok && onLog)
    onLog("Calibration save failed. Check disk space or permissions.", true);
  return ok;
}

bool CalibrationStore::load(const DeviceIdentity &device, CalibrationProfile &out) const {
  const juce::ScopedLock sl(fileLock);
  auto root = readAll();
  auto entry = root.getProperty(juce::Identifier(device.getModelKey()), juce::var());
  if (entry.isVoid())
    return false;

  CalibrationProfile p;
  if (!CalibrationProfile::fromVar(entry, p) || !p.device.sameModel(device)) {
    if (onLog)
      onLog("Stored calibration for " + device.getModelKey() + " is unusable; recalibrate.", true);
    return false;
  }
  p.device.path = device.path;
  out = std::move(p);
  return true;
}

bool CalibrationStore::save(const CalibrationProfile &profile) {
  const juce::ScopedLock sl(fileLock);
  auto root = readAll();
  root.getDynamicObject()->setProperty(juce::Identifier(profile.device.getModelKey()),
                                       profile.toVar());
  bool ok = writeAll(root);
  if (ok && onLog)
    onLog("Calibration saved for " + profile.device.getModelKey(), false);
  return ok;
}

bool CalibrationStore::remove(const DeviceIdentity &device) {
  const juce::ScopedLock sl(fileLock);
  auto root = readAll();
  auto *obj = root.getDynamicObject();
  const juce::Identifier key(device.getModelKey());
  if (!obj->hasProperty(key))
    return false;
  obj->removeProperty(key);
  return writeAll(root);
}

juce::StringArray CalibrationStore::getStoredModels() const {
  const juce::ScopedLock sl(fileLock);
  juce::StringArray models;
  auto root = readAll();
  for (auto &prop : root.getDynamicObject()->getProperties())
    models.add(prop.name.toString());
  return models;
}
