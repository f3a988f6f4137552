/*
  ==============================================================================
    Source/Core/ConfigManager.cpp
    Role: BridgeConfig snapshot + JSON persistence.
  ==============================================================================
*/
#include "ConfigManager.h"

BridgeConfig ConfigManager::snapshot() const {
  BridgeConfig c;
  c.tickRateHz = juce::jlimit(125.0, 1000.0, get<double>(ConfigKeys::tickRateHz, c.tickRateHz));
  c.deadzoneFraction =
      juce::jlimit(0.0f, 0.45f, get<float>(ConfigKeys::deadzoneFraction, c.deadzoneFraction));
  c.rangeMarginFraction =
      juce::jlimit(0.0f, 0.2f, get<float>(ConfigKeys::rangeMarginFraction, c.rangeMarginFraction));
  c.minMovementFraction =
      juce::jlimit(0.0f, 1.0f, get<float>(ConfigKeys::minMovementFraction, c.minMovementFraction));
  c.restCaptureMs = juce::jmax(0, get<int>(ConfigKeys::restCaptureMs, c.restCaptureMs));
  c.motionCaptureMs = juce::jmax(0, get<int>(ConfigKeys::motionCaptureMs, c.motionCaptureMs));
  c.reconnectGraceMs = juce::jmax(0, get<int>(ConfigKeys::reconnectGraceMs, c.reconnectGraceMs));
  c.ioRetryCount = juce::jlimit(0, 100, get<int>(ConfigKeys::ioRetryCount, c.ioRetryCount));
  c.effectSlots = juce::jlimit(1, 256, get<int>(ConfigKeys::effectSlots, c.effectSlots));
  c.effectWaitMs = juce::jlimit(1, 1000, get<int>(ConfigKeys::effectWaitMs, c.effectWaitMs));
  c.ffGain = juce::jlimit(0.0f, 1.0f, get<float>(ConfigKeys::ffGain, c.ffGain));
  c.dedicatedSteeringAxis = get<bool>(ConfigKeys::dedicatedSteeringAxis, c.dedicatedSteeringAxis);
  c.preferredDevice = get<juce::String>(ConfigKeys::preferredDevice, {}).trim();
  return c;
}

bool ConfigManager::loadFromFile(const juce::File &file) {
  if (!file.existsAsFile()) {
    if (onLog)
      onLog("No config at " + file.getFullPathName() + ", using defaults.", false);
    return true;
  }

  auto data = juce::JSON::parse(file.loadFileAsString());
  auto *obj = data.getDynamicObject();
  if (obj == nullptr) {
    if (onLog)
      onLog("Config file is invalid or corrupted: " + file.getFullPathName(), true);
    return false;
  }

  for (auto &prop : obj->getProperties())
    configTree.setProperty(prop.name, prop.value, nullptr);

  if (onLog)
    onLog("Config loaded: " + file.getFileName(), false);
  return true;
}

bool ConfigManager::saveToFile(const juce::File &file) const {
  auto *root = new juce::DynamicObject();
  for (int i = 0; i < configTree.getNumProperties(); ++i) {
    auto name = configTree.getPropertyName(i);
    root->setProperty(name, configTree.getProperty(name));
  }

  // Temp then move so an existing file is not truncated on failure
  juce::File parent = file.getParentDirectory();
  if (!parent.exists() && !parent.createDirectory()) {
    if (onLog)
      onLog("Could not create config folder. Check path or permissions.", true);
    return false;
  }
  juce::File tempFile = file.withFileExtension(".tmp");
  bool ok = tempFile.replaceWithText(juce::JSON::toString(juce::var(root))) &&
            tempFile.moveFileTo(file);
  if (onLog)
    onLog(ok ? "Config saved: " + file.getFileName()
             : "Config save failed. Check disk space or permissions.",
          !ok);
  return ok;
}

juce::File ConfigManager::getDefaultConfigFile() {
  return juce::File::getSpecialLocation(juce::File::userApplicationDataDirectory)
      .getChildFile("WheelBridge")
      .getChildFile("config.json");
}
