/*
  ==============================================================================
    Source/Core/ConfigManager.h
    Role: Central config access over ValueTree (single place for get/set/listener).
    Persists to JSON and produces the immutable BridgeConfig snapshot.
  ==============================================================================
*/
#pragma once

#include "BridgeSettings.h"
#include <functional>
#include <map>
#include <juce_core/juce_core.h>
#include <juce_data_structures/juce_data_structures.h>

namespace ConfigKeys {
static const juce::Identifier root{"WheelBridgeConfig"};
static const juce::Identifier tickRateHz{"tickRateHz"};
static const juce::Identifier deadzoneFraction{"deadzoneFraction"};
static const juce::Identifier rangeMarginFraction{"rangeMarginFraction"};
static const juce::Identifier minMovementFraction{"minMovementFraction"};
static const juce::Identifier restCaptureMs{"restCaptureMs"};
static const juce::Identifier motionCaptureMs{"motionCaptureMs"};
static const juce::Identifier reconnectGraceMs{"reconnectGraceMs"};
static const juce::Identifier ioRetryCount{"ioRetryCount"};
static const juce::Identifier effectSlots{"effectSlots"};
static const juce::Identifier effectWaitMs{"effectWaitMs"};
static const juce::Identifier ffGain{"ffGain"};
static const juce::Identifier dedicatedSteeringAxis{"dedicatedSteeringAxis"};
static const juce::Identifier preferredDevice{"preferredDevice"};
static const juce::Identifier logLevel{"logLevel"};
} // namespace ConfigKeys

class ConfigManager : public juce::ValueTree::Listener {
public:
  ConfigManager() : configTree(ConfigKeys::root) { configTree.addListener(this); }

  ~ConfigManager() override { configTree.removeListener(this); }

  void valueTreePropertyChanged(juce::ValueTree &tree,
                                const juce::Identifier &id) override {
    juce::ignoreUnused(tree);
    auto it = listeners.find(id);
    if (it != listeners.end() && it->second)
      it->second(configTree.getProperty(id));
  }

  template <typename T> T get(const juce::Identifier &key, T defaultVal) const {
    auto v = configTree.getProperty(key);
    if (v.isVoid())
      return defaultVal;
    if constexpr (std::is_same_v<T, int>)
      return static_cast<int>(v);
    else if constexpr (std::is_same_v<T, double>)
      return static_cast<double>(v);
    else if constexpr (std::is_same_v<T, float>)
      return static_cast<float>(static_cast<double>(v));
    else if constexpr (std::is_same_v<T, bool>)
      return static_cast<bool>(v);
    else if constexpr (std::is_same_v<T, juce::String>)
      return v.toString();
    return defaultVal;
  }

  template <typename T> void set(const juce::Identifier &key, T value) {
    configTree.setProperty(key, value, nullptr);
  }

  void addListener(const juce::Identifier &key,
                   std::function<void(const juce::var &)> onChange) {
    listeners[key] = std::move(onChange);
  }

  void removeListener(const juce::Identifier &key) { listeners.erase(key); }

  /** Values clamped to their legal ranges. */
  BridgeConfig snapshot() const;

  /** Missing file is not an error: defaults stay in place. */
  bool loadFromFile(const juce::File &file);
  bool saveToFile(const juce::File &file) const;

  static juce::File getDefaultConfigFile();

  juce::ValueTree &getTree() { return configTree; }
  const juce::ValueTree &getTree() const { return configTree; }

  std::function<void(const juce::String &, bool isError)> onLog;

private:
  juce::ValueTree configTree;
  std::map<juce::Identifier, std::function<void(const juce::var &)>> listeners;

  JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(ConfigManager)
};
