/*
  ==============================================================================
    Source/Services/ForceFeedbackTranslator.h
    Role: Applies host EffectEvents to the wheel. Upload -> upload + play,
    Update -> updateEffect on the same native handle, Stop -> stop + free,
    host Disconnected -> stop and free everything.
    Owned and called by the effect-forwarding thread only.
  ==============================================================================
*/
#pragma once
#include "../Core/BridgeResult.h"
#include "../Devices/VirtualGamepad.h"
#include "EffectSlotTable.h"

class ScopedDevice;

class ForceFeedbackTranslator {
public:
  ForceFeedbackTranslator(int capacity, float gain);
  ~ForceFeedbackTranslator();

  /**
    Starts driving a (re)opened wheel. Effects the host started while no
    wheel was attached are uploaded and played now.
  */
  void attachDevice(ScopedDevice *device);

  /** Stops and frees every effect on the current wheel, then forgets it. */
  void detachDevice();

  bool hasDevice() const { return device != nullptr; }

  /**
    ResourceExhausted when a new id finds no free slot (no other effect is
    touched). Unsupported when the wheel rejects the effect type.
  */
  BridgeResult handleEvent(const EffectEvent &event);

  /** Stop + release every outstanding effect. Best effort, never fails. */
  void releaseAll();

  int getActiveCount() const { return table.size(); }
  int getCapacity() const { return table.capacity(); }

  /** Set once the host has released the virtual pad. */
  bool wasReleasedByHost() const { return hostReleased; }

  /** Looks up the current command for an id (tests, status). */
  const EffectSlotTable::Entry *findEffect(int effectId) { return table.find(effectId); }

private:
  BridgeResult start(const EffectEvent &event, const EffectCommand &command);
  BridgeResult update(int effectId, const EffectCommand &command);
  BridgeResult stop(int effectId);
  BridgeResult pushToWheel(EffectSlotTable::Entry &entry);
  void freeNative(EffectSlotTable::Entry &entry);

  EffectSlotTable table;
  float gain;
  ScopedDevice *device = nullptr;
  bool hostReleased = false;

  JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(ForceFeedbackTranslator)
};
