#include "ForceFeedbackTranslator.h"
#include "../Core/LogService.h"
#include "../Devices/DeviceBackend.h"
#include "EffectCodec.h"

ForceFeedbackTranslator::ForceFeedbackTranslator(int capacity, float g)
    : table(capacity), gain(juce::jlimit(0.0f, 1.0f, g)) {}

ForceFeedbackTranslator::~ForceFeedbackTranslator() { releaseAll(); }

void ForceFeedbackTranslator::attachDevice(ScopedDevice *d) {
  device = d;
  if (device == nullptr)
    return;

  std::vector<int> failed;
  int started = 0;
  table.forEach([&](EffectSlotTable::Entry &e) {
    if (e.native != kInvalidHandle)
      return;
    auto r = pushToWheel(e);
    if (r.wasOk())
      ++started;
    else {
      LogService::instance().warning("Effect " + juce::String(e.effectId) +
                                     " could not be restored: " + r.describe());
      failed.push_back(e.effectId);
    }
  });
  for (int id : failed)
    table.release(id);

  if (started > 0)
    LogService::instance().info("Restored " + juce::String(started) + " pending effect(s) on wheel");
}

void ForceFeedbackTranslator::detachDevice() {
  releaseAll();
  device = nullptr;
}

BridgeResult ForceFeedbackTranslator::handleEvent(const EffectEvent &event) {
  switch (event.type) {
  case EffectEvent::Type::Disconnected:
    LogService::instance().info("Host released the virtual pad, stopping all effects");
    releaseAll();
    hostReleased = true;
    return BridgeResult::ok();

  case EffectEvent::Type::Stop:
    return stop(event.effectId);

  case EffectEvent::Type::Upload:
  case EffectEvent::Type::Update:
    break;
  }

  const EffectCommand command = EffectCodec::decode(event.params);
  if (command.kind == EffectKind::Stop)
    return stop(event.effectId);

  auto *existing = table.find(event.effectId);
  if (existing != nullptr && (existing->native != kInvalidHandle || device == nullptr))
    return update(event.effectId, command);
  return start(event, command);
}

BridgeResult ForceFeedbackTranslator::start(const EffectEvent &event, const EffectCommand &command) {
  auto *entry = table.acquire(event.effectId);
  if (entry == nullptr)
    return BridgeResult::fail(ErrorKind::ResourceExhausted,
                              "No free effect slot for effect " + juce::String(event.effectId) +
                                  " (" + juce::String(table.capacity()) + " in use)");

  entry->command = command;
  if (device == nullptr) {
    writeDebugLog("Effect " + juce::String(event.effectId) + " queued until the wheel returns");
    return BridgeResult::ok();
  }

  auto r = pushToWheel(*entry);
  if (r.failed()) {
    table.release(event.effectId);
    return r;
  }
  writeDebugLog("Effect " + juce::String(event.effectId) + " started (" +
                effectKindName(command.kind) + ", native " + juce::String(entry->native) + ")");
  return r;
}

BridgeResult ForceFeedbackTranslator::update(int effectId, const EffectCommand &command) {
  auto *entry = table.find(effectId);
  if (entry == nullptr)
    return BridgeResult::fail(ErrorKind::NotFound, "Unknown effect " + juce::String(effectId));

  if (device == nullptr || entry->native == kInvalidHandle) {
    entry->command = command;
    return BridgeResult::ok();
  }

  // The native type of a handle is fixed; a kind change re-uses the slot
  if (entry->command.kind != command.kind || entry->command.damper != command.damper) {
    freeNative(*entry);
    entry->command = command;
    auto r = pushToWheel(*entry);
    if (r.failed())
      table.release(effectId);
    return r;
  }

  NativeEffect native;
  if (!EffectCodec::encode(command, gain, native))
    return stop(effectId);

  auto r = device->updateEffect(entry->native, native);
  if (r.wasOk())
    entry->command = command;
  return r;
}

BridgeResult ForceFeedbackTranslator::stop(int effectId) {
  auto *entry = table.find(effectId);
  if (entry == nullptr)
    return BridgeResult::ok();

  freeNative(*entry);
  table.release(effectId);
  writeDebugLog("Effect " + juce::String(effectId) + " stopped");
  return BridgeResult::ok();
}

BridgeResult ForceFeedbackTranslator::pushToWheel(EffectSlotTable::Entry &entry) {
  NativeEffect native;
  if (!EffectCodec::encode(entry.command, gain, native))
    return BridgeResult::fail(ErrorKind::Unsupported, "Effect has no native form");

  NativeEffectHandle handle = kInvalidHandle;
  auto r = device->uploadEffect(native, handle);
  if (r.failed())
    return r;

  entry.native = handle;
  r = device->playEffect(handle);
  if (r.failed())
    freeNative(entry);
  return r;
}

void ForceFeedbackTranslator::freeNative(EffectSlotTable::Entry &entry) {
  if (device == nullptr || entry.native == kInvalidHandle) {
    entry.native = kInvalidHandle;
    return;
  }

  auto r = device->stopEffect(entry.native);
  if (r.failed())
    writeDebugLog("Stop effect " + juce::String(entry.effectId) + ": " + r.describe());
  r = device->releaseEffect(entry.native);
  if (r.failed())
    writeDebugLog("Release effect " + juce::String(entry.effectId) + ": " + r.describe());
  entry.native = kInvalidHandle;
}

void ForceFeedbackTranslator::releaseAll() {
  const int count = table.size();
  table.forEach([this](EffectSlotTable::Entry &e) { freeNative(e); });
  table.clear();
  if (count > 0)
    LogService::instance().info("Released " + juce::String(count) + " outstanding effect(s)");
}
