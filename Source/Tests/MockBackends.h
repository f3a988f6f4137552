/*
  ==============================================================================
    Source/Tests/MockBackends.h
    Role: In-memory wheel and virtual pad backends for tests. The wheel has a
    fixed effect-slot pool and records every effect call; the pad takes
    injected host effect events and records published frames.
  ==============================================================================
*/
#pragma once
#include "../Devices/DeviceBackend.h"
#include "../Devices/VirtualGamepad.h"
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <set>
#include <thread>

namespace TestData {
/** Steering [0, 1023], throttle and brake [0, 255], 12 buttons, 4 FFB slots. */
inline PhysicalDevice makeWheel(const juce::String &path = "/dev/input/event7") {
  PhysicalDevice d;
  d.identity.vendorId = 0x046d;
  d.identity.productId = 0xc24f;
  d.identity.path = path;
  d.name = "Test Racing Wheel";
  d.hasForceFeedback = true;
  d.effectSlots = 4;

  AxisDescriptor steering;
  steering.code = 0;
  steering.name = "X";
  steering.rawMin = 0;
  steering.rawMax = 1023;
  steering.role = AxisRole::Steering;
  d.axes.push_back(steering);

  AxisDescriptor throttle;
  throttle.code = 1;
  throttle.name = "Y";
  throttle.rawMin = 0;
  throttle.rawMax = 255;
  throttle.role = AxisRole::Throttle;
  d.axes.push_back(throttle);

  AxisDescriptor brake = throttle;
  brake.code = 2;
  brake.name = "Z";
  brake.role = AxisRole::Brake;
  d.axes.push_back(brake);

  for (int i = 0; i < 12; ++i) {
    ButtonDescriptor b;
    b.code = 0x120 + i;
    b.name = "Button " + juce::String(i);
    d.buttons.push_back(b);
  }
  return d;
}

inline RawSample makeSample(int32_t steering, int32_t throttle, int32_t brake) {
  RawSample s;
  s.numAxes = 3;
  s.axes[0] = steering;
  s.axes[1] = throttle;
  s.axes[2] = brake;
  return s;
}
} // namespace TestData

class MockInputBackend : public InputDeviceBackend {
public:
  enum class Call { Upload, Play, Stop, Update, Release };

  struct Record {
    Call call;
    NativeEffectHandle native;
  };

  explicit MockInputBackend(PhysicalDevice device, int slotPool = 4)
      : wheel(std::move(device)), slotCount(slotPool) {
    current = TestData::makeSample(512, 0, 0);
    for (int i = slotCount - 1; i >= 0; --i)
      freeSlots.push_back(i);
  }

  juce::String getName() const override { return "mock"; }

  std::vector<PhysicalDevice> enumerate() override {
    std::lock_guard<std::mutex> lock(mutex);
    if (!present)
      return {};
    return {wheel};
  }

  BridgeResult open(const DeviceIdentity &id, DeviceHandle &handle,
                    PhysicalDevice &description) override {
    std::lock_guard<std::mutex> lock(mutex);
    if (!present || !id.sameModel(wheel.identity))
      return BridgeResult::fail(ErrorKind::NotFound, "not attached");
    if (denyOpen)
      return BridgeResult::fail(ErrorKind::PermissionDenied, "denied");
    if (isOpen)
      return BridgeResult::fail(ErrorKind::AlreadyOpen, "busy");
    isOpen = true;
    disconnected = false;
    ++opens;
    handle = ++nextHandle;
    description = wheel;
    return BridgeResult::ok();
  }

  BridgeResult pollInput(DeviceHandle, int timeoutMs, RawSample &sample) override {
    if (timeoutMs > 0)
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    std::lock_guard<std::mutex> lock(mutex);
    if (disconnected)
      return BridgeResult::fail(ErrorKind::Disconnected, "unplugged");
    if (ioErrorsToInject > 0) {
      --ioErrorsToInject;
      return BridgeResult::fail(ErrorKind::IOError, "glitch");
    }
    ++polls;
    if (sweeping) {
      sweepHigh = !sweepHigh;
      sample = sweepHigh ? TestData::makeSample(1023, 255, 255) : TestData::makeSample(0, 0, 0);
    } else {
      sample = current;
    }
    sample.sequence = (uint32_t)polls;
    return BridgeResult::ok();
  }

  BridgeResult uploadEffect(DeviceHandle, const NativeEffect &effect,
                            NativeEffectHandle &effectHandle) override {
    std::lock_guard<std::mutex> lock(mutex);
    if (disconnected)
      return BridgeResult::fail(ErrorKind::Disconnected, "unplugged");
    if (freeSlots.empty())
      return BridgeResult::fail(ErrorKind::ResourceExhausted, "no slot");
    effectHandle = freeSlots.back();
    freeSlots.pop_back();
    loaded[effectHandle] = effect;
    calls.push_back({Call::Upload, effectHandle});
    return BridgeResult::ok();
  }

  BridgeResult playEffect(DeviceHandle, NativeEffectHandle effectHandle) override {
    std::lock_guard<std::mutex> lock(mutex);
    calls.push_back({Call::Play, effectHandle});
    if (disconnected)
      return BridgeResult::fail(ErrorKind::Disconnected, "unplugged");
    playing.insert(effectHandle);
    return BridgeResult::ok();
  }

  BridgeResult stopEffect(DeviceHandle, NativeEffectHandle effectHandle) override {
    std::lock_guard<std::mutex> lock(mutex);
    calls.push_back({Call::Stop, effectHandle});
    playing.erase(effectHandle);
    if (disconnected)
      return BridgeResult::fail(ErrorKind::Disconnected, "unplugged");
    return BridgeResult::ok();
  }

  BridgeResult updateEffect(DeviceHandle, NativeEffectHandle effectHandle,
                            const NativeEffect &effect) override {
    std::lock_guard<std::mutex> lock(mutex);
    calls.push_back({Call::Update, effectHandle});
    if (disconnected)
      return BridgeResult::fail(ErrorKind::Disconnected, "unplugged");
    if (loaded.count(effectHandle) == 0)
      return BridgeResult::fail(ErrorKind::NotFound, "bad handle");
    loaded[effectHandle] = effect;
    return BridgeResult::ok();
  }

  BridgeResult releaseEffect(DeviceHandle, NativeEffectHandle effectHandle) override {
    std::lock_guard<std::mutex> lock(mutex);
    calls.push_back({Call::Release, effectHandle});
    freeSlot(effectHandle);
    if (disconnected)
      return BridgeResult::fail(ErrorKind::Disconnected, "unplugged");
    return BridgeResult::ok();
  }

  void close(DeviceHandle) override {
    std::lock_guard<std::mutex> lock(mutex);
    isOpen = false;
    ++closes;
    std::vector<int> handles;
    for (auto &kv : loaded)
      handles.push_back(kv.first);
    for (int h : handles)
      freeSlot(h);
  }

  // --- Scripting ---
  void setSample(const RawSample &s) {
    std::lock_guard<std::mutex> lock(mutex);
    current = s;
  }
  void setSweeping(bool on) {
    std::lock_guard<std::mutex> lock(mutex);
    sweeping = on;
  }
  void unplug() {
    std::lock_guard<std::mutex> lock(mutex);
    disconnected = true;
    present = false;
  }
  void plugBackIn() {
    std::lock_guard<std::mutex> lock(mutex);
    present = true;
  }
  void injectIOErrors(int n) {
    std::lock_guard<std::mutex> lock(mutex);
    ioErrorsToInject = n;
  }
  void setDenyOpen(bool deny) {
    std::lock_guard<std::mutex> lock(mutex);
    denyOpen = deny;
  }

  // --- Inspection ---
  int count(Call c) const {
    std::lock_guard<std::mutex> lock(mutex);
    int n = 0;
    for (auto &r : calls)
      if (r.call == c)
        ++n;
    return n;
  }
  bool wasCalled(Call c, NativeEffectHandle h) const {
    std::lock_guard<std::mutex> lock(mutex);
    for (auto &r : calls)
      if (r.call == c && r.native == h)
        return true;
    return false;
  }
  int loadedCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return (int)loaded.size();
  }
  int playingCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return (int)playing.size();
  }
  bool getLoaded(NativeEffectHandle h, NativeEffect &out) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = loaded.find(h);
    if (it == loaded.end())
      return false;
    out = it->second;
    return true;
  }
  std::vector<NativeEffectHandle> playingHandles() const {
    std::lock_guard<std::mutex> lock(mutex);
    return std::vector<NativeEffectHandle>(playing.begin(), playing.end());
  }
  bool deviceOpen() const {
    std::lock_guard<std::mutex> lock(mutex);
    return isOpen;
  }
  int openCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return opens;
  }
  int pollCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return polls;
  }

private:
  void freeSlot(NativeEffectHandle h) {
    if (loaded.erase(h) > 0)
      freeSlots.push_back(h);
    playing.erase(h);
  }

  mutable std::mutex mutex;
  PhysicalDevice wheel;
  RawSample current;
  bool present = true;
  bool isOpen = false;
  bool disconnected = false;
  bool sweeping = false;
  bool sweepHigh = false;
  bool denyOpen = false;
  int ioErrorsToInject = 0;
  int nextHandle = 0;
  int opens = 0;
  int closes = 0;
  int polls = 0;

  const int slotCount;
  std::vector<int> freeSlots;
  std::map<NativeEffectHandle, NativeEffect> loaded;
  std::set<NativeEffectHandle> playing;
  std::vector<Record> calls;
};

/** Shared between the backend (test side) and the controller the session owns. */
struct MockPadState {
  std::mutex mutex;
  std::condition_variable cond;
  std::deque<EffectEvent> events;
  bool cancelled = false;
  bool destroyed = false;
  bool publishFails = false;
  int created = 0;
  uint32_t published = 0;
  GamepadState last;
};

class MockVirtualController : public VirtualController {
public:
  explicit MockVirtualController(std::shared_ptr<MockPadState> s, bool dedicatedAxis)
      : state(std::move(s)), wheelAxis(dedicatedAxis) {}
  ~MockVirtualController() override { destroy(); }

  BridgeResult publish(const GamepadState &gs) override {
    std::lock_guard<std::mutex> lock(state->mutex);
    if (state->publishFails)
      return BridgeResult::fail(ErrorKind::Disconnected, "bus gone");
    state->last = gs;
    state->published++;
    return BridgeResult::ok();
  }

  int pollEffectEvents(int timeoutMs, const EffectEventCallback &onEvent) override {
    std::deque<EffectEvent> batch;
    {
      std::unique_lock<std::mutex> lock(state->mutex);
      state->cond.wait_for(lock, std::chrono::milliseconds(timeoutMs),
                           [this] { return !state->events.empty() || state->cancelled; });
      state->cancelled = false;
      batch.swap(state->events);
    }
    for (auto &e : batch)
      onEvent(e);
    return (int)batch.size();
  }

  void cancelPendingWait() override {
    {
      std::lock_guard<std::mutex> lock(state->mutex);
      state->cancelled = true;
    }
    state->cond.notify_all();
  }

  bool hasDedicatedSteeringAxis() const override { return wheelAxis; }

  void destroy() override {
    std::lock_guard<std::mutex> lock(state->mutex);
    state->destroyed = true;
  }

private:
  std::shared_ptr<MockPadState> state;
  bool wheelAxis;
};

class MockVirtualGamepadBackend : public VirtualGamepadBackend {
public:
  juce::String getName() const override { return "mock-pad"; }

  BridgeResult create(const VirtualPadOptions &options,
                      std::unique_ptr<VirtualController> &controller) override {
    if (createFailure != ErrorKind::None)
      return BridgeResult::fail(createFailure, "mock create failure");
    lastOptions = options;
    {
      std::lock_guard<std::mutex> lock(state->mutex);
      state->created++;
      state->destroyed = false;
    }
    controller = std::make_unique<MockVirtualController>(state, options.dedicatedSteeringAxis);
    return BridgeResult::ok();
  }

  void inject(const EffectEvent &e) {
    {
      std::lock_guard<std::mutex> lock(state->mutex);
      state->events.push_back(e);
    }
    state->cond.notify_all();
  }

  static EffectEvent constantUpload(int id, int16_t level, EffectEvent::Type type = EffectEvent::Type::Upload) {
    EffectEvent e;
    e.type = type;
    e.effectId = id;
    e.params.format = BackendEffectParams::Format::Native16;
    e.params.native.type = NativeEffectType::Constant;
    e.params.native.level = level;
    e.params.native.direction = 0xC000;
    return e;
  }

  static EffectEvent stopEvent(int id) {
    EffectEvent e;
    e.type = EffectEvent::Type::Stop;
    e.effectId = id;
    return e;
  }

  static EffectEvent hostGone() {
    EffectEvent e;
    e.type = EffectEvent::Type::Disconnected;
    return e;
  }

  bool isDestroyed() {
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->destroyed;
  }
  uint32_t publishedFrames() {
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->published;
  }
  GamepadState lastState() {
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->last;
  }
  size_t pendingEvents() {
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->events.size();
  }

  ErrorKind createFailure = ErrorKind::None;
  VirtualPadOptions lastOptions;
  std::shared_ptr<MockPadState> state = std::make_shared<MockPadState>();
};

/** Polls cond every 2 ms until true or timeoutMs elapses. */
template <typename Condition> bool waitUntil(Condition &&cond, int timeoutMs = 2000) {
  const auto end = juce::Time::getMillisecondCounterHiRes() + timeoutMs;
  while (!cond()) {
    if (juce::Time::getMillisecondCounterHiRes() > end)
      return false;
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return true;
}
