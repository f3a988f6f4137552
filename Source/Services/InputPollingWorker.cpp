#include "InputPollingWorker.h"
#include "../Core/LogService.h"
#include "../Devices/DeviceBackend.h"
#include "../Devices/VirtualGamepad.h"
#include "InputTranslator.h"

InputPollingWorker::InputPollingWorker(ScopedDevice &d, VirtualController &p,
                                       const ProfileSlot &prof, SignalQueue &sig,
                                       SessionStatus &st, const BridgeConfig &config)
    : juce::Thread("Input_Poller"), device(d), pad(p), profile(prof), signals(sig), status(st),
      periodMs(1000.0 / config.tickRateHz),
      dedicatedSteering(config.dedicatedSteeringAxis && p.hasDedicatedSteeringAxis()) {}

void InputPollingWorker::run() {
  LogService::instance().info("Input polling started at " +
                              juce::String(1000.0 / periodMs, 0) + " Hz");
  RawSample sample;
  double nextTickMs = juce::Time::getMillisecondCounterHiRes() + periodMs;

  try {
    while (!threadShouldExit()) {
      if (!tickOnce(sample, nextTickMs))
        break;
    }
  } catch (const std::exception &e) {
    LogService::instance().error(juce::String("Input polling crashed: ") + e.what());
    SessionSignal s;
    s.type = SessionSignal::Type::BackendFailure;
    s.error = ErrorKind::IOError;
    signals.push(s);
  }
  writeDebugLog("Input polling stopped");
}

bool InputPollingWorker::tickOnce(RawSample &sample, double &nextTickMs) {
  const double now = juce::Time::getMillisecondCounterHiRes();
  const int remaining = juce::jmax(0, (int)(nextTickMs - now));

  auto r = device.poll(remaining, sample);
  if (r.failed()) {
    SessionSignal s;
    s.error = r.kind();
    s.type = r.is(ErrorKind::Disconnected) ? SessionSignal::Type::PhysicalDisconnected
                                           : SessionSignal::Type::BackendFailure;
    LogService::instance().warning("Wheel read failed: " + r.describe());
    signals.push(s);
    return false;
  }

  // Keep draining until the tick is due; each poll leaves the latest state
  const double after = juce::Time::getMillisecondCounterHiRes();
  if (after < nextTickMs)
    return true;
  nextTickMs += periodMs;
  if (nextTickMs < after)
    nextTickMs = after + periodMs;

  auto current = profile.get();
  if (current == nullptr)
    return true;

  auto state = InputTranslator::translate(sample, *current, dedicatedSteering);
  r = pad.publish(state);
  if (r.failed()) {
    SessionSignal s;
    s.error = r.kind();
    s.type = r.is(ErrorKind::Disconnected) ? SessionSignal::Type::HostReleased
                                           : SessionSignal::Type::BackendFailure;
    LogService::instance().warning("Virtual pad publish failed: " + r.describe());
    signals.push(s);
    return false;
  }

  status.publishedFrames.fetch_add(1, std::memory_order_relaxed);
  status.pollerHeartbeat.fetch_add(1, std::memory_order_relaxed);
  return true;
}
