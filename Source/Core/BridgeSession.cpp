/*
  ==============================================================================
    Source/Core/BridgeSession.cpp
    Role: Session state machine, suspend / reconnect, teardown.
  ==============================================================================
*/
#include "BridgeSession.h"
#include "../Services/EffectForwardingWorker.h"
#include "../Services/ForceFeedbackTranslator.h"
#include "../Services/InputPollingWorker.h"
#include "LogService.h"

namespace {
constexpr double kReconnectScanIntervalMs = 250.0;

double nowMs() { return juce::Time::getMillisecondCounterHiRes(); }

bool isTerminal(SessionState s) { return s == SessionState::Terminated; }
} // namespace

BridgeSession::BridgeSession(InputDeviceBackend &input, VirtualGamepadBackend &pads,
                             const BridgeConfig &c)
    : inputBackend(input), padBackend(pads), config(c) {}

BridgeSession::~BridgeSession() { shutdown(); }

bool BridgeSession::isValidTransition(SessionState from, SessionState to) {
  using S = SessionState;
  if (from == S::Terminated)
    return false;
  if (to == S::Error)
    return from != S::Error;
  if (to == S::Terminated)
    return true;

  switch (from) {
  case S::Idle:        return to == S::Enumerated;
  case S::Enumerated:  return to == S::Calibrating;
  case S::Calibrating: return to == S::Active;
  case S::Active:      return to == S::Suspended;
  case S::Suspended:   return to == S::Active;
  default:             return false;
  }
}

bool BridgeSession::transitionTo(SessionState next) {
  if (!isValidTransition(state, next)) {
    LogService::instance().error(juce::String("Rejected state change ") + sessionStateName(state) +
                                 " -> " + sessionStateName(next));
    return false;
  }
  const SessionState previous = state;
  state = next;
  status.state.store(static_cast<int>(next));
  LogService::instance().info(juce::String("Session ") + sessionStateName(previous) + " -> " +
                              sessionStateName(next));
  if (onStateChanged)
    onStateChanged(previous, next);
  return true;
}

void BridgeSession::fail(ErrorKind kind, const juce::String &why) {
  lastError = kind;
  status.lastError.store(static_cast<int>(kind));
  LogService::instance().error(juce::String(errorKindName(kind)) + ": " + why);
  if (transitionTo(SessionState::Error)) {
    teardown();
    transitionTo(SessionState::Terminated);
  }
}

BridgeResult BridgeSession::discover() {
  if (state != SessionState::Idle && state != SessionState::Enumerated)
    return BridgeResult::fail(ErrorKind::Unsupported,
                              juce::String("Cannot discover while ") + sessionStateName(state));

  candidates = inputBackend.enumerate();
  if (candidates.empty())
    return BridgeResult::fail(ErrorKind::NotFound, "No racing wheel found");

  const PhysicalDevice *choice = nullptr;
  if (config.preferredDevice.isNotEmpty()) {
    for (auto &d : candidates)
      if (d.identity.getModelKey().equalsIgnoreCase(config.preferredDevice) ||
          d.identity.path == config.preferredDevice) {
        choice = &d;
        break;
      }
    if (choice == nullptr)
      return BridgeResult::fail(ErrorKind::NotFound,
                                "Preferred wheel " + config.preferredDevice + " is not attached");
  } else {
    for (auto &d : candidates)
      if (d.hasForceFeedback) {
        choice = &d;
        break;
      }
    if (choice == nullptr)
      choice = &candidates.front();
  }

  selected = *choice;
  LogService::instance().info("Selected " + selected.name + " [" + selected.identity.getModelKey() +
                              "] at " + selected.identity.path +
                              (selected.hasForceFeedback ? "" : " (no force feedback)"));
  if (state == SessionState::Idle)
    transitionTo(SessionState::Enumerated);
  return BridgeResult::ok();
}

BridgeResult BridgeSession::beginCalibration() {
  if (state != SessionState::Enumerated)
    return BridgeResult::fail(ErrorKind::Unsupported,
                              juce::String("Cannot calibrate while ") + sessionStateName(state));

  auto r = ScopedDevice::open(inputBackend, selected.identity, config.ioRetryCount, device);
  if (r.failed()) {
    lastError = r.kind();
    status.lastError.store(static_cast<int>(r.kind()));
    LogService::instance().error("Could not open " + selected.name + ": " + r.describe());
    return r;
  }
  selected = device->getDescription();
  transitionTo(SessionState::Calibrating);
  return r;
}

BridgeResult BridgeSession::readSample(int timeoutMs, RawSample &sample) {
  if (state != SessionState::Calibrating || device == nullptr)
    return BridgeResult::fail(ErrorKind::Unsupported, "Wheel is not open for calibration");
  return device->poll(timeoutMs, sample);
}

BridgeResult BridgeSession::calibrate(const CalibrationWindow &window,
                                      const RoleAssignment *assignment) {
  if (state != SessionState::Calibrating || device == nullptr)
    return BridgeResult::fail(ErrorKind::Unsupported, "Wheel is not open for calibration");

  ++calibrationRuns;
  const auto &desc = device->getDescription();
  auto roles = assignment != nullptr ? assignment->rolesFor(desc.axes.size())
                                     : CalibrationService::defaultRoles(desc);

  CalibrationProfile result;
  auto r = CalibrationService::calibrate(*device, roles, window, config, result, onCalibrationPhase);
  if (r.failed()) {
    lastError = r.kind();
    status.lastError.store(static_cast<int>(r.kind()));
    LogService::instance().warning("Calibration failed: " + r.describe());
    return r;
  }

  if (assignment != nullptr) {
    const int steering = result.findAxis(AxisRole::Steering);
    if (steering >= 0)
      result.axes[(size_t)steering].inverted = assignment->steeringInverted;
    auto markPedal = [&result](AxisRole role, bool inverted) {
      const int index = result.findAxis(role);
      if (index >= 0)
        result.axes[(size_t)index].inverted = inverted;
    };
    markPedal(AxisRole::Throttle, assignment->throttleInverted);
    markPedal(AxisRole::Brake, assignment->brakeInverted);
    markPedal(AxisRole::Clutch, assignment->clutchInverted);
    result.shiftUpButton = assignment->shiftUpButton;
    result.shiftDownButton = assignment->shiftDownButton;
  }

  profile.replace(std::make_shared<const CalibrationProfile>(std::move(result)));
  return r;
}

BridgeResult BridgeSession::useStoredProfile(const CalibrationProfile &stored) {
  if (state != SessionState::Calibrating || device == nullptr)
    return BridgeResult::fail(ErrorKind::Unsupported, "Wheel is not open for calibration");
  if (!stored.isValid() || !stored.fits(device->getDescription()))
    return BridgeResult::fail(ErrorKind::Unsupported,
                              "Stored calibration does not match " + device->getDescription().name);

  auto copy = std::make_shared<CalibrationProfile>(stored);
  copy->device = device->getIdentity();
  profile.replace(std::move(copy));
  LogService::instance().info("Using stored calibration for " + stored.device.getModelKey());
  return BridgeResult::ok();
}

BridgeResult BridgeSession::recalibrate(const CalibrationProfile &next) {
  if (state != SessionState::Active && state != SessionState::Suspended)
    return BridgeResult::fail(ErrorKind::Unsupported,
                              juce::String("Cannot swap calibration while ") + sessionStateName(state));
  if (!next.isValid() || !next.fits(selected))
    return BridgeResult::fail(ErrorKind::Unsupported, "Calibration does not match the active wheel");

  profile.replace(std::make_shared<const CalibrationProfile>(next));
  ++calibrationRuns;
  LogService::instance().info("Calibration replaced");
  return BridgeResult::ok();
}

int BridgeSession::effectCapacity() const {
  const int deviceSlots = selected.effectSlots;
  return deviceSlots > 0 ? juce::jmin(config.effectSlots, deviceSlots) : config.effectSlots;
}

BridgeResult BridgeSession::activate() {
  if (state != SessionState::Calibrating || device == nullptr)
    return BridgeResult::fail(ErrorKind::Unsupported,
                              juce::String("Cannot activate while ") + sessionStateName(state));
  if (profile.get() == nullptr)
    return BridgeResult::fail(ErrorKind::Unsupported, "Calibrate the wheel before activating");

  VirtualPadOptions options;
  options.effectSlots = effectCapacity();
  options.dedicatedSteeringAxis = config.dedicatedSteeringAxis;

  auto r = padBackend.create(options, pad);
  if (r.failed()) {
    fail(r.kind(), "Virtual pad via " + padBackend.getName() + ": " + r.getErrorMessage());
    return r;
  }

  translator = std::make_unique<ForceFeedbackTranslator>(effectCapacity(), config.ffGain);
  if (selected.hasForceFeedback)
    translator->attachDevice(device.get());
  else
    LogService::instance().warning(selected.name + " has no force feedback; effects are ignored");

  forwarder = std::make_unique<EffectForwardingWorker>(*pad, *translator, signals, status,
                                                       config.effectWaitMs);
  forwarder->setPriority(juce::Thread::Priority::high);
  forwarder->startThread();
  startPoller();

  transitionTo(SessionState::Active);
  return r;
}

void BridgeSession::startPoller() {
  poller = std::make_unique<InputPollingWorker>(*device, *pad, profile, signals, status, config);
  poller->setPriority(juce::Thread::Priority::high);
  poller->startThread();
}

int BridgeSession::dispatchSignals(int timeoutMs) {
  if (signals.getNumReady() == 0)
    signals.waitForData(std::chrono::milliseconds(juce::jmax(0, timeoutMs)));
  return signals.process([this](const SessionSignal &s) { handleSignal(s); });
}

void BridgeSession::handleSignal(const SessionSignal &s) {
  if (isTerminal(state))
    return;

  switch (s.type) {
  case SessionSignal::Type::PhysicalDisconnected:
    if (state == SessionState::Active)
      suspend();
    break;

  case SessionSignal::Type::HostReleased:
    if (state == SessionState::Active || state == SessionState::Suspended) {
      LogService::instance().info("Host released the virtual controller, ending session");
      teardown();
      transitionTo(SessionState::Terminated);
    }
    break;

  case SessionSignal::Type::OperatorError:
    lastError = s.error;
    status.lastError.store(static_cast<int>(s.error));
    LogService::instance().error(juce::String(errorKindName(s.error)) + " on effect " +
                                 juce::String(s.effectId) + "; the wheel keeps its other effects");
    break;

  case SessionSignal::Type::BackendFailure:
    // A worker stopped on a failure nobody can retry
    fail(s.error, "Worker stopped");
    break;

  case SessionSignal::Type::None:
    break;
  }
}

void BridgeSession::suspend() {
  LogService::instance().warning(selected.name + " disconnected, waiting up to " +
                                 juce::String(config.reconnectGraceMs) + " ms for it to return");
  poller.reset();
  if (forwarder != nullptr && translator != nullptr)
    forwarder->callAndWait([this] { translator->detachDevice(); });
  device.reset();

  suspendedAtMs = nowMs();
  lastReconnectAttemptMs = 0.0;
  transitionTo(SessionState::Suspended);
}

void BridgeSession::tick() {
  if (state != SessionState::Suspended)
    return;

  const double now = nowMs();
  if (now - suspendedAtMs >= (double)config.reconnectGraceMs) {
    lastError = ErrorKind::Disconnected;
    status.lastError.store(static_cast<int>(ErrorKind::Disconnected));
    LogService::instance().warning(selected.name + " did not return within the grace period");
    teardown();
    transitionTo(SessionState::Terminated);
    return;
  }

  if (now - lastReconnectAttemptMs < kReconnectScanIntervalMs)
    return;
  lastReconnectAttemptMs = now;
  tryReconnect();
}

bool BridgeSession::tryReconnect() {
  const PhysicalDevice *match = nullptr;
  auto found = inputBackend.enumerate();
  for (auto &d : found)
    if (d.identity.matches(selected.identity)) {
      match = &d;
      break;
    }
  if (match == nullptr)
    return false;

  auto r = ScopedDevice::open(inputBackend, match->identity, config.ioRetryCount, device);
  if (r.failed()) {
    writeDebugLog("Reconnect attempt: " + r.describe());
    return false;
  }

  auto current = profile.get();
  if (current == nullptr || !current->fits(device->getDescription())) {
    device.reset();
    fail(ErrorKind::Unsupported, "Returned wheel no longer matches its calibration");
    return false;
  }

  if (selected.hasForceFeedback && forwarder != nullptr && translator != nullptr) {
    ScopedDevice *wheel = device.get();
    forwarder->callAndWait([this, wheel] { translator->attachDevice(wheel); });
  }
  startPoller();
  transitionTo(SessionState::Active);
  LogService::instance().info(selected.name + " reconnected, calibration kept");
  return true;
}

void BridgeSession::teardown() {
  poller.reset();

  if (forwarder != nullptr && translator != nullptr)
    forwarder->callAndWait([this] { translator->releaseAll(); });
  forwarder.reset();
  if (translator != nullptr)
    translator->releaseAll();
  translator.reset();

  if (pad != nullptr) {
    pad->destroy();
    pad.reset();
  }
  device.reset();
  status.activeEffects.store(0);
}

void BridgeSession::shutdown() {
  if (isTerminal(state))
    return;
  LogService::instance().info("Shutting down session");
  teardown();
  transitionTo(SessionState::Terminated);
}
