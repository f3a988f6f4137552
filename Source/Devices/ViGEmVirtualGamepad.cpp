/*
  ==============================================================================
    Source/Devices/ViGEmVirtualGamepad.cpp
    Role: ViGEm client/target lifetime, XUSB report publishing, rumble queue.
  ==============================================================================
*/
#include "ViGEmVirtualGamepad.h"

#if JUCE_WINDOWS
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif

#include "../Core/LogService.h"
#include <windows.h>
#include <ViGEm/Client.h>

namespace {
// GamepadState::Button order
const USHORT xusbButtons[GamepadState::NumButtons] = {
    XUSB_GAMEPAD_A,          XUSB_GAMEPAD_B,           XUSB_GAMEPAD_X,
    XUSB_GAMEPAD_Y,          XUSB_GAMEPAD_LEFT_SHOULDER, XUSB_GAMEPAD_RIGHT_SHOULDER,
    XUSB_GAMEPAD_BACK,       XUSB_GAMEPAD_START,       XUSB_GAMEPAD_GUIDE,
    XUSB_GAMEPAD_LEFT_THUMB, XUSB_GAMEPAD_RIGHT_THUMB, XUSB_GAMEPAD_DPAD_UP,
    XUSB_GAMEPAD_DPAD_DOWN,  XUSB_GAMEPAD_DPAD_LEFT,   XUSB_GAMEPAD_DPAD_RIGHT};

VOID CALLBACK rumbleNotification(PVIGEM_CLIENT, PVIGEM_TARGET, UCHAR largeMotor, UCHAR smallMotor,
                                 UCHAR, LPVOID userData) {
  static_cast<ViGEmVirtualController *>(userData)->onRumble(largeMotor, smallMotor);
}

juce::String vigemErrorText(VIGEM_ERROR err) {
  return "ViGEm error 0x" + juce::String::toHexString((int)err);
}
} // namespace

BridgeResult ViGEmVirtualController::create(const VirtualPadOptions &options,
                                            std::unique_ptr<VirtualController> &controller) {
  PVIGEM_CLIENT client = vigem_alloc();
  if (client == nullptr)
    return BridgeResult::fail(ErrorKind::VirtualControllerCreationFailed, "vigem_alloc failed");

  VIGEM_ERROR err = vigem_connect(client);
  if (!VIGEM_SUCCESS(err)) {
    vigem_free(client);
    if (err == VIGEM_ERROR_BUS_NOT_FOUND)
      return BridgeResult::fail(ErrorKind::DriverUnavailable,
                                "ViGEmBus driver is not installed");
    if (err == VIGEM_ERROR_BUS_ACCESS_FAILED)
      return BridgeResult::fail(ErrorKind::PermissionDenied, "Access to ViGEmBus was denied");
    return BridgeResult::fail(ErrorKind::DriverUnavailable, vigemErrorText(err));
  }

  PVIGEM_TARGET target = vigem_target_x360_alloc();
  vigem_target_set_vid(target, options.vendorId);
  vigem_target_set_pid(target, options.productId);

  err = vigem_target_add(client, target);
  if (!VIGEM_SUCCESS(err)) {
    vigem_target_free(target);
    vigem_disconnect(client);
    vigem_free(client);
    return BridgeResult::fail(ErrorKind::VirtualControllerCreationFailed, vigemErrorText(err));
  }

  std::unique_ptr<ViGEmVirtualController> pad(new ViGEmVirtualController(client, target));
  err = vigem_target_x360_register_notification(client, target, rumbleNotification, pad.get());
  if (!VIGEM_SUCCESS(err))
    LogService::instance().warning("Rumble notifications unavailable: " + vigemErrorText(err));

  LogService::instance().info("Virtual controller created: " + options.name + " (ViGEmBus)");
  controller = std::move(pad);
  return BridgeResult::ok();
}

ViGEmVirtualController::~ViGEmVirtualController() { destroy(); }

void ViGEmVirtualController::destroy() {
  if (destroyed.exchange(true))
    return;
  auto *c = static_cast<PVIGEM_CLIENT>(client);
  auto *t = static_cast<PVIGEM_TARGET>(target);
  vigem_target_x360_unregister_notification(t);
  vigem_target_remove(c, t);
  vigem_target_free(t);
  vigem_disconnect(c);
  vigem_free(c);
  cancelPendingWait();
  LogService::instance().info("Virtual controller destroyed");
}

BridgeResult ViGEmVirtualController::publish(const GamepadState &state) {
  if (destroyed.load())
    return BridgeResult::fail(ErrorKind::Disconnected, "Virtual controller destroyed");

  XUSB_REPORT report;
  XUSB_REPORT_INIT(&report);
  for (int i = 0; i < GamepadState::NumButtons; ++i)
    if (state.isPressed(i))
      report.wButtons |= xusbButtons[i];
  report.bLeftTrigger = GamepadState::toTrigger(state.axes[GamepadState::LeftTrigger]);
  report.bRightTrigger = GamepadState::toTrigger(state.axes[GamepadState::RightTrigger]);
  report.sThumbLX = GamepadState::toStick(state.axes[GamepadState::LeftStickX]);
  report.sThumbRX = GamepadState::toStick(state.axes[GamepadState::RightStickX]);
  // XInput Y is positive up
  report.sThumbLY = GamepadState::toStick(-state.axes[GamepadState::LeftStickY]);
  report.sThumbRY = GamepadState::toStick(-state.axes[GamepadState::RightStickY]);

  VIGEM_ERROR err = vigem_target_x360_update(static_cast<PVIGEM_CLIENT>(client),
                                             static_cast<PVIGEM_TARGET>(target), report);
  if (!VIGEM_SUCCESS(err)) {
    if (err == VIGEM_ERROR_BUS_NOT_FOUND || err == VIGEM_ERROR_TARGET_NOT_PLUGGED_IN)
      return BridgeResult::fail(ErrorKind::Disconnected, vigemErrorText(err));
    return BridgeResult::fail(ErrorKind::IOError, vigemErrorText(err));
  }
  return BridgeResult::ok();
}

void ViGEmVirtualController::onRumble(uint8_t largeMotor, uint8_t smallMotor) {
  {
    std::lock_guard<std::mutex> lock(queueMutex);
    pending.push_back({largeMotor, smallMotor});
  }
  queueCond.notify_one();
}

void ViGEmVirtualController::cancelPendingWait() {
  {
    std::lock_guard<std::mutex> lock(queueMutex);
    wakeRequested = true;
  }
  queueCond.notify_one();
}

int ViGEmVirtualController::pollEffectEvents(int timeoutMs, const EffectEventCallback &onEvent) {
  std::deque<Rumble> batch;
  {
    std::unique_lock<std::mutex> lock(queueMutex);
    queueCond.wait_for(lock, std::chrono::milliseconds(timeoutMs),
                       [this] { return !pending.empty() || wakeRequested; });
    wakeRequested = false;
    batch.swap(pending);
  }

  int delivered = 0;
  for (auto &r : batch) {
    EffectEvent ev;
    ev.effectId = 0;
    ev.params.format = BackendEffectParams::Format::XInputRumble;
    ev.params.largeMotor = r.large;
    ev.params.smallMotor = r.small;

    if (r.large == 0 && r.small == 0) {
      if (!rumbleActive)
        continue;
      ev.type = EffectEvent::Type::Stop;
      rumbleActive = false;
    } else {
      ev.type = rumbleActive ? EffectEvent::Type::Update : EffectEvent::Type::Upload;
      rumbleActive = true;
    }
    onEvent(ev);
    ++delivered;
  }
  return delivered;
}
#endif
