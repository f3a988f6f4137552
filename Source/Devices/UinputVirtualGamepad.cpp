/*
  ==============================================================================
    Source/Devices/UinputVirtualGamepad.cpp
    Role: uinput device creation, frame publishing, FF request handling.
  ==============================================================================
*/
#include "UinputVirtualGamepad.h"

#if JUCE_LINUX
#include "../Core/LogService.h"
#include "LinuxFfConversion.h"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <linux/uinput.h>
#include <poll.h>
#include <sys/eventfd.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace {
// GamepadState::Button order; d-pad goes out on the hat instead
const int buttonCodes[] = {BTN_A,      BTN_B,     BTN_X,     BTN_Y,     BTN_TL,
                           BTN_TR,     BTN_SELECT, BTN_START, BTN_MODE, BTN_THUMBL,
                           BTN_THUMBR};
constexpr int numKeyButtons = (int)(sizeof(buttonCodes) / sizeof(buttonCodes[0]));

const int ffBits[] = {FF_CONSTANT, FF_PERIODIC, FF_SINE,   FF_SQUARE, FF_TRIANGLE, FF_SAW_UP,
                      FF_SAW_DOWN, FF_SPRING,   FF_DAMPER, FF_RAMP,   FF_RUMBLE,   FF_GAIN};

struct AbsSetup {
  int code;
  int min;
  int max;
};

const AbsSetup stickAxes[] = {{ABS_X, -32768, 32767},  {ABS_Y, -32768, 32767},
                              {ABS_RX, -32768, 32767}, {ABS_RY, -32768, 32767},
                              {ABS_Z, 0, 255},         {ABS_RZ, 0, 255},
                              {ABS_HAT0X, -1, 1},      {ABS_HAT0Y, -1, 1}};

BridgeResult createFailure(int err, const juce::String &what) {
  const juce::String msg = what + ": " + juce::String(std::strerror(err));
  if (err == EACCES || err == EPERM)
    return BridgeResult::fail(ErrorKind::PermissionDenied,
                              msg + " (grant access to /dev/uinput via a udev rule)");
  if (err == ENOENT || err == ENODEV || err == ENXIO)
    return BridgeResult::fail(ErrorKind::DriverUnavailable, msg + " (is the uinput module loaded?)");
  return BridgeResult::fail(ErrorKind::VirtualControllerCreationFailed, msg);
}

bool setBit(int fd, unsigned long request, int bit) { return ::ioctl(fd, request, bit) >= 0; }

input_event makeEvent(int type, int code, int value) {
  input_event ev;
  std::memset(&ev, 0, sizeof(ev));
  ev.type = (__u16)type;
  ev.code = (__u16)code;
  ev.value = value;
  return ev;
}
} // namespace

BridgeResult UinputVirtualController::create(const VirtualPadOptions &options,
                                             std::unique_ptr<VirtualController> &controller) {
  int fd = ::open("/dev/uinput", O_RDWR | O_NONBLOCK);
  if (fd < 0 && errno == ENOENT)
    fd = ::open("/dev/input/uinput", O_RDWR | O_NONBLOCK);
  if (fd < 0)
    return createFailure(errno, "open /dev/uinput");

  auto fail = [fd](const juce::String &what) {
    auto r = createFailure(errno, what);
    ::close(fd);
    return r;
  };

  for (int type : {EV_KEY, EV_ABS, EV_FF, EV_SYN})
    if (!setBit(fd, UI_SET_EVBIT, type))
      return fail("UI_SET_EVBIT");
  for (int code : buttonCodes)
    if (!setBit(fd, UI_SET_KEYBIT, code))
      return fail("UI_SET_KEYBIT");
  for (auto &axis : stickAxes)
    if (!setBit(fd, UI_SET_ABSBIT, axis.code))
      return fail("UI_SET_ABSBIT");
  if (options.dedicatedSteeringAxis && !setBit(fd, UI_SET_ABSBIT, ABS_WHEEL))
    return fail("UI_SET_ABSBIT wheel");
  for (int bit : ffBits)
    if (!setBit(fd, UI_SET_FFBIT, bit))
      return fail("UI_SET_FFBIT");

  uinput_setup setup;
  std::memset(&setup, 0, sizeof(setup));
  setup.id.bustype = BUS_USB;
  setup.id.vendor = options.vendorId;
  setup.id.product = options.productId;
  setup.id.version = options.version;
  options.name.copyToUTF8(setup.name, UINPUT_MAX_NAME_SIZE);
  setup.ff_effects_max = (__u32)juce::jmax(1, options.effectSlots);
  if (::ioctl(fd, UI_DEV_SETUP, &setup) < 0)
    return fail("UI_DEV_SETUP");

  auto setupAxis = [fd](int code, int min, int max) {
    uinput_abs_setup abs;
    std::memset(&abs, 0, sizeof(abs));
    abs.code = (__u16)code;
    abs.absinfo.minimum = min;
    abs.absinfo.maximum = max;
    abs.absinfo.flat = (max - min) > 255 ? 128 : 0;
    return ::ioctl(fd, UI_ABS_SETUP, &abs) >= 0;
  };
  for (auto &axis : stickAxes)
    if (!setupAxis(axis.code, axis.min, axis.max))
      return fail("UI_ABS_SETUP");
  if (options.dedicatedSteeringAxis && !setupAxis(ABS_WHEEL, -32768, 32767))
    return fail("UI_ABS_SETUP wheel");

  if (::ioctl(fd, UI_DEV_CREATE) < 0)
    return fail("UI_DEV_CREATE");

  int wakeFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
  if (wakeFd < 0) {
    auto r = createFailure(errno, "eventfd");
    ::ioctl(fd, UI_DEV_DESTROY);
    ::close(fd);
    return r;
  }

  controller.reset(new UinputVirtualController(fd, wakeFd, options.dedicatedSteeringAxis));
  LogService::instance().info("Virtual controller created: " + options.name);
  return BridgeResult::ok();
}

UinputVirtualController::~UinputVirtualController() { destroy(); }

void UinputVirtualController::destroy() {
  if (destroyed.exchange(true))
    return;
  ::ioctl(fd, UI_DEV_DESTROY);
  ::close(fd);
  ::close(wakeFd);
  LogService::instance().info("Virtual controller destroyed");
}

BridgeResult UinputVirtualController::publish(const GamepadState &state) {
  if (destroyed.load())
    return BridgeResult::fail(ErrorKind::Disconnected, "Virtual controller destroyed");

  input_event frame[24];
  int n = 0;
  frame[n++] = makeEvent(EV_ABS, ABS_X, GamepadState::toStick(state.axes[GamepadState::LeftStickX]));
  frame[n++] = makeEvent(EV_ABS, ABS_Y, GamepadState::toStick(state.axes[GamepadState::LeftStickY]));
  frame[n++] = makeEvent(EV_ABS, ABS_RX, GamepadState::toStick(state.axes[GamepadState::RightStickX]));
  frame[n++] = makeEvent(EV_ABS, ABS_RY, GamepadState::toStick(state.axes[GamepadState::RightStickY]));
  frame[n++] = makeEvent(EV_ABS, ABS_Z, GamepadState::toTrigger(state.axes[GamepadState::LeftTrigger]));
  frame[n++] = makeEvent(EV_ABS, ABS_RZ, GamepadState::toTrigger(state.axes[GamepadState::RightTrigger]));
  if (wheelAxis)
    frame[n++] = makeEvent(EV_ABS, ABS_WHEEL, GamepadState::toStick(state.axes[GamepadState::Wheel]));

  const int hatX = (state.isPressed(GamepadState::DpadRight) ? 1 : 0) -
                   (state.isPressed(GamepadState::DpadLeft) ? 1 : 0);
  const int hatY = (state.isPressed(GamepadState::DpadDown) ? 1 : 0) -
                   (state.isPressed(GamepadState::DpadUp) ? 1 : 0);
  frame[n++] = makeEvent(EV_ABS, ABS_HAT0X, hatX);
  frame[n++] = makeEvent(EV_ABS, ABS_HAT0Y, hatY);

  for (int i = 0; i < numKeyButtons; ++i)
    frame[n++] = makeEvent(EV_KEY, buttonCodes[i], state.isPressed(i) ? 1 : 0);
  frame[n++] = makeEvent(EV_SYN, SYN_REPORT, 0);

  const ssize_t bytes = (ssize_t)(sizeof(input_event) * (size_t)n);
  if (::write(fd, frame, (size_t)bytes) != bytes) {
    if (errno == ENODEV)
      return BridgeResult::fail(ErrorKind::Disconnected, "uinput device gone");
    return BridgeResult::fail(ErrorKind::IOError,
                              "uinput write: " + juce::String(std::strerror(errno)));
  }
  return BridgeResult::ok();
}

void UinputVirtualController::cancelPendingWait() {
  if (destroyed.load())
    return;
  const uint64_t one = 1;
  if (::write(wakeFd, &one, sizeof(one)) != (ssize_t)sizeof(one))
    writeDebugLog("eventfd wake failed: " + juce::String(std::strerror(errno)));
}

void UinputVirtualController::reportDisconnected(std::vector<EffectEvent> &out,
                                                 const juce::String &why) {
  if (disconnectReported)
    return;
  disconnectReported = true;
  LogService::instance().warning("Virtual controller lost: " + why);
  EffectEvent ev;
  ev.type = EffectEvent::Type::Disconnected;
  out.push_back(ev);
}

int UinputVirtualController::pollEffectEvents(int timeoutMs, const EffectEventCallback &onEvent) {
  if (destroyed.load() || disconnectReported)
    return 0;

  std::vector<EffectEvent> pending;
  pollfd fds[2] = {{fd, POLLIN, 0}, {wakeFd, POLLIN, 0}};
  const int rc = ::poll(fds, 2, timeoutMs);
  if (rc < 0) {
    if (errno != EINTR)
      reportDisconnected(pending, juce::String(std::strerror(errno)));
  } else if (rc > 0) {
    if ((fds[1].revents & POLLIN) != 0) {
      uint64_t count = 0;
      if (::read(wakeFd, &count, sizeof(count)) < 0 && errno != EAGAIN)
        writeDebugLog("eventfd drain failed: " + juce::String(std::strerror(errno)));
    }

    if ((fds[0].revents & (POLLERR | POLLHUP | POLLNVAL)) != 0) {
      reportDisconnected(pending, "poll error on uinput");
    } else if ((fds[0].revents & POLLIN) != 0) {
      input_event ev;
      for (;;) {
        const ssize_t n = ::read(fd, &ev, sizeof(ev));
        if (n < 0) {
          if (errno == EINTR)
            continue;
          if (errno != EAGAIN && errno != EWOULDBLOCK)
            reportDisconnected(pending, juce::String(std::strerror(errno)));
          break;
        }
        if (n != (ssize_t)sizeof(ev))
          break;

        if (ev.type == EV_UINPUT && ev.code == UI_FF_UPLOAD)
          handleUpload((uint32_t)ev.value, pending);
        else if (ev.type == EV_UINPUT && ev.code == UI_FF_ERASE)
          handleErase((uint32_t)ev.value, pending);
        else if (ev.type == EV_FF)
          handlePlayback(ev, pending);
      }
    }
  }

  for (auto &e : pending)
    onEvent(e);
  return (int)pending.size();
}

void UinputVirtualController::handleUpload(uint32_t requestId, std::vector<EffectEvent> &out) {
  uinput_ff_upload upload;
  std::memset(&upload, 0, sizeof(upload));
  upload.request_id = requestId;
  if (::ioctl(fd, UI_BEGIN_FF_UPLOAD, &upload) < 0) {
    LogService::instance().error("UI_BEGIN_FF_UPLOAD failed: " + juce::String(std::strerror(errno)));
    return;
  }

  const int id = upload.effect.id;
  if (isSupportedKernelEffect(upload.effect.type)) {
    auto &known = effects[id];
    known.params = fromKernelEffect(upload.effect);
    upload.retval = 0;
    if (known.playing) {
      EffectEvent ev;
      ev.type = EffectEvent::Type::Update;
      ev.effectId = id;
      ev.params.native = known.params;
      out.push_back(ev);
    }
  } else {
    writeDebugLog("Host uploaded unsupported FF type " + juce::String(upload.effect.type));
    upload.retval = -EINVAL;
  }

  // Host is blocked in EVIOCSFF until this completes
  if (::ioctl(fd, UI_END_FF_UPLOAD, &upload) < 0)
    LogService::instance().error("UI_END_FF_UPLOAD failed: " + juce::String(std::strerror(errno)));
}

void UinputVirtualController::handleErase(uint32_t requestId, std::vector<EffectEvent> &out) {
  uinput_ff_erase erase;
  std::memset(&erase, 0, sizeof(erase));
  erase.request_id = requestId;
  if (::ioctl(fd, UI_BEGIN_FF_ERASE, &erase) < 0) {
    LogService::instance().error("UI_BEGIN_FF_ERASE failed: " + juce::String(std::strerror(errno)));
    return;
  }

  const int id = (int)erase.effect_id;
  auto it = effects.find(id);
  if (it != effects.end()) {
    if (it->second.playing) {
      EffectEvent ev;
      ev.type = EffectEvent::Type::Stop;
      ev.effectId = id;
      out.push_back(ev);
    }
    effects.erase(it);
  }
  erase.retval = 0;

  if (::ioctl(fd, UI_END_FF_ERASE, &erase) < 0)
    LogService::instance().error("UI_END_FF_ERASE failed: " + juce::String(std::strerror(errno)));
}

void UinputVirtualController::handlePlayback(const input_event &ev, std::vector<EffectEvent> &out) {
  if (ev.code == FF_GAIN || ev.code == FF_AUTOCENTER) {
    writeDebugLog("Host set FF control " + juce::String(ev.code) + " = " + juce::String(ev.value));
    return;
  }

  auto it = effects.find(ev.code);
  if (it == effects.end()) {
    writeDebugLog("Playback for unknown effect " + juce::String(ev.code));
    return;
  }

  auto &known = it->second;
  EffectEvent out1;
  out1.effectId = ev.code;
  if (ev.value > 0) {
    // Re-trigger of a playing effect restarts it with the same parameters
    out1.type = known.playing ? EffectEvent::Type::Update : EffectEvent::Type::Upload;
    out1.params.native = known.params;
    known.playing = true;
    out.push_back(out1);
  } else if (known.playing) {
    out1.type = EffectEvent::Type::Stop;
    known.playing = false;
    out.push_back(out1);
  }
}
#endif
