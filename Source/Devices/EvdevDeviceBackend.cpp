/*
  ==============================================================================
    Source/Devices/EvdevDeviceBackend.cpp
    Role: evdev enumeration, exclusive grab, timed reads, kernel FF effects.
  ==============================================================================
*/
#include "EvdevDeviceBackend.h"

#if JUCE_LINUX
#include "../Core/LogService.h"
#include "LinuxFfConversion.h"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <linux/input.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace {
constexpr size_t bitsPerLong = sizeof(unsigned long) * 8;
constexpr size_t longsFor(size_t bits) { return (bits + bitsPerLong - 1) / bitsPerLong; }

bool testBit(const unsigned long *bits, int bit) {
  return ((bits[(size_t)bit / bitsPerLong] >> ((size_t)bit % bitsPerLong)) & 1UL) != 0;
}

// Analog axes only; hats (ABS_HAT0X and up) are not wheel axes.
constexpr int kLastAnalogAxis = ABS_HAT0X - 1;

juce::String absName(int code) {
  static const char *names[] = {"X",  "Y",        "Z",      "RX",    "RY",  "RZ",
                                "Throttle", "Rudder", "Wheel", "Gas", "Brake"};
  if (code >= 0 && code < (int)(sizeof(names) / sizeof(names[0])))
    return names[code];
  return "Abs " + juce::String(code);
}

AxisRole guessRole(int code) {
  switch (code) {
  case ABS_X:
  case ABS_WHEEL:
    return AxisRole::Steering;
  case ABS_GAS:
    return AxisRole::Throttle;
  case ABS_BRAKE:
    return AxisRole::Brake;
  default:
    return AxisRole::Unmapped;
  }
}

BridgeResult errnoResult(int err, const juce::String &what) {
  const juce::String msg = what + ": " + juce::String(std::strerror(err));
  switch (err) {
  case EACCES:
  case EPERM:
    return BridgeResult::fail(ErrorKind::PermissionDenied,
                              msg + " (add the user to the 'input' group or install a udev rule)");
  case ENOENT:
    return BridgeResult::fail(ErrorKind::NotFound, msg);
  case ENODEV:
  case ENXIO:
    return BridgeResult::fail(ErrorKind::Disconnected, msg);
  case EBUSY:
    return BridgeResult::fail(ErrorKind::AlreadyOpen, msg);
  case ENOSPC:
  case ENOMEM:
    return BridgeResult::fail(ErrorKind::ResourceExhausted, msg);
  case EINVAL:
  case ENOSYS:
  case ENOTTY:
    return BridgeResult::fail(ErrorKind::Unsupported, msg);
  default:
    return BridgeResult::fail(ErrorKind::IOError, msg);
  }
}

/** Fills identity, axes, buttons and FFB capability. False if fd is not an input device. */
bool describeDevice(int fd, const juce::String &path, PhysicalDevice &out) {
  input_id id{};
  if (::ioctl(fd, EVIOCGID, &id) < 0)
    return false;

  char name[256] = {};
  ::ioctl(fd, EVIOCGNAME(sizeof(name) - 1), name);

  unsigned long evBits[longsFor(EV_MAX + 1)] = {};
  if (::ioctl(fd, EVIOCGBIT(0, sizeof(evBits)), evBits) < 0)
    return false;

  out = PhysicalDevice();
  out.identity.vendorId = id.vendor;
  out.identity.productId = id.product;
  out.identity.path = path;
  out.name = juce::String(name).trim();
  if (out.name.isEmpty())
    out.name = path;

  if (testBit(evBits, EV_ABS)) {
    unsigned long absBits[longsFor(ABS_MAX + 1)] = {};
    ::ioctl(fd, EVIOCGBIT(EV_ABS, sizeof(absBits)), absBits);
    bool haveSteering = false;
    for (int code = 0; code <= kLastAnalogAxis && (int)out.axes.size() < kMaxAxes; ++code) {
      if (!testBit(absBits, code))
        continue;
      input_absinfo info{};
      if (::ioctl(fd, EVIOCGABS(code), &info) < 0 || info.maximum <= info.minimum)
        continue;
      AxisDescriptor axis;
      axis.code = code;
      axis.name = absName(code);
      axis.rawMin = info.minimum;
      axis.rawMax = info.maximum;
      axis.role = guessRole(code);
      if (axis.role == AxisRole::Steering) {
        if (haveSteering)
          axis.role = AxisRole::Unmapped;
        haveSteering = true;
      }
      out.axes.push_back(axis);
    }
  }

  if (testBit(evBits, EV_KEY)) {
    unsigned long keyBits[longsFor(KEY_MAX + 1)] = {};
    ::ioctl(fd, EVIOCGBIT(EV_KEY, sizeof(keyBits)), keyBits);
    for (int code = BTN_MISC; code <= KEY_MAX && (int)out.buttons.size() < kMaxButtons; ++code)
      if (testBit(keyBits, code))
        out.buttons.push_back({code, "Button " + juce::String((int)out.buttons.size())});
  }

  if (testBit(evBits, EV_FF)) {
    unsigned long ffBits[longsFor(FF_MAX + 1)] = {};
    ::ioctl(fd, EVIOCGBIT(EV_FF, sizeof(ffBits)), ffBits);
    out.hasForceFeedback = testBit(ffBits, FF_CONSTANT) || testBit(ffBits, FF_PERIODIC);
    int slots = 0;
    if (::ioctl(fd, EVIOCGEFFECTS, &slots) >= 0)
      out.effectSlots = slots;
  }
  return true;
}

bool looksLikeWheel(const PhysicalDevice &d) {
  if (d.findAxis(AxisRole::Steering) < 0)
    return false;
  return d.hasForceFeedback || d.axes.size() >= 3;
}

} // namespace

EvdevDeviceBackend::~EvdevDeviceBackend() {
  const juce::ScopedLock sl(lock);
  for (auto &entry : devices) {
    ::ioctl(entry.second->fd, EVIOCGRAB, 0);
    ::close(entry.second->fd);
  }
  devices.clear();
}

std::vector<PhysicalDevice> EvdevDeviceBackend::enumerate() {
  std::vector<PhysicalDevice> found;
  auto nodes = juce::File("/dev/input").findChildFiles(juce::File::findFiles, false, "event*");
  nodes.sort();

  for (auto &node : nodes) {
    const auto path = node.getFullPathName();
    int fd = ::open(path.toRawUTF8(), O_RDONLY | O_NONBLOCK);
    if (fd < 0) {
      if (errno == EACCES)
        writeDebugLog("Skipping " + path + " (no read permission)");
      continue;
    }
    PhysicalDevice desc;
    if (describeDevice(fd, path, desc) && looksLikeWheel(desc))
      found.push_back(std::move(desc));
    ::close(fd);
  }

  // FFB-capable wheels first
  std::stable_sort(found.begin(), found.end(), [](const PhysicalDevice &a, const PhysicalDevice &b) {
    return a.hasForceFeedback && !b.hasForceFeedback;
  });
  return found;
}

BridgeResult EvdevDeviceBackend::open(const DeviceIdentity &id, DeviceHandle &handle,
                                      PhysicalDevice &description) {
  juce::String path = id.path;
  if (path.isEmpty() || !juce::File(path).exists()) {
    path.clear();
    for (auto &candidate : enumerate())
      if (candidate.identity.sameModel(id)) {
        path = candidate.identity.path;
        break;
      }
  }
  if (path.isEmpty())
    return BridgeResult::fail(ErrorKind::NotFound, "No evdev node for " + id.getModelKey());

  const juce::ScopedLock sl(lock);
  for (auto &entry : devices)
    if (entry.second->description.identity.path == path)
      return BridgeResult::fail(ErrorKind::AlreadyOpen, path + " is already open");

  int fd = ::open(path.toRawUTF8(), O_RDWR | O_NONBLOCK);
  if (fd < 0)
    return errnoResult(errno, "open " + path);

  auto dev = std::make_unique<OpenDevice>();
  dev->fd = fd;
  if (!describeDevice(fd, path, dev->description)) {
    ::close(fd);
    return BridgeResult::fail(ErrorKind::IOError, path + " is not an input device");
  }
  if ((id.vendorId != 0 || id.productId != 0) && !dev->description.identity.sameModel(id)) {
    ::close(fd);
    return BridgeResult::fail(ErrorKind::NotFound,
                              path + " is now " + dev->description.identity.getModelKey());
  }

  if (::ioctl(fd, EVIOCGRAB, 1) < 0) {
    auto r = errnoResult(errno, "grab " + path);
    ::close(fd);
    return r;
  }

  auto &desc = dev->description;
  dev->state.numAxes = (int)desc.axes.size();
  for (size_t i = 0; i < desc.axes.size(); ++i) {
    dev->absIndex[desc.axes[i].code] = (int)i;
    input_absinfo info{};
    if (::ioctl(fd, EVIOCGABS(desc.axes[i].code), &info) >= 0)
      dev->state.axes[i] = info.value;
  }
  unsigned long keyState[longsFor(KEY_MAX + 1)] = {};
  ::ioctl(fd, EVIOCGKEY(sizeof(keyState)), keyState);
  for (size_t i = 0; i < desc.buttons.size(); ++i) {
    dev->keyIndex[desc.buttons[i].code] = (int)i;
    dev->state.buttons.set(i, testBit(keyState, desc.buttons[i].code));
  }

  // Only bridged effects should act on the wheel
  if (desc.hasForceFeedback) {
    writeFfEvent(*dev, FF_AUTOCENTER, 0, "disable autocenter");
    writeFfEvent(*dev, FF_GAIN, 0xffff, "set gain");
  }

  handle = nextHandle++;
  description = desc;
  devices[handle] = std::move(dev);
  return BridgeResult::ok();
}

EvdevDeviceBackend::OpenDevice *EvdevDeviceBackend::find(DeviceHandle handle) {
  const juce::ScopedLock sl(lock);
  auto it = devices.find(handle);
  return it != devices.end() ? it->second.get() : nullptr;
}

BridgeResult EvdevDeviceBackend::pollInput(DeviceHandle handle, int timeoutMs,
                                           RawSample &sample) {
  auto *dev = find(handle);
  if (dev == nullptr)
    return BridgeResult::fail(ErrorKind::NotFound, "Device handle is not open");

  pollfd pfd{dev->fd, POLLIN, 0};
  int rc = ::poll(&pfd, 1, timeoutMs);
  if (rc < 0 && errno != EINTR)
    return errnoResult(errno, "poll");

  if (rc > 0) {
    if ((pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) != 0)
      return BridgeResult::fail(ErrorKind::Disconnected, dev->description.name + " went away");

    input_event events[64];
    for (;;) {
      ssize_t n = ::read(dev->fd, events, sizeof(events));
      if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK)
          break;
        if (errno == EINTR)
          continue;
        return errnoResult(errno, "read");
      }
      if (n == 0)
        return BridgeResult::fail(ErrorKind::Disconnected, dev->description.name + " closed");

      const size_t count = (size_t)n / sizeof(input_event);
      for (size_t i = 0; i < count; ++i) {
        const auto &ev = events[i];
        if (ev.type == EV_ABS) {
          auto it = dev->absIndex.find(ev.code);
          if (it != dev->absIndex.end())
            dev->state.axes[(size_t)it->second] = ev.value;
        } else if (ev.type == EV_KEY) {
          auto it = dev->keyIndex.find(ev.code);
          if (it != dev->keyIndex.end())
            dev->state.buttons.set((size_t)it->second, ev.value != 0);
        } else if (ev.type == EV_SYN && ev.code == SYN_DROPPED) {
          // Kernel buffer overran; resync absolute state
          for (auto &entry : dev->absIndex) {
            input_absinfo info{};
            if (::ioctl(dev->fd, EVIOCGABS(entry.first), &info) >= 0)
              dev->state.axes[(size_t)entry.second] = info.value;
          }
        }
      }
      dev->state.sequence++;
    }
  }

  sample = dev->state;
  return BridgeResult::ok();
}

BridgeResult EvdevDeviceBackend::writeFfEvent(OpenDevice &dev, int code, int value,
                                              const char *what) {
  input_event ev;
  std::memset(&ev, 0, sizeof(ev));
  ev.type = EV_FF;
  ev.code = (__u16)code;
  ev.value = value;
  if (::write(dev.fd, &ev, sizeof(ev)) != (ssize_t)sizeof(ev))
    return errnoResult(errno, what);
  return BridgeResult::ok();
}

BridgeResult EvdevDeviceBackend::uploadEffect(DeviceHandle handle, const NativeEffect &effect,
                                              NativeEffectHandle &effectHandle) {
  auto *dev = find(handle);
  if (dev == nullptr)
    return BridgeResult::fail(ErrorKind::NotFound, "Device handle is not open");
  if (!dev->description.hasForceFeedback)
    return BridgeResult::fail(ErrorKind::Unsupported, dev->description.name + " has no FFB");

  ff_effect fx = toKernelEffect(effect, -1);
  if (::ioctl(dev->fd, EVIOCSFF, &fx) < 0)
    return errnoResult(errno, "upload effect");
  effectHandle = fx.id;
  return BridgeResult::ok();
}

BridgeResult EvdevDeviceBackend::updateEffect(DeviceHandle handle, NativeEffectHandle effectHandle,
                                              const NativeEffect &effect) {
  auto *dev = find(handle);
  if (dev == nullptr)
    return BridgeResult::fail(ErrorKind::NotFound, "Device handle is not open");

  ff_effect fx = toKernelEffect(effect, effectHandle);
  if (::ioctl(dev->fd, EVIOCSFF, &fx) < 0)
    return errnoResult(errno, "update effect " + juce::String(effectHandle));
  return BridgeResult::ok();
}

BridgeResult EvdevDeviceBackend::playEffect(DeviceHandle handle, NativeEffectHandle effectHandle) {
  auto *dev = find(handle);
  if (dev == nullptr)
    return BridgeResult::fail(ErrorKind::NotFound, "Device handle is not open");
  return writeFfEvent(*dev, effectHandle, 1, "play effect");
}

BridgeResult EvdevDeviceBackend::stopEffect(DeviceHandle handle, NativeEffectHandle effectHandle) {
  auto *dev = find(handle);
  if (dev == nullptr)
    return BridgeResult::fail(ErrorKind::NotFound, "Device handle is not open");
  return writeFfEvent(*dev, effectHandle, 0, "stop effect");
}

BridgeResult EvdevDeviceBackend::releaseEffect(DeviceHandle handle,
                                               NativeEffectHandle effectHandle) {
  auto *dev = find(handle);
  if (dev == nullptr)
    return BridgeResult::fail(ErrorKind::NotFound, "Device handle is not open");
  if (::ioctl(dev->fd, EVIOCRMFF, effectHandle) < 0)
    return errnoResult(errno, "erase effect " + juce::String(effectHandle));
  return BridgeResult::ok();
}

void EvdevDeviceBackend::close(DeviceHandle handle) {
  std::unique_ptr<OpenDevice> dev;
  {
    const juce::ScopedLock sl(lock);
    auto it = devices.find(handle);
    if (it == devices.end())
      return;
    dev = std::move(it->second);
    devices.erase(it);
  }
  // Kernel erases this fd's effects on close
  ::ioctl(dev->fd, EVIOCGRAB, 0);
  ::close(dev->fd);
}
#endif
