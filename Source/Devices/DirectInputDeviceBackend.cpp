/*
  ==============================================================================
    Source/Devices/DirectInputDeviceBackend.cpp
    Role: DirectInput 8 enumeration, acquisition, polling and FFB effects.
  ==============================================================================
*/
#include "DirectInputDeviceBackend.h"

#if JUCE_WINDOWS
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#define DIRECTINPUT_VERSION 0x0800

#include "../Core/LogService.h"
#include <algorithm>
#include <cmath>
#include <dinput.h>
#include <windows.h>

namespace {
constexpr LONG kAxisMin = 0;
constexpr LONG kAxisMax = 65535;
constexpr int kNumStateAxes = 8;

const DWORD axisOffsets[kNumStateAxes] = {DIJOFS_X,  DIJOFS_Y,  DIJOFS_Z,         DIJOFS_RX,
                                          DIJOFS_RY, DIJOFS_RZ, DIJOFS_SLIDER(0), DIJOFS_SLIDER(1)};
const char *axisNames[kNumStateAxes] = {"X", "Y", "Z", "RX", "RY", "RZ", "Slider 0", "Slider 1"};

LONG readAxis(const DIJOYSTATE2 &s, int code) {
  switch (code) {
  case 0: return s.lX;
  case 1: return s.lY;
  case 2: return s.lZ;
  case 3: return s.lRx;
  case 4: return s.lRy;
  case 5: return s.lRz;
  case 6: return s.rglSlider[0];
  default: return s.rglSlider[1];
  }
}

BridgeResult hrResult(HRESULT hr, const juce::String &what) {
  const juce::String msg = what + " (HRESULT 0x" + juce::String::toHexString((int)hr) + ")";
  switch (hr) {
  case DIERR_UNPLUGGED:
  case DIERR_DEVICENOTREG:
    return BridgeResult::fail(ErrorKind::Disconnected, msg);
  case DIERR_OTHERAPPHASPRIO:
  case DIERR_ACQUIRED:
    return BridgeResult::fail(ErrorKind::AlreadyOpen, msg);
  case DIERR_DEVICEFULL:
  case E_OUTOFMEMORY:
    return BridgeResult::fail(ErrorKind::ResourceExhausted, msg);
  case DIERR_UNSUPPORTED:
  case DIERR_INVALIDPARAM:
  case DIERR_INCOMPLETEEFFECT:
    return BridgeResult::fail(ErrorKind::Unsupported, msg);
  case E_ACCESSDENIED:
    return BridgeResult::fail(ErrorKind::PermissionDenied, msg);
  default:
    return BridgeResult::fail(ErrorKind::IOError, msg);
  }
}

juce::String guidToString(const GUID &guid) {
  wchar_t buffer[64] = {};
  StringFromGUID2(guid, buffer, 64);
  return juce::String(buffer);
}

LONG toDi(int v16) { return (LONG)std::lround((double)v16 * DI_FFNOMINALMAX / 32767.0); }
DWORD toDiUnsigned(unsigned v16) { return (DWORD)std::lround((double)v16 * DI_FFNOMINALMAX / 65535.0); }
DWORD toDiLevel(unsigned v15) { return (DWORD)std::lround(juce::jmin(32767u, v15) * (double)DI_FFNOMINALMAX / 32767.0); }

/** Signed share of the force along the steering axis (+ = right). 0x4000 (90 deg) pushes left. */
double steeringProjection(uint16_t direction) {
  const double radians = (double)direction * 2.0 * juce::MathConstants<double>::pi / 65536.0;
  return -std::sin(radians);
}

/**
  DIEFFECT with every pointed-to block kept alive beside it. Single steering
  axis; the sign of the magnitude carries the direction.
*/
struct DiEffectBlock {
  DIEFFECT eff;
  DWORD axes[1] = {DIJOFS_X};
  LONG directions[1] = {0};
  DIENVELOPE envelope;
  DICONSTANTFORCE constant;
  DIPERIODIC periodic;
  DICONDITION condition;
  DIRAMPFORCE ramp;
  GUID guid = GUID_ConstantForce;

  explicit DiEffectBlock(const NativeEffect &e) {
    ZeroMemory(&eff, sizeof(eff));
    ZeroMemory(&envelope, sizeof(envelope));
    ZeroMemory(&constant, sizeof(constant));
    ZeroMemory(&periodic, sizeof(periodic));
    ZeroMemory(&condition, sizeof(condition));
    ZeroMemory(&ramp, sizeof(ramp));

    const double projection = steeringProjection(e.direction);

    eff.dwSize = sizeof(DIEFFECT);
    eff.dwFlags = DIEFF_CARTESIAN | DIEFF_OBJECTOFFSETS;
    eff.dwDuration = e.replayLength == 0 ? INFINITE : (DWORD)e.replayLength * 1000;
    eff.dwStartDelay = (DWORD)e.replayDelay * 1000;
    eff.dwGain = DI_FFNOMINALMAX;
    eff.dwTriggerButton = DIEB_NOTRIGGER;
    eff.cAxes = 1;
    eff.rgdwAxes = axes;
    eff.rglDirection = directions;

    if (e.hasEnvelope()) {
      envelope.dwSize = sizeof(DIENVELOPE);
      envelope.dwAttackLevel = toDiLevel(e.attackLevel);
      envelope.dwAttackTime = (DWORD)e.attackLength * 1000;
      envelope.dwFadeLevel = toDiLevel(e.fadeLevel);
      envelope.dwFadeTime = (DWORD)e.fadeLength * 1000;
      eff.lpEnvelope = &envelope;
    }

    switch (e.type) {
    case NativeEffectType::Periodic: {
      static const GUID *waveGuids[] = {&GUID_Sine, &GUID_Square, &GUID_Triangle,
                                        &GUID_SawtoothUp, &GUID_SawtoothDown};
      guid = *waveGuids[(int)e.waveform];
      const double signedMagnitude = e.level * projection;
      periodic.dwMagnitude = (DWORD)std::abs(toDi((int)std::lround(signedMagnitude)));
      periodic.lOffset = toDi(e.offset);
      periodic.dwPhase = signedMagnitude < 0.0 ? 18000 : 0;
      periodic.dwPeriod = (DWORD)juce::jmax(1, (int)e.period) * 1000;
      eff.cbTypeSpecificParams = sizeof(DIPERIODIC);
      eff.lpvTypeSpecificParams = &periodic;
      break;
    }
    case NativeEffectType::Spring:
    case NativeEffectType::Damper:
      guid = e.type == NativeEffectType::Spring ? GUID_Spring : GUID_Damper;
      condition.lOffset = toDi(e.center);
      condition.lPositiveCoefficient = toDi(e.level);
      condition.lNegativeCoefficient = toDi(e.level);
      condition.dwPositiveSaturation = toDiUnsigned(e.saturation);
      condition.dwNegativeSaturation = toDiUnsigned(e.saturation);
      condition.lDeadBand = (LONG)toDiUnsigned(e.deadband);
      eff.lpEnvelope = nullptr;
      eff.cbTypeSpecificParams = sizeof(DICONDITION);
      eff.lpvTypeSpecificParams = &condition;
      break;
    case NativeEffectType::Ramp:
      guid = GUID_RampForce;
      ramp.lStart = toDi((int)std::lround(e.level * projection));
      ramp.lEnd = toDi((int)std::lround(e.endLevel * projection));
      eff.cbTypeSpecificParams = sizeof(DIRAMPFORCE);
      eff.lpvTypeSpecificParams = &ramp;
      break;
    case NativeEffectType::Rumble:
      guid = GUID_ConstantForce;
      constant.lMagnitude =
          (LONG)std::lround(((double)e.strongMagnitude - (double)e.weakMagnitude) * DI_FFNOMINALMAX / 65535.0);
      eff.cbTypeSpecificParams = sizeof(DICONSTANTFORCE);
      eff.lpvTypeSpecificParams = &constant;
      break;
    case NativeEffectType::Constant:
    default:
      guid = GUID_ConstantForce;
      constant.lMagnitude = toDi((int)std::lround(e.level * projection));
      eff.cbTypeSpecificParams = sizeof(DICONSTANTFORCE);
      eff.lpvTypeSpecificParams = &constant;
      break;
    }
  }

  JUCE_DECLARE_NON_COPYABLE(DiEffectBlock)
};

struct EnumContext {
  IDirectInput8W *dinput;
  std::vector<PhysicalDevice> *out;
};

BOOL CALLBACK collectDevice(LPCDIDEVICEINSTANCEW instance, LPVOID ref) {
  auto *ctx = static_cast<EnumContext *>(ref);
  PhysicalDevice desc;
  desc.identity.vendorId = LOWORD(instance->guidProduct.Data1);
  desc.identity.productId = HIWORD(instance->guidProduct.Data1);
  desc.identity.path = guidToString(instance->guidInstance);
  desc.name = juce::String(instance->tszProductName);

  IDirectInputDevice8W *device = nullptr;
  if (SUCCEEDED(ctx->dinput->CreateDevice(instance->guidInstance, &device, nullptr))) {
    DIDEVCAPS caps;
    ZeroMemory(&caps, sizeof(caps));
    caps.dwSize = sizeof(DIDEVCAPS);
    if (SUCCEEDED(device->GetCapabilities(&caps))) {
      desc.hasForceFeedback = (caps.dwFlags & DIDC_FORCEFEEDBACK) != 0;
      for (DWORD b = 0; b < caps.dwButtons && (int)b < kMaxButtons; ++b)
        desc.buttons.push_back({(int)b, "Button " + juce::String((int)b)});
    }
    for (int code = 0; code < kNumStateAxes; ++code) {
      DIDEVICEOBJECTINSTANCEW obj;
      ZeroMemory(&obj, sizeof(obj));
      obj.dwSize = sizeof(obj);
      if (FAILED(device->GetObjectInfo(&obj, axisOffsets[code], DIPH_BYOFFSET)))
        continue;
      AxisDescriptor axis;
      axis.code = code;
      axis.name = axisNames[code];
      axis.rawMin = kAxisMin;
      axis.rawMax = kAxisMax;
      axis.role = code == 0 ? AxisRole::Steering : AxisRole::Unmapped;
      desc.axes.push_back(axis);
    }
    device->Release();
  }

  const BYTE devType = LOBYTE(instance->dwDevType);
  if (devType == DI8DEVTYPE_DRIVING || (desc.hasForceFeedback && desc.findAxis(AxisRole::Steering) >= 0))
    ctx->out->push_back(std::move(desc));
  return DIENUM_CONTINUE;
}

void setDwordProperty(IDirectInputDevice8W *device, REFGUID prop, DWORD value) {
  DIPROPDWORD dipdw;
  dipdw.diph.dwSize = sizeof(DIPROPDWORD);
  dipdw.diph.dwHeaderSize = sizeof(DIPROPHEADER);
  dipdw.diph.dwObj = 0;
  dipdw.diph.dwHow = DIPH_DEVICE;
  dipdw.dwData = value;
  device->SetProperty(prop, &dipdw.diph);
}
} // namespace

struct DirectInputDeviceBackend::OpenDevice {
  IDirectInputDevice8W *device = nullptr;
  PhysicalDevice description;
  RawSample state;

  struct Effect {
    IDirectInputEffect *effect = nullptr;
    GUID guid;
  };
  std::map<NativeEffectHandle, Effect> effects;
  NativeEffectHandle nextEffect = 0;

  /** Re-acquire after focus/input loss. */
  BridgeResult reacquire() {
    HRESULT hr = device->Acquire();
    if (FAILED(hr))
      return hrResult(hr, "Acquire");
    return BridgeResult::ok();
  }
};

DirectInputDeviceBackend::DirectInputDeviceBackend() = default;

DirectInputDeviceBackend::~DirectInputDeviceBackend() {
  std::vector<DeviceHandle> open;
  {
    const juce::ScopedLock sl(lock);
    for (auto &entry : devices)
      open.push_back(entry.first);
  }
  for (auto h : open)
    close(h);
  if (dinput != nullptr)
    dinput->Release();
  if (window != nullptr)
    DestroyWindow(window);
}

BridgeResult DirectInputDeviceBackend::ensureInitialised() {
  if (dinput != nullptr)
    return BridgeResult::ok();

  HRESULT hr = DirectInput8Create(GetModuleHandleW(nullptr), DIRECTINPUT_VERSION, IID_IDirectInput8W,
                                  (void **)&dinput, nullptr);
  if (FAILED(hr)) {
    dinput = nullptr;
    return BridgeResult::fail(ErrorKind::DriverUnavailable,
                              "DirectInput8Create failed (0x" + juce::String::toHexString((int)hr) + ")");
  }

  // Exclusive access needs a window; a message-only one never shows
  window = CreateWindowExW(0, L"STATIC", L"WheelBridge", 0, 0, 0, 0, 0, HWND_MESSAGE, nullptr,
                           GetModuleHandleW(nullptr), nullptr);
  if (window == nullptr)
    return BridgeResult::fail(ErrorKind::DriverUnavailable, "Could not create message window");
  return BridgeResult::ok();
}

std::vector<PhysicalDevice> DirectInputDeviceBackend::enumerate() {
  std::vector<PhysicalDevice> found;
  auto r = ensureInitialised();
  if (r.failed()) {
    LogService::instance().error(r.describe());
    return found;
  }
  EnumContext ctx{dinput, &found};
  dinput->EnumDevices(DI8DEVCLASS_GAMECTRL, collectDevice, &ctx, DIEDFL_ATTACHEDONLY);
  std::stable_sort(found.begin(), found.end(), [](const PhysicalDevice &a, const PhysicalDevice &b) {
    return a.hasForceFeedback && !b.hasForceFeedback;
  });
  return found;
}

BridgeResult DirectInputDeviceBackend::open(const DeviceIdentity &id, DeviceHandle &handle,
                                            PhysicalDevice &description) {
  auto r = ensureInitialised();
  if (r.failed())
    return r;

  // Exact instance first, otherwise the first wheel of the same model
  const auto candidates = enumerate();
  auto match = std::find_if(candidates.begin(), candidates.end(),
                            [&id](const PhysicalDevice &d) { return d.identity.matches(id); });
  if (match == candidates.end())
    match = std::find_if(candidates.begin(), candidates.end(),
                         [&id](const PhysicalDevice &d) { return d.identity.sameModel(id); });
  if (match == candidates.end())
    return BridgeResult::fail(ErrorKind::NotFound, "No DirectInput device for " + id.getModelKey());

  PhysicalDevice desc = *match;
  const juce::ScopedLock sl(lock);
  for (auto &entry : devices)
    if (entry.second->description.identity.path == desc.identity.path)
      return BridgeResult::fail(ErrorKind::AlreadyOpen, desc.name + " is already open");

  GUID instanceGuid;
  if (FAILED(IIDFromString(desc.identity.path.toWideCharPointer(), &instanceGuid)))
    return BridgeResult::fail(ErrorKind::NotFound, "Bad instance id " + desc.identity.path);

  auto dev = std::make_unique<OpenDevice>();
  HRESULT hr = dinput->CreateDevice(instanceGuid, &dev->device, nullptr);
  if (FAILED(hr))
    return hrResult(hr, "CreateDevice");

  auto fail = [&dev](HRESULT code, const char *what) {
    auto res = hrResult(code, what);
    dev->device->Release();
    return res;
  };

  if (FAILED(hr = dev->device->SetDataFormat(&c_dfDIJoystick2)))
    return fail(hr, "SetDataFormat");

  hr = dev->device->SetCooperativeLevel(window, DISCL_EXCLUSIVE | DISCL_BACKGROUND);
  if (FAILED(hr)) {
    LogService::instance().warning(desc.name + ": exclusive access refused, force feedback disabled");
    hr = dev->device->SetCooperativeLevel(window, DISCL_NONEXCLUSIVE | DISCL_BACKGROUND);
    if (FAILED(hr))
      return fail(hr, "SetCooperativeLevel");
    desc.hasForceFeedback = false;
  }

  for (auto &axis : desc.axes) {
    DIPROPRANGE range;
    range.diph.dwSize = sizeof(DIPROPRANGE);
    range.diph.dwHeaderSize = sizeof(DIPROPHEADER);
    range.diph.dwHow = DIPH_BYOFFSET;
    range.diph.dwObj = axisOffsets[axis.code];
    range.lMin = kAxisMin;
    range.lMax = kAxisMax;
    dev->device->SetProperty(DIPROP_RANGE, &range.diph);
  }

  // Only bridged effects should act on the wheel
  if (desc.hasForceFeedback) {
    setDwordProperty(dev->device, DIPROP_AUTOCENTER, DIPROPAUTOCENTER_OFF);
    setDwordProperty(dev->device, DIPROP_FFGAIN, DI_FFNOMINALMAX);
  }

  if (FAILED(hr = dev->device->Acquire()))
    return fail(hr, "Acquire");

  dev->description = desc;
  dev->state.numAxes = (int)desc.axes.size();
  handle = nextHandle++;
  description = desc;
  devices[handle] = std::move(dev);
  return BridgeResult::ok();
}

DirectInputDeviceBackend::OpenDevice *DirectInputDeviceBackend::find(DeviceHandle handle) {
  const juce::ScopedLock sl(lock);
  auto it = devices.find(handle);
  return it != devices.end() ? it->second.get() : nullptr;
}

BridgeResult DirectInputDeviceBackend::pollInput(DeviceHandle handle, int timeoutMs,
                                                 RawSample &sample) {
  auto *dev = find(handle);
  if (dev == nullptr)
    return BridgeResult::fail(ErrorKind::NotFound, "Device handle is not open");

  // No input event to wait on: sit out the timeout, then read the freshest state
  if (timeoutMs > 0)
    juce::Thread::sleep(timeoutMs);

  HRESULT hr = dev->device->Poll();
  if (hr == DIERR_INPUTLOST || hr == DIERR_NOTACQUIRED) {
    auto r = dev->reacquire();
    if (r.failed())
      return r;
    dev->device->Poll();
  } else if (hr == DIERR_UNPLUGGED) {
    return hrResult(hr, "Poll");
  }

  DIJOYSTATE2 js;
  hr = dev->device->GetDeviceState(sizeof(DIJOYSTATE2), &js);
  if (FAILED(hr)) {
    if (hr == DIERR_INPUTLOST || hr == DIERR_NOTACQUIRED)
      dev->reacquire();
    return hrResult(hr, "GetDeviceState");
  }

  auto &desc = dev->description;
  for (size_t i = 0; i < desc.axes.size(); ++i)
    dev->state.axes[i] = readAxis(js, desc.axes[i].code);
  for (size_t i = 0; i < desc.buttons.size(); ++i)
    dev->state.buttons.set(i, (js.rgbButtons[desc.buttons[i].code] & 0x80) != 0);
  dev->state.sequence++;

  sample = dev->state;
  return BridgeResult::ok();
}

BridgeResult DirectInputDeviceBackend::uploadEffect(DeviceHandle handle, const NativeEffect &effect,
                                                    NativeEffectHandle &effectHandle) {
  auto *dev = find(handle);
  if (dev == nullptr)
    return BridgeResult::fail(ErrorKind::NotFound, "Device handle is not open");
  if (!dev->description.hasForceFeedback)
    return BridgeResult::fail(ErrorKind::Unsupported, dev->description.name + " has no FFB");

  DiEffectBlock block(effect);
  IDirectInputEffect *fx = nullptr;
  HRESULT hr = dev->device->CreateEffect(block.guid, &block.eff, &fx, nullptr);
  if (FAILED(hr))
    return hrResult(hr, "CreateEffect");

  effectHandle = dev->nextEffect++;
  dev->effects[effectHandle] = {fx, block.guid};
  return BridgeResult::ok();
}

BridgeResult DirectInputDeviceBackend::updateEffect(DeviceHandle handle, NativeEffectHandle effectHandle,
                                                    const NativeEffect &effect) {
  auto *dev = find(handle);
  if (dev == nullptr)
    return BridgeResult::fail(ErrorKind::NotFound, "Device handle is not open");
  auto it = dev->effects.find(effectHandle);
  if (it == dev->effects.end())
    return BridgeResult::fail(ErrorKind::NotFound, "Unknown effect handle");

  DiEffectBlock block(effect);
  if (block.guid != it->second.guid) {
    // A DirectInput effect cannot change type; replace it under the same handle
    IDirectInputEffect *fx = nullptr;
    HRESULT hr = dev->device->CreateEffect(block.guid, &block.eff, &fx, nullptr);
    if (FAILED(hr))
      return hrResult(hr, "CreateEffect");
    it->second.effect->Stop();
    it->second.effect->Unload();
    it->second.effect->Release();
    it->second = {fx, block.guid};
    return BridgeResult::ok();
  }

  HRESULT hr = it->second.effect->SetParameters(
      &block.eff, DIEP_DIRECTION | DIEP_DURATION | DIEP_ENVELOPE | DIEP_STARTDELAY |
                      DIEP_TYPESPECIFICPARAMS);
  if (FAILED(hr))
    return hrResult(hr, "SetParameters");
  return BridgeResult::ok();
}

BridgeResult DirectInputDeviceBackend::playEffect(DeviceHandle handle, NativeEffectHandle effectHandle) {
  auto *dev = find(handle);
  if (dev == nullptr)
    return BridgeResult::fail(ErrorKind::NotFound, "Device handle is not open");
  auto it = dev->effects.find(effectHandle);
  if (it == dev->effects.end())
    return BridgeResult::fail(ErrorKind::NotFound, "Unknown effect handle");

  HRESULT hr = it->second.effect->Start(1, 0);
  if (FAILED(hr))
    return hrResult(hr, "Start");
  return BridgeResult::ok();
}

BridgeResult DirectInputDeviceBackend::stopEffect(DeviceHandle handle, NativeEffectHandle effectHandle) {
  auto *dev = find(handle);
  if (dev == nullptr)
    return BridgeResult::fail(ErrorKind::NotFound, "Device handle is not open");
  auto it = dev->effects.find(effectHandle);
  if (it == dev->effects.end())
    return BridgeResult::ok();

  HRESULT hr = it->second.effect->Stop();
  if (FAILED(hr))
    return hrResult(hr, "Stop");
  return BridgeResult::ok();
}

BridgeResult DirectInputDeviceBackend::releaseEffect(DeviceHandle handle,
                                                     NativeEffectHandle effectHandle) {
  auto *dev = find(handle);
  if (dev == nullptr)
    return BridgeResult::fail(ErrorKind::NotFound, "Device handle is not open");
  auto it = dev->effects.find(effectHandle);
  if (it == dev->effects.end())
    return BridgeResult::ok();

  it->second.effect->Unload();
  it->second.effect->Release();
  dev->effects.erase(it);
  return BridgeResult::ok();
}

void DirectInputDeviceBackend::close(DeviceHandle handle) {
  std::unique_ptr<OpenDevice> dev;
  {
    const juce::ScopedLock sl(lock);
    auto it = devices.find(handle);
    if (it == devices.end())
      return;
    dev = std::move(it->second);
    devices.erase(it);
  }

  for (auto &entry : dev->effects) {
    entry.second.effect->Stop();
    entry.second.effect->Unload();
    entry.second.effect->Release();
  }
  dev->effects.clear();
  if (dev->description.hasForceFeedback)
    dev->device->SendForceFeedbackCommand(DISFFC_STOPALL);
  dev->device->Unacquire();
  dev->device->Release();
}
#endif
