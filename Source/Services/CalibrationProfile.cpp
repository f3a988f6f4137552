#include "CalibrationProfile.h"
#include <cmath>

float normalizeAxis(const AxisCalibration &axis, int32_t raw) {
  const double d = (double)raw - (double)axis.center;
  if (std::abs(d) <= axis.deadzone)
    return 0.0f;

  double n;
  if (d > 0.0) {
    const double span = ((double)axis.effectiveMax - (double)axis.center) - axis.deadzone;
    n = span > 0.0 ? (d - axis.deadzone) / span : 1.0;
  } else {
    const double span = ((double)axis.center - (double)axis.effectiveMin) - axis.deadzone;
    n = span > 0.0 ? (d + axis.deadzone) / span : -1.0;
  }
  n = juce::jlimit(-1.0, 1.0, n);
  return (float)(axis.inverted ? -n : n);
}

float normalizePedal(const AxisCalibration &axis, int32_t raw) {
  const double up = (double)axis.effectiveMax - (double)axis.center;
  const double down = (double)axis.center - (double)axis.effectiveMin;
  const bool pressesUp = !axis.inverted && up >= down;

  const double travel = pressesUp ? (double)raw - axis.center : (double)axis.center - raw;
  if (travel <= axis.deadzone)
    return 0.0f;
  const double span = (pressesUp ? up : down) - axis.deadzone;
  if (span <= 0.0)
    return 0.0f;
  return (float)juce::jlimit(0.0, 1.0, (travel - axis.deadzone) / span);
}

bool CalibrationProfile::isValid() const {
  if (axes.empty())
    return false;
  for (auto &a : axes)
    if (!a.isValid())
      return false;
  return true;
}

juce::var CalibrationProfile::toVar() const {
  auto *root = new juce::DynamicObject();
  root->setProperty("vendorId", (int)device.vendorId);
  root->setProperty("productId", (int)device.productId);
  root->setProperty("shiftUpButton", shiftUpButton);
  root->setProperty("shiftDownButton", shiftDownButton);

  juce::Array<juce::var> list;
  for (auto &a : axes) {
    auto *obj = new juce::DynamicObject();
    obj->setProperty("role", axisRoleName(a.role));
    obj->setProperty("center", (int)a.center);
    obj->setProperty("deadzone", a.deadzone);
    obj->setProperty("min", (int)a.effectiveMin);
    obj->setProperty("max", (int)a.effectiveMax);
    obj->setProperty("inverted", a.inverted);
    list.add(juce::var(obj));
  }
  root->setProperty("axes", list);
  return juce::var(root);
}

bool CalibrationProfile::fromVar(const juce::var &v, CalibrationProfile &out) {
  auto *obj = v.getDynamicObject();
  if (obj == nullptr)
    return false;
  auto *list = obj->getProperty("axes").getArray();
  if (list == nullptr)
    return false;

  CalibrationProfile p;
  p.device.vendorId = (uint16_t)(int)obj->getProperty("vendorId");
  p.device.productId = (uint16_t)(int)obj->getProperty("productId");
  p.shiftUpButton = obj->hasProperty("shiftUpButton") ? (int)obj->getProperty("shiftUpButton") : -1;
  p.shiftDownButton = obj->hasProperty("shiftDownButton") ? (int)obj->getProperty("shiftDownButton") : -1;

  for (auto &entry : *list) {
    AxisCalibration a;
    a.role = axisRoleFromName(entry.getProperty("role", "unmapped").toString());
    a.center = (int)entry.getProperty("center", 0);
    a.deadzone = (double)entry.getProperty("deadzone", 0.0);
    a.effectiveMin = (int)entry.getProperty("min", 0);
    a.effectiveMax = (int)entry.getProperty("max", 0);
    a.inverted = (bool)entry.getProperty("inverted", false);
    p.axes.push_back(a);
  }

  if (!p.isValid())
    return false;
  out = std::move(p);
  return true;
}
