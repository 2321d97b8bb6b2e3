// DeviceRules.cpp
#include "apps/fw/DeviceRules.hpp"

#include <algorithm>

namespace fw {

void setContrast(msg::DeviceState& next, int v, EffectList& fx) {
    next.contrast = std::clamp(v, 0, msg::CONTRAST_MAX);
    fx.push_back({EffectType::SET_CONTRAST, next.contrast});
}

void setRegRatio(msg::DeviceState& next, int v, EffectList& fx) {
    next.reg_ratio = std::clamp(v, 0, msg::REG_RATIO_MAX);
    fx.push_back({EffectType::SET_REG_RATIO, next.reg_ratio});
}

void setBias(msg::DeviceState& next, bool bias_1_7, EffectList& fx) {
    next.bias_1_7 = bias_1_7;
    fx.push_back({EffectType::SET_BIAS, bias_1_7 ? 1 : 0});
}

void setInvert(msg::DeviceState& next, bool invert, EffectList& fx) {
    next.invert = invert;
    fx.push_back({EffectType::SET_INVERT, invert ? 1 : 0});
}

void setBacklight(msg::DeviceState& next, int duty, EffectList& fx) {
    next.backlight = std::clamp(duty, 0, msg::BACKLIGHT_MAX);
    fx.push_back({EffectType::SET_BACKLIGHT, next.backlight});
}

} // namespace fw
