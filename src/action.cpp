#include "action.hpp"
#include "logging.hpp"

namespace {
constexpr const char* TAG = "ACTION";

struct FamilyLayout {
    bool has_header;
    uint8_t header[kActionHeaderLen];
    bool has_parameter;
    uint8_t max_tag;
};

const FamilyLayout& layout_for(ActionFamily family) {
    static const FamilyLayout kEquilibrium{false, {0, 0, 0}, true, 13};
    static const FamilyLayout kHaloChlorinator{true, {0x03, 0xF4, 0x01}, true, 33};
    static const FamilyLayout kHaloLight{true, {0x03, 0xF5, 0x01}, false, 6};
    static const FamilyLayout kHaloHeater{true, {0x03, 0xF6, 0x01}, false, 13};
    static const FamilyLayout kHaloSolar{true, {0x03, 0xF7, 0x01}, false, 7};
    switch (family) {
        case ActionFamily::HaloChlorinator: return kHaloChlorinator;
        case ActionFamily::HaloLight: return kHaloLight;
        case ActionFamily::HaloHeater: return kHaloHeater;
        case ActionFamily::HaloSolar: return kHaloSolar;
        case ActionFamily::Equilibrium: break;
    }
    return kEquilibrium;
}

ActionFrame encode_frame(ActionFamily family, uint8_t tag, int32_t parameter) {
    const FamilyLayout& layout = layout_for(family);
    ActionFrame frame{};
    frame.family = family;
    frame.len = kActionFrameLen;
    std::size_t idx = 0;
    if (layout.has_header) {
        for (uint8_t b : layout.header) {
            frame.bytes[idx++] = b;
        }
    }
    frame.bytes[idx++] = tag;
    if (layout.has_parameter) {
        const uint32_t p = static_cast<uint32_t>(parameter);
        frame.bytes[idx++] = static_cast<uint8_t>(p & 0xFF);
        frame.bytes[idx++] = static_cast<uint8_t>((p >> 8) & 0xFF);
        frame.bytes[idx++] = static_cast<uint8_t>((p >> 16) & 0xFF);
        frame.bytes[idx++] = static_cast<uint8_t>((p >> 24) & 0xFF);
    }
    log_message(LogLevel::Debug, TAG, "encoded %s action tag=%u param=%ld", action_family_name(family),
                static_cast<unsigned>(tag), static_cast<long>(parameter));
    return frame;
}

const char* name_at(const char* const* names, std::size_t count, uint8_t tag) {
    return tag < count ? names[tag] : "Unknown";
}

const char* const kEquilibriumNames[] = {
    "NoAction", "Off", "Auto", "Manual", "Low", "Medium", "High", "Pool", "Spa",
    "DismissInfoMessage", "DisableAcidDosingIndefinitely", "DisableAcidDosingForPeriod",
    "ResetStatistics", "TriggerCellReversal",
};

const char* const kHaloChlorinatorNames[] = {
    "NoAction", "Off", "Auto", "On", "Low", "Medium", "High", "Pool", "Spa",
    "DismissInfoMessage", "DisableAcidDosingIndefinitely", "DisableAcidDosingForPeriod",
    "ResetStatistics", "TriggerCellReversal", "AllOff", "AllAuto", "Backwash", "PrimeAcid",
    "ManualDose", "ProbeCalibrationStart", "ProbeCalibrationAction", "AbortMaintTask",
    "SanitiseUntilTimerTomorrow", "FilterForPeriod", "FilterAndCleanForPeriod",
    "ResetToFactoryDefaults", "PoolFavourite", "SpaFavourite", "Favourite1", "Favourite2",
    "ClearEventList", "SanitiseForPeriod", "SanitiseAndCleanForPeriod", "OverrideHeaterCooldown",
};

const char* const kLightNames[] = {
    "NoAction", "SetZoneModeToManual", "SetZoneModeToAuto", "TurnOffZone", "TurnOnZone",
    "SetZoneColour", "SynchroniseZoneColour",
};

const char* const kHeaterNames[] = {
    "NoAction", "HeaterPumpOff", "HeaterPumpAuto", "HeaterPumpOn", "HeaterOff", "HeaterOn",
    "IncreaseSetpoint", "DecreaseSetpoint", "Pool", "Spa", "DisableUseTimers",
    "EnableUseTimers", "ModeHeating", "ModeCooling",
};

const char* const kSolarNames[] = {
    "NoAction", "Off", "Auto", "On", "Summer", "Winter", "IncreaseSetPoint", "DecreaseSetPoint",
};

template <std::size_t N>
constexpr std::size_t count_of(const char* const (&)[N]) {
    return N;
}
} // namespace

ActionFrame encode_equilibrium_action(EquilibriumAction action, int32_t minutes) {
    return encode_frame(ActionFamily::Equilibrium, static_cast<uint8_t>(action), minutes);
}

ActionFrame encode_halo_chlorinator_action(HaloChlorinatorAction action, int32_t minutes) {
    return encode_frame(ActionFamily::HaloChlorinator, static_cast<uint8_t>(action), minutes);
}

ActionFrame encode_light_action(LightAction action) {
    return encode_frame(ActionFamily::HaloLight, static_cast<uint8_t>(action), 0);
}

ActionFrame encode_heater_action(HeaterAction action) {
    return encode_frame(ActionFamily::HaloHeater, static_cast<uint8_t>(action), 0);
}

ActionFrame encode_solar_action(SolarAction action) {
    return encode_frame(ActionFamily::HaloSolar, static_cast<uint8_t>(action), 0);
}

bool decode_action_frame(ActionFamily family, const uint8_t* data, std::size_t len, DecodedAction& out) {
    if (!data || len != kActionFrameLen) {
        return false;
    }
    const FamilyLayout& layout = layout_for(family);
    std::size_t idx = 0;
    if (layout.has_header) {
        for (uint8_t b : layout.header) {
            if (data[idx++] != b) {
                return false;
            }
        }
    }
    const uint8_t tag = data[idx++];
    if (tag > layout.max_tag) {
        return false;
    }
    int32_t parameter = 0;
    if (layout.has_parameter) {
        const uint32_t p = static_cast<uint32_t>(data[idx]) |
                           (static_cast<uint32_t>(data[idx + 1]) << 8) |
                           (static_cast<uint32_t>(data[idx + 2]) << 16) |
                           (static_cast<uint32_t>(data[idx + 3]) << 24);
        parameter = static_cast<int32_t>(p);
    }
    out.family = family;
    out.tag = tag;
    out.parameter = parameter;
    return true;
}

bool action_uses_parameter(EquilibriumAction action) {
    return action == EquilibriumAction::DisableAcidDosingForPeriod;
}

bool action_uses_parameter(HaloChlorinatorAction action) {
    switch (action) {
        case HaloChlorinatorAction::DisableAcidDosingForPeriod:
        case HaloChlorinatorAction::FilterForPeriod:
        case HaloChlorinatorAction::FilterAndCleanForPeriod:
        case HaloChlorinatorAction::SanitiseForPeriod:
        case HaloChlorinatorAction::SanitiseAndCleanForPeriod:
            return true;
        default:
            return false;
    }
}

const char* action_family_name(ActionFamily family) {
    switch (family) {
        case ActionFamily::Equilibrium: return "equilibrium";
        case ActionFamily::HaloChlorinator: return "halo_chlorinator";
        case ActionFamily::HaloLight: return "halo_light";
        case ActionFamily::HaloHeater: return "halo_heater";
        case ActionFamily::HaloSolar: return "halo_solar";
    }
    return "unknown";
}

const char* to_string(EquilibriumAction action) {
    return name_at(kEquilibriumNames, count_of(kEquilibriumNames), static_cast<uint8_t>(action));
}

const char* to_string(HaloChlorinatorAction action) {
    return name_at(kHaloChlorinatorNames, count_of(kHaloChlorinatorNames), static_cast<uint8_t>(action));
}

const char* to_string(LightAction action) {
    return name_at(kLightNames, count_of(kLightNames), static_cast<uint8_t>(action));
}

const char* to_string(HeaterAction action) {
    return name_at(kHeaterNames, count_of(kHeaterNames), static_cast<uint8_t>(action));
}

const char* to_string(SolarAction action) {
    return name_at(kSolarNames, count_of(kSolarNames), static_cast<uint8_t>(action));
}
