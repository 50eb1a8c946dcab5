#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

enum class ActionFamily : uint8_t {
    Equilibrium,
    HaloChlorinator,
    HaloLight,
    HaloHeater,
    HaloSolar,
};

enum class EquilibriumAction : uint8_t {
    NoAction = 0,
    Off = 1,
    Auto = 2,
    Manual = 3,
    Low = 4,
    Medium = 5,
    High = 6,
    Pool = 7,
    Spa = 8,
    DismissInfoMessage = 9,
    DisableAcidDosingIndefinitely = 10,
    DisableAcidDosingForPeriod = 11,
    ResetStatistics = 12,
    TriggerCellReversal = 13,
};

enum class HaloChlorinatorAction : uint8_t {
    NoAction = 0,
    Off = 1,
    Auto = 2,
    On = 3,
    Low = 4,
    Medium = 5,
    High = 6,
    Pool = 7,
    Spa = 8,
    DismissInfoMessage = 9,
    DisableAcidDosingIndefinitely = 10,
    DisableAcidDosingForPeriod = 11,
    ResetStatistics = 12,
    TriggerCellReversal = 13,
    AllOff = 14,
    AllAuto = 15,
    Backwash = 16,
    PrimeAcid = 17,
    ManualDose = 18,
    ProbeCalibrationStart = 19,
    ProbeCalibrationAction = 20,
    AbortMaintTask = 21,
    SanitiseUntilTimerTomorrow = 22,
    FilterForPeriod = 23,
    FilterAndCleanForPeriod = 24,
    ResetToFactoryDefaults = 25,
    PoolFavourite = 26,
    SpaFavourite = 27,
    Favourite1 = 28,
    Favourite2 = 29,
    ClearEventList = 30,
    SanitiseForPeriod = 31,
    SanitiseAndCleanForPeriod = 32,
    OverrideHeaterCooldown = 33,
};

enum class LightAction : uint8_t {
    NoAction = 0,
    SetZoneModeToManual = 1,
    SetZoneModeToAuto = 2,
    TurnOffZone = 3,
    TurnOnZone = 4,
    SetZoneColour = 5,
    SynchroniseZoneColour = 6,
};

enum class HeaterAction : uint8_t {
    NoAction = 0,
    HeaterPumpOff = 1,
    HeaterPumpAuto = 2,
    HeaterPumpOn = 3,
    HeaterOff = 4,
    HeaterOn = 5,
    IncreaseSetpoint = 6,
    DecreaseSetpoint = 7,
    Pool = 8,
    Spa = 9,
    DisableUseTimers = 10,
    EnableUseTimers = 11,
    ModeHeating = 12,
    ModeCooling = 13,
};

enum class SolarAction : uint8_t {
    NoAction = 0,
    Off = 1,
    Auto = 2,
    On = 3,
    Summer = 4,
    Winter = 5,
    IncreaseSetPoint = 6,
    DecreaseSetPoint = 7,
};

// Every action frame is one cipher payload long.
constexpr std::size_t kActionFrameLen = 20;
constexpr std::size_t kActionHeaderLen = 3;

struct ActionFrame {
    ActionFamily family;
    std::array<uint8_t, kActionFrameLen> bytes;
    std::size_t len;
};

struct DecodedAction {
    ActionFamily family;
    uint8_t tag;
    int32_t parameter;
};

// `minutes` is only meaningful for actions where action_uses_parameter() holds.
ActionFrame encode_equilibrium_action(EquilibriumAction action, int32_t minutes = 0);
ActionFrame encode_halo_chlorinator_action(HaloChlorinatorAction action, int32_t minutes = 0);
ActionFrame encode_light_action(LightAction action);
ActionFrame encode_heater_action(HeaterAction action);
ActionFrame encode_solar_action(SolarAction action);

// Rejects frames of the wrong length, with a foreign header or an out-of-range tag.
bool decode_action_frame(ActionFamily family, const uint8_t* data, std::size_t len, DecodedAction& out);

bool action_uses_parameter(EquilibriumAction action);
bool action_uses_parameter(HaloChlorinatorAction action);

const char* action_family_name(ActionFamily family);
const char* to_string(EquilibriumAction action);
const char* to_string(HaloChlorinatorAction action);
const char* to_string(LightAction action);
const char* to_string(HeaterAction action);
const char* to_string(SolarAction action);
