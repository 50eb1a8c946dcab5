#pragma once

#include "wire_reader.hpp"
#include <array>
#include <cstddef>
#include <cstdint>

// Equilibrium (poll variant) characteristic records, plus the enums the
// Halo records share with it.

enum class ChlorinatorMode : uint8_t {
    Off = 0,
    ManualOn = 1,
    Auto = 2,
};

enum class SpeedLevel : int8_t {
    NotSet = -1,
    Low = 0,
    Medium = 1,
    High = 2,
    AI = 3,
};

enum class InfoMessage : uint8_t {
    NoMessage = 0,
    PhProbeNoComms = 1,
    PhProbeOtherError = 2,
    PhProbeCleanCalibrate = 3,
    OrpProbeNoComms = 4,
    OrpProbeOtherError = 5,
    OrpProbeCleanCalibrate = 6,
    G4CommsFailure = 7,
    NoWaterFlow = 8,
    RtccFault = 128,
    OrpProbeFittedPhProbeMissing = 129,
    AiPumpSpeed = 130,
    LowSalt = 131,
    Unspecified = 132,
};

// Messages at or above this code are warnings rather than information.
constexpr uint8_t kInfoMessageWarningLevel = 128;

enum class ChlorineControlStatus : int8_t {
    Unknown = -1,
    InvalidNoMeasurement = 0,
    VeryVeryLow = 1,
    VeryLow = 2,
    Low = 3,
    Ok = 4,
    High = 5,
    VeryHigh = 6,
    VeryVeryHigh = 7,
};

enum class PhControlType : uint8_t {
    None = 0,
    Manual = 1,
    Automatic = 2,
};

enum class ChlorineControlType : uint8_t {
    None = 0,
    Manual = 1,
    Automatic = 2,
};

enum class VolumeUnits : uint8_t {
    Litres = 0,
    UsGallons = 1,
    ImperialGallons = 2,
};

enum class AcidDosingInhibitStatus : uint8_t {
    NotInhibited = 0,
    InhibitedIndefinitely = 1,
    InhibitedForAPeriod = 2,
};

constexpr uint8_t kStateChemistryValuesCurrent = 0x01;
constexpr uint8_t kStateChemistryValuesValid = 0x02;
constexpr uint8_t kStateSpaSelection = 0x04;
constexpr uint8_t kStatePumpIsPriming = 0x08;
constexpr uint8_t kStatePumpIsOperating = 0x10;
constexpr uint8_t kStateCellIsOperating = 0x20;
constexpr uint8_t kStateUserSettingsChanged = 0x40;
constexpr uint8_t kStateSanitisingUntilNextTimerTomorrow = 0x80;

constexpr uint8_t kCapThreeSpeedPumpEnabled = 0x01;
constexpr uint8_t kCapAiModeEnabled = 0x02;
constexpr uint8_t kCapVolumeUnitMask = 0x0C;
constexpr uint8_t kCapVolumeUnitShift = 2;
constexpr uint8_t kCapLightingEnabled = 0x10;
constexpr uint8_t kCapDosingCapableUnit = 0x20;

constexpr uint8_t kSetupNoTimerModel = 0x01;
constexpr uint8_t kSetupTimerMasterPresent = 0x02;

constexpr uint8_t kTimerStartHourMask = 0x1F;
constexpr uint8_t kTimerEnabled = 0x20;
constexpr uint8_t kTimerSpeedMask = 0xC0;
constexpr uint8_t kTimerSpeedShift = 6;

constexpr std::size_t kChlorinatorStateLen = 11;
constexpr std::size_t kChlorinatorSetupLen = 5;
constexpr std::size_t kChlorinatorCapabilitiesLen = 20;
constexpr std::size_t kChlorinatorSettingsLen = 3;
constexpr std::size_t kChlorinatorStatisticsLen = 17;
constexpr std::size_t kPumpTimerLen = 4;
constexpr std::size_t kPumpTimerCount = 4;
constexpr std::size_t kChlorinatorTimersLen = kPumpTimerLen * kPumpTimerCount;
constexpr uint16_t kMinutesPerDay = 24 * 60;

struct ChlorinatorState {
    ChlorinatorMode mode;
    SpeedLevel pump_speed;
    uint8_t active_timer;
    InfoMessage info_message;
    uint8_t flags;
    double ph_measurement;
    ChlorineControlStatus chlorine_control_status;
    uint8_t time_hours;
    uint8_t time_minutes;
    uint8_t time_seconds;

    bool chemistry_values_current;
    bool chemistry_values_valid;
    bool spa_selection;
    bool pump_is_priming;
    bool pump_is_operating;
    bool cell_is_operating;
    bool user_settings_changed;
    bool sanitising_until_next_timer_tomorrow;
};

struct ChlorinatorSetup {
    SpeedLevel default_manual_on_speed;
    double ph_control_setpoint;
    uint16_t chlorine_control_setpoint;
    uint8_t flags;
    bool no_timer_model;
    bool timer_master_present;
};

struct ChlorinatorCapabilities {
    uint8_t minimum_manual_acid_setpoint;
    uint8_t maximum_manual_acid_setpoint;
    uint8_t minimum_manual_chlorine_setpoint;
    uint8_t maximum_manual_chlorine_setpoint;
    double minimum_ph_setpoint;
    double maximum_ph_setpoint;
    uint16_t minimum_orp_setpoint;
    uint16_t maximum_orp_setpoint;
    PhControlType ph_control_type;
    ChlorineControlType chlorine_control_type;
    uint8_t flags;
    uint8_t cell_size;
    uint8_t acid_pump_size;
    double filter_pump_size;
    uint8_t reversal_period;
    // Three raw bytes; their encoding has not been established.
    std::array<uint8_t, 3> pool_volume_raw;
    uint16_t spa_volume;

    bool three_speed_pump_enabled;
    bool ai_mode_enabled;
    VolumeUnits volume_units;
    bool lighting_enabled;
    bool dosing_capable_unit;
};

struct ChlorinatorSettings {
    uint16_t acid_dosing_inhibit_time_remaining;
    AcidDosingInhibitStatus acid_dosing_inhibit_status;
};

struct ChlorinatorStatistics {
    double highest_ph_measured;
    double lowest_ph_measured;
    uint16_t highest_orp_measured;
    uint16_t lowest_orp_measured;
    uint16_t cell_reversal_count;
    uint32_t cell_running_hours;
    uint32_t low_salt_cell_running_hours;
    uint8_t previous_days_cell_load;
};

struct PumpTimer {
    bool enabled;
    // Minutes since midnight. The start hour field is five bits wide, so
    // hours of 24 and above are representable and must be rejected.
    uint16_t start_minutes;
    uint16_t stop_minutes;
    SpeedLevel speed_level;
};

struct ChlorinatorTimers {
    std::array<PumpTimer, kPumpTimerCount> pump_timers;
};

bool info_message_is_warning(InfoMessage msg);
bool pump_timer_is_invalid(const PumpTimer& timer);

CodecResult decode_chlorinator_state(const uint8_t* data, std::size_t len, ChlorinatorState& out);
CodecResult decode_chlorinator_setup(const uint8_t* data, std::size_t len, ChlorinatorSetup& out);
CodecResult decode_chlorinator_capabilities(const uint8_t* data, std::size_t len, ChlorinatorCapabilities& out);
CodecResult decode_chlorinator_settings(const uint8_t* data, std::size_t len, ChlorinatorSettings& out);
CodecResult decode_chlorinator_statistics(const uint8_t* data, std::size_t len, ChlorinatorStatistics& out);
CodecResult decode_chlorinator_timers(const uint8_t* data, std::size_t len, ChlorinatorTimers& out);

bool speed_level_from_code(uint8_t code, SpeedLevel& out);
bool info_message_from_code(uint8_t code, InfoMessage& out);

const char* to_string(ChlorinatorMode v);
const char* to_string(SpeedLevel v);
const char* to_string(InfoMessage v);
const char* to_string(ChlorineControlStatus v);
const char* to_string(PhControlType v);
const char* to_string(ChlorineControlType v);
const char* to_string(VolumeUnits v);
const char* to_string(AcidDosingInhibitStatus v);
