#pragma once

#include "chlorinator_records.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

// Halo (notification variant) records. Each decoder takes the data slice that
// follows the command tag; all multi-byte fields are little-endian.

enum class DeviceType : int16_t {
    Unknown = -1,
    Pump = 0,
    Chlorinator = 1,
    Doser = 2,
    Light = 3,
    Probe = 4,
    ChlorinatorEmulator = 129,
};

enum class DeviceProtocol : int8_t {
    Unknown = -1,
    Protocol0 = 0,
    Firmware57 = 1,
    NextGen = 2,
};

// Equipment mode shared by pump, light zones, heater pump and solar.
enum class HaloMode : uint8_t {
    Off = 0,
    Auto = 1,
    On = 2,
};

enum class GpoMode : uint8_t {
    Off = 0,
    Auto = 1,
    On = 2,
    NotEnabled = 255,
};

enum class TempValid : uint8_t {
    Invalid = 0,
    IsValid = 1,
    WasValid = 2,
};

enum class CellModel : uint8_t {
    Model18 = 0,
    Model25 = 1,
    Model35 = 2,
    Model45 = 3,
};

enum class MainText : int8_t {
    None = -1,
    Off = 0,
    Sanitising = 1,
    AIModeSanitising = 2,
    AIModeSampling = 3,
    Sampling = 4,
    Standby = 5,
    PrePurge = 6,
    PostPurge = 7,
    SanitisingUntilFirstTimer = 8,
    Filtering = 9,
    FilteringAndCleaning = 10,
    CalibratingSensor = 11,
    Backwashing = 12,
    PrimingAcidPump = 13,
    ManualAcidDose = 14,
    LowSpeedNoChlorinating = 15,
    SanitisingForPeriod = 16,
    SanitisingAndCleaningForPeriod = 17,
    LowTemperatureReducedOutput = 18,
    HeaterCooldownInProgress = 19,
};

enum class ChlorineSubText : uint8_t {
    None = 0,
    ORPIsYellow = 1,
    ORPWasYellow = 2,
    ORPIsGreen = 3,
    ORPWasGreen = 4,
    ORPIsRed = 5,
    ORPWasRed = 6,
    ChlorineIsLow = 7,
    ChlorineWasLow = 8,
    ChlorineIsOK = 9,
    ChlorineWasOK = 10,
    ChlorineIsHigh = 11,
    ChlorineWasHigh = 12,
};

enum class PhSubText : uint8_t {
    None = 0,
    PHIsYellow = 1,
    PHWasYellow = 2,
    PHIsGreen = 3,
    PHWasGreen = 4,
    PHIsRed = 5,
    PHWasRed = 6,
    PHIsLow = 7,
    PHWasLow = 8,
    PHIsOK = 9,
    PHWasOK = 10,
    PHIsHigh = 11,
    PHWasHigh = 12,
};

enum class TimerSubText : uint8_t {
    None = 0,
    SanitisingPoolOff = 1,
    SanitisingPoolUntil = 2,
    SanitisingSpaOff = 3,
    SanitisingSpaUntil = 4,
    SanitisingOff = 5,
    SanitisingUntil = 6,
    PrimingFor = 7,
    HeaterCooldownTimeRemaining = 8,
};

enum class ErrorSubText : uint16_t {
    None = 0,
    IOExpander = 1,
    EEPROM = 2,
    RTC = 3,
    NoComPowerToUser = 4,
    NoComUserToPower = 5,
    Backwashing = 6,
    SensorCalibration = 7,
    AccessoryPairing = 8,
    ChlorOverheat = 9,
    TempShortCir = 10,
    TempOpenCir = 11,
    FactoryReset = 12,
    UpdateSuccess = 50,
    UpdateFailed = 51,
    UpdateAvailable = 52,
    LostCom = 100,
    LowVoltage = 101,
    PumpHighTemp = 102,
    OverCurrent = 103,
    BlockedInlet = 104,
    PumpGnlFault = 150,
    PumpLimitFault = 151,
    PumpVoltFault = 152,
    PumpCommFault = 153,
    PumpTempFault = 154,
    PumpSoftFault = 155,
    PumpFailedStart = 156,
    PumpCommErr = 157,
    PumpBlocked = 158,
    PhComLost = 200,
    OrpComLost = 201,
    PhHigh = 202,
    OrpHigh = 203,
    PhLow = 204,
    OrpLow = 205,
    PhACErr = 206,
    OrpACErr = 207,
    NoComHeater = 300,
    LowWaterTemp = 301,
    HighWaterTemp = 302,
    MechOverheat = 303,
    TherShortCir = 304,
    FlameRollOut = 305,
    FlueOverheat = 306,
    CondensateOverflow = 307,
    HXTherOpenCir = 308,
    HXTherShortCir = 309,
    WtrSsrSrted = 310,
    WtrSsrOpen = 311,
    HeaterHighTemp = 312,
    LowRefPrs = 313,
    HighRefPrs = 314,
    SrtedCoilSsr = 315,
    OpenCoilSsr = 316,
    Interlock = 317,
    HighLimit = 318,
    AirSsrSrted = 319,
    Gpo1ComLost = 400,
    Gpo2ComLost = 401,
    Light1LostCom = 500,
    Light2LostCom = 501,
    SlrRoofSsrSrted = 600,
    SlrRoofSsrDis = 601,
    SlrWtrSsrSrted = 602,
    SlrWtrSsrDis = 603,
    NoFlow = 700,
    HighSalt = 701,
    LowSalt = 702,
    WaterTooCold = 703,
    DownRate2 = 705,
    DownRate1 = 706,
    SamplingOnly = 707,
    DosingDisabled = 708,
    DlyAcidDoseLimit = 709,
    CellDis = 710,
    PhBatteryLow = 900,
    OrpBatteryLow = 901,
    PhRequired = 902,
    ConnectionError = 1400,
    Unknown = 65535,
};

enum class TaskState : int8_t {
    NoState = -1,
    NoTask = 0,
    SanitiseUntilTimer = 1,
    FilterForPeriod = 2,
    FilterAndCleanForPeriod = 3,
    Backwash = 4,
    CalibratePH = 5,
    CalibrateORP = 6,
    PrimeAcid = 7,
    DoseAcid = 8,
    SanitiseForPeriod = 9,
    SanitiseAndCleanForPeriod = 10,
};

enum class TaskReturnCode : uint8_t {
    OK = 0,
    FailedSetStartConditions = 1,
    TaskOverriddenByUser = 2,
    FailedSetSystemMode = 3,
    TaskAbortedByUser = 4,
    TaskComplete = 5,
};

enum class CalibrateState : uint8_t {
    Idle = 0,
    ProbeCalStarting = 1,
    ConnectToProbe = 2,
    ConnectionFailed = 3,
    ReadCalValue = 4,
    ReadCalValueFailed = 5,
    RunningPump = 6,
    TakingMeasurement = 7,
    MeasurementFailed = 8,
    WaitNewCalValue = 9,
    TimeOutWaitingCalibration = 10,
    WritingCalibrationValue = 11,
    CalibrationFailedToWrite = 12,
    CalibrationSuccessful = 13,
    CalAbort = 14,
};

enum class LightZoneName : uint8_t {
    Pool = 0,
    Spa = 1,
    PoolAndSpa = 2,
    Waterfall1 = 3,
    Waterfall2 = 4,
    Waterfall3 = 5,
    Garden = 6,
    Other = 7,
};

enum class HeaterMode : uint8_t {
    Off = 0,
    On = 1,
};

enum class HeatPumpMode : uint8_t {
    Cooling = 0,
    Heating = 1,
    Auto = 2,
};

enum class HeaterForced : uint8_t {
    NotForced = 0,
    ForcedOn = 1,
    ForcedOff = 2,
};

enum class SolarMessage : uint8_t {
    DisplayNothing = 0,
    Standby = 1,
    SolarHeatingActive = 2,
    SolarFlushActive = 3,
    SolarExcPerActive = 4,
    SolarSystemFlushed = 5,
    PumpWillRunFor = 6,
};

enum class GpoDeviceType : uint8_t {
    FilterPump = 0,
    PhProbe = 1,
    OrpProbe = 2,
    Heater = 3,
    Light1 = 4,
    Light2 = 5,
    LightFAB = 6,
    Connect1 = 7,
    Connect2 = 8,
};

enum class GpoFunction : uint8_t {
    Equipment = 0,
    Lighting = 1,
    Solar = 2,
    Heating = 3,
};

enum class GpoName : uint8_t {
    NoName = 0,
    Other = 1,
    CleaningPump = 2,
    HeaterPump = 3,
    BoosterPump = 4,
    WaterfallPump = 5,
    FountainPump = 6,
    Blower = 7,
    Jets = 8,
};

enum class RelayName : uint8_t {
    Relay1 = 0,
    Relay2 = 1,
};

enum class ValveName : uint8_t {
    None = 0,
    Other = 1,
    Pool = 2,
    Spa = 3,
    WaterFeature = 4,
    Waterfall = 5,
};

constexpr uint8_t kTempBoard = 0x01;
constexpr uint8_t kTempWater = 0x02;
constexpr uint8_t kTempChloroWater = 0x04;
constexpr uint8_t kTempSolarWater = 0x08;
constexpr uint8_t kTempSolarRoof = 0x10;
constexpr uint8_t kTempHeater = 0x20;

constexpr uint16_t kSettingsPrePurge = 0x0001;
constexpr uint16_t kSettingsPostPurge = 0x0002;
constexpr uint16_t kSettingsAcidFlush = 0x0004;
constexpr uint16_t kSettingsAiEnabled = 0x0008;
constexpr uint16_t kSettingsAiReadOnly = 0x0010;
constexpr uint16_t kSettingsDisplayOrp = 0x0020;
constexpr uint16_t kSettingsDosingEnabled = 0x0040;
constexpr uint16_t kSettingsThreeSpeedPump = 0x0080;
constexpr uint16_t kSettingsThreeSpeedPumpReadOnly = 0x0100;
constexpr uint16_t kSettingsPumpProtect = 0x0200;
constexpr uint16_t kSettingsUseTempSensor = 0x0400;
constexpr uint16_t kSettingsCleaningInterlock = 0x0800;
constexpr uint16_t kSettingsDisplayPh = 0x1000;

constexpr uint8_t kVolumePoolEnabled = 0x01;
constexpr uint8_t kVolumeSpaEnabled = 0x02;

constexpr uint8_t kHaloStateSpaMode = 0x01;
constexpr uint8_t kHaloStateCellOn = 0x02;
constexpr uint8_t kHaloStateCellReversed = 0x04;
constexpr uint8_t kHaloStateCoolingFanOn = 0x08;
constexpr uint8_t kHaloStateLightOutputOn = 0x10;
constexpr uint8_t kHaloStateDosingPumpOn = 0x20;
constexpr uint8_t kHaloStateCellIsReversing = 0x40;
constexpr uint8_t kHaloStateAiModeActive = 0x80;

constexpr uint8_t kMaintenanceAcidDosingDisabled = 0x01;
constexpr uint8_t kMaintenanceDayRolledOver = 0x02;

// Bit positions in the equipment state and auto-enabled bitfields.
constexpr uint16_t kEquipmentFilterPumpBit = 0x0001;
constexpr unsigned kEquipmentGpoShift = 1;
constexpr unsigned kEquipmentValveShift = 5;
constexpr unsigned kEquipmentRelayShift = 9;

constexpr uint8_t kHeaterOn = 0x01;
constexpr uint8_t kHeaterPressure = 0x02;
constexpr uint8_t kHeaterGasValve = 0x04;
constexpr uint8_t kHeaterFlame = 0x08;
constexpr uint8_t kHeaterLockout = 0x10;
constexpr uint8_t kHeaterGeneralService = 0x20;
constexpr uint8_t kHeaterIgnitionService = 0x40;
constexpr uint8_t kHeaterCoolingAvailable = 0x80;

constexpr uint8_t kSolarPumpState = 0x01;
constexpr uint8_t kSolarFlushActive = 0x02;

constexpr std::size_t kGpoCount = 4;
constexpr std::size_t kValveCount = 4;
constexpr std::size_t kRelayCount = 2;
constexpr std::size_t kLightZoneCount = 4;
constexpr std::size_t kAccessCodeLen = 4;
constexpr const char* kInvalidAccessCode = "Invalid UTF-8 encoding";

constexpr std::size_t kScanResponseLen = 21;
constexpr std::size_t kDeviceProfileLen = 13;
constexpr std::size_t kTemperatureLen = 16;
constexpr std::size_t kHaloSettingsLen = 8;
constexpr std::size_t kWaterVolumeLen = 14;
constexpr std::size_t kSetPointLen = 6;
constexpr std::size_t kHaloStateLen = 16;
constexpr std::size_t kHaloCapabilitiesLen = 2;
constexpr std::size_t kMaintenanceStateLen = 13;
constexpr std::size_t kEquipmentModeLen = 16;
constexpr std::size_t kEquipmentParameterLen = 11;
constexpr std::size_t kLightStateLen = 9;
constexpr std::size_t kLightCapabilitiesLen = 5;
constexpr std::size_t kLightSetupLen = 4;
constexpr std::size_t kProbeStatisticsLen = 6;
constexpr std::size_t kCellStatisticsLen = 15;
constexpr std::size_t kPowerBoardStatisticsLen = 4;
constexpr std::size_t kHeaterCapabilitiesLen = 5;
constexpr std::size_t kHeaterConfigLen = 2;
constexpr std::size_t kHeaterStateLen = 12;
constexpr std::size_t kHeaterCooldownStateLen = 8;
constexpr std::size_t kSolarCapabilitiesLen = 1;
constexpr std::size_t kSolarConfigLen = 10;
constexpr std::size_t kSolarStateLen = 14;
constexpr std::size_t kGpoSetupLen = 7;
constexpr std::size_t kRelaySetupLen = 5;
constexpr std::size_t kValveSetupLen = 4;

// Several Temperature readings are scaled by ten without protocol
// confirmation. They go through this constant so the assumption stays
// visible and can be changed in one place.
constexpr double kProvisionalTempScale = 10.0;

// Fixed setpoint limits of Halo units; the Capabilities record only carries
// the control types.
constexpr uint8_t kHaloMinManualAcidSetpoint = 0;
constexpr uint8_t kHaloMaxManualAcidSetpoint = 10;
constexpr uint8_t kHaloMinManualChlorineSetpoint = 0;
constexpr uint8_t kHaloMaxManualChlorineSetpoint = 8;
constexpr uint16_t kHaloMinOrpSetpoint = 100;
constexpr uint16_t kHaloMaxOrpSetpoint = 800;
constexpr double kHaloMinPhSetpoint = 3.0;
constexpr double kHaloMaxPhSetpoint = 10.0;

// Manufacturer data of the advertisement, used for pairing.
struct ScanResponse {
    DeviceType device_type;
    uint8_t device_version;
    DeviceProtocol device_protocol;
    uint8_t protocol_revision;
    uint8_t device_status;
    uint32_t unique_id;
    std::array<uint8_t, kAccessCodeLen> access_code;
    uint8_t firmware_major;
    uint8_t firmware_minor;
    uint8_t bootloader_major;
    uint8_t bootloader_minor;
    uint8_t hardware_platform_lo;
    uint8_t hardware_platform_hi;
    uint8_t time_alive;
    bool pairable;
};

struct DeviceProfile {
    DeviceType device_type;
    uint8_t device_version;
    DeviceProtocol device_protocol;
    uint8_t protocol_revision;
    uint8_t firmware_major;
    uint8_t firmware_minor;
    uint8_t bootloader_major;
    uint8_t bootloader_minor;
    uint8_t hardware_version;
    uint32_t serial_number;
};

struct TemperatureRecord {
    bool is_fahrenheit;
    uint8_t supports_mask;
    double board_temp;          // provisional scale
    double water_temp;
    double chloro_water_temp;   // provisional scale
    double solar_water_temp;    // provisional scale
    TempValid water_temp_valid;
    double solar_roof_temp;     // provisional scale
    double heater_temp;         // provisional scale
    uint8_t displayed_mask;
};

struct HaloSettings {
    uint16_t general;
    CellModel cell_model;
    uint8_t reversal_period;
    uint8_t ai_water_turns;
    uint8_t acid_pump_size;
    uint8_t filter_pump_size;
    uint8_t default_manual_on_speed;  // raw, not confirmed to be a SpeedLevel

    bool pre_purge_enabled;
    bool post_purge_enabled;
    bool acid_flush_enabled;
    bool ai_enabled_read_only;
    bool ai_mode_enabled;
    bool display_orp;
    bool dosing_capable;
    bool three_speed_pump_enabled;
    bool three_speed_pump_read_only;
    bool pump_protect_enabled;
    bool use_temperature_sensor;
    bool cleaning_interlock_enabled;
    bool display_ph;
};

struct WaterVolume {
    VolumeUnits volume_units;
    uint32_t pool_volume;
    uint16_t spa_volume;
    uint32_t pool_left_filter;
    uint16_t spa_left_filter;
    uint8_t flags;
    bool pool_enabled;
    bool spa_enabled;
};

struct SetPoint {
    double ph_control_setpoint;
    uint16_t orp_control_setpoint;
    uint8_t pool_chlorine_control_setpoint;
    uint8_t acid_control_setpoint;
    uint8_t spa_chlorine_control_setpoint;
};

struct HaloState {
    uint8_t flags;
    uint8_t real_cell_level;
    uint16_t cell_current_ma;
    MainText main_text;
    ChlorineSubText chlorine_text;
    uint16_t orp_measurement;
    PhSubText ph_text;
    double ph_measurement;
    TimerSubText timer_text;
    std::array<uint8_t, 2> timer_text_data;
    ErrorSubText error_text;
    uint8_t flag;

    bool in_pool_selection;
    bool cell_running;
    bool cell_reversed;
    bool cooling_fan_on;
    bool light_output_on;
    bool dosing_pump_on;
    bool cell_is_reversing;
    bool ai_mode_active;
};

struct HaloCapabilities {
    PhControlType ph_control_type;
    ChlorineControlType chlorine_control_type;
};

struct MaintenanceState {
    uint8_t flags;
    uint16_t dose_disable_time_mins;
    TaskState task_state;
    TaskReturnCode task_return_code;
    uint32_t task_time_remaining;
    uint16_t value_to_display;
    CalibrateState calibrate_state;
    HaloMode mode_after_complete;
    bool acid_dosing_disabled;
    bool day_rolled_over;
};

struct EquipmentSlot {
    GpoMode mode;
    bool state;
    bool auto_enabled;
};

struct EquipmentModeRecord {
    uint8_t equipment_enabled;  // raw, meaning unconfirmed
    HaloMode filter_pump_mode;
    std::array<EquipmentSlot, kGpoCount> gpo;
    std::array<EquipmentSlot, kValveCount> valve;
    std::array<EquipmentSlot, kRelayCount> relay;
    uint16_t state_bitfield;
    uint16_t auto_enabled_bitfield;
    bool filter_pump_state;
    bool filter_pump_auto_enabled;
};

struct EquipmentParameter {
    SpeedLevel filter_pump_speed;
    std::array<uint8_t, kGpoCount> gpo;
    std::array<uint8_t, kValveCount> valve;
    std::array<uint8_t, kRelayCount> relay;
};

struct LightState {
    std::array<HaloMode, kLightZoneCount> zone_mode;
    std::array<uint8_t, kLightZoneCount> zone_colour;  // model specific
    uint8_t zone_state_flags;
    std::array<bool, kLightZoneCount> zone_on;
};

struct LightCapabilities {
    uint8_t lighting_enabled;
    uint8_t onboard_light_enabled;
    uint8_t model;
    uint8_t zones_in_use;
    uint8_t multicolour_flags;
    std::array<bool, kLightZoneCount> zone_multicolour;
};

struct LightSetup {
    std::array<LightZoneName, kLightZoneCount> zone_name;
};

struct ProbeStatistics {
    double highest_ph_measured;
    double lowest_ph_measured;
    uint16_t highest_orp_measured;
    uint16_t lowest_orp_measured;
};

struct CellStatistics {
    uint16_t cell_reversal_count;
    uint32_t cell_running_hours;
    uint32_t low_salt_cell_running_hours;
    uint8_t previous_days_cell_load;
    uint16_t dosing_pump_secs;
    uint16_t filter_pump_mins;
};

struct PowerBoardStatistics {
    uint32_t runtime_hours;
};

struct HeaterCapabilities {
    uint8_t heater_enabled;
    uint8_t filter_pump_three_speed;
    uint8_t heater_pump_three_speed;
    uint8_t heater_pump_installed;
    uint8_t heater_pump_timer_bit;
};

struct HeaterConfig {
    uint8_t heater_pump_enabled;
    SpeedLevel min_pump_speed;
};

struct HeaterState {
    uint8_t status_flags;
    HaloMode heater_pump_mode;
    HeaterMode heater_mode;
    uint8_t setpoint;
    HeatPumpMode heat_pump_mode;
    HeaterForced forced;
    uint8_t forced_hours;
    uint8_t forced_minutes;
    TempValid water_temp_valid;
    double water_temp;
    uint8_t error;

    bool heater_on;
    bool pressure;
    bool gas_valve;
    bool flame;
    bool lockout;
    bool general_service_required;
    bool ignition_service_required;
    bool cooling_available;
};

struct HeaterCooldownState {
    uint8_t event_occurred;
    uint8_t cooldown_state;
    uint8_t reserved;
    uint8_t target_mode;
    uint16_t remaining_time;
    uint16_t total_time;
};

struct SolarCapabilities {
    uint8_t solar_enabled;
};

struct SolarConfig {
    uint8_t pump_start_hour;
    uint8_t pump_start_minute;
    uint8_t pump_stop_hour;
    uint8_t pump_stop_minute;
    uint8_t enable_flush;
    uint8_t flush_hours;
    uint8_t flush_minutes;
    uint16_t differential;
    uint8_t enable_exclusion_period;
};

struct SolarState {
    double roof_temp;
    double water_temp;
    uint16_t solar_temp;  // raw
    uint8_t season;
    HaloMode mode;
    uint8_t flags;
    TempValid roof_temp_valid;
    TempValid water_temp_valid;
    uint16_t spec_temp;   // raw
    SolarMessage message;
    bool summer_mode;
    bool pump_on;
    bool flush_active;
};

struct GpoSetup {
    GpoDeviceType device_type;
    uint8_t index;
    uint8_t outlet_enabled;
    GpoFunction function;
    GpoName name;
    uint8_t lighting_zone;
    uint8_t use_timers;
    // 1..4 for Connect expansion outlets, 0 when the outlet has no GPO slot.
    uint8_t slot;
};

struct RelaySetup {
    uint8_t index;
    uint8_t enabled;
    RelayName name;
    uint8_t action;
    uint8_t use_timers;
};

struct ValveSetup {
    uint8_t index;
    uint8_t enabled;
    ValveName name;
    uint8_t use_timers;
};

CodecResult decode_scan_response(const uint8_t* data, std::size_t len, ScanResponse& out);
// Pairing code advertised by the unit; "0000" when it is not pairable.
// "0000" when the unit is not pairable. Codes with NUL bytes or invalid UTF-8 yield kInvalidAccessCode.
std::string scan_access_code(const ScanResponse& scan);

CodecResult decode_device_profile(const uint8_t* data, std::size_t len, DeviceProfile& out);
CodecResult decode_temperature(const uint8_t* data, std::size_t len, TemperatureRecord& out);
CodecResult decode_halo_settings(const uint8_t* data, std::size_t len, HaloSettings& out);
CodecResult decode_water_volume(const uint8_t* data, std::size_t len, WaterVolume& out);
CodecResult decode_set_point(const uint8_t* data, std::size_t len, SetPoint& out);
CodecResult decode_halo_state(const uint8_t* data, std::size_t len, HaloState& out);
CodecResult decode_halo_capabilities(const uint8_t* data, std::size_t len, HaloCapabilities& out);
CodecResult decode_maintenance_state(const uint8_t* data, std::size_t len, MaintenanceState& out);
CodecResult decode_equipment_mode(const uint8_t* data, std::size_t len, EquipmentModeRecord& out);
CodecResult decode_equipment_parameter(const uint8_t* data, std::size_t len, EquipmentParameter& out);
CodecResult decode_light_state(const uint8_t* data, std::size_t len, LightState& out);
CodecResult decode_light_capabilities(const uint8_t* data, std::size_t len, LightCapabilities& out);
CodecResult decode_light_setup(const uint8_t* data, std::size_t len, LightSetup& out);
CodecResult decode_probe_statistics(const uint8_t* data, std::size_t len, ProbeStatistics& out);
CodecResult decode_cell_statistics(const uint8_t* data, std::size_t len, CellStatistics& out);
CodecResult decode_power_board_statistics(const uint8_t* data, std::size_t len, PowerBoardStatistics& out);
CodecResult decode_heater_capabilities(const uint8_t* data, std::size_t len, HeaterCapabilities& out);
CodecResult decode_heater_config(const uint8_t* data, std::size_t len, HeaterConfig& out);
CodecResult decode_heater_state(const uint8_t* data, std::size_t len, HeaterState& out);
CodecResult decode_heater_cooldown_state(const uint8_t* data, std::size_t len, HeaterCooldownState& out);
CodecResult decode_solar_capabilities(const uint8_t* data, std::size_t len, SolarCapabilities& out);
CodecResult decode_solar_config(const uint8_t* data, std::size_t len, SolarConfig& out);
CodecResult decode_solar_state(const uint8_t* data, std::size_t len, SolarState& out);
CodecResult decode_gpo_setup(const uint8_t* data, std::size_t len, GpoSetup& out);
CodecResult decode_relay_setup(const uint8_t* data, std::size_t len, RelaySetup& out);
CodecResult decode_valve_setup(const uint8_t* data, std::size_t len, ValveSetup& out);

bool error_sub_text_from_code(uint16_t code, ErrorSubText& out);

const char* to_string(DeviceType v);
const char* to_string(DeviceProtocol v);
const char* to_string(HaloMode v);
const char* to_string(GpoMode v);
const char* to_string(TempValid v);
const char* to_string(CellModel v);
const char* to_string(MainText v);
const char* to_string(ChlorineSubText v);
const char* to_string(PhSubText v);
const char* to_string(TimerSubText v);
const char* to_string(ErrorSubText v);
const char* to_string(TaskState v);
const char* to_string(TaskReturnCode v);
const char* to_string(CalibrateState v);
const char* to_string(LightZoneName v);
const char* to_string(HeaterMode v);
const char* to_string(HeatPumpMode v);
const char* to_string(HeaterForced v);
const char* to_string(SolarMessage v);
const char* to_string(GpoDeviceType v);
const char* to_string(GpoFunction v);
const char* to_string(GpoName v);
const char* to_string(RelayName v);
const char* to_string(ValveName v);
