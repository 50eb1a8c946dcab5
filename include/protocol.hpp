#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

enum class DeviceFamily : uint8_t {
    Equilibrium,
    Halo,
};

// GATT characteristics of both device families.
enum class Characteristic : uint8_t {
    // Equilibrium (poll)
    EqSessionKey,
    EqAuthentication,
    EqDeviceTime,
    EqDeviceProfile,
    EqDeviceName,
    EqDeviceDebug,
    EqState,
    EqCapabilities,
    EqSetup,
    EqAppAction,
    EqTimers,
    EqStatistics,
    EqSettings,
    EqLightState,
    EqLightCapabilities,
    EqLightSetup,
    EqLightAppAction,
    EqLightTimers,
    // Halo (notify)
    HaloSessionKey,
    HaloAuthentication,
    HaloTx,
    HaloRx,
};

constexpr std::size_t kCharacteristicCount = 22;
constexpr std::size_t kUuidStringLen = 36;

struct CharacteristicInfo {
    Characteristic id;
    const char* uuid;
    const char* name;
};

extern const std::array<CharacteristicInfo, kCharacteristicCount> kCharacteristicTable;

extern const char* const kEquilibriumServiceUuid;
extern const char* const kHaloServiceUuid;
extern const char* const kHaloAdvertisedName;

const char* characteristic_uuid(Characteristic c);
const char* characteristic_name(Characteristic c);
// Case-insensitive match against the closed UUID table.
bool characteristic_from_uuid(const char* uuid, Characteristic& out);

const char* service_uuid(DeviceFamily family);
// Picks the family from a scan result. Either argument may be null.
bool family_from_advertisement(const char* service, const char* local_name, DeviceFamily& out);

// Halo command tags carried little-endian at offset 1 of every packet.
enum class HaloCommand : uint16_t {
    DeviceProfile = 1,
    Time = 2,
    Date = 3,
    HaloPing = 5,
    DeviceName = 6,
    Temperature = 9,
    Settings = 100,
    WaterVolume = 101,
    SetPoint = 102,
    State = 104,
    Capabilities = 105,
    MaintenanceState = 106,
    FlexSettings = 107,
    EquipmentMode = 201,
    EquipmentParameter = 202,
    LightState = 300,
    LightCapabilities = 301,
    LightSetup = 302,
    TimerSetup = 400,
    TimerState = 401,
    TimerCapabilities = 402,
    TimerConfig = 403,
    ProbeStatistics = 600,
    CellStatistics = 601,
    PowerBoardStatistics = 602,
    InfoLog = 603,
    HeaterCapabilities = 1100,
    HeaterConfig = 1101,
    HeaterState = 1102,
    HeaterCooldownState = 1104,
    SolarCapabilities = 1200,
    SolarConfig = 1201,
    SolarState = 1202,
    GpoSetup = 1300,
    RelaySetup = 1301,
    ValveSetup = 1302,
};

constexpr std::size_t kHaloPacketLen = 20;
constexpr std::size_t kHaloTagOffset = 1;
constexpr std::size_t kHaloDataOffset = 3;
constexpr std::size_t kHaloDataLen = kHaloPacketLen - kHaloDataOffset;
constexpr uint8_t kHaloRequestType = 0x02;

struct HaloRequest {
    uint16_t command;
    bool has_sub_param;
    uint8_t sub_param;
};

// Issued after subscribing; the device answers with every record it has.
constexpr std::array<HaloRequest, 6> kHaloCatchAllRequests{{
    {static_cast<uint16_t>(HaloCommand::FlexSettings), false, 0},
    {static_cast<uint16_t>(HaloCommand::HaloPing), false, 0},
    {static_cast<uint16_t>(HaloCommand::ProbeStatistics), false, 0},
    {static_cast<uint16_t>(HaloCommand::CellStatistics), false, 0},
    {static_cast<uint16_t>(HaloCommand::PowerBoardStatistics), false, 0},
    {static_cast<uint16_t>(HaloCommand::InfoLog), false, 0},
}};
