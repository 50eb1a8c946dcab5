#include "protocol.hpp"
#include <cctype>
#include <cstring>

const char* const kEquilibriumServiceUuid = "45000001-98b7-4e29-a03f-160174643001";
const char* const kHaloServiceUuid = "45000001-98b7-4e29-a03f-160174643002";
const char* const kHaloAdvertisedName = "HCHLOR";

const std::array<CharacteristicInfo, kCharacteristicCount> kCharacteristicTable{{
    {Characteristic::EqSessionKey, "45000002-98b7-4e29-a03f-160174643001", "session_key"},
    {Characteristic::EqAuthentication, "45000003-98b7-4e29-a03f-160174643001", "authentication"},
    {Characteristic::EqDeviceTime, "45000006-98b7-4e29-a03f-160174643001", "device_time"},
    {Characteristic::EqDeviceProfile, "45000007-98b7-4e29-a03f-160174643001", "device_profile"},
    {Characteristic::EqDeviceName, "45000008-98b7-4e29-a03f-160174643001", "device_name"},
    {Characteristic::EqDeviceDebug, "45000009-98b7-4e29-a03f-160174643001", "device_debug"},
    {Characteristic::EqState, "45000200-98b7-4e29-a03f-160174643001", "chlorinator_state"},
    {Characteristic::EqCapabilities, "45000201-98b7-4e29-a03f-160174643001", "chlorinator_capabilities"},
    {Characteristic::EqSetup, "45000202-98b7-4e29-a03f-160174643001", "chlorinator_setup"},
    {Characteristic::EqAppAction, "45000203-98b7-4e29-a03f-160174643001", "chlorinator_app_action"},
    {Characteristic::EqTimers, "45000204-98b7-4e29-a03f-160174643001", "chlorinator_timers"},
    {Characteristic::EqStatistics, "45000205-98b7-4e29-a03f-160174643001", "chlorinator_statistics"},
    {Characteristic::EqSettings, "45000206-98b7-4e29-a03f-160174643001", "chlorinator_settings"},
    {Characteristic::EqLightState, "45000300-98b7-4e29-a03f-160174643001", "lighting_state"},
    {Characteristic::EqLightCapabilities, "45000301-98b7-4e29-a03f-160174643001", "lighting_capabilities"},
    {Characteristic::EqLightSetup, "45000302-98b7-4e29-a03f-160174643001", "lighting_setup"},
    {Characteristic::EqLightAppAction, "45000303-98b7-4e29-a03f-160174643001", "lighting_app_action"},
    {Characteristic::EqLightTimers, "45000304-98b7-4e29-a03f-160174643001", "lighting_timers"},
    {Characteristic::HaloSessionKey, "45000001-98b7-4e29-a03f-160174643002", "halo_session_key"},
    {Characteristic::HaloAuthentication, "45000002-98b7-4e29-a03f-160174643002", "halo_authentication"},
    {Characteristic::HaloTx, "45000003-98b7-4e29-a03f-160174643002", "halo_tx"},
    {Characteristic::HaloRx, "45000004-98b7-4e29-a03f-160174643002", "halo_rx"},
}};

namespace {
const CharacteristicInfo* lookup(Characteristic c) {
    for (const auto& info : kCharacteristicTable) {
        if (info.id == c) {
            return &info;
        }
    }
    return nullptr;
}

bool uuid_equal(const char* a, const char* b) {
    for (std::size_t i = 0; i < kUuidStringLen; ++i) {
        if (a[i] == '\0' || b[i] == '\0') {
            return false;
        }
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return a[kUuidStringLen] == '\0' && b[kUuidStringLen] == '\0';
}
} // namespace

const char* characteristic_uuid(Characteristic c) {
    const CharacteristicInfo* info = lookup(c);
    return info ? info->uuid : "";
}

const char* characteristic_name(Characteristic c) {
    const CharacteristicInfo* info = lookup(c);
    return info ? info->name : "unknown";
}

bool characteristic_from_uuid(const char* uuid, Characteristic& out) {
    if (!uuid) {
        return false;
    }
    for (const auto& info : kCharacteristicTable) {
        if (uuid_equal(info.uuid, uuid)) {
            out = info.id;
            return true;
        }
    }
    return false;
}

const char* service_uuid(DeviceFamily family) {
    return family == DeviceFamily::Halo ? kHaloServiceUuid : kEquilibriumServiceUuid;
}

bool family_from_advertisement(const char* service, const char* local_name, DeviceFamily& out) {
    if (service && uuid_equal(service, kEquilibriumServiceUuid)) {
        out = DeviceFamily::Equilibrium;
        return true;
    }
    if ((service && uuid_equal(service, kHaloServiceUuid)) ||
        (local_name && std::strcmp(local_name, kHaloAdvertisedName) == 0)) {
        out = DeviceFamily::Halo;
        return true;
    }
    return false;
}
