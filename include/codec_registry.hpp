#pragma once

#include "chlorinator_records.hpp"
#include "halo_records.hpp"
#include "protocol.hpp"
#include "snapshot.hpp"
#include "wire_reader.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <variant>

using ChlorinatorRecord = std::variant<std::monostate,
                                       ChlorinatorState,
                                       ChlorinatorSetup,
                                       ChlorinatorCapabilities,
                                       ChlorinatorSettings,
                                       ChlorinatorStatistics,
                                       ChlorinatorTimers>;

using HaloRecord = std::variant<std::monostate,
                                DeviceProfile,
                                TemperatureRecord,
                                HaloSettings,
                                WaterVolume,
                                SetPoint,
                                HaloState,
                                HaloCapabilities,
                                MaintenanceState,
                                EquipmentModeRecord,
                                EquipmentParameter,
                                LightState,
                                LightCapabilities,
                                LightSetup,
                                ProbeStatistics,
                                CellStatistics,
                                PowerBoardStatistics,
                                HeaterCapabilities,
                                HeaterConfig,
                                HeaterState,
                                HeaterCooldownState,
                                SolarCapabilities,
                                SolarConfig,
                                SolarState,
                                GpoSetup,
                                RelaySetup,
                                ValveSetup>;

using ChlorinatorDecodeFn = CodecResult(*)(const uint8_t* data, std::size_t len, ChlorinatorRecord& out);
using HaloDecodeFn = CodecResult(*)(const uint8_t* data, std::size_t len, HaloRecord& out);

// Poll variant: one entry per readable record characteristic.
struct CharacteristicCodec {
    Characteristic id;
    const char* name;
    std::size_t length;
    ChlorinatorDecodeFn decode;
};

// Notification variant: one entry per command tag that carries a record.
struct CommandCodec {
    uint16_t tag;
    const char* name;
    std::size_t length;
    HaloDecodeFn decode;
};

constexpr std::size_t kPolledCharacteristicCount = 6;

const CharacteristicCodec* find_characteristic_codec(Characteristic id);
const CommandCodec* find_command_codec(uint16_t tag);

// Records read by a poll-variant gather, in read order.
const std::array<Characteristic, kPolledCharacteristicCount>& polled_characteristics();

void merge_record(const ChlorinatorRecord& record, StateSnapshot& snap);
void merge_record(const HaloRecord& record, StateSnapshot& snap);

// Decode a plaintext buffer and merge its fields. The snapshot is untouched on failure.
CodecResult decode_and_merge(const CharacteristicCodec& codec, const uint8_t* data, std::size_t len,
                             StateSnapshot& snap);
CodecResult decode_and_merge(const CommandCodec& codec, const uint8_t* data, std::size_t len,
                             StateSnapshot& snap);
