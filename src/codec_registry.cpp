#include "codec_registry.hpp"
#include "record_fields.hpp"
#include <algorithm>
#include <iterator>

namespace {
template <typename Record, typename Variant, CodecResult (*Decode)(const uint8_t*, std::size_t, Record&)>
CodecResult decode_into(const uint8_t* data, std::size_t len, Variant& out) {
    Record rec{};
    CodecResult res = Decode(data, len, rec);
    if (res.ok) {
        out = rec;
    }
    return res;
}

template <typename Record, CodecResult (*Decode)(const uint8_t*, std::size_t, Record&)>
constexpr ChlorinatorDecodeFn chlor_fn() {
    return &decode_into<Record, ChlorinatorRecord, Decode>;
}

template <typename Record, CodecResult (*Decode)(const uint8_t*, std::size_t, Record&)>
constexpr HaloDecodeFn halo_fn() {
    return &decode_into<Record, HaloRecord, Decode>;
}

constexpr uint16_t tag(HaloCommand cmd) {
    return static_cast<uint16_t>(cmd);
}

const std::array<CharacteristicCodec, kPolledCharacteristicCount> kCharacteristicCodecs{{
    {Characteristic::EqState, "state", kChlorinatorStateLen,
     chlor_fn<ChlorinatorState, decode_chlorinator_state>()},
    {Characteristic::EqSetup, "setup", kChlorinatorSetupLen,
     chlor_fn<ChlorinatorSetup, decode_chlorinator_setup>()},
    {Characteristic::EqCapabilities, "capabilities", kChlorinatorCapabilitiesLen,
     chlor_fn<ChlorinatorCapabilities, decode_chlorinator_capabilities>()},
    {Characteristic::EqTimers, "timers", kChlorinatorTimersLen,
     chlor_fn<ChlorinatorTimers, decode_chlorinator_timers>()},
    {Characteristic::EqStatistics, "statistics", kChlorinatorStatisticsLen,
     chlor_fn<ChlorinatorStatistics, decode_chlorinator_statistics>()},
    {Characteristic::EqSettings, "settings", kChlorinatorSettingsLen,
     chlor_fn<ChlorinatorSettings, decode_chlorinator_settings>()},
}};

const std::array<Characteristic, kPolledCharacteristicCount> kPolledOrder{{
    Characteristic::EqState,
    Characteristic::EqSetup,
    Characteristic::EqCapabilities,
    Characteristic::EqTimers,
    Characteristic::EqStatistics,
    Characteristic::EqSettings,
}};

// Sorted by tag.
const CommandCodec kCommandCodecs[] = {
    {tag(HaloCommand::DeviceProfile), "device_profile", kDeviceProfileLen,
     halo_fn<DeviceProfile, decode_device_profile>()},
    {tag(HaloCommand::Temperature), "temperature", kTemperatureLen,
     halo_fn<TemperatureRecord, decode_temperature>()},
    {tag(HaloCommand::Settings), "settings", kHaloSettingsLen,
     halo_fn<HaloSettings, decode_halo_settings>()},
    {tag(HaloCommand::WaterVolume), "water_volume", kWaterVolumeLen,
     halo_fn<WaterVolume, decode_water_volume>()},
    {tag(HaloCommand::SetPoint), "set_point", kSetPointLen,
     halo_fn<SetPoint, decode_set_point>()},
    {tag(HaloCommand::State), "state", kHaloStateLen,
     halo_fn<HaloState, decode_halo_state>()},
    {tag(HaloCommand::Capabilities), "capabilities", kHaloCapabilitiesLen,
     halo_fn<HaloCapabilities, decode_halo_capabilities>()},
    {tag(HaloCommand::MaintenanceState), "maintenance_state", kMaintenanceStateLen,
     halo_fn<MaintenanceState, decode_maintenance_state>()},
    {tag(HaloCommand::EquipmentMode), "equipment_mode", kEquipmentModeLen,
     halo_fn<EquipmentModeRecord, decode_equipment_mode>()},
    {tag(HaloCommand::EquipmentParameter), "equipment_parameter", kEquipmentParameterLen,
     halo_fn<EquipmentParameter, decode_equipment_parameter>()},
    {tag(HaloCommand::LightState), "light_state", kLightStateLen,
     halo_fn<LightState, decode_light_state>()},
    {tag(HaloCommand::LightCapabilities), "light_capabilities", kLightCapabilitiesLen,
     halo_fn<LightCapabilities, decode_light_capabilities>()},
    {tag(HaloCommand::LightSetup), "light_setup", kLightSetupLen,
     halo_fn<LightSetup, decode_light_setup>()},
    {tag(HaloCommand::ProbeStatistics), "probe_statistics", kProbeStatisticsLen,
     halo_fn<ProbeStatistics, decode_probe_statistics>()},
    {tag(HaloCommand::CellStatistics), "cell_statistics", kCellStatisticsLen,
     halo_fn<CellStatistics, decode_cell_statistics>()},
    {tag(HaloCommand::PowerBoardStatistics), "power_board_statistics", kPowerBoardStatisticsLen,
     halo_fn<PowerBoardStatistics, decode_power_board_statistics>()},
    {tag(HaloCommand::HeaterCapabilities), "heater_capabilities", kHeaterCapabilitiesLen,
     halo_fn<HeaterCapabilities, decode_heater_capabilities>()},
    {tag(HaloCommand::HeaterConfig), "heater_config", kHeaterConfigLen,
     halo_fn<HeaterConfig, decode_heater_config>()},
    {tag(HaloCommand::HeaterState), "heater_state", kHeaterStateLen,
     halo_fn<HeaterState, decode_heater_state>()},
    {tag(HaloCommand::HeaterCooldownState), "heater_cooldown_state", kHeaterCooldownStateLen,
     halo_fn<HeaterCooldownState, decode_heater_cooldown_state>()},
    {tag(HaloCommand::SolarCapabilities), "solar_capabilities", kSolarCapabilitiesLen,
     halo_fn<SolarCapabilities, decode_solar_capabilities>()},
    {tag(HaloCommand::SolarConfig), "solar_config", kSolarConfigLen,
     halo_fn<SolarConfig, decode_solar_config>()},
    {tag(HaloCommand::SolarState), "solar_state", kSolarStateLen,
     halo_fn<SolarState, decode_solar_state>()},
    {tag(HaloCommand::GpoSetup), "gpo_setup", kGpoSetupLen,
     halo_fn<GpoSetup, decode_gpo_setup>()},
    {tag(HaloCommand::RelaySetup), "relay_setup", kRelaySetupLen,
     halo_fn<RelaySetup, decode_relay_setup>()},
    {tag(HaloCommand::ValveSetup), "valve_setup", kValveSetupLen,
     halo_fn<ValveSetup, decode_valve_setup>()},
};

struct FieldExporter {
    StateSnapshot& snap;

    void operator()(const std::monostate&) const {}

    template <typename Record>
    void operator()(const Record& rec) const {
        export_fields(rec, snap);
    }
};
} // namespace

const CharacteristicCodec* find_characteristic_codec(Characteristic id) {
    for (const auto& codec : kCharacteristicCodecs) {
        if (codec.id == id) {
            return &codec;
        }
    }
    return nullptr;
}

const CommandCodec* find_command_codec(uint16_t command) {
    auto first = std::begin(kCommandCodecs);
    auto last = std::end(kCommandCodecs);
    auto it = std::lower_bound(first, last, command,
                               [](const CommandCodec& c, uint16_t t) { return c.tag < t; });
    if (it == last || it->tag != command) {
        return nullptr;
    }
    return &*it;
}

const std::array<Characteristic, kPolledCharacteristicCount>& polled_characteristics() {
    return kPolledOrder;
}

void merge_record(const ChlorinatorRecord& record, StateSnapshot& snap) {
    std::visit(FieldExporter{snap}, record);
}

void merge_record(const HaloRecord& record, StateSnapshot& snap) {
    std::visit(FieldExporter{snap}, record);
}

CodecResult decode_and_merge(const CharacteristicCodec& codec, const uint8_t* data, std::size_t len,
                             StateSnapshot& snap) {
    ChlorinatorRecord record;
    CodecResult res = codec.decode(data, len, record);
    if (res.ok) {
        merge_record(record, snap);
    }
    return res;
}

CodecResult decode_and_merge(const CommandCodec& codec, const uint8_t* data, std::size_t len,
                             StateSnapshot& snap) {
    HaloRecord record;
    CodecResult res = codec.decode(data, len, record);
    if (res.ok) {
        merge_record(record, snap);
    }
    return res;
}
