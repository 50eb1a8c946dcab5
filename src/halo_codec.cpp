#include "halo_records.hpp"

#include <algorithm>

namespace {
template <typename T>
bool flag(T flags, T mask) {
    return (flags & mask) != 0;
}

double provisional_temp(uint16_t raw) {
    return static_cast<double>(raw) / kProvisionalTempScale;
}

// Strict UTF-8: no overlong forms, surrogates or code points past U+10FFFF.
bool valid_utf8(const uint8_t* data, std::size_t len) {
    std::size_t i = 0;
    while (i < len) {
        const uint8_t lead = data[i];
        std::size_t extra = 0;
        uint8_t lo = 0x80, hi = 0xBF;
        if (lead < 0x80) {
            ++i;
            continue;
        } else if (lead >= 0xC2 && lead <= 0xDF) {
            extra = 1;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            extra = 2;
            lo = lead == 0xE0 ? 0xA0 : 0x80;
            hi = lead == 0xED ? 0x9F : 0xBF;
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            extra = 3;
            lo = lead == 0xF0 ? 0x90 : 0x80;
            hi = lead == 0xF4 ? 0x8F : 0xBF;
        } else {
            return false;
        }
        if (len - i <= extra) {
            return false;
        }
        if (data[i + 1] < lo || data[i + 1] > hi) {
            return false;
        }
        for (std::size_t k = 2; k <= extra; ++k) {
            if ((data[i + k] & 0xC0) != 0x80) {
                return false;
            }
        }
        i += extra + 1;
    }
    return true;
}

bool device_type_from_code(uint8_t code, DeviceType& out) {
    if (code == static_cast<uint8_t>(DeviceType::ChlorinatorEmulator)) {
        out = DeviceType::ChlorinatorEmulator;
        return true;
    }
    if (code == 0xFF) {
        out = DeviceType::Unknown;
        return true;
    }
    return enum_from_code(code, static_cast<uint32_t>(DeviceType::Probe), out);
}

bool gpo_mode_from_code(uint8_t code, GpoMode& out) {
    if (code == static_cast<uint8_t>(GpoMode::NotEnabled)) {
        out = GpoMode::NotEnabled;
        return true;
    }
    return enum_from_code(code, static_cast<uint32_t>(GpoMode::On), out);
}

bool halo_mode_from_code(uint8_t code, HaloMode& out) {
    return enum_from_code(code, static_cast<uint32_t>(HaloMode::On), out);
}

bool temp_valid_from_code(uint8_t code, TempValid& out) {
    return enum_from_code(code, static_cast<uint32_t>(TempValid::WasValid), out);
}

CodecResult decode_equipment_slot(uint8_t raw_mode, unsigned bit, uint16_t state_bits, uint16_t auto_bits,
                                  const char* field, EquipmentSlot& out) {
    if (!gpo_mode_from_code(raw_mode, out.mode)) {
        return codec_error(ChlorError::UnknownEnumValue, field);
    }
    const uint16_t mask = static_cast<uint16_t>(1u << bit);
    out.state = flag<uint16_t>(state_bits, mask);
    out.auto_enabled = flag<uint16_t>(auto_bits, mask);
    return codec_ok();
}

const char* const kGpoModeFields[kGpoCount] = {"gpo1_mode", "gpo2_mode", "gpo3_mode", "gpo4_mode"};
const char* const kValveModeFields[kValveCount] = {"valve1_mode", "valve2_mode", "valve3_mode", "valve4_mode"};
const char* const kRelayModeFields[kRelayCount] = {"relay1_mode", "relay2_mode"};
const char* const kZoneModeFields[kLightZoneCount] = {
    "lighting_mode_1", "lighting_mode_2", "lighting_mode_3", "lighting_mode_4"};
const char* const kZoneNameFields[kLightZoneCount] = {
    "lighting_zone_name_1", "lighting_zone_name_2", "lighting_zone_name_3", "lighting_zone_name_4"};
} // namespace

bool error_sub_text_from_code(uint16_t code, ErrorSubText& out) {
    const bool known = code <= 12 || (code >= 50 && code <= 52) || (code >= 100 && code <= 104) ||
                       (code >= 150 && code <= 158) || (code >= 200 && code <= 207) ||
                       (code >= 300 && code <= 319) || code == 400 || code == 401 || code == 500 ||
                       code == 501 || (code >= 600 && code <= 603) || (code >= 700 && code <= 703) ||
                       (code >= 705 && code <= 710) || (code >= 900 && code <= 902) || code == 1400 ||
                       code == 65535;
    if (!known) {
        return false;
    }
    out = static_cast<ErrorSubText>(code);
    return true;
}

CodecResult decode_scan_response(const uint8_t* data, std::size_t len, ScanResponse& out) {
    if (!data || len < kScanResponseLen) {
        return codec_error(ChlorError::ShortBuffer, "scan_response");
    }
    WireReader r{data, kScanResponseLen};
    uint8_t type = 0, protocol = 0, reserved = 0;
    r.u8(type);
    r.u8(out.device_version);
    r.u8(protocol);
    r.u8(out.protocol_revision);
    r.u8(out.device_status);
    r.u8(reserved);
    r.u32le(out.unique_id);
    r.bytes(out.access_code.data(), out.access_code.size());
    r.u8(out.firmware_major);
    r.u8(out.firmware_minor);
    r.u8(out.bootloader_major);
    r.u8(out.bootloader_minor);
    r.u8(out.hardware_platform_lo);
    r.u8(out.hardware_platform_hi);
    r.u8(out.time_alive);

    if (!device_type_from_code(type, out.device_type)) {
        return codec_error(ChlorError::UnknownEnumValue, "device_type");
    }
    if (!enum_from_code_or_sentinel(protocol, 2, out.device_protocol)) {
        return codec_error(ChlorError::UnknownEnumValue, "device_protocol");
    }
    out.pairable = false;
    for (uint8_t b : out.access_code) {
        if (b != 0) {
            out.pairable = true;
        }
    }
    return codec_ok();
}

std::string scan_access_code(const ScanResponse& scan) {
    if (!scan.pairable) {
        return "0000";
    }
    const uint8_t* code = scan.access_code.data();
    const std::size_t len = scan.access_code.size();
    if (std::find(code, code + len, 0) != code + len || !valid_utf8(code, len)) {
        return kInvalidAccessCode;
    }
    return std::string(reinterpret_cast<const char*>(code), len);
}

CodecResult decode_device_profile(const uint8_t* data, std::size_t len, DeviceProfile& out) {
    if (!data || len < kDeviceProfileLen) {
        return codec_error(ChlorError::ShortBuffer, "device_profile");
    }
    WireReader r{data, kDeviceProfileLen};
    uint8_t type = 0, protocol = 0;
    r.u8(type);
    r.u8(out.device_version);
    r.u8(protocol);
    r.u8(out.protocol_revision);
    r.u8(out.firmware_major);
    r.u8(out.firmware_minor);
    r.u8(out.bootloader_major);
    r.u8(out.bootloader_minor);
    r.u8(out.hardware_version);
    r.u32le(out.serial_number);

    if (!device_type_from_code(type, out.device_type)) {
        return codec_error(ChlorError::UnknownEnumValue, "device_type");
    }
    if (!enum_from_code_or_sentinel(protocol, 2, out.device_protocol)) {
        return codec_error(ChlorError::UnknownEnumValue, "device_protocol");
    }
    return codec_ok();
}

CodecResult decode_temperature(const uint8_t* data, std::size_t len, TemperatureRecord& out) {
    if (!data || len < kTemperatureLen) {
        return codec_error(ChlorError::ShortBuffer, "temperature");
    }
    WireReader r{data, kTemperatureLen};
    uint8_t fahrenheit = 0, valid = 0;
    uint16_t board = 0, water = 0, chloro = 0, solar_water = 0, solar_roof = 0, heater = 0;
    r.u8(fahrenheit);
    r.u8(out.supports_mask);
    r.u16le(board);
    r.u16le(water);
    r.u16le(chloro);
    r.u16le(solar_water);
    r.u8(valid);
    r.u16le(solar_roof);
    r.u16le(heater);
    r.u8(out.displayed_mask);

    if (!temp_valid_from_code(valid, out.water_temp_valid)) {
        return codec_error(ChlorError::UnknownEnumValue, "water_temp_valid");
    }
    out.is_fahrenheit = fahrenheit != 0;
    out.water_temp = scale_tenths(water);
    out.board_temp = provisional_temp(board);
    out.chloro_water_temp = provisional_temp(chloro);
    out.solar_water_temp = provisional_temp(solar_water);
    out.solar_roof_temp = provisional_temp(solar_roof);
    out.heater_temp = provisional_temp(heater);
    return codec_ok();
}

CodecResult decode_halo_settings(const uint8_t* data, std::size_t len, HaloSettings& out) {
    if (!data || len < kHaloSettingsLen) {
        return codec_error(ChlorError::ShortBuffer, "settings");
    }
    WireReader r{data, kHaloSettingsLen};
    uint8_t model = 0;
    r.u16le(out.general);
    r.u8(model);
    r.u8(out.reversal_period);
    r.u8(out.ai_water_turns);
    r.u8(out.acid_pump_size);
    r.u8(out.filter_pump_size);
    r.u8(out.default_manual_on_speed);

    if (!enum_from_code(model, 3, out.cell_model)) {
        return codec_error(ChlorError::UnknownEnumValue, "cell_model");
    }
    const uint16_t g = out.general;
    out.pre_purge_enabled = flag(g, kSettingsPrePurge);
    out.post_purge_enabled = flag(g, kSettingsPostPurge);
    out.acid_flush_enabled = flag(g, kSettingsAcidFlush);
    out.ai_enabled_read_only = flag(g, kSettingsAiReadOnly);
    out.ai_mode_enabled = flag(g, kSettingsAiEnabled) || out.ai_enabled_read_only;
    out.display_orp = flag(g, kSettingsDisplayOrp);
    out.dosing_capable = flag(g, kSettingsDosingEnabled);
    out.three_speed_pump_enabled = flag(g, kSettingsThreeSpeedPump);
    out.three_speed_pump_read_only = flag(g, kSettingsThreeSpeedPumpReadOnly);
    out.pump_protect_enabled = flag(g, kSettingsPumpProtect);
    out.use_temperature_sensor = flag(g, kSettingsUseTempSensor);
    out.cleaning_interlock_enabled = flag(g, kSettingsCleaningInterlock);
    out.display_ph = flag(g, kSettingsDisplayPh);
    return codec_ok();
}

CodecResult decode_water_volume(const uint8_t* data, std::size_t len, WaterVolume& out) {
    if (!data || len < kWaterVolumeLen) {
        return codec_error(ChlorError::ShortBuffer, "water_volume");
    }
    WireReader r{data, kWaterVolumeLen};
    uint8_t units = 0;
    r.u8(units);
    r.u32le(out.pool_volume);
    r.u16le(out.spa_volume);
    r.u32le(out.pool_left_filter);
    r.u16le(out.spa_left_filter);
    r.u8(out.flags);

    if (!enum_from_code(units, 2, out.volume_units)) {
        return codec_error(ChlorError::UnknownEnumValue, "volume_units");
    }
    out.pool_enabled = flag(out.flags, kVolumePoolEnabled);
    out.spa_enabled = flag(out.flags, kVolumeSpaEnabled);
    return codec_ok();
}

CodecResult decode_set_point(const uint8_t* data, std::size_t len, SetPoint& out) {
    if (!data || len < kSetPointLen) {
        return codec_error(ChlorError::ShortBuffer, "set_point");
    }
    WireReader r{data, kSetPointLen};
    uint8_t ph = 0;
    r.u8(ph);
    r.u16le(out.orp_control_setpoint);
    r.u8(out.pool_chlorine_control_setpoint);
    r.u8(out.acid_control_setpoint);
    r.u8(out.spa_chlorine_control_setpoint);
    out.ph_control_setpoint = scale_tenths(ph);
    return codec_ok();
}

CodecResult decode_halo_state(const uint8_t* data, std::size_t len, HaloState& out) {
    if (!data || len < kHaloStateLen) {
        return codec_error(ChlorError::ShortBuffer, "state");
    }
    WireReader r{data, kHaloStateLen};
    uint8_t main = 0, chlorine = 0, ph_text = 0, ph = 0, timer = 0;
    uint16_t error = 0;
    r.u8(out.flags);
    r.u8(out.real_cell_level);
    r.u16le(out.cell_current_ma);
    r.u8(main);
    r.u8(chlorine);
    r.u16le(out.orp_measurement);
    r.u8(ph_text);
    r.u8(ph);
    r.u8(timer);
    r.bytes(out.timer_text_data.data(), out.timer_text_data.size());
    r.u16le(error);
    r.u8(out.flag);

    if (!enum_from_code_or_sentinel(main, 19, out.main_text)) {
        return codec_error(ChlorError::UnknownEnumValue, "main_text");
    }
    if (!enum_from_code(chlorine, 12, out.chlorine_text)) {
        return codec_error(ChlorError::UnknownEnumValue, "chlorine_text");
    }
    if (!enum_from_code(ph_text, 12, out.ph_text)) {
        return codec_error(ChlorError::UnknownEnumValue, "ph_text");
    }
    if (!enum_from_code(timer, 8, out.timer_text)) {
        return codec_error(ChlorError::UnknownEnumValue, "timer_text");
    }
    if (!error_sub_text_from_code(error, out.error_text)) {
        return codec_error(ChlorError::UnknownEnumValue, "error_text");
    }
    out.ph_measurement = scale_tenths(ph);
    out.in_pool_selection = !flag(out.flags, kHaloStateSpaMode);
    out.cell_running = flag(out.flags, kHaloStateCellOn);
    out.cell_reversed = flag(out.flags, kHaloStateCellReversed);
    out.cooling_fan_on = flag(out.flags, kHaloStateCoolingFanOn);
    out.light_output_on = flag(out.flags, kHaloStateLightOutputOn);
    out.dosing_pump_on = flag(out.flags, kHaloStateDosingPumpOn);
    out.cell_is_reversing = flag(out.flags, kHaloStateCellIsReversing);
    out.ai_mode_active = flag(out.flags, kHaloStateAiModeActive);
    return codec_ok();
}

CodecResult decode_halo_capabilities(const uint8_t* data, std::size_t len, HaloCapabilities& out) {
    if (!data || len < kHaloCapabilitiesLen) {
        return codec_error(ChlorError::ShortBuffer, "capabilities");
    }
    if (!enum_from_code(data[0], 2, out.ph_control_type)) {
        return codec_error(ChlorError::UnknownEnumValue, "ph_control_type");
    }
    if (!enum_from_code(data[1], 2, out.chlorine_control_type)) {
        return codec_error(ChlorError::UnknownEnumValue, "chlorine_control_type");
    }
    return codec_ok();
}

CodecResult decode_maintenance_state(const uint8_t* data, std::size_t len, MaintenanceState& out) {
    if (!data || len < kMaintenanceStateLen) {
        return codec_error(ChlorError::ShortBuffer, "maintenance_state");
    }
    WireReader r{data, kMaintenanceStateLen};
    uint8_t task = 0, ret = 0, cal = 0, mode = 0;
    r.u8(out.flags);
    r.u16le(out.dose_disable_time_mins);
    r.u8(task);
    r.u8(ret);
    r.u32le(out.task_time_remaining);
    r.u16le(out.value_to_display);
    r.u8(cal);
    r.u8(mode);

    if (!enum_from_code_or_sentinel(task, 10, out.task_state)) {
        return codec_error(ChlorError::UnknownEnumValue, "task_state");
    }
    if (!enum_from_code(ret, 5, out.task_return_code)) {
        return codec_error(ChlorError::UnknownEnumValue, "task_return_code");
    }
    if (!enum_from_code(cal, 14, out.calibrate_state)) {
        return codec_error(ChlorError::UnknownEnumValue, "calibrate_state");
    }
    if (!halo_mode_from_code(mode, out.mode_after_complete)) {
        return codec_error(ChlorError::UnknownEnumValue, "mode_after_complete");
    }
    out.acid_dosing_disabled = flag(out.flags, kMaintenanceAcidDosingDisabled);
    out.day_rolled_over = flag(out.flags, kMaintenanceDayRolledOver);
    return codec_ok();
}

CodecResult decode_equipment_mode(const uint8_t* data, std::size_t len, EquipmentModeRecord& out) {
    if (!data || len < kEquipmentModeLen) {
        return codec_error(ChlorError::ShortBuffer, "equipment_mode");
    }
    WireReader r{data, kEquipmentModeLen};
    uint8_t pump = 0;
    std::array<uint8_t, kGpoCount> gpo{};
    std::array<uint8_t, kValveCount> valve{};
    std::array<uint8_t, kRelayCount> relay{};
    r.u8(out.equipment_enabled);
    r.u8(pump);
    r.bytes(gpo.data(), gpo.size());
    r.bytes(valve.data(), valve.size());
    r.bytes(relay.data(), relay.size());
    r.u16le(out.state_bitfield);
    r.u16le(out.auto_enabled_bitfield);

    if (!halo_mode_from_code(pump, out.filter_pump_mode)) {
        return codec_error(ChlorError::UnknownEnumValue, "filter_pump_mode");
    }
    for (std::size_t i = 0; i < kGpoCount; ++i) {
        CodecResult res = decode_equipment_slot(gpo[i], static_cast<unsigned>(kEquipmentGpoShift + i),
                                                out.state_bitfield, out.auto_enabled_bitfield,
                                                kGpoModeFields[i], out.gpo[i]);
        if (!res.ok) return res;
    }
    for (std::size_t i = 0; i < kValveCount; ++i) {
        CodecResult res = decode_equipment_slot(valve[i], static_cast<unsigned>(kEquipmentValveShift + i),
                                                out.state_bitfield, out.auto_enabled_bitfield,
                                                kValveModeFields[i], out.valve[i]);
        if (!res.ok) return res;
    }
    for (std::size_t i = 0; i < kRelayCount; ++i) {
        CodecResult res = decode_equipment_slot(relay[i], static_cast<unsigned>(kEquipmentRelayShift + i),
                                                out.state_bitfield, out.auto_enabled_bitfield,
                                                kRelayModeFields[i], out.relay[i]);
        if (!res.ok) return res;
    }
    out.filter_pump_state = flag<uint16_t>(out.state_bitfield, kEquipmentFilterPumpBit);
    out.filter_pump_auto_enabled = flag<uint16_t>(out.auto_enabled_bitfield, kEquipmentFilterPumpBit);
    return codec_ok();
}

CodecResult decode_equipment_parameter(const uint8_t* data, std::size_t len, EquipmentParameter& out) {
    if (!data || len < kEquipmentParameterLen) {
        return codec_error(ChlorError::ShortBuffer, "equipment_parameter");
    }
    WireReader r{data, kEquipmentParameterLen};
    uint8_t speed = 0;
    r.u8(speed);
    r.bytes(out.gpo.data(), out.gpo.size());
    r.bytes(out.valve.data(), out.valve.size());
    r.bytes(out.relay.data(), out.relay.size());
    if (!speed_level_from_code(speed, out.filter_pump_speed)) {
        return codec_error(ChlorError::UnknownEnumValue, "filter_pump_speed");
    }
    return codec_ok();
}

CodecResult decode_light_state(const uint8_t* data, std::size_t len, LightState& out) {
    if (!data || len < kLightStateLen) {
        return codec_error(ChlorError::ShortBuffer, "light_state");
    }
    WireReader r{data, kLightStateLen};
    std::array<uint8_t, kLightZoneCount> modes{};
    r.bytes(modes.data(), modes.size());
    r.bytes(out.zone_colour.data(), out.zone_colour.size());
    r.u8(out.zone_state_flags);
    for (std::size_t i = 0; i < kLightZoneCount; ++i) {
        if (!halo_mode_from_code(modes[i], out.zone_mode[i])) {
            return codec_error(ChlorError::UnknownEnumValue, kZoneModeFields[i]);
        }
        out.zone_on[i] = flag<uint8_t>(out.zone_state_flags, static_cast<uint8_t>(1u << i));
    }
    return codec_ok();
}

CodecResult decode_light_capabilities(const uint8_t* data, std::size_t len, LightCapabilities& out) {
    if (!data || len < kLightCapabilitiesLen) {
        return codec_error(ChlorError::ShortBuffer, "light_capabilities");
    }
    WireReader r{data, kLightCapabilitiesLen};
    r.u8(out.lighting_enabled);
    r.u8(out.onboard_light_enabled);
    r.u8(out.model);
    r.u8(out.zones_in_use);
    r.u8(out.multicolour_flags);
    for (std::size_t i = 0; i < kLightZoneCount; ++i) {
        out.zone_multicolour[i] = flag<uint8_t>(out.multicolour_flags, static_cast<uint8_t>(1u << i));
    }
    return codec_ok();
}

CodecResult decode_light_setup(const uint8_t* data, std::size_t len, LightSetup& out) {
    if (!data || len < kLightSetupLen) {
        return codec_error(ChlorError::ShortBuffer, "light_setup");
    }
    for (std::size_t i = 0; i < kLightZoneCount; ++i) {
        if (!enum_from_code(data[i], 7, out.zone_name[i])) {
            return codec_error(ChlorError::UnknownEnumValue, kZoneNameFields[i]);
        }
    }
    return codec_ok();
}

CodecResult decode_probe_statistics(const uint8_t* data, std::size_t len, ProbeStatistics& out) {
    if (!data || len < kProbeStatisticsLen) {
        return codec_error(ChlorError::ShortBuffer, "probe_statistics");
    }
    WireReader r{data, kProbeStatisticsLen};
    uint8_t hi = 0, lo = 0;
    r.u8(hi);
    r.u8(lo);
    r.u16le(out.highest_orp_measured);
    r.u16le(out.lowest_orp_measured);
    out.highest_ph_measured = scale_tenths(hi);
    out.lowest_ph_measured = scale_tenths(lo);
    return codec_ok();
}

CodecResult decode_cell_statistics(const uint8_t* data, std::size_t len, CellStatistics& out) {
    if (!data || len < kCellStatisticsLen) {
        return codec_error(ChlorError::ShortBuffer, "cell_statistics");
    }
    WireReader r{data, kCellStatisticsLen};
    r.u16le(out.cell_reversal_count);
    r.u32le(out.cell_running_hours);
    r.u32le(out.low_salt_cell_running_hours);
    r.u8(out.previous_days_cell_load);
    r.u16le(out.dosing_pump_secs);
    r.u16le(out.filter_pump_mins);
    return codec_ok();
}

CodecResult decode_power_board_statistics(const uint8_t* data, std::size_t len, PowerBoardStatistics& out) {
    if (!data || len < kPowerBoardStatisticsLen) {
        return codec_error(ChlorError::ShortBuffer, "power_board_statistics");
    }
    WireReader r{data, kPowerBoardStatisticsLen};
    r.u32le(out.runtime_hours);
    return codec_ok();
}

CodecResult decode_heater_capabilities(const uint8_t* data, std::size_t len, HeaterCapabilities& out) {
    if (!data || len < kHeaterCapabilitiesLen) {
        return codec_error(ChlorError::ShortBuffer, "heater_capabilities");
    }
    out.heater_enabled = data[0];
    out.filter_pump_three_speed = data[1];
    out.heater_pump_three_speed = data[2];
    out.heater_pump_installed = data[3];
    out.heater_pump_timer_bit = data[4];
    return codec_ok();
}

CodecResult decode_heater_config(const uint8_t* data, std::size_t len, HeaterConfig& out) {
    if (!data || len < kHeaterConfigLen) {
        return codec_error(ChlorError::ShortBuffer, "heater_config");
    }
    out.heater_pump_enabled = data[0];
    if (!speed_level_from_code(data[1], out.min_pump_speed)) {
        return codec_error(ChlorError::UnknownEnumValue, "heater_min_pump_speed");
    }
    return codec_ok();
}

CodecResult decode_heater_state(const uint8_t* data, std::size_t len, HeaterState& out) {
    if (!data || len < kHeaterStateLen) {
        return codec_error(ChlorError::ShortBuffer, "heater_state");
    }
    WireReader r{data, kHeaterStateLen};
    uint8_t pump_mode = 0, mode = 0, hp_mode = 0, forced = 0, valid = 0;
    uint16_t temp = 0;
    r.u8(out.status_flags);
    r.u8(pump_mode);
    r.u8(mode);
    r.u8(out.setpoint);
    r.u8(hp_mode);
    r.u8(forced);
    r.u8(out.forced_hours);
    r.u8(out.forced_minutes);
    r.u8(valid);
    r.u16le(temp);
    r.u8(out.error);

    if (!halo_mode_from_code(pump_mode, out.heater_pump_mode)) {
        return codec_error(ChlorError::UnknownEnumValue, "heater_pump_mode");
    }
    if (!enum_from_code(mode, 1, out.heater_mode)) {
        return codec_error(ChlorError::UnknownEnumValue, "heater_mode");
    }
    if (!enum_from_code(hp_mode, 2, out.heat_pump_mode)) {
        return codec_error(ChlorError::UnknownEnumValue, "heat_pump_mode");
    }
    if (!enum_from_code(forced, 2, out.forced)) {
        return codec_error(ChlorError::UnknownEnumValue, "heater_forced");
    }
    if (!temp_valid_from_code(valid, out.water_temp_valid)) {
        return codec_error(ChlorError::UnknownEnumValue, "heater_water_temp_valid");
    }
    out.water_temp = scale_tenths(temp);
    out.heater_on = flag(out.status_flags, kHeaterOn);
    out.pressure = flag(out.status_flags, kHeaterPressure);
    out.gas_valve = flag(out.status_flags, kHeaterGasValve);
    out.flame = flag(out.status_flags, kHeaterFlame);
    out.lockout = flag(out.status_flags, kHeaterLockout);
    out.general_service_required = flag(out.status_flags, kHeaterGeneralService);
    out.ignition_service_required = flag(out.status_flags, kHeaterIgnitionService);
    out.cooling_available = flag(out.status_flags, kHeaterCoolingAvailable);
    return codec_ok();
}

CodecResult decode_heater_cooldown_state(const uint8_t* data, std::size_t len, HeaterCooldownState& out) {
    if (!data || len < kHeaterCooldownStateLen) {
        return codec_error(ChlorError::ShortBuffer, "heater_cooldown_state");
    }
    WireReader r{data, kHeaterCooldownStateLen};
    r.u8(out.event_occurred);
    r.u8(out.cooldown_state);
    r.u8(out.reserved);
    r.u8(out.target_mode);
    r.u16le(out.remaining_time);
    r.u16le(out.total_time);
    return codec_ok();
}

CodecResult decode_solar_capabilities(const uint8_t* data, std::size_t len, SolarCapabilities& out) {
    if (!data || len < kSolarCapabilitiesLen) {
        return codec_error(ChlorError::ShortBuffer, "solar_capabilities");
    }
    out.solar_enabled = data[0];
    return codec_ok();
}

CodecResult decode_solar_config(const uint8_t* data, std::size_t len, SolarConfig& out) {
    if (!data || len < kSolarConfigLen) {
        return codec_error(ChlorError::ShortBuffer, "solar_config");
    }
    WireReader r{data, kSolarConfigLen};
    r.u8(out.pump_start_hour);
    r.u8(out.pump_start_minute);
    r.u8(out.pump_stop_hour);
    r.u8(out.pump_stop_minute);
    r.u8(out.enable_flush);
    r.u8(out.flush_hours);
    r.u8(out.flush_minutes);
    r.u16le(out.differential);
    r.u8(out.enable_exclusion_period);
    return codec_ok();
}

CodecResult decode_solar_state(const uint8_t* data, std::size_t len, SolarState& out) {
    if (!data || len < kSolarStateLen) {
        return codec_error(ChlorError::ShortBuffer, "solar_state");
    }
    WireReader r{data, kSolarStateLen};
    uint16_t roof = 0, water = 0;
    uint8_t mode = 0, roof_valid = 0, water_valid = 0, message = 0;
    r.u16le(roof);
    r.u16le(water);
    r.u16le(out.solar_temp);
    r.u8(out.season);
    r.u8(mode);
    r.u8(out.flags);
    r.u8(roof_valid);
    r.u8(water_valid);
    r.u16le(out.spec_temp);
    r.u8(message);

    if (!halo_mode_from_code(mode, out.mode)) {
        return codec_error(ChlorError::UnknownEnumValue, "solar_mode");
    }
    if (!temp_valid_from_code(roof_valid, out.roof_temp_valid)) {
        return codec_error(ChlorError::UnknownEnumValue, "solar_roof_temp_valid");
    }
    if (!temp_valid_from_code(water_valid, out.water_temp_valid)) {
        return codec_error(ChlorError::UnknownEnumValue, "solar_water_temp_valid");
    }
    if (!enum_from_code(message, 6, out.message)) {
        return codec_error(ChlorError::UnknownEnumValue, "solar_message");
    }
    out.roof_temp = scale_tenths(roof);
    out.water_temp = scale_tenths(water);
    out.summer_mode = out.season != 0;
    out.pump_on = flag(out.flags, kSolarPumpState);
    out.flush_active = flag(out.flags, kSolarFlushActive);
    return codec_ok();
}

CodecResult decode_gpo_setup(const uint8_t* data, std::size_t len, GpoSetup& out) {
    if (!data || len < kGpoSetupLen) {
        return codec_error(ChlorError::ShortBuffer, "gpo_setup");
    }
    WireReader r{data, kGpoSetupLen};
    uint8_t type = 0, function = 0, name = 0;
    r.u8(type);
    r.u8(out.index);
    r.u8(out.outlet_enabled);
    r.u8(function);
    r.u8(name);
    r.u8(out.lighting_zone);
    r.u8(out.use_timers);

    if (!enum_from_code(type, 8, out.device_type)) {
        return codec_error(ChlorError::UnknownEnumValue, "gpo_device_type");
    }
    if (!enum_from_code(function, 3, out.function)) {
        return codec_error(ChlorError::UnknownEnumValue, "gpo_function");
    }
    if (!enum_from_code(name, 8, out.name)) {
        return codec_error(ChlorError::UnknownEnumValue, "gpo_name");
    }
    int slot = 0;
    if (out.device_type == GpoDeviceType::Connect1) {
        slot = 1 + static_cast<int>(out.index);
    } else if (out.device_type == GpoDeviceType::Connect2) {
        slot = 3 + static_cast<int>(out.index);
    }
    if (slot > static_cast<int>(kGpoCount)) {
        return codec_error(ChlorError::UnknownEnumValue, "gpo_index");
    }
    out.slot = static_cast<uint8_t>(slot);
    return codec_ok();
}

CodecResult decode_relay_setup(const uint8_t* data, std::size_t len, RelaySetup& out) {
    if (!data || len < kRelaySetupLen) {
        return codec_error(ChlorError::ShortBuffer, "relay_setup");
    }
    WireReader r{data, kRelaySetupLen};
    uint8_t name = 0;
    r.u8(out.index);
    r.u8(out.enabled);
    r.u8(name);
    r.u8(out.action);
    r.u8(out.use_timers);
    if (!enum_from_code(name, 1, out.name)) {
        return codec_error(ChlorError::UnknownEnumValue, "relay_name");
    }
    return codec_ok();
}

CodecResult decode_valve_setup(const uint8_t* data, std::size_t len, ValveSetup& out) {
    if (!data || len < kValveSetupLen) {
        return codec_error(ChlorError::ShortBuffer, "valve_setup");
    }
    WireReader r{data, kValveSetupLen};
    uint8_t name = 0;
    r.u8(out.index);
    r.u8(out.enabled);
    r.u8(name);
    r.u8(out.use_timers);
    if (!enum_from_code(name, 5, out.name)) {
        return codec_error(ChlorError::UnknownEnumValue, "valve_name");
    }
    return codec_ok();
}

const char* to_string(DeviceType v) {
    switch (v) {
        case DeviceType::Unknown: return "Unknown";
        case DeviceType::Pump: return "Pump";
        case DeviceType::Chlorinator: return "Chlorinator";
        case DeviceType::Doser: return "Doser";
        case DeviceType::Light: return "Light";
        case DeviceType::Probe: return "Probe";
        case DeviceType::ChlorinatorEmulator: return "ChlorinatorEmulator";
    }
    return "Unknown";
}

const char* to_string(DeviceProtocol v) {
    switch (v) {
        case DeviceProtocol::Unknown: return "Unknown";
        case DeviceProtocol::Protocol0: return "Protocol0";
        case DeviceProtocol::Firmware57: return "Firmware57";
        case DeviceProtocol::NextGen: return "NextGen";
    }
    return "Unknown";
}

const char* to_string(HaloMode v) {
    switch (v) {
        case HaloMode::Off: return "Off";
        case HaloMode::Auto: return "Auto";
        case HaloMode::On: return "On";
    }
    return "Unknown";
}

const char* to_string(GpoMode v) {
    switch (v) {
        case GpoMode::Off: return "Off";
        case GpoMode::Auto: return "Auto";
        case GpoMode::On: return "On";
        case GpoMode::NotEnabled: return "NotEnabled";
    }
    return "Unknown";
}

const char* to_string(TempValid v) {
    switch (v) {
        case TempValid::Invalid: return "Invalid";
        case TempValid::IsValid: return "IsValid";
        case TempValid::WasValid: return "WasValid";
    }
    return "Unknown";
}

const char* to_string(CellModel v) {
    switch (v) {
        case CellModel::Model18: return "Model18";
        case CellModel::Model25: return "Model25";
        case CellModel::Model35: return "Model35";
        case CellModel::Model45: return "Model45";
    }
    return "Unknown";
}

const char* to_string(MainText v) {
    switch (v) {
        case MainText::None: return "None";
        case MainText::Off: return "Off";
        case MainText::Sanitising: return "Sanitising";
        case MainText::AIModeSanitising: return "AIModeSanitising";
        case MainText::AIModeSampling: return "AIModeSampling";
        case MainText::Sampling: return "Sampling";
        case MainText::Standby: return "Standby";
        case MainText::PrePurge: return "PrePurge";
        case MainText::PostPurge: return "PostPurge";
        case MainText::SanitisingUntilFirstTimer: return "SanitisingUntilFirstTimer";
        case MainText::Filtering: return "Filtering";
        case MainText::FilteringAndCleaning: return "FilteringAndCleaning";
        case MainText::CalibratingSensor: return "CalibratingSensor";
        case MainText::Backwashing: return "Backwashing";
        case MainText::PrimingAcidPump: return "PrimingAcidPump";
        case MainText::ManualAcidDose: return "ManualAcidDose";
        case MainText::LowSpeedNoChlorinating: return "LowSpeedNoChlorinating";
        case MainText::SanitisingForPeriod: return "SanitisingForPeriod";
        case MainText::SanitisingAndCleaningForPeriod: return "SanitisingAndCleaningForPeriod";
        case MainText::LowTemperatureReducedOutput: return "LowTemperatureReducedOutput";
        case MainText::HeaterCooldownInProgress: return "HeaterCooldownInProgress";
    }
    return "Unknown";
}

const char* to_string(ChlorineSubText v) {
    switch (v) {
        case ChlorineSubText::None: return "None";
        case ChlorineSubText::ORPIsYellow: return "ORPIsYellow";
        case ChlorineSubText::ORPWasYellow: return "ORPWasYellow";
        case ChlorineSubText::ORPIsGreen: return "ORPIsGreen";
        case ChlorineSubText::ORPWasGreen: return "ORPWasGreen";
        case ChlorineSubText::ORPIsRed: return "ORPIsRed";
        case ChlorineSubText::ORPWasRed: return "ORPWasRed";
        case ChlorineSubText::ChlorineIsLow: return "ChlorineIsLow";
        case ChlorineSubText::ChlorineWasLow: return "ChlorineWasLow";
        case ChlorineSubText::ChlorineIsOK: return "ChlorineIsOK";
        case ChlorineSubText::ChlorineWasOK: return "ChlorineWasOK";
        case ChlorineSubText::ChlorineIsHigh: return "ChlorineIsHigh";
        case ChlorineSubText::ChlorineWasHigh: return "ChlorineWasHigh";
    }
    return "Unknown";
}

const char* to_string(PhSubText v) {
    switch (v) {
        case PhSubText::None: return "None";
        case PhSubText::PHIsYellow: return "PHIsYellow";
        case PhSubText::PHWasYellow: return "PHWasYellow";
        case PhSubText::PHIsGreen: return "PHIsGreen";
        case PhSubText::PHWasGreen: return "PHWasGreen";
        case PhSubText::PHIsRed: return "PHIsRed";
        case PhSubText::PHWasRed: return "PHWasRed";
        case PhSubText::PHIsLow: return "PHIsLow";
        case PhSubText::PHWasLow: return "PHWasLow";
        case PhSubText::PHIsOK: return "PHIsOK";
        case PhSubText::PHWasOK: return "PHWasOK";
        case PhSubText::PHIsHigh: return "PHIsHigh";
        case PhSubText::PHWasHigh: return "PHWasHigh";
    }
    return "Unknown";
}

const char* to_string(TimerSubText v) {
    switch (v) {
        case TimerSubText::None: return "None";
        case TimerSubText::SanitisingPoolOff: return "SanitisingPoolOff";
        case TimerSubText::SanitisingPoolUntil: return "SanitisingPoolUntil";
        case TimerSubText::SanitisingSpaOff: return "SanitisingSpaOff";
        case TimerSubText::SanitisingSpaUntil: return "SanitisingSpaUntil";
        case TimerSubText::SanitisingOff: return "SanitisingOff";
        case TimerSubText::SanitisingUntil: return "SanitisingUntil";
        case TimerSubText::PrimingFor: return "PrimingFor";
        case TimerSubText::HeaterCooldownTimeRemaining: return "HeaterCooldownTimeRemaining";
    }
    return "Unknown";
}

const char* to_string(ErrorSubText v) {
    switch (v) {
        case ErrorSubText::None: return "None";
        case ErrorSubText::IOExpander: return "IOExpander";
        case ErrorSubText::EEPROM: return "EEPROM";
        case ErrorSubText::RTC: return "RTC";
        case ErrorSubText::NoComPowerToUser: return "NoComPowerToUser";
        case ErrorSubText::NoComUserToPower: return "NoComUserToPower";
        case ErrorSubText::Backwashing: return "Backwashing";
        case ErrorSubText::SensorCalibration: return "SensorCalibration";
        case ErrorSubText::AccessoryPairing: return "AccessoryPairing";
        case ErrorSubText::ChlorOverheat: return "ChlorOverheat";
        case ErrorSubText::TempShortCir: return "TempShortCir";
        case ErrorSubText::TempOpenCir: return "TempOpenCir";
        case ErrorSubText::FactoryReset: return "FactoryReset";
        case ErrorSubText::UpdateSuccess: return "UpdateSuccess";
        case ErrorSubText::UpdateFailed: return "UpdateFailed";
        case ErrorSubText::UpdateAvailable: return "UpdateAvailable";
        case ErrorSubText::LostCom: return "LostCom";
        case ErrorSubText::LowVoltage: return "LowVoltage";
        case ErrorSubText::PumpHighTemp: return "PumpHighTemp";
        case ErrorSubText::OverCurrent: return "OverCurrent";
        case ErrorSubText::BlockedInlet: return "BlockedInlet";
        case ErrorSubText::PumpGnlFault: return "PumpGnlFault";
        case ErrorSubText::PumpLimitFault: return "PumpLimitFault";
        case ErrorSubText::PumpVoltFault: return "PumpVoltFault";
        case ErrorSubText::PumpCommFault: return "PumpCommFault";
        case ErrorSubText::PumpTempFault: return "PumpTempFault";
        case ErrorSubText::PumpSoftFault: return "PumpSoftFault";
        case ErrorSubText::PumpFailedStart: return "PumpFailedStart";
        case ErrorSubText::PumpCommErr: return "PumpCommErr";
        case ErrorSubText::PumpBlocked: return "PumpBlocked";
        case ErrorSubText::PhComLost: return "PhComLost";
        case ErrorSubText::OrpComLost: return "OrpComLost";
        case ErrorSubText::PhHigh: return "PhHigh";
        case ErrorSubText::OrpHigh: return "OrpHigh";
        case ErrorSubText::PhLow: return "PhLow";
        case ErrorSubText::OrpLow: return "OrpLow";
        case ErrorSubText::PhACErr: return "PhACErr";
        case ErrorSubText::OrpACErr: return "OrpACErr";
        case ErrorSubText::NoComHeater: return "NoComHeater";
        case ErrorSubText::LowWaterTemp: return "LowWaterTemp";
        case ErrorSubText::HighWaterTemp: return "HighWaterTemp";
        case ErrorSubText::MechOverheat: return "MechOverheat";
        case ErrorSubText::TherShortCir: return "TherShortCir";
        case ErrorSubText::FlameRollOut: return "FlameRollOut";
        case ErrorSubText::FlueOverheat: return "FlueOverheat";
        case ErrorSubText::CondensateOverflow: return "CondensateOverflow";
        case ErrorSubText::HXTherOpenCir: return "HXTherOpenCir";
        case ErrorSubText::HXTherShortCir: return "HXTherShortCir";
        case ErrorSubText::WtrSsrSrted: return "WtrSsrSrted";
        case ErrorSubText::WtrSsrOpen: return "WtrSsrOpen";
        case ErrorSubText::HeaterHighTemp: return "HeaterHighTemp";
        case ErrorSubText::LowRefPrs: return "LowRefPrs";
        case ErrorSubText::HighRefPrs: return "HighRefPrs";
        case ErrorSubText::SrtedCoilSsr: return "SrtedCoilSsr";
        case ErrorSubText::OpenCoilSsr: return "OpenCoilSsr";
        case ErrorSubText::Interlock: return "Interlock";
        case ErrorSubText::HighLimit: return "HighLimit";
        case ErrorSubText::AirSsrSrted: return "AirSsrSrted";
        case ErrorSubText::Gpo1ComLost: return "Gpo1ComLost";
        case ErrorSubText::Gpo2ComLost: return "Gpo2ComLost";
        case ErrorSubText::Light1LostCom: return "Light1LostCom";
        case ErrorSubText::Light2LostCom: return "Light2LostCom";
        case ErrorSubText::SlrRoofSsrSrted: return "SlrRoofSsrSrted";
        case ErrorSubText::SlrRoofSsrDis: return "SlrRoofSsrDis";
        case ErrorSubText::SlrWtrSsrSrted: return "SlrWtrSsrSrted";
        case ErrorSubText::SlrWtrSsrDis: return "SlrWtrSsrDis";
        case ErrorSubText::NoFlow: return "NoFlow";
        case ErrorSubText::HighSalt: return "HighSalt";
        case ErrorSubText::LowSalt: return "LowSalt";
        case ErrorSubText::WaterTooCold: return "WaterTooCold";
        case ErrorSubText::DownRate2: return "DownRate2";
        case ErrorSubText::DownRate1: return "DownRate1";
        case ErrorSubText::SamplingOnly: return "SamplingOnly";
        case ErrorSubText::DosingDisabled: return "DosingDisabled";
        case ErrorSubText::DlyAcidDoseLimit: return "DlyAcidDoseLimit";
        case ErrorSubText::CellDis: return "CellDis";
        case ErrorSubText::PhBatteryLow: return "PhBatteryLow";
        case ErrorSubText::OrpBatteryLow: return "OrpBatteryLow";
        case ErrorSubText::PhRequired: return "PhRequired";
        case ErrorSubText::ConnectionError: return "ConnectionError";
        case ErrorSubText::Unknown: return "Unknown";
    }
    return "Unknown";
}

const char* to_string(TaskState v) {
    switch (v) {
        case TaskState::NoState: return "NoState";
        case TaskState::NoTask: return "NoTask";
        case TaskState::SanitiseUntilTimer: return "SanitiseUntilTimer";
        case TaskState::FilterForPeriod: return "FilterForPeriod";
        case TaskState::FilterAndCleanForPeriod: return "FilterAndCleanForPeriod";
        case TaskState::Backwash: return "Backwash";
        case TaskState::CalibratePH: return "CalibratePH";
        case TaskState::CalibrateORP: return "CalibrateORP";
        case TaskState::PrimeAcid: return "PrimeAcid";
        case TaskState::DoseAcid: return "DoseAcid";
        case TaskState::SanitiseForPeriod: return "SanitiseForPeriod";
        case TaskState::SanitiseAndCleanForPeriod: return "SanitiseAndCleanForPeriod";
    }
    return "Unknown";
}

const char* to_string(TaskReturnCode v) {
    switch (v) {
        case TaskReturnCode::OK: return "OK";
        case TaskReturnCode::FailedSetStartConditions: return "FailedSetStartConditions";
        case TaskReturnCode::TaskOverriddenByUser: return "TaskOverriddenByUser";
        case TaskReturnCode::FailedSetSystemMode: return "FailedSetSystemMode";
        case TaskReturnCode::TaskAbortedByUser: return "TaskAbortedByUser";
        case TaskReturnCode::TaskComplete: return "TaskComplete";
    }
    return "Unknown";
}

const char* to_string(CalibrateState v) {
    switch (v) {
        case CalibrateState::Idle: return "Idle";
        case CalibrateState::ProbeCalStarting: return "ProbeCalStarting";
        case CalibrateState::ConnectToProbe: return "ConnectToProbe";
        case CalibrateState::ConnectionFailed: return "ConnectionFailed";
        case CalibrateState::ReadCalValue: return "ReadCalValue";
        case CalibrateState::ReadCalValueFailed: return "ReadCalValueFailed";
        case CalibrateState::RunningPump: return "RunningPump";
        case CalibrateState::TakingMeasurement: return "TakingMeasurement";
        case CalibrateState::MeasurementFailed: return "MeasurementFailed";
        case CalibrateState::WaitNewCalValue: return "WaitNewCalValue";
        case CalibrateState::TimeOutWaitingCalibration: return "TimeOutWaitingCalibration";
        case CalibrateState::WritingCalibrationValue: return "WritingCalibrationValue";
        case CalibrateState::CalibrationFailedToWrite: return "CalibrationFailedToWrite";
        case CalibrateState::CalibrationSuccessful: return "CalibrationSuccessful";
        case CalibrateState::CalAbort: return "CalAbort";
    }
    return "Unknown";
}

const char* to_string(LightZoneName v) {
    switch (v) {
        case LightZoneName::Pool: return "Pool";
        case LightZoneName::Spa: return "Spa";
        case LightZoneName::PoolAndSpa: return "PoolAndSpa";
        case LightZoneName::Waterfall1: return "Waterfall1";
        case LightZoneName::Waterfall2: return "Waterfall2";
        case LightZoneName::Waterfall3: return "Waterfall3";
        case LightZoneName::Garden: return "Garden";
        case LightZoneName::Other: return "Other";
    }
    return "Unknown";
}

const char* to_string(HeaterMode v) {
    switch (v) {
        case HeaterMode::Off: return "Off";
        case HeaterMode::On: return "On";
    }
    return "Unknown";
}

const char* to_string(HeatPumpMode v) {
    switch (v) {
        case HeatPumpMode::Cooling: return "Cooling";
        case HeatPumpMode::Heating: return "Heating";
        case HeatPumpMode::Auto: return "Auto";
    }
    return "Unknown";
}

const char* to_string(HeaterForced v) {
    switch (v) {
        case HeaterForced::NotForced: return "NotForced";
        case HeaterForced::ForcedOn: return "ForcedOn";
        case HeaterForced::ForcedOff: return "ForcedOff";
    }
    return "Unknown";
}

const char* to_string(SolarMessage v) {
    switch (v) {
        case SolarMessage::DisplayNothing: return "DisplayNothing";
        case SolarMessage::Standby: return "Standby";
        case SolarMessage::SolarHeatingActive: return "SolarHeatingActive";
        case SolarMessage::SolarFlushActive: return "SolarFlushActive";
        case SolarMessage::SolarExcPerActive: return "SolarExcPerActive";
        case SolarMessage::SolarSystemFlushed: return "SolarSystemFlushed";
        case SolarMessage::PumpWillRunFor: return "PumpWillRunFor";
    }
    return "Unknown";
}

const char* to_string(GpoDeviceType v) {
    switch (v) {
        case GpoDeviceType::FilterPump: return "FilterPump";
        case GpoDeviceType::PhProbe: return "PhProbe";
        case GpoDeviceType::OrpProbe: return "OrpProbe";
        case GpoDeviceType::Heater: return "Heater";
        case GpoDeviceType::Light1: return "Light1";
        case GpoDeviceType::Light2: return "Light2";
        case GpoDeviceType::LightFAB: return "LightFAB";
        case GpoDeviceType::Connect1: return "Connect1";
        case GpoDeviceType::Connect2: return "Connect2";
    }
    return "Unknown";
}

const char* to_string(GpoFunction v) {
    switch (v) {
        case GpoFunction::Equipment: return "Equipment";
        case GpoFunction::Lighting: return "Lighting";
        case GpoFunction::Solar: return "Solar";
        case GpoFunction::Heating: return "Heating";
    }
    return "Unknown";
}

const char* to_string(GpoName v) {
    switch (v) {
        case GpoName::NoName: return "NoName";
        case GpoName::Other: return "Other";
        case GpoName::CleaningPump: return "CleaningPump";
        case GpoName::HeaterPump: return "HeaterPump";
        case GpoName::BoosterPump: return "BoosterPump";
        case GpoName::WaterfallPump: return "WaterfallPump";
        case GpoName::FountainPump: return "FountainPump";
        case GpoName::Blower: return "Blower";
        case GpoName::Jets: return "Jets";
    }
    return "Unknown";
}

const char* to_string(RelayName v) {
    switch (v) {
        case RelayName::Relay1: return "Relay1";
        case RelayName::Relay2: return "Relay2";
    }
    return "Unknown";
}

const char* to_string(ValveName v) {
    switch (v) {
        case ValveName::None: return "None";
        case ValveName::Other: return "Other";
        case ValveName::Pool: return "Pool";
        case ValveName::Spa: return "Spa";
        case ValveName::WaterFeature: return "WaterFeature";
        case ValveName::Waterfall: return "Waterfall";
    }
    return "Unknown";
}
