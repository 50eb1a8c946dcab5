#include "record_fields.hpp"

const char* const kFieldMode = "mode";
const char* const kFieldPumpSpeed = "pump_speed";
const char* const kFieldPumpIsOperating = "pump_is_operating";
const char* const kFieldPhMeasurement = "ph_measurement";
const char* const kFieldInfoMessage = "info_message";
const char* const kFieldChlorineControlStatus = "chlorine_control_status";
const char* const kFieldCellIsOperating = "cell_is_operating";
const char* const kFieldPhControlSetpoint = "ph_control_setpoint";
const char* const kFieldChlorineControlSetpoint = "chlorine_control_setpoint";
const char* const kFieldPhControlType = "ph_control_type";
const char* const kFieldChlorineControlType = "chlorine_control_type";
const char* const kFieldHighestPhMeasured = "highest_ph_measured";
const char* const kFieldLowestPhMeasured = "lowest_ph_measured";
const char* const kFieldHighestOrpMeasured = "highest_orp_measured";
const char* const kFieldLowestOrpMeasured = "lowest_orp_measured";
const char* const kFieldCellReversalCount = "cell_reversal_count";
const char* const kFieldCellRunningHours = "cell_running_hours";
const char* const kFieldLowSaltCellRunningHours = "low_salt_cell_running_hours";
const char* const kFieldPreviousDaysCellLoad = "previous_days_cell_load";
const char* const kFieldWaterTemp = "water_temp";

namespace {
struct TimerKeys {
    const char* enabled;
    const char* start_minutes;
    const char* stop_minutes;
    const char* speed;
    const char* invalid;
};

const TimerKeys kTimerKeys[kPumpTimerCount] = {
    {"pump_timer_1_enabled", "pump_timer_1_start_minutes", "pump_timer_1_stop_minutes", "pump_timer_1_speed", "pump_timer_1_invalid"},
    {"pump_timer_2_enabled", "pump_timer_2_start_minutes", "pump_timer_2_stop_minutes", "pump_timer_2_speed", "pump_timer_2_invalid"},
    {"pump_timer_3_enabled", "pump_timer_3_start_minutes", "pump_timer_3_stop_minutes", "pump_timer_3_speed", "pump_timer_3_invalid"},
    {"pump_timer_4_enabled", "pump_timer_4_start_minutes", "pump_timer_4_stop_minutes", "pump_timer_4_speed", "pump_timer_4_invalid"},
};

struct EquipmentKeys {
    const char* mode;
    const char* state;
    const char* auto_enabled;
    const char* parameter;
};

const EquipmentKeys kGpoKeys[kGpoCount] = {
    {"gpo1_mode", "gpo1_state", "gpo1_auto_enabled", "gpo1_parameter"},
    {"gpo2_mode", "gpo2_state", "gpo2_auto_enabled", "gpo2_parameter"},
    {"gpo3_mode", "gpo3_state", "gpo3_auto_enabled", "gpo3_parameter"},
    {"gpo4_mode", "gpo4_state", "gpo4_auto_enabled", "gpo4_parameter"},
};

const EquipmentKeys kValveKeys[kValveCount] = {
    {"valve1_mode", "valve1_state", "valve1_auto_enabled", "valve1_parameter"},
    {"valve2_mode", "valve2_state", "valve2_auto_enabled", "valve2_parameter"},
    {"valve3_mode", "valve3_state", "valve3_auto_enabled", "valve3_parameter"},
    {"valve4_mode", "valve4_state", "valve4_auto_enabled", "valve4_parameter"},
};

const EquipmentKeys kRelayKeys[kRelayCount] = {
    {"relay1_mode", "relay1_state", "relay1_auto_enabled", "relay1_parameter"},
    {"relay2_mode", "relay2_state", "relay2_auto_enabled", "relay2_parameter"},
};

struct GpoSetupKeys {
    const char* outlet_enabled;
    const char* function;
    const char* name;
    const char* lighting_zone;
    const char* use_timers;
};

// Slot 0 collects outlets that are not on a Connect expansion.
const GpoSetupKeys kGpoSetupKeys[kGpoCount + 1] = {
    {"gpo0_outlet_enabled", "gpo0_function", "gpo0_name", "gpo0_lighting_zone", "gpo0_use_timers"},
    {"gpo1_outlet_enabled", "gpo1_function", "gpo1_name", "gpo1_lighting_zone", "gpo1_use_timers"},
    {"gpo2_outlet_enabled", "gpo2_function", "gpo2_name", "gpo2_lighting_zone", "gpo2_use_timers"},
    {"gpo3_outlet_enabled", "gpo3_function", "gpo3_name", "gpo3_lighting_zone", "gpo3_use_timers"},
    {"gpo4_outlet_enabled", "gpo4_function", "gpo4_name", "gpo4_lighting_zone", "gpo4_use_timers"},
};

struct RelaySetupKeys {
    const char* name;
    const char* enabled;
    const char* action;
    const char* use_timers;
};

const RelaySetupKeys kRelaySetupKeys[kRelayCount] = {
    {"relay1_name", "relay1_enabled", "relay1_action", "relay1_use_timers"},
    {"relay2_name", "relay2_enabled", "relay2_action", "relay2_use_timers"},
};

struct ValveSetupKeys {
    const char* name;
    const char* enabled;
    const char* use_timers;
};

const ValveSetupKeys kValveSetupKeys[kValveCount] = {
    {"valve1_name", "valve1_enabled", "valve1_use_timers"},
    {"valve2_name", "valve2_enabled", "valve2_use_timers"},
    {"valve3_name", "valve3_enabled", "valve3_use_timers"},
    {"valve4_name", "valve4_enabled", "valve4_use_timers"},
};

struct LightZoneKeys {
    const char* mode;
    const char* colour;
    const char* on;
    const char* multicolour;
    const char* name;
};

const LightZoneKeys kLightZoneKeys[kLightZoneCount] = {
    {"lighting_mode_1", "lighting_colour_1", "lighting_state_1", "lighting_multicolour_1", "lighting_zone_name_1"},
    {"lighting_mode_2", "lighting_colour_2", "lighting_state_2", "lighting_multicolour_2", "lighting_zone_name_2"},
    {"lighting_mode_3", "lighting_colour_3", "lighting_state_3", "lighting_multicolour_3", "lighting_zone_name_3"},
    {"lighting_mode_4", "lighting_colour_4", "lighting_state_4", "lighting_multicolour_4", "lighting_zone_name_4"},
};

void export_slot(const EquipmentKeys& keys, const EquipmentSlot& slot, StateSnapshot& snap) {
    snap.set_text(keys.mode, to_string(slot.mode));
    snap.set_flag(keys.state, slot.state);
    snap.set_flag(keys.auto_enabled, slot.auto_enabled);
}
} // namespace

void export_fields(const ChlorinatorState& rec, StateSnapshot& snap) {
    snap.set_text(kFieldMode, to_string(rec.mode));
    snap.set_text(kFieldPumpSpeed, to_string(rec.pump_speed));
    snap.set_int("active_timer", rec.active_timer);
    snap.set_text(kFieldInfoMessage, to_string(rec.info_message));
    snap.set_flag("info_message_is_warning", info_message_is_warning(rec.info_message));
    snap.set_real(kFieldPhMeasurement, rec.ph_measurement);
    snap.set_text(kFieldChlorineControlStatus, to_string(rec.chlorine_control_status));
    snap.set_int("time_hours", rec.time_hours);
    snap.set_int("time_minutes", rec.time_minutes);
    snap.set_int("time_seconds", rec.time_seconds);
    snap.set_flag("chemistry_values_current", rec.chemistry_values_current);
    snap.set_flag("chemistry_values_valid", rec.chemistry_values_valid);
    snap.set_flag("spa_selection", rec.spa_selection);
    snap.set_flag("pump_is_priming", rec.pump_is_priming);
    snap.set_flag(kFieldPumpIsOperating, rec.pump_is_operating);
    snap.set_flag(kFieldCellIsOperating, rec.cell_is_operating);
    snap.set_flag("user_settings_changed", rec.user_settings_changed);
    snap.set_flag("sanitising_until_next_timer_tomorrow", rec.sanitising_until_next_timer_tomorrow);
}

void export_fields(const ChlorinatorSetup& rec, StateSnapshot& snap) {
    snap.set_text("default_manual_on_speed", to_string(rec.default_manual_on_speed));
    snap.set_real(kFieldPhControlSetpoint, rec.ph_control_setpoint);
    snap.set_int(kFieldChlorineControlSetpoint, rec.chlorine_control_setpoint);
    snap.set_flag("no_timer_model", rec.no_timer_model);
    snap.set_flag("timer_master_present", rec.timer_master_present);
}

void export_fields(const ChlorinatorCapabilities& rec, StateSnapshot& snap) {
    snap.set_int("minimum_manual_acid_setpoint", rec.minimum_manual_acid_setpoint);
    snap.set_int("maximum_manual_acid_setpoint", rec.maximum_manual_acid_setpoint);
    snap.set_int("minimum_manual_chlorine_setpoint", rec.minimum_manual_chlorine_setpoint);
    snap.set_int("maximum_manual_chlorine_setpoint", rec.maximum_manual_chlorine_setpoint);
    snap.set_real("minimum_ph_setpoint", rec.minimum_ph_setpoint);
    snap.set_real("maximum_ph_setpoint", rec.maximum_ph_setpoint);
    snap.set_int("minimum_orp_setpoint", rec.minimum_orp_setpoint);
    snap.set_int("maximum_orp_setpoint", rec.maximum_orp_setpoint);
    snap.set_text(kFieldPhControlType, to_string(rec.ph_control_type));
    snap.set_text(kFieldChlorineControlType, to_string(rec.chlorine_control_type));
    snap.set_int("cell_size", rec.cell_size);
    snap.set_int("acid_pump_size", rec.acid_pump_size);
    snap.set_real("filter_pump_size", rec.filter_pump_size);
    snap.set_int("reversal_period", rec.reversal_period);
    snap.set_int("spa_volume", rec.spa_volume);
    snap.set_flag("three_speed_pump_enabled", rec.three_speed_pump_enabled);
    snap.set_flag("ai_mode_enabled", rec.ai_mode_enabled);
    snap.set_text("volume_units", to_string(rec.volume_units));
    snap.set_flag("lighting_enabled", rec.lighting_enabled);
    snap.set_flag("dosing_capable_unit", rec.dosing_capable_unit);
}

void export_fields(const ChlorinatorSettings& rec, StateSnapshot& snap) {
    snap.set_int("acid_dosing_inhibit_time_remaining", rec.acid_dosing_inhibit_time_remaining);
    snap.set_text("acid_dosing_inhibit_status", to_string(rec.acid_dosing_inhibit_status));
}

void export_fields(const ChlorinatorStatistics& rec, StateSnapshot& snap) {
    snap.set_real(kFieldHighestPhMeasured, rec.highest_ph_measured);
    snap.set_real(kFieldLowestPhMeasured, rec.lowest_ph_measured);
    snap.set_int(kFieldHighestOrpMeasured, rec.highest_orp_measured);
    snap.set_int(kFieldLowestOrpMeasured, rec.lowest_orp_measured);
    snap.set_int(kFieldCellReversalCount, rec.cell_reversal_count);
    snap.set_int(kFieldCellRunningHours, rec.cell_running_hours);
    snap.set_int(kFieldLowSaltCellRunningHours, rec.low_salt_cell_running_hours);
    snap.set_int(kFieldPreviousDaysCellLoad, rec.previous_days_cell_load);
}

void export_fields(const ChlorinatorTimers& rec, StateSnapshot& snap) {
    for (std::size_t i = 0; i < kPumpTimerCount; ++i) {
        const PumpTimer& t = rec.pump_timers[i];
        const TimerKeys& keys = kTimerKeys[i];
        snap.set_flag(keys.enabled, t.enabled);
        snap.set_int(keys.start_minutes, t.start_minutes);
        snap.set_int(keys.stop_minutes, t.stop_minutes);
        snap.set_text(keys.speed, to_string(t.speed_level));
        snap.set_flag(keys.invalid, pump_timer_is_invalid(t));
    }
}

void export_fields(const DeviceProfile& rec, StateSnapshot& snap) {
    snap.set_text("device_type", to_string(rec.device_type));
    snap.set_int("device_version", rec.device_version);
    snap.set_text("device_protocol", to_string(rec.device_protocol));
    snap.set_int("device_protocol_revision", rec.protocol_revision);
    snap.set_int("firmware_version_major", rec.firmware_major);
    snap.set_int("firmware_version_minor", rec.firmware_minor);
    snap.set_int("bootloader_version_major", rec.bootloader_major);
    snap.set_int("bootloader_version_minor", rec.bootloader_minor);
    snap.set_int("hardware_version", rec.hardware_version);
    snap.set_int("serial_number", rec.serial_number);
}

void export_fields(const TemperatureRecord& rec, StateSnapshot& snap) {
    snap.set_flag("is_fahrenheit", rec.is_fahrenheit);
    snap.set_int("temp_supports", rec.supports_mask);
    snap.set_real("board_temp", rec.board_temp);
    snap.set_real(kFieldWaterTemp, rec.water_temp);
    snap.set_real("chloro_water_temp", rec.chloro_water_temp);
    snap.set_real("solar_water_sensor_temp", rec.solar_water_temp);
    snap.set_text("water_temp_valid", to_string(rec.water_temp_valid));
    snap.set_real("solar_roof_sensor_temp", rec.solar_roof_temp);
    snap.set_real("heater_temp", rec.heater_temp);
    snap.set_int("temp_displayed", rec.displayed_mask);
}

void export_fields(const HaloSettings& rec, StateSnapshot& snap) {
    snap.set_int("general_settings", rec.general);
    snap.set_text("cell_model", to_string(rec.cell_model));
    snap.set_int("reversal_period", rec.reversal_period);
    snap.set_int("ai_water_turns", rec.ai_water_turns);
    snap.set_int("acid_pump_size", rec.acid_pump_size);
    snap.set_int("filter_pump_size", rec.filter_pump_size);
    snap.set_int("default_manual_on_speed", rec.default_manual_on_speed);
    snap.set_flag("pre_purge_enabled", rec.pre_purge_enabled);
    snap.set_flag("post_purge_enabled", rec.post_purge_enabled);
    snap.set_flag("acid_flush_enabled", rec.acid_flush_enabled);
    snap.set_flag("ai_enabled_read_only", rec.ai_enabled_read_only);
    snap.set_flag("ai_mode_enabled", rec.ai_mode_enabled);
    snap.set_flag("display_orp", rec.display_orp);
    snap.set_flag("dosing_capable_unit", rec.dosing_capable);
    snap.set_flag("three_speed_pump_enabled", rec.three_speed_pump_enabled);
    snap.set_flag("three_speed_pump_read_only", rec.three_speed_pump_read_only);
    snap.set_flag("pump_protect_enabled", rec.pump_protect_enabled);
    snap.set_flag("use_temperature_sensor", rec.use_temperature_sensor);
    snap.set_flag("cleaning_interlock_enabled", rec.cleaning_interlock_enabled);
    snap.set_flag("display_ph", rec.display_ph);
}

void export_fields(const WaterVolume& rec, StateSnapshot& snap) {
    snap.set_text("volume_units", to_string(rec.volume_units));
    snap.set_int("pool_volume", rec.pool_volume);
    snap.set_int("spa_volume", rec.spa_volume);
    snap.set_int("pool_left_filter", rec.pool_left_filter);
    snap.set_int("spa_left_filter", rec.spa_left_filter);
    snap.set_flag("pool_enabled", rec.pool_enabled);
    snap.set_flag("spa_enabled", rec.spa_enabled);
    snap.set_flag("pool_spa_enabled", rec.pool_enabled && rec.spa_enabled);
}

void export_fields(const SetPoint& rec, StateSnapshot& snap) {
    snap.set_real(kFieldPhControlSetpoint, rec.ph_control_setpoint);
    snap.set_int("orp_control_setpoint", rec.orp_control_setpoint);
    snap.set_int(kFieldChlorineControlSetpoint, rec.orp_control_setpoint);
    snap.set_int("pool_chlorine_control_setpoint", rec.pool_chlorine_control_setpoint);
    snap.set_int("acid_control_setpoint", rec.acid_control_setpoint);
    snap.set_int("spa_chlorine_control_setpoint", rec.spa_chlorine_control_setpoint);
}

void export_fields(const HaloState& rec, StateSnapshot& snap) {
    snap.set_int("real_cell_level", rec.real_cell_level);
    snap.set_int("cell_current_ma", rec.cell_current_ma);
    snap.set_text("main_text", to_string(rec.main_text));
    snap.set_text(kFieldInfoMessage, to_string(rec.main_text));
    snap.set_text("chlorine_sub_text", to_string(rec.chlorine_text));
    snap.set_text(kFieldChlorineControlStatus, to_string(rec.chlorine_text));
    snap.set_int("orp_measurement", rec.orp_measurement);
    snap.set_text("ph_sub_text", to_string(rec.ph_text));
    snap.set_real(kFieldPhMeasurement, rec.ph_measurement);
    snap.set_text("timer_sub_text", to_string(rec.timer_text));
    snap.set_text("error_sub_text", to_string(rec.error_text));
    snap.set_flag("is_in_pool_selection", rec.in_pool_selection);
    snap.set_flag("cell_running", rec.cell_running);
    snap.set_flag(kFieldCellIsOperating, rec.cell_running);
    snap.set_flag("cell_reversed", rec.cell_reversed);
    snap.set_flag("cooling_fan_on", rec.cooling_fan_on);
    snap.set_flag("light_output_on", rec.light_output_on);
    snap.set_flag("dosing_pump_on", rec.dosing_pump_on);
    snap.set_flag("cell_is_reversing", rec.cell_is_reversing);
    snap.set_flag("ai_mode_active", rec.ai_mode_active);
}

void export_fields(const HaloCapabilities& rec, StateSnapshot& snap) {
    snap.set_text(kFieldPhControlType, to_string(rec.ph_control_type));
    snap.set_text(kFieldChlorineControlType, to_string(rec.chlorine_control_type));
    snap.set_int("minimum_manual_acid_setpoint", kHaloMinManualAcidSetpoint);
    snap.set_int("maximum_manual_acid_setpoint", kHaloMaxManualAcidSetpoint);
    snap.set_int("minimum_manual_chlorine_setpoint", kHaloMinManualChlorineSetpoint);
    snap.set_int("maximum_manual_chlorine_setpoint", kHaloMaxManualChlorineSetpoint);
    snap.set_int("minimum_orp_setpoint", kHaloMinOrpSetpoint);
    snap.set_int("maximum_orp_setpoint", kHaloMaxOrpSetpoint);
    snap.set_real("minimum_ph_setpoint", kHaloMinPhSetpoint);
    snap.set_real("maximum_ph_setpoint", kHaloMaxPhSetpoint);
}

void export_fields(const MaintenanceState& rec, StateSnapshot& snap) {
    snap.set_flag("acid_dosing_disabled", rec.acid_dosing_disabled);
    snap.set_flag("day_rolled_over", rec.day_rolled_over);
    snap.set_int("dose_disable_time_mins", rec.dose_disable_time_mins);
    snap.set_text("maintenance_task_state", to_string(rec.task_state));
    snap.set_text("maintenance_task_return_code", to_string(rec.task_return_code));
    snap.set_int("task_time_remaining", rec.task_time_remaining);
    snap.set_int("value_to_display", rec.value_to_display);
    snap.set_text("calibrate_state", to_string(rec.calibrate_state));
    snap.set_text("mode_after_complete", to_string(rec.mode_after_complete));
}

void export_fields(const EquipmentModeRecord& rec, StateSnapshot& snap) {
    snap.set_int("equipment_enabled", rec.equipment_enabled);
    snap.set_text("filter_pump_mode", to_string(rec.filter_pump_mode));
    snap.set_text(kFieldMode, to_string(rec.filter_pump_mode));
    snap.set_flag("filter_pump_state", rec.filter_pump_state);
    snap.set_flag(kFieldPumpIsOperating, rec.filter_pump_state);
    snap.set_flag("filter_pump_auto_enabled", rec.filter_pump_auto_enabled);
    for (std::size_t i = 0; i < kGpoCount; ++i) {
        export_slot(kGpoKeys[i], rec.gpo[i], snap);
    }
    for (std::size_t i = 0; i < kValveCount; ++i) {
        export_slot(kValveKeys[i], rec.valve[i], snap);
    }
    for (std::size_t i = 0; i < kRelayCount; ++i) {
        export_slot(kRelayKeys[i], rec.relay[i], snap);
    }
}

void export_fields(const EquipmentParameter& rec, StateSnapshot& snap) {
    snap.set_text("filter_pump_speed", to_string(rec.filter_pump_speed));
    snap.set_text(kFieldPumpSpeed, to_string(rec.filter_pump_speed));
    for (std::size_t i = 0; i < kGpoCount; ++i) {
        snap.set_int(kGpoKeys[i].parameter, rec.gpo[i]);
    }
    for (std::size_t i = 0; i < kValveCount; ++i) {
        snap.set_int(kValveKeys[i].parameter, rec.valve[i]);
    }
    for (std::size_t i = 0; i < kRelayCount; ++i) {
        snap.set_int(kRelayKeys[i].parameter, rec.relay[i]);
    }
}

void export_fields(const LightState& rec, StateSnapshot& snap) {
    for (std::size_t i = 0; i < kLightZoneCount; ++i) {
        snap.set_text(kLightZoneKeys[i].mode, to_string(rec.zone_mode[i]));
        snap.set_int(kLightZoneKeys[i].colour, rec.zone_colour[i]);
        snap.set_flag(kLightZoneKeys[i].on, rec.zone_on[i]);
    }
}

void export_fields(const LightCapabilities& rec, StateSnapshot& snap) {
    snap.set_int("lighting_enabled_raw", rec.lighting_enabled);
    snap.set_int("onboard_light_enabled", rec.onboard_light_enabled);
    snap.set_int("light_model", rec.model);
    snap.set_int("light_zones_in_use", rec.zones_in_use);
    for (std::size_t i = 0; i < kLightZoneCount; ++i) {
        snap.set_flag(kLightZoneKeys[i].multicolour, rec.zone_multicolour[i]);
    }
}

void export_fields(const LightSetup& rec, StateSnapshot& snap) {
    for (std::size_t i = 0; i < kLightZoneCount; ++i) {
        snap.set_text(kLightZoneKeys[i].name, to_string(rec.zone_name[i]));
    }
}

void export_fields(const ProbeStatistics& rec, StateSnapshot& snap) {
    snap.set_real(kFieldHighestPhMeasured, rec.highest_ph_measured);
    snap.set_real(kFieldLowestPhMeasured, rec.lowest_ph_measured);
    snap.set_int(kFieldHighestOrpMeasured, rec.highest_orp_measured);
    snap.set_int(kFieldLowestOrpMeasured, rec.lowest_orp_measured);
}

void export_fields(const CellStatistics& rec, StateSnapshot& snap) {
    snap.set_int(kFieldCellReversalCount, rec.cell_reversal_count);
    snap.set_int(kFieldCellRunningHours, rec.cell_running_hours);
    snap.set_int(kFieldLowSaltCellRunningHours, rec.low_salt_cell_running_hours);
    snap.set_int(kFieldPreviousDaysCellLoad, rec.previous_days_cell_load);
    snap.set_int("dosing_pump_secs", rec.dosing_pump_secs);
    snap.set_int("filter_pump_mins", rec.filter_pump_mins);
}

void export_fields(const PowerBoardStatistics& rec, StateSnapshot& snap) {
    snap.set_int("power_board_runtime_hours", rec.runtime_hours);
}

void export_fields(const HeaterCapabilities& rec, StateSnapshot& snap) {
    snap.set_int("heater_enabled", rec.heater_enabled);
    snap.set_int("filter_pump_three_speed", rec.filter_pump_three_speed);
    snap.set_int("heater_pump_three_speed", rec.heater_pump_three_speed);
    snap.set_int("heater_pump_installed", rec.heater_pump_installed);
    snap.set_int("heater_pump_timer_bit", rec.heater_pump_timer_bit);
}

void export_fields(const HeaterConfig& rec, StateSnapshot& snap) {
    snap.set_int("heater_pump_enabled", rec.heater_pump_enabled);
    snap.set_text("heater_min_pump_speed", to_string(rec.min_pump_speed));
}

void export_fields(const HeaterState& rec, StateSnapshot& snap) {
    snap.set_flag("heater_on", rec.heater_on);
    snap.set_flag("heater_pressure", rec.pressure);
    snap.set_flag("heater_gas_valve", rec.gas_valve);
    snap.set_flag("heater_flame", rec.flame);
    snap.set_flag("heater_lockout", rec.lockout);
    snap.set_flag("general_service_required", rec.general_service_required);
    snap.set_flag("ignition_service_required", rec.ignition_service_required);
    snap.set_flag("cooling_available", rec.cooling_available);
    snap.set_text("heater_pump_mode", to_string(rec.heater_pump_mode));
    snap.set_text("heater_mode", to_string(rec.heater_mode));
    snap.set_int("heater_setpoint", rec.setpoint);
    snap.set_text("heat_pump_mode", to_string(rec.heat_pump_mode));
    snap.set_text("heater_forced", to_string(rec.forced));
    snap.set_int("heater_forced_time_hrs", rec.forced_hours);
    snap.set_int("heater_forced_time_mins", rec.forced_minutes);
    snap.set_text("heater_water_temp_valid", to_string(rec.water_temp_valid));
    snap.set_real("heater_water_temp", rec.water_temp);
    snap.set_int("heater_error", rec.error);
}

void export_fields(const HeaterCooldownState& rec, StateSnapshot& snap) {
    snap.set_int("heater_cooldown_event_occurred", rec.event_occurred);
    snap.set_int("heater_cooldown_state", rec.cooldown_state);
    snap.set_int("heater_cooldown_target_mode", rec.target_mode);
    snap.set_int("remaining_cooldown_time", rec.remaining_time);
    snap.set_int("total_heater_cooldown_time", rec.total_time);
}

void export_fields(const SolarCapabilities& rec, StateSnapshot& snap) {
    snap.set_int("solar_enabled", rec.solar_enabled);
}

void export_fields(const SolarConfig& rec, StateSnapshot& snap) {
    snap.set_int("solar_pump_start_hr", rec.pump_start_hour);
    snap.set_int("solar_pump_start_min", rec.pump_start_minute);
    snap.set_int("solar_pump_stop_hr", rec.pump_stop_hour);
    snap.set_int("solar_pump_stop_min", rec.pump_stop_minute);
    snap.set_int("solar_enable_flush", rec.enable_flush);
    snap.set_int("solar_flush_time_hr", rec.flush_hours);
    snap.set_int("solar_flush_time_min", rec.flush_minutes);
    snap.set_int("solar_differential", rec.differential);
    snap.set_int("solar_enable_exclusion_period", rec.enable_exclusion_period);
}

void export_fields(const SolarState& rec, StateSnapshot& snap) {
    snap.set_real("solar_roof_temp", rec.roof_temp);
    snap.set_real("solar_water_temp", rec.water_temp);
    snap.set_int("solar_temp", rec.solar_temp);
    snap.set_flag("solar_is_summer_mode", rec.summer_mode);
    snap.set_flag("solar_is_winter_mode", !rec.summer_mode);
    snap.set_text("solar_mode", to_string(rec.mode));
    snap.set_flag("solar_pump_state", rec.pump_on);
    snap.set_flag("solar_flush_active", rec.flush_active);
    snap.set_text("solar_roof_temp_valid", to_string(rec.roof_temp_valid));
    snap.set_text("solar_water_temp_valid", to_string(rec.water_temp_valid));
    snap.set_int("solar_spec_temp", rec.spec_temp);
    snap.set_text("solar_message", to_string(rec.message));
}

void export_fields(const GpoSetup& rec, StateSnapshot& snap) {
    if (rec.slot > kGpoCount) {
        return;
    }
    const GpoSetupKeys& keys = kGpoSetupKeys[rec.slot];
    snap.set_int(keys.outlet_enabled, rec.outlet_enabled);
    snap.set_text(keys.function, to_string(rec.function));
    snap.set_text(keys.name, to_string(rec.name));
    snap.set_int(keys.lighting_zone, rec.lighting_zone);
    snap.set_int(keys.use_timers, rec.use_timers);
}

void export_fields(const RelaySetup& rec, StateSnapshot& snap) {
    if (rec.index >= kRelayCount) {
        return;
    }
    const RelaySetupKeys& keys = kRelaySetupKeys[rec.index];
    snap.set_text(keys.name, to_string(rec.name));
    snap.set_int(keys.enabled, rec.enabled);
    snap.set_int(keys.action, rec.action);
    snap.set_int(keys.use_timers, rec.use_timers);
}

void export_fields(const ValveSetup& rec, StateSnapshot& snap) {
    if (rec.index >= kValveCount) {
        return;
    }
    const ValveSetupKeys& keys = kValveSetupKeys[rec.index];
    snap.set_text(keys.name, to_string(rec.name));
    snap.set_int(keys.enabled, rec.enabled);
    snap.set_int(keys.use_timers, rec.use_timers);
}
