#include "chlorinator_records.hpp"

namespace {
bool flag(uint8_t flags, uint8_t mask) {
    return (flags & mask) != 0;
}

bool chlorine_status_from_code(uint8_t code, ChlorineControlStatus& out) {
    return enum_from_code_or_sentinel(code, 7, out);
}
} // namespace

bool speed_level_from_code(uint8_t code, SpeedLevel& out) {
    return enum_from_code_or_sentinel(code, 3, out);
}

bool info_message_from_code(uint8_t code, InfoMessage& out) {
    if (code <= static_cast<uint8_t>(InfoMessage::NoWaterFlow) ||
        (code >= static_cast<uint8_t>(InfoMessage::RtccFault) && code <= static_cast<uint8_t>(InfoMessage::Unspecified))) {
        out = static_cast<InfoMessage>(code);
        return true;
    }
    return false;
}

bool info_message_is_warning(InfoMessage msg) {
    return static_cast<uint8_t>(msg) >= kInfoMessageWarningLevel;
}

bool pump_timer_is_invalid(const PumpTimer& timer) {
    if (timer.start_minutes >= kMinutesPerDay || timer.stop_minutes >= kMinutesPerDay) {
        return true;
    }
    if (!timer.enabled) {
        return false;
    }
    if (timer.start_minutes >= timer.stop_minutes) {
        return true;
    }
    return timer.speed_level == SpeedLevel::NotSet;
}

CodecResult decode_chlorinator_state(const uint8_t* data, std::size_t len, ChlorinatorState& out) {
    if (!data || len < kChlorinatorStateLen) {
        return codec_error(ChlorError::ShortBuffer, "chlorinator_state");
    }
    WireReader r{data, kChlorinatorStateLen};
    uint8_t mode = 0, speed = 0, info = 0, reserved = 0, ph = 0, chlorine = 0;
    r.u8(mode);
    r.u8(speed);
    r.u8(out.active_timer);
    r.u8(info);
    r.u8(reserved);
    r.u8(out.flags);
    r.u8(ph);
    r.u8(chlorine);
    r.u8(out.time_hours);
    r.u8(out.time_minutes);
    r.u8(out.time_seconds);

    if (!enum_from_code(mode, 2, out.mode)) {
        return codec_error(ChlorError::UnknownEnumValue, "mode");
    }
    if (!speed_level_from_code(speed, out.pump_speed)) {
        return codec_error(ChlorError::UnknownEnumValue, "pump_speed");
    }
    if (!info_message_from_code(info, out.info_message)) {
        return codec_error(ChlorError::UnknownEnumValue, "info_message");
    }
    if (!chlorine_status_from_code(chlorine, out.chlorine_control_status)) {
        return codec_error(ChlorError::UnknownEnumValue, "chlorine_control_status");
    }
    out.ph_measurement = scale_tenths(ph);

    out.chemistry_values_current = flag(out.flags, kStateChemistryValuesCurrent);
    out.chemistry_values_valid = flag(out.flags, kStateChemistryValuesValid);
    out.spa_selection = flag(out.flags, kStateSpaSelection);
    out.pump_is_priming = flag(out.flags, kStatePumpIsPriming);
    out.pump_is_operating = flag(out.flags, kStatePumpIsOperating);
    out.cell_is_operating = flag(out.flags, kStateCellIsOperating);
    out.user_settings_changed = flag(out.flags, kStateUserSettingsChanged);
    out.sanitising_until_next_timer_tomorrow = flag(out.flags, kStateSanitisingUntilNextTimerTomorrow);
    return codec_ok();
}

CodecResult decode_chlorinator_setup(const uint8_t* data, std::size_t len, ChlorinatorSetup& out) {
    if (!data || len < kChlorinatorSetupLen) {
        return codec_error(ChlorError::ShortBuffer, "chlorinator_setup");
    }
    WireReader r{data, kChlorinatorSetupLen};
    uint8_t speed = 0, ph = 0;
    r.u8(speed);
    r.u8(ph);
    r.u16le(out.chlorine_control_setpoint);
    r.u8(out.flags);

    if (!speed_level_from_code(speed, out.default_manual_on_speed)) {
        return codec_error(ChlorError::UnknownEnumValue, "default_manual_on_speed");
    }
    out.ph_control_setpoint = scale_tenths(ph);
    out.no_timer_model = flag(out.flags, kSetupNoTimerModel);
    out.timer_master_present = flag(out.flags, kSetupTimerMasterPresent);
    return codec_ok();
}

CodecResult decode_chlorinator_capabilities(const uint8_t* data, std::size_t len, ChlorinatorCapabilities& out) {
    if (!data || len < kChlorinatorCapabilitiesLen) {
        return codec_error(ChlorError::ShortBuffer, "chlorinator_capabilities");
    }
    WireReader r{data, kChlorinatorCapabilitiesLen};
    uint8_t min_ph = 0, max_ph = 0, min_orp = 0, max_orp = 0, ph_type = 0, chlorine_type = 0, filter_size = 0;
    r.u8(out.minimum_manual_acid_setpoint);
    r.u8(out.maximum_manual_acid_setpoint);
    r.u8(out.minimum_manual_chlorine_setpoint);
    r.u8(out.maximum_manual_chlorine_setpoint);
    r.u8(min_ph);
    r.u8(max_ph);
    r.u8(min_orp);
    r.u8(max_orp);
    r.u8(ph_type);
    r.u8(chlorine_type);
    r.u8(out.flags);
    r.u8(out.cell_size);
    r.u8(out.acid_pump_size);
    r.u8(filter_size);
    r.u8(out.reversal_period);
    r.bytes(out.pool_volume_raw.data(), out.pool_volume_raw.size());
    r.u16le(out.spa_volume);

    if (!enum_from_code(ph_type, 2, out.ph_control_type)) {
        return codec_error(ChlorError::UnknownEnumValue, "ph_control_type");
    }
    if (!enum_from_code(chlorine_type, 2, out.chlorine_control_type)) {
        return codec_error(ChlorError::UnknownEnumValue, "chlorine_control_type");
    }
    const uint8_t units = static_cast<uint8_t>((out.flags & kCapVolumeUnitMask) >> kCapVolumeUnitShift);
    if (!enum_from_code(units, 2, out.volume_units)) {
        return codec_error(ChlorError::UnknownEnumValue, "volume_units");
    }

    out.minimum_ph_setpoint = scale_tenths(min_ph);
    out.maximum_ph_setpoint = scale_tenths(max_ph);
    out.minimum_orp_setpoint = static_cast<uint16_t>(min_orp * 10);
    out.maximum_orp_setpoint = static_cast<uint16_t>(max_orp * 10);
    out.filter_pump_size = scale_tenths(filter_size);
    out.three_speed_pump_enabled = flag(out.flags, kCapThreeSpeedPumpEnabled);
    out.ai_mode_enabled = flag(out.flags, kCapAiModeEnabled);
    out.lighting_enabled = flag(out.flags, kCapLightingEnabled);
    out.dosing_capable_unit = flag(out.flags, kCapDosingCapableUnit);
    return codec_ok();
}

CodecResult decode_chlorinator_settings(const uint8_t* data, std::size_t len, ChlorinatorSettings& out) {
    if (!data || len < kChlorinatorSettingsLen) {
        return codec_error(ChlorError::ShortBuffer, "chlorinator_settings");
    }
    WireReader r{data, kChlorinatorSettingsLen};
    uint8_t status = 0;
    r.u16le(out.acid_dosing_inhibit_time_remaining);
    r.u8(status);
    if (!enum_from_code(status, 2, out.acid_dosing_inhibit_status)) {
        return codec_error(ChlorError::UnknownEnumValue, "acid_dosing_inhibit_status");
    }
    return codec_ok();
}

CodecResult decode_chlorinator_statistics(const uint8_t* data, std::size_t len, ChlorinatorStatistics& out) {
    if (!data || len < kChlorinatorStatisticsLen) {
        return codec_error(ChlorError::ShortBuffer, "chlorinator_statistics");
    }
    WireReader r{data, kChlorinatorStatisticsLen};
    uint8_t hi_ph = 0, lo_ph = 0;
    r.u8(hi_ph);
    r.u8(lo_ph);
    r.u16le(out.highest_orp_measured);
    r.u16le(out.lowest_orp_measured);
    r.u16le(out.cell_reversal_count);
    r.u32le(out.cell_running_hours);
    r.u32le(out.low_salt_cell_running_hours);
    r.u8(out.previous_days_cell_load);

    out.highest_ph_measured = scale_tenths(hi_ph);
    out.lowest_ph_measured = scale_tenths(lo_ph);
    return codec_ok();
}

CodecResult decode_chlorinator_timers(const uint8_t* data, std::size_t len, ChlorinatorTimers& out) {
    if (!data || len < kChlorinatorTimersLen) {
        return codec_error(ChlorError::ShortBuffer, "chlorinator_timers");
    }
    WireReader r{data, kChlorinatorTimersLen};
    for (PumpTimer& timer : out.pump_timers) {
        uint8_t start_hour_and_flags = 0, start_minute = 0, stop_hour = 0, stop_minute = 0;
        r.u8(start_hour_and_flags);
        r.u8(start_minute);
        r.u8(stop_hour);
        r.u8(stop_minute);

        const uint8_t start_hour = start_hour_and_flags & kTimerStartHourMask;
        timer.start_minutes = static_cast<uint16_t>(start_hour * 60 + start_minute);
        timer.stop_minutes = static_cast<uint16_t>(stop_hour * 60 + stop_minute);
        timer.enabled = flag(start_hour_and_flags, kTimerEnabled);
        const uint8_t speed = static_cast<uint8_t>((start_hour_and_flags & kTimerSpeedMask) >> kTimerSpeedShift);
        if (!enum_from_code(speed, 3, timer.speed_level)) {
            return codec_error(ChlorError::UnknownEnumValue, "pump_timer_speed");
        }
    }
    return codec_ok();
}

const char* to_string(ChlorinatorMode v) {
    switch (v) {
        case ChlorinatorMode::Off: return "Off";
        case ChlorinatorMode::ManualOn: return "ManualOn";
        case ChlorinatorMode::Auto: return "Auto";
    }
    return "Unknown";
}

const char* to_string(SpeedLevel v) {
    switch (v) {
        case SpeedLevel::NotSet: return "NotSet";
        case SpeedLevel::Low: return "Low";
        case SpeedLevel::Medium: return "Medium";
        case SpeedLevel::High: return "High";
        case SpeedLevel::AI: return "AI";
    }
    return "Unknown";
}

const char* to_string(InfoMessage v) {
    switch (v) {
        case InfoMessage::NoMessage: return "NoMessage";
        case InfoMessage::PhProbeNoComms: return "PhProbeNoComms";
        case InfoMessage::PhProbeOtherError: return "PhProbeOtherError";
        case InfoMessage::PhProbeCleanCalibrate: return "PhProbeCleanCalibrate";
        case InfoMessage::OrpProbeNoComms: return "OrpProbeNoComms";
        case InfoMessage::OrpProbeOtherError: return "OrpProbeOtherError";
        case InfoMessage::OrpProbeCleanCalibrate: return "OrpProbeCleanCalibrate";
        case InfoMessage::G4CommsFailure: return "G4CommsFailure";
        case InfoMessage::NoWaterFlow: return "NoWaterFlow";
        case InfoMessage::RtccFault: return "RtccFault";
        case InfoMessage::OrpProbeFittedPhProbeMissing: return "OrpProbeFittedPhProbeMissing";
        case InfoMessage::AiPumpSpeed: return "AiPumpSpeed";
        case InfoMessage::LowSalt: return "LowSalt";
        case InfoMessage::Unspecified: return "Unspecified";
    }
    return "Unknown";
}

const char* to_string(ChlorineControlStatus v) {
    switch (v) {
        case ChlorineControlStatus::Unknown: return "Unknown";
        case ChlorineControlStatus::InvalidNoMeasurement: return "InvalidNoMeasurement";
        case ChlorineControlStatus::VeryVeryLow: return "VeryVeryLow";
        case ChlorineControlStatus::VeryLow: return "VeryLow";
        case ChlorineControlStatus::Low: return "Low";
        case ChlorineControlStatus::Ok: return "Ok";
        case ChlorineControlStatus::High: return "High";
        case ChlorineControlStatus::VeryHigh: return "VeryHigh";
        case ChlorineControlStatus::VeryVeryHigh: return "VeryVeryHigh";
    }
    return "Unknown";
}

const char* to_string(PhControlType v) {
    switch (v) {
        case PhControlType::None: return "None";
        case PhControlType::Manual: return "Manual";
        case PhControlType::Automatic: return "Automatic";
    }
    return "Unknown";
}

const char* to_string(ChlorineControlType v) {
    switch (v) {
        case ChlorineControlType::None: return "None";
        case ChlorineControlType::Manual: return "Manual";
        case ChlorineControlType::Automatic: return "Automatic";
    }
    return "Unknown";
}

const char* to_string(VolumeUnits v) {
    switch (v) {
        case VolumeUnits::Litres: return "Litres";
        case VolumeUnits::UsGallons: return "UsGallons";
        case VolumeUnits::ImperialGallons: return "ImperialGallons";
    }
    return "Unknown";
}

const char* to_string(AcidDosingInhibitStatus v) {
    switch (v) {
        case AcidDosingInhibitStatus::NotInhibited: return "NotInhibited";
        case AcidDosingInhibitStatus::InhibitedIndefinitely: return "InhibitedIndefinitely";
        case AcidDosingInhibitStatus::InhibitedForAPeriod: return "InhibitedForAPeriod";
    }
    return "Unknown";
}
