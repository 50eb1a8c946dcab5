#include "chlorinator_records.hpp"
#include "codec_registry.hpp"
#include "record_fields.hpp"

#include <cassert>
#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

static bool near(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

static std::vector<uint8_t> state_with_flags(uint8_t flags) {
    return {2, 1, 1, 0, 0, flags, 74, 4, 14, 5, 9};
}

static int count_state_flags(const ChlorinatorState& s) {
    return s.chemistry_values_current + s.chemistry_values_valid + s.spa_selection + s.pump_is_priming +
           s.pump_is_operating + s.cell_is_operating + s.user_settings_changed +
           s.sanitising_until_next_timer_tomorrow;
}

static void check_state_fields() {
    const std::vector<uint8_t> buf = state_with_flags(0x21);
    ChlorinatorState s{};
    CodecResult res = decode_chlorinator_state(buf.data(), buf.size(), s);
    assert(res.ok);
    assert(s.mode == ChlorinatorMode::Auto);
    assert(s.pump_speed == SpeedLevel::Medium);
    assert(s.active_timer == 1);
    assert(s.info_message == InfoMessage::NoMessage);
    assert(near(s.ph_measurement, 7.4));
    assert(s.chlorine_control_status == ChlorineControlStatus::Ok);
    assert(s.time_hours == 14 && s.time_minutes == 5 && s.time_seconds == 9);

    // 0x21 is ChemistryValuesCurrent | CellIsOperating on the wire.
    assert(s.chemistry_values_current);
    assert(s.cell_is_operating);
    assert(count_state_flags(s) == 2);

    const std::vector<uint8_t> priming = state_with_flags(0x09);
    ChlorinatorState p{};
    res = decode_chlorinator_state(priming.data(), priming.size(), p);
    assert(res.ok);
    assert(p.chemistry_values_current);
    assert(p.pump_is_priming);
    assert(count_state_flags(p) == 2);
}

static void check_state_enums() {
    std::vector<uint8_t> buf = state_with_flags(0);
    buf[1] = 0xFF;
    buf[7] = 0xFF;
    ChlorinatorState s{};
    CodecResult res = decode_chlorinator_state(buf.data(), buf.size(), s);
    assert(res.ok);
    assert(s.pump_speed == SpeedLevel::NotSet);
    assert(s.chlorine_control_status == ChlorineControlStatus::Unknown);

    buf = state_with_flags(0);
    buf[0] = 3;
    res = decode_chlorinator_state(buf.data(), buf.size(), s);
    assert(!res.ok);
    assert(res.error == ChlorError::UnknownEnumValue);
    assert(std::string(res.field) == "mode");

    buf = state_with_flags(0);
    buf[3] = 9;  // gap between NoWaterFlow and RtccFault
    res = decode_chlorinator_state(buf.data(), buf.size(), s);
    assert(!res.ok);
    assert(res.error == ChlorError::UnknownEnumValue);

    buf = state_with_flags(0);
    buf[3] = 130;
    res = decode_chlorinator_state(buf.data(), buf.size(), s);
    assert(res.ok);
    assert(s.info_message == InfoMessage::AiPumpSpeed);
    assert(info_message_is_warning(s.info_message));
    assert(!info_message_is_warning(InfoMessage::NoWaterFlow));
}

static void check_timers() {
    // Timer 1: enabled, speed High, 08:00-17:30. Timer 2: disabled, start 25:00.
    // Timer 3: enabled, start after stop. Timer 4: disabled and empty.
    const std::vector<uint8_t> buf = {
        0xA8, 0, 17, 30,
        0x19, 0, 10, 0,
        0x6A, 0, 9, 0,
        0x00, 0, 0, 0,
    };
    ChlorinatorTimers t{};
    CodecResult res = decode_chlorinator_timers(buf.data(), buf.size(), t);
    assert(res.ok);

    const PumpTimer& t1 = t.pump_timers[0];
    assert(t1.enabled);
    assert(t1.speed_level == SpeedLevel::High);
    assert(t1.start_minutes == 8 * 60);
    assert(t1.stop_minutes == 17 * 60 + 30);
    assert(!pump_timer_is_invalid(t1));

    const PumpTimer& t2 = t.pump_timers[1];
    assert(!t2.enabled);
    assert(t2.start_minutes == 25 * 60);
    assert(pump_timer_is_invalid(t2));
    PumpTimer enabled_copy = t2;
    enabled_copy.enabled = true;
    assert(pump_timer_is_invalid(enabled_copy));

    assert(t.pump_timers[2].enabled);
    assert(pump_timer_is_invalid(t.pump_timers[2]));
    assert(!pump_timer_is_invalid(t.pump_timers[3]));

    PumpTimer unset{true, 60, 120, SpeedLevel::NotSet};
    assert(pump_timer_is_invalid(unset));
}

static void check_timers_at_midnight_boundary() {
    // Timer 1: disabled 24:00-10:00. Timer 2: disabled 25:00-10:00.
    // Timer 3: disabled 08:00-24:00. Timer 4: enabled 08:00-23:59.
    const std::vector<uint8_t> buf = {
        0x18, 0, 10, 0,
        0x19, 0, 10, 0,
        0x08, 0, 24, 0,
        0x68, 0, 23, 59,
    };
    ChlorinatorTimers t{};
    CodecResult res = decode_chlorinator_timers(buf.data(), buf.size(), t);
    assert(res.ok);

    assert(!t.pump_timers[0].enabled);
    assert(t.pump_timers[0].start_minutes == kMinutesPerDay);
    assert(pump_timer_is_invalid(t.pump_timers[0]));

    assert(!t.pump_timers[1].enabled);
    assert(pump_timer_is_invalid(t.pump_timers[1]));

    assert(!t.pump_timers[2].enabled);
    assert(t.pump_timers[2].stop_minutes == kMinutesPerDay);
    assert(pump_timer_is_invalid(t.pump_timers[2]));

    assert(t.pump_timers[3].enabled);
    assert(!pump_timer_is_invalid(t.pump_timers[3]));
}

static void check_timer_speed_levels() {
    // Speed lives in the top two bits of the start hour byte.
    const std::vector<uint8_t> buf = {
        0x28, 0, 9, 0,
        0x68, 0, 9, 0,
        0xA8, 0, 9, 0,
        0xE8, 0, 9, 0,
    };
    ChlorinatorTimers t{};
    CodecResult res = decode_chlorinator_timers(buf.data(), buf.size(), t);
    assert(res.ok);
    assert(t.pump_timers[0].speed_level == SpeedLevel::Low);
    assert(t.pump_timers[1].speed_level == SpeedLevel::Medium);
    assert(t.pump_timers[2].speed_level == SpeedLevel::High);
    assert(t.pump_timers[3].speed_level == SpeedLevel::AI);
    for (const PumpTimer& timer : t.pump_timers) {
        assert(timer.enabled);
        assert(timer.start_minutes == 8 * 60);
        assert(!pump_timer_is_invalid(timer));
    }
}

static void check_capabilities_and_statistics() {
    std::vector<uint8_t> caps = {0, 10, 0, 8, 70, 78, 40, 80, 1, 1, 0x25, 25, 1, 15, 4, 0x10, 0x27, 0x00, 0xE8, 0x03};
    ChlorinatorCapabilities c{};
    CodecResult res = decode_chlorinator_capabilities(caps.data(), caps.size(), c);
    assert(res.ok);
    assert(near(c.minimum_ph_setpoint, 7.0));
    assert(near(c.maximum_ph_setpoint, 7.8));
    assert(c.minimum_orp_setpoint == 400);
    assert(c.maximum_orp_setpoint == 800);
    assert(near(c.filter_pump_size, 1.5));
    assert(c.three_speed_pump_enabled);
    assert(c.dosing_capable_unit);
    assert(!c.ai_mode_enabled);
    assert(c.volume_units == VolumeUnits::UsGallons);
    assert(c.pool_volume_raw[0] == 0x10 && c.pool_volume_raw[1] == 0x27 && c.pool_volume_raw[2] == 0x00);
    assert(c.spa_volume == 1000);

    caps[10] = 0x0C;
    res = decode_chlorinator_capabilities(caps.data(), caps.size(), c);
    assert(!res.ok);
    assert(res.error == ChlorError::UnknownEnumValue);
    assert(std::string(res.field) == "volume_units");

    const std::vector<uint8_t> stats = {78, 70, 0xD0, 0x02, 0x58, 0x02, 12, 0, 0x10, 0x27, 0, 0, 5, 0, 0, 0, 80};
    ChlorinatorStatistics s{};
    res = decode_chlorinator_statistics(stats.data(), stats.size(), s);
    assert(res.ok);
    assert(near(s.highest_ph_measured, 7.8));
    assert(near(s.lowest_ph_measured, 7.0));
    assert(s.highest_orp_measured == 720);
    assert(s.lowest_orp_measured == 600);
    assert(s.cell_reversal_count == 12);
    assert(s.cell_running_hours == 10000);
    assert(s.low_salt_cell_running_hours == 5);
    assert(s.previous_days_cell_load == 80);
}

static void check_short_buffers() {
    const uint8_t three[3] = {0, 0, 0};
    for (Characteristic c : polled_characteristics()) {
        const CharacteristicCodec* codec = find_characteristic_codec(c);
        assert(codec);
        StateSnapshot snap;
        const std::vector<uint8_t> one_short(codec->length - 1, 0);
        CodecResult res = decode_and_merge(*codec, one_short.data(), one_short.size(), snap);
        assert(!res.ok);
        assert(res.error == ChlorError::ShortBuffer);
        assert(snap.empty());
        if (codec->length >= 4) {
            res = decode_and_merge(*codec, three, sizeof(three), snap);
            assert(!res.ok);
            assert(res.error == ChlorError::ShortBuffer);
            assert(snap.empty());
        }
    }
}

static void check_snapshot_export() {
    const std::vector<uint8_t> buf = state_with_flags(0x30);
    StateSnapshot snap;
    const CharacteristicCodec* codec = find_characteristic_codec(Characteristic::EqState);
    assert(codec);
    // Trailing bytes beyond the record are ignored.
    std::vector<uint8_t> padded = buf;
    padded.resize(20, 0xEE);
    CodecResult res = decode_and_merge(*codec, padded.data(), padded.size(), snap);
    assert(res.ok);

    std::string text;
    assert(snap.get_text(kFieldMode, text) && text == "Auto");
    assert(snap.get_text(kFieldPumpSpeed, text) && text == "Medium");
    double ph = 0.0;
    assert(snap.get_real(kFieldPhMeasurement, ph) && near(ph, 7.4));
    bool on = false;
    assert(snap.get_flag(kFieldPumpIsOperating, on) && on);
    assert(snap.get_flag(kFieldCellIsOperating, on) && on);
    int64_t hours = 0;
    assert(snap.get_int("time_hours", hours) && hours == 14);
    assert(!find_characteristic_codec(Characteristic::EqAppAction));
}

int main() {
    check_state_fields();
    check_state_enums();
    check_timers();
    check_timers_at_midnight_boundary();
    check_timer_speed_levels();
    check_capabilities_and_statistics();
    check_short_buffers();
    check_snapshot_export();
    return 0;
}
