#include "codec_registry.hpp"
#include "halo_records.hpp"
#include "protocol.hpp"
#include "record_fields.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

static bool near(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

static void check_temperature() {
    const std::vector<uint8_t> buf = {0, 0x03, 0xFA, 0x00, 0xF0, 0x00, 0, 0, 0, 0, 1, 0, 0, 0, 0, 0x02};
    TemperatureRecord t{};
    CodecResult res = decode_temperature(buf.data(), buf.size(), t);
    assert(res.ok);
    assert(!t.is_fahrenheit);
    assert(t.supports_mask == (kTempBoard | kTempWater));
    assert(near(t.water_temp, 24.0));
    assert(near(t.board_temp, 250.0 / kProvisionalTempScale));
    assert(t.water_temp_valid == TempValid::IsValid);
    assert(t.displayed_mask == kTempWater);

    std::vector<uint8_t> bad = buf;
    bad[10] = 3;
    res = decode_temperature(bad.data(), bad.size(), t);
    assert(!res.ok);
    assert(res.error == ChlorError::UnknownEnumValue);
    assert(std::string(res.field) == "water_temp_valid");
}

static void check_state_record() {
    const std::vector<uint8_t> buf = {0x02, 5, 0xE8, 0x03, 0, 4, 0xBC, 0x02, 0, 73, 0, 0, 0, 0, 0, 0};
    HaloState s{};
    CodecResult res = decode_halo_state(buf.data(), buf.size(), s);
    assert(res.ok);
    assert(s.cell_running);
    assert(s.in_pool_selection);
    assert(!s.cell_reversed);
    assert(s.real_cell_level == 5);
    assert(s.cell_current_ma == 1000);
    assert(s.main_text == MainText::Off);
    assert(s.chlorine_text == ChlorineSubText::ORPWasGreen);
    assert(s.orp_measurement == 700);
    assert(near(s.ph_measurement, 7.3));
    assert(s.error_text == ErrorSubText::None);

    std::vector<uint8_t> sentinel = buf;
    sentinel[4] = 0xFF;
    res = decode_halo_state(sentinel.data(), sentinel.size(), s);
    assert(res.ok);
    assert(s.main_text == MainText::None);

    std::vector<uint8_t> bad_error = buf;
    bad_error[13] = 13;  // 13 sits in a gap of the error sub text table
    res = decode_halo_state(bad_error.data(), bad_error.size(), s);
    assert(!res.ok);
    assert(std::string(res.field) == "error_text");

    std::vector<uint8_t> lost = buf;
    lost[13] = 0x78;
    lost[14] = 0x05;
    res = decode_halo_state(lost.data(), lost.size(), s);
    assert(res.ok);
    assert(s.error_text == ErrorSubText::ConnectionError);

    StateSnapshot snap;
    const CommandCodec* codec = find_command_codec(static_cast<uint16_t>(HaloCommand::State));
    assert(codec);
    res = decode_and_merge(*codec, buf.data(), buf.size(), snap);
    assert(res.ok);
    bool on = false;
    assert(snap.get_flag(kFieldCellIsOperating, on) && on);
    std::string text;
    assert(snap.get_text(kFieldInfoMessage, text) && text == "Off");
    double ph = 0.0;
    assert(snap.get_real(kFieldPhMeasurement, ph) && near(ph, 7.3));
}

static void check_equipment() {
    // Filter pump Auto, GPO1 On, GPO2 not enabled, the rest off.
    // State bits: filter pump and GPO1. Auto bits: filter pump and valve 1.
    const std::vector<uint8_t> buf = {1, 1, 2, 255, 0, 0, 0, 0, 0, 0, 0, 0, 0x03, 0x00, 0x21, 0x00};
    EquipmentModeRecord m{};
    CodecResult res = decode_equipment_mode(buf.data(), buf.size(), m);
    assert(res.ok);
    assert(m.filter_pump_mode == HaloMode::Auto);
    assert(m.filter_pump_state);
    assert(m.filter_pump_auto_enabled);
    assert(m.gpo[0].mode == GpoMode::On);
    assert(m.gpo[0].state);
    assert(!m.gpo[0].auto_enabled);
    assert(m.gpo[1].mode == GpoMode::NotEnabled);
    assert(!m.gpo[1].state);
    assert(m.valve[0].auto_enabled);
    assert(!m.relay[1].state);

    std::vector<uint8_t> bad = buf;
    bad[6] = 7;
    res = decode_equipment_mode(bad.data(), bad.size(), m);
    assert(!res.ok);
    assert(std::string(res.field) == "valve1_mode");

    const std::vector<uint8_t> param = {0xFF, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10};
    EquipmentParameter p{};
    res = decode_equipment_parameter(param.data(), param.size(), p);
    assert(res.ok);
    assert(p.filter_pump_speed == SpeedLevel::NotSet);
    assert(p.gpo[3] == 4);
    assert(p.valve[0] == 5);
    assert(p.relay[1] == 10);
}

static void check_lighting() {
    // Zone modes, colours, then the on bits: zones 1 and 3.
    const std::vector<uint8_t> buf = {2, 1, 0, 0, 11, 12, 13, 14, 0x05};
    LightState l{};
    CodecResult res = decode_light_state(buf.data(), buf.size(), l);
    assert(res.ok);
    assert(l.zone_mode[0] == HaloMode::On);
    assert(l.zone_mode[1] == HaloMode::Auto);
    assert(l.zone_colour[2] == 13);
    assert(l.zone_on[0] && !l.zone_on[1] && l.zone_on[2] && !l.zone_on[3]);

    StateSnapshot snap;
    merge_record(HaloRecord{l}, snap);
    bool on = false;
    assert(snap.get_flag("lighting_state_3", on) && on);
    assert(snap.get_flag("lighting_state_4", on) && !on);

    const std::vector<uint8_t> names = {0, 1, 2, 8};
    LightSetup setup{};
    res = decode_light_setup(names.data(), names.size(), setup);
    assert(!res.ok);
    assert(std::string(res.field) == "lighting_zone_name_4");
}

static void check_gpo_slots() {
    const std::vector<uint8_t> connect2 = {8, 1, 1, 0, 4, 0, 1};
    GpoSetup g{};
    CodecResult res = decode_gpo_setup(connect2.data(), connect2.size(), g);
    assert(res.ok);
    assert(g.device_type == GpoDeviceType::Connect2);
    assert(g.slot == 4);
    assert(g.name == GpoName::BoosterPump);

    const std::vector<uint8_t> connect1 = {7, 0, 1, 1, 0, 2, 0};
    res = decode_gpo_setup(connect1.data(), connect1.size(), g);
    assert(res.ok);
    assert(g.slot == 1);
    assert(g.function == GpoFunction::Lighting);

    StateSnapshot snap;
    merge_record(HaloRecord{g}, snap);
    int64_t zone = 0;
    assert(snap.get_int("gpo1_lighting_zone", zone) && zone == 2);

    const std::vector<uint8_t> heater = {3, 0, 1, 3, 3, 0, 0};
    res = decode_gpo_setup(heater.data(), heater.size(), g);
    assert(res.ok);
    assert(g.slot == 0);
}

static void check_gpo_index_out_of_range() {
    StateSnapshot snap;
    const std::vector<uint8_t> builtin = {3, 0, 1, 3, 3, 0, 0};
    const CommandCodec* codec = find_command_codec(static_cast<uint16_t>(HaloCommand::GpoSetup));
    assert(codec);
    CodecResult res = decode_and_merge(*codec, builtin.data(), builtin.size(), snap);
    assert(res.ok);
    std::string name;
    assert(snap.get_text("gpo0_name", name) && name == "HeaterPump");

    // Indexes that would wrap the slot number must not land on another outlet.
    const std::vector<std::vector<uint8_t>> wrapping = {
        {7, 255, 1, 1, 0, 2, 0},
        {8, 253, 1, 1, 0, 2, 0},
        {8, 2, 1, 1, 0, 2, 0},
        {7, 4, 1, 1, 0, 2, 0},
    };
    for (const auto& buf : wrapping) {
        GpoSetup g{};
        res = decode_gpo_setup(buf.data(), buf.size(), g);
        assert(!res.ok);
        assert(res.error == ChlorError::UnknownEnumValue);
        assert(std::string(res.field) == "gpo_index");

        res = decode_and_merge(*codec, buf.data(), buf.size(), snap);
        assert(!res.ok);
        assert(snap.get_text("gpo0_name", name) && name == "HeaterPump");
        int64_t zone = -1;
        assert(snap.get_int("gpo0_lighting_zone", zone) && zone == 0);
    }

    const std::vector<uint8_t> last_connect2 = {8, 1, 1, 1, 0, 2, 0};
    GpoSetup g{};
    res = decode_gpo_setup(last_connect2.data(), last_connect2.size(), g);
    assert(res.ok);
    assert(g.slot == kGpoCount);
}

static void check_heater_and_solar() {
    const std::vector<uint8_t> heater = {0x09, 1, 1, 28, 1, 0, 0, 0, 1, 0x04, 0x01, 0};
    HeaterState h{};
    CodecResult res = decode_heater_state(heater.data(), heater.size(), h);
    assert(res.ok);
    assert(h.heater_on && h.flame && !h.lockout);
    assert(h.heater_mode == HeaterMode::On);
    assert(h.heat_pump_mode == HeatPumpMode::Heating);
    assert(near(h.water_temp, 26.0));

    const std::vector<uint8_t> solar = {0x2C, 0x01, 0xF0, 0x00, 0, 0, 1, 1, 0x01, 1, 1, 0, 0, 2};
    SolarState s{};
    res = decode_solar_state(solar.data(), solar.size(), s);
    assert(res.ok);
    assert(near(s.roof_temp, 30.0));
    assert(near(s.water_temp, 24.0));
    assert(s.summer_mode);
    assert(s.pump_on && !s.flush_active);
    assert(s.message == SolarMessage::SolarHeatingActive);
}

static void check_scan_response() {
    std::vector<uint8_t> adv = {1, 2, 2, 3, 0, 0, 0x78, 0x56, 0x34, 0x12, '4', '3', '2', '1', 1, 2, 3, 4, 5, 6, 7};
    ScanResponse scan{};
    CodecResult res = decode_scan_response(adv.data(), adv.size(), scan);
    assert(res.ok);
    assert(scan.device_type == DeviceType::Chlorinator);
    assert(scan.device_protocol == DeviceProtocol::NextGen);
    assert(scan.unique_id == 0x12345678u);
    assert(scan.pairable);
    assert(scan_access_code(scan) == "4321");

    for (std::size_t i = 10; i < 14; ++i) {
        adv[i] = 0;
    }
    res = decode_scan_response(adv.data(), adv.size(), scan);
    assert(res.ok);
    assert(!scan.pairable);
    assert(scan_access_code(scan) == "0000");

    // Any non-zero code is pairable, but only valid UTF-8 without NULs is a code.
    const std::vector<std::vector<uint8_t>> garbage = {
        {'1', 0, '3', '4'},
        {0xFF, '2', '3', '4'},
        {'1', '2', '3', 0xC3},
        {0xC0, 0xB1, '3', '4'},
        {0xED, 0xA0, 0x80, '4'},
    };
    for (const auto& code : garbage) {
        std::copy(code.begin(), code.end(), adv.begin() + 10);
        res = decode_scan_response(adv.data(), adv.size(), scan);
        assert(res.ok);
        assert(scan.pairable);
        assert(scan_access_code(scan) == kInvalidAccessCode);
    }

    const std::vector<uint8_t> accented = {'1', 0xC3, 0xA9, '4'};
    std::copy(accented.begin(), accented.end(), adv.begin() + 10);
    res = decode_scan_response(adv.data(), adv.size(), scan);
    assert(res.ok);
    assert(scan_access_code(scan) == "1\xC3\xA9" "4");
}

static void check_registry() {
    assert(!find_command_codec(static_cast<uint16_t>(HaloCommand::InfoLog)));
    assert(!find_command_codec(static_cast<uint16_t>(HaloCommand::HaloPing)));
    assert(!find_command_codec(4242));
    const CommandCodec* stats = find_command_codec(static_cast<uint16_t>(HaloCommand::ProbeStatistics));
    assert(stats && stats->length == kProbeStatisticsLen);

    // Short slices leave the snapshot as it was.
    StateSnapshot snap;
    snap.set_int("cell_reversal_count", 3);
    const CommandCodec* cell = find_command_codec(static_cast<uint16_t>(HaloCommand::CellStatistics));
    assert(cell);
    const uint8_t short_buf[4] = {9, 9, 9, 9};
    CodecResult res = decode_and_merge(*cell, short_buf, sizeof(short_buf), snap);
    assert(!res.ok);
    assert(res.error == ChlorError::ShortBuffer);
    int64_t count = 0;
    assert(snap.get_int("cell_reversal_count", count) && count == 3);
    assert(snap.size() == 1);

    const CommandCodec* caps = find_command_codec(static_cast<uint16_t>(HaloCommand::Capabilities));
    assert(caps);
    const uint8_t cap_buf[2] = {2, 1};
    res = decode_and_merge(*caps, cap_buf, sizeof(cap_buf), snap);
    assert(res.ok);
    std::string type;
    assert(snap.get_text(kFieldPhControlType, type) && type == "Automatic");
}

static void check_every_command_codec_rejects_short_buffers() {
    const uint8_t three[3] = {0, 0, 0};
    std::size_t codecs = 0;
    for (uint32_t tag = 0; tag <= 0xFFFF; ++tag) {
        const CommandCodec* codec = find_command_codec(static_cast<uint16_t>(tag));
        if (!codec) {
            continue;
        }
        ++codecs;
        assert(codec->tag == tag);
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
    assert(codecs > 20);
}

int main() {
    check_temperature();
    check_state_record();
    check_equipment();
    check_lighting();
    check_gpo_slots();
    check_gpo_index_out_of_range();
    check_heater_and_solar();
    check_scan_response();
    check_registry();
    check_every_command_codec_rejects_short_buffers();
    return 0;
}
