#include "action.hpp"

#include <cassert>
#include <cstdint>
#include <cstring>
#include <string>

static bool tail_is_zero(const ActionFrame& frame, std::size_t from) {
    for (std::size_t i = from; i < frame.len; ++i) {
        if (frame.bytes[i] != 0) {
            return false;
        }
    }
    return true;
}

static void check_equilibrium() {
    ActionFrame frame = encode_equilibrium_action(EquilibriumAction::DisableAcidDosingForPeriod, 90);
    assert(frame.family == ActionFamily::Equilibrium);
    assert(frame.len == kActionFrameLen);
    assert(frame.bytes[0] == 11);
    assert(frame.bytes[1] == 90 && frame.bytes[2] == 0 && frame.bytes[3] == 0 && frame.bytes[4] == 0);
    assert(tail_is_zero(frame, 5));

    frame = encode_equilibrium_action(EquilibriumAction::Spa);
    assert(frame.bytes[0] == 8);
    assert(tail_is_zero(frame, 1));

    frame = encode_equilibrium_action(EquilibriumAction::DisableAcidDosingForPeriod, 0x01020304);
    assert(frame.bytes[1] == 0x04 && frame.bytes[2] == 0x03 && frame.bytes[3] == 0x02 && frame.bytes[4] == 0x01);

    DecodedAction decoded{};
    assert(decode_action_frame(ActionFamily::Equilibrium, frame.bytes.data(), frame.len, decoded));
    assert(decoded.tag == 11);
    assert(decoded.parameter == 0x01020304);

    assert(action_uses_parameter(EquilibriumAction::DisableAcidDosingForPeriod));
    assert(!action_uses_parameter(EquilibriumAction::DisableAcidDosingIndefinitely));
}

static void check_halo_families() {
    ActionFrame frame = encode_halo_chlorinator_action(HaloChlorinatorAction::FilterForPeriod, 120);
    const uint8_t chlor_head[] = {0x03, 0xF4, 0x01, 23, 120, 0, 0, 0};
    assert(std::memcmp(frame.bytes.data(), chlor_head, sizeof(chlor_head)) == 0);
    assert(tail_is_zero(frame, sizeof(chlor_head)));
    assert(action_uses_parameter(HaloChlorinatorAction::SanitiseAndCleanForPeriod));
    assert(!action_uses_parameter(HaloChlorinatorAction::Backwash));

    frame = encode_halo_chlorinator_action(HaloChlorinatorAction::DisableAcidDosingForPeriod, -1);
    assert(frame.bytes[4] == 0xFF && frame.bytes[7] == 0xFF);
    DecodedAction decoded{};
    assert(decode_action_frame(ActionFamily::HaloChlorinator, frame.bytes.data(), frame.len, decoded));
    assert(decoded.parameter == -1);

    frame = encode_light_action(LightAction::TurnOnZone);
    const uint8_t light_head[] = {0x03, 0xF5, 0x01, 4};
    assert(std::memcmp(frame.bytes.data(), light_head, sizeof(light_head)) == 0);
    assert(tail_is_zero(frame, sizeof(light_head)));

    frame = encode_heater_action(HeaterAction::ModeCooling);
    assert(frame.bytes[1] == 0xF6 && frame.bytes[3] == 13);
    assert(decode_action_frame(ActionFamily::HaloHeater, frame.bytes.data(), frame.len, decoded));
    assert(decoded.family == ActionFamily::HaloHeater);
    assert(decoded.tag == 13);
    assert(decoded.parameter == 0);

    frame = encode_solar_action(SolarAction::Winter);
    assert(frame.bytes[1] == 0xF7 && frame.bytes[3] == 5);
}

static void check_rejections() {
    DecodedAction decoded{};
    ActionFrame light = encode_light_action(LightAction::SetZoneColour);

    // Wrong family header.
    assert(!decode_action_frame(ActionFamily::HaloSolar, light.bytes.data(), light.len, decoded));
    // Wrong length.
    assert(!decode_action_frame(ActionFamily::HaloLight, light.bytes.data(), 19, decoded));
    assert(!decode_action_frame(ActionFamily::HaloLight, nullptr, kActionFrameLen, decoded));
    // Tag past the end of the family's enumeration.
    light.bytes[3] = 7;
    assert(!decode_action_frame(ActionFamily::HaloLight, light.bytes.data(), light.len, decoded));

    ActionFrame eq = encode_equilibrium_action(EquilibriumAction::TriggerCellReversal);
    assert(decode_action_frame(ActionFamily::Equilibrium, eq.bytes.data(), eq.len, decoded));
    eq.bytes[0] = 14;
    assert(!decode_action_frame(ActionFamily::Equilibrium, eq.bytes.data(), eq.len, decoded));
}

static void check_names() {
    assert(std::string(to_string(HaloChlorinatorAction::OverrideHeaterCooldown)) == "OverrideHeaterCooldown");
    assert(std::string(to_string(LightAction::SynchroniseZoneColour)) == "SynchroniseZoneColour");
    assert(std::string(to_string(static_cast<SolarAction>(40))) == "Unknown");
    assert(std::string(action_family_name(ActionFamily::HaloHeater)).size() > 0);
}

int main() {
    check_equilibrium();
    check_halo_families();
    check_rejections();
    check_names();
    return 0;
}
