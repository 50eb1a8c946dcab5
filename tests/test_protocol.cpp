#include "protocol.hpp"

#include <cassert>
#include <cctype>
#include <cstring>
#include <set>
#include <string>

static void check_uuid_table_round_trip() {
    std::set<std::string> seen;
    for (const CharacteristicInfo& info : kCharacteristicTable) {
        assert(std::strlen(info.uuid) == kUuidStringLen);
        assert(seen.insert(info.uuid).second);
        assert(std::strcmp(characteristic_uuid(info.id), info.uuid) == 0);
        assert(std::strcmp(characteristic_name(info.id), info.name) == 0);

        Characteristic back = Characteristic::EqSessionKey;
        bool ok = characteristic_from_uuid(info.uuid, back);
        (void)ok;
        assert(ok);
        assert(back == info.id);

        std::string upper = info.uuid;
        for (char& ch : upper) {
            ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
        }
        back = Characteristic::EqSessionKey;
        assert(characteristic_from_uuid(upper.c_str(), back));
        assert(back == info.id);
    }
    assert(seen.size() == kCharacteristicCount);
}

static void check_uuid_lookup_rejects() {
    Characteristic c = Characteristic::EqState;
    assert(!characteristic_from_uuid(nullptr, c));
    assert(!characteristic_from_uuid("", c));
    assert(!characteristic_from_uuid("45000200-98b7-4e29-a03f-16017464300", c));
    assert(!characteristic_from_uuid("45000200-98b7-4e29-a03f-1601746430011", c));
    assert(!characteristic_from_uuid("45000299-98b7-4e29-a03f-160174643001", c));
    // Service UUIDs are not characteristics.
    assert(!characteristic_from_uuid(kEquilibriumServiceUuid, c));
    assert(c == Characteristic::EqState);
}

static void check_family_from_advertisement() {
    assert(std::strcmp(service_uuid(DeviceFamily::Equilibrium), kEquilibriumServiceUuid) == 0);
    assert(std::strcmp(service_uuid(DeviceFamily::Halo), kHaloServiceUuid) == 0);

    DeviceFamily family = DeviceFamily::Halo;
    assert(family_from_advertisement(kEquilibriumServiceUuid, nullptr, family));
    assert(family == DeviceFamily::Equilibrium);

    assert(family_from_advertisement("45000001-98B7-4E29-A03F-160174643002", nullptr, family));
    assert(family == DeviceFamily::Halo);

    family = DeviceFamily::Equilibrium;
    assert(family_from_advertisement(nullptr, kHaloAdvertisedName, family));
    assert(family == DeviceFamily::Halo);

    family = DeviceFamily::Equilibrium;
    assert(!family_from_advertisement(nullptr, nullptr, family));
    assert(!family_from_advertisement("0000180f-0000-1000-8000-00805f9b34fb", "hchlor", family));
    assert(family == DeviceFamily::Equilibrium);
}

int main() {
    check_uuid_table_round_trip();
    check_uuid_lookup_rejects();
    check_family_from_advertisement();
    return 0;
}
