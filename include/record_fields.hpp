#pragma once

#include "chlorinator_records.hpp"
#include "halo_records.hpp"
#include "snapshot.hpp"

// Field names published by both device families. Records that report the
// same quantity write the same key so the later record wins.
extern const char* const kFieldMode;
extern const char* const kFieldPumpSpeed;
extern const char* const kFieldPumpIsOperating;
extern const char* const kFieldPhMeasurement;
extern const char* const kFieldInfoMessage;
extern const char* const kFieldChlorineControlStatus;
extern const char* const kFieldCellIsOperating;
extern const char* const kFieldPhControlSetpoint;
extern const char* const kFieldChlorineControlSetpoint;
extern const char* const kFieldPhControlType;
extern const char* const kFieldChlorineControlType;
extern const char* const kFieldHighestPhMeasured;
extern const char* const kFieldLowestPhMeasured;
extern const char* const kFieldHighestOrpMeasured;
extern const char* const kFieldLowestOrpMeasured;
extern const char* const kFieldCellReversalCount;
extern const char* const kFieldCellRunningHours;
extern const char* const kFieldLowSaltCellRunningHours;
extern const char* const kFieldPreviousDaysCellLoad;
extern const char* const kFieldWaterTemp;

void export_fields(const ChlorinatorState& rec, StateSnapshot& snap);
void export_fields(const ChlorinatorSetup& rec, StateSnapshot& snap);
void export_fields(const ChlorinatorCapabilities& rec, StateSnapshot& snap);
void export_fields(const ChlorinatorSettings& rec, StateSnapshot& snap);
void export_fields(const ChlorinatorStatistics& rec, StateSnapshot& snap);
void export_fields(const ChlorinatorTimers& rec, StateSnapshot& snap);

void export_fields(const DeviceProfile& rec, StateSnapshot& snap);
void export_fields(const TemperatureRecord& rec, StateSnapshot& snap);
void export_fields(const HaloSettings& rec, StateSnapshot& snap);
void export_fields(const WaterVolume& rec, StateSnapshot& snap);
void export_fields(const SetPoint& rec, StateSnapshot& snap);
void export_fields(const HaloState& rec, StateSnapshot& snap);
void export_fields(const HaloCapabilities& rec, StateSnapshot& snap);
void export_fields(const MaintenanceState& rec, StateSnapshot& snap);
void export_fields(const EquipmentModeRecord& rec, StateSnapshot& snap);
void export_fields(const EquipmentParameter& rec, StateSnapshot& snap);
void export_fields(const LightState& rec, StateSnapshot& snap);
void export_fields(const LightCapabilities& rec, StateSnapshot& snap);
void export_fields(const LightSetup& rec, StateSnapshot& snap);
void export_fields(const ProbeStatistics& rec, StateSnapshot& snap);
void export_fields(const CellStatistics& rec, StateSnapshot& snap);
void export_fields(const PowerBoardStatistics& rec, StateSnapshot& snap);
void export_fields(const HeaterCapabilities& rec, StateSnapshot& snap);
void export_fields(const HeaterConfig& rec, StateSnapshot& snap);
void export_fields(const HeaterState& rec, StateSnapshot& snap);
void export_fields(const HeaterCooldownState& rec, StateSnapshot& snap);
void export_fields(const SolarCapabilities& rec, StateSnapshot& snap);
void export_fields(const SolarConfig& rec, StateSnapshot& snap);
void export_fields(const SolarState& rec, StateSnapshot& snap);
void export_fields(const GpoSetup& rec, StateSnapshot& snap);
void export_fields(const RelaySetup& rec, StateSnapshot& snap);
void export_fields(const ValveSetup& rec, StateSnapshot& snap);
