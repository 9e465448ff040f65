#ifndef TIRE_TRANSFER_RECORDS_HPP
#define TIRE_TRANSFER_RECORDS_HPP

/**
 * @file Records.hpp
 * @brief Convenience header including all flat transfer records
 *
 * This header provides a single include point for all tire-transfer records.
 * Use this when you need the complete cross-boundary data layout.
 */

#include "tire-transfer/src/ContactAggregateRecord.hpp"
#include "tire-transfer/src/PatchAggregateRecord.hpp"
#include "tire-transfer/src/PatchSampleRecord.hpp"
#include "tire-transfer/src/TireConventionsRecord.hpp"
#include "tire-transfer/src/Vector3FRecord.hpp"
#include "tire-transfer/src/WearThermalInputRecord.hpp"
#include "tire-transfer/src/WearThermalModelRecord.hpp"
#include "tire-transfer/src/WearThermalOutputRecord.hpp"

#endif  // TIRE_TRANSFER_RECORDS_HPP
