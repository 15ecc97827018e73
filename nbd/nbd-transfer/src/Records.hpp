// Ticket: 0007_record_reflection

#ifndef NBD_TRANSFER_RECORDS_HPP
#define NBD_TRANSFER_RECORDS_HPP

/**
 * @file Records.hpp
 * @brief Convenience header including all transfer records
 *
 * This header provides a single include point for every record handed to the
 * presentation and reporting collaborators.
 */

#include "nbd-transfer/src/CoordinateRecord.hpp"
#include "nbd-transfer/src/DeliverySummaryRecord.hpp"
#include "nbd-transfer/src/DesignSpecsRecord.hpp"
#include "nbd-transfer/src/EfficiencyFactorsRecord.hpp"
#include "nbd-transfer/src/EnsembleSummaryRecord.hpp"
#include "nbd-transfer/src/EnvironmentalImpactRecord.hpp"
#include "nbd-transfer/src/RecordFields.hpp"
#include "nbd-transfer/src/TrajectoryAnalysisRecord.hpp"
#include "nbd-transfer/src/TrajectoryStepRecord.hpp"
#include "nbd-transfer/src/Vector3DRecord.hpp"

#endif  // NBD_TRANSFER_RECORDS_HPP
