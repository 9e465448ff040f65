// Ticket: 0001_flat_tire_records

#ifndef TIRE_TRANSFER_TIRE_CONVENTIONS_RECORD_HPP
#define TIRE_TRANSFER_TIRE_CONVENTIONS_RECORD_HPP

#include <type_traits>

namespace tire_transfer
{

/**
 * @brief Flat record for the numerical tuning conventions
 *
 * Defaults are the baseline conventions, so a value-initialized record is
 * always usable.
 */
struct TireConventionsRecord
{
  float epsilon{1.0e-6F};
  float min_stiffness{1.0e-4F};
  float min_positive_weight{0.0F};
  float contact_penetration_threshold{0.0F};
};

static_assert(std::is_standard_layout_v<TireConventionsRecord>);
static_assert(sizeof(TireConventionsRecord) == 4 * sizeof(float));

}  // namespace tire_transfer

#endif  // TIRE_TRANSFER_TIRE_CONVENTIONS_RECORD_HPP
