// Ticket: 0002_single_precision_vector_types
// Shared float storage, record conversion and length for the contact-patch
// vector types

#ifndef TIRE_CORE_VEC3F_BASE_HPP
#define TIRE_CORE_VEC3F_BASE_HPP

// NOLINTBEGIN(bugprone-crtp-constructor-accessibility)

#include <Eigen/Dense>

#include "tire-transfer/src/Vector3FRecord.hpp"

namespace tire_core::detail
{

/**
 * @brief Common base of Vector3F, Coordinate, ForceVector and TorqueVector
 *
 * Tire quantities are computed in single precision, so the storage is an
 * Eigen::Vector3f and the arithmetic (sum, difference, scaling, cross) is
 * Eigen's. Derived is the concrete type, which lets fromRecord() hand back
 * a Coordinate or a ForceVector rather than the base.
 *
 * Every derived type maps to the same 12-byte Vector3FRecord.
 */
template <typename Derived>
class Vec3FBase : public Eigen::Vector3f
{
public:
  Vec3FBase() : Eigen::Vector3f{0.0F, 0.0F, 0.0F}
  {
  }

  Vec3FBase(float x, float y, float z) : Eigen::Vector3f{x, y, z}
  {
  }

  // NOLINTNEXTLINE(google-explicit-constructor)
  Vec3FBase(const Eigen::Vector3f& vec) : Eigen::Vector3f{vec}
  {
  }

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Vec3FBase(const Eigen::MatrixBase<OtherDerived>& other)
    : Eigen::Vector3f{other}
  {
  }

  template <typename OtherDerived>
  Vec3FBase& operator=(const Eigen::MatrixBase<OtherDerived>& other)
  {
    this->Eigen::Vector3f::operator=(other);
    return *this;
  }

  /// Euclidean length
  [[nodiscard]] float length() const
  {
    return norm();
  }

  static Derived fromRecord(const tire_transfer::Vector3FRecord& record)
  {
    return Derived{record.x, record.y, record.z};
  }

  [[nodiscard]] tire_transfer::Vector3FRecord toRecord() const
  {
    tire_transfer::Vector3FRecord record;
    record.x = x();
    record.y = y();
    record.z = z();
    return record;
  }
};

}  // namespace tire_core::detail

// NOLINTEND(bugprone-crtp-constructor-accessibility)

#endif  // TIRE_CORE_VEC3F_BASE_HPP
