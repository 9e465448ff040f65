// Ticket: 0002_single_precision_vector_types
// Semantic single-precision vector types

#ifndef TIRE_CORE_VECTOR_TYPES_HPP
#define TIRE_CORE_VECTOR_TYPES_HPP

#include "tire-core/src/DataTypes/Vec3FBase.hpp"
#include "tire-core/src/DataTypes/Vec3FFormatter.hpp"

namespace tire_core
{

/**
 * @brief Generic 3D vector (surface normals, directions)
 *
 * Use the semantic types below for positions, forces and torques.
 */
struct Vector3F final : detail::Vec3FBase<Vector3F>
{
  using Vec3FBase::Vec3FBase;
  using Vec3FBase::operator=;

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Vector3F(const Eigen::MatrixBase<OtherDerived>& other) : Vec3FBase{other}
  {
  }
};

/// World-space position [m]
struct Coordinate final : detail::Vec3FBase<Coordinate>
{
  using Vec3FBase::Vec3FBase;
  using Vec3FBase::operator=;

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Coordinate(const Eigen::MatrixBase<OtherDerived>& other) : Vec3FBase{other}
  {
  }
};

/// Force [N]
struct ForceVector final : detail::Vec3FBase<ForceVector>
{
  using Vec3FBase::Vec3FBase;
  using Vec3FBase::operator=;

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  ForceVector(const Eigen::MatrixBase<OtherDerived>& other) : Vec3FBase{other}
  {
  }
};

/// Torque [N*m]
struct TorqueVector final : detail::Vec3FBase<TorqueVector>
{
  using Vec3FBase::Vec3FBase;
  using Vec3FBase::operator=;

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  TorqueVector(const Eigen::MatrixBase<OtherDerived>& other)
    : Vec3FBase{other}
  {
  }
};

}  // namespace tire_core

#endif  // TIRE_CORE_VECTOR_TYPES_HPP
