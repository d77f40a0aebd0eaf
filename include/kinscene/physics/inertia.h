#ifndef KINSCENE_PHYSICS_INERTIA_H_
#define KINSCENE_PHYSICS_INERTIA_H_

#include <iosfwd>
#include <optional>
#include <string>

#include <Eigen/Geometry>

#include <kinscene/options.h>

namespace kinscene {
namespace physics {

struct MassProperties
{
  double mass = 0.0;                                                       // [kg]
  Eigen::Vector3d local_center_of_mass = Eigen::Vector3d::Zero();          // link frame [m]
  Eigen::Vector3d principal_inertia = Eigen::Vector3d::Zero();             // [kg*m^2], >= 0
  Eigen::Quaterniond principal_inertia_orientation = Eigen::Quaterniond::Identity();  // link -> principal axes
};

/**
 * Diagonalize a symmetric inertia tensor into principal moments and axes.
 *
 * Only the lower triangle of `tensor` is read. A tensor that is exactly zero yields no mass
 * properties. `principal_inertia` is returned in ascending order (solver order); callers must not
 * rely on that order to identify axes, the orientation does that.
 *
 * @throws CompileError (InvalidInertiaTensor) naming `link_name` on non-finite input, negative mass,
 *         solver failure, a non-orthonormal eigenbasis, negative principal moments or moments that
 *         violate the triangle inequality (rank <= 1 tensors).
 */
std::optional<MassProperties> diagonalizeInertia(const Eigen::Matrix3d& tensor, const Eigen::Vector3d& center_of_mass,
                                                 double mass, const std::string& link_name,
                                                 const CompileOptions& options = {});

/**
 * Build mass properties from an already computed eigen-decomposition.
 *
 * `eigenvectors` holds one eigenvector per column. The basis is validated (orthonormal within
 * options.orthonormal_tolerance), its signs are canonicalized (largest component of each column
 * positive) and a reflection is turned into a rotation by negating the third column.
 */
MassProperties massPropertiesFromEigenbasis(const Eigen::Vector3d& eigenvalues, const Eigen::Matrix3d& eigenvectors,
                                            const Eigen::Vector3d& center_of_mass, double mass,
                                            const std::string& link_name, const CompileOptions& options = {});

// Inertia tensor of the principal representation expressed back in the link frame (R D R^T).
Eigen::Matrix3d reconstructInertiaTensor(const MassProperties& props);

std::ostream& operator<<(std::ostream& os, const MassProperties& props);

}  // namespace physics
}  // namespace kinscene

#endif  // KINSCENE_PHYSICS_INERTIA_H_
