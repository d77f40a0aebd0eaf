#ifndef KINSCENE_KINEMATICS_JOINT_CONSTRAINT_H_
#define KINSCENE_KINEMATICS_JOINT_CONSTRAINT_H_

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include <Eigen/Core>

#include <kinscene/components/joint.h>
#include <kinscene/geometry/transform.h>
#include <kinscene/options.h>

namespace kinscene {
namespace kinematics {

enum class DofType
{
  ROTATIONAL,
  TRANSLATIONAL,
};

// A motion left free by a constraint, about/along `axis` of the joint frame.
struct DegreeOfFreedom
{
  DofType type = DofType::ROTATIONAL;
  Eigen::Vector3d axis = Eigen::Vector3d::UnitX();  // unit length
};

struct ConstraintSpec
{
  components::JointType kind = components::JointType::FIXED;

  // Everything not listed is locked.
  std::vector<DegreeOfFreedom> free_dofs;

  bool bounded = true;  // false for CONTINUOUS

  // Joint frame in the parent link frame: anchor point and rotation basis.
  geometry::ResolvedFrame parent_anchor;

  // Joint frame in the child link frame. The child frame coincides with the joint frame.
  geometry::ResolvedFrame child_anchor;

  // Normalized, joint frame. Set for REVOLUTE, CONTINUOUS and PRISMATIC.
  std::optional<Eigen::Vector3d> axis;

  int dof() const
  {
    return static_cast<int>(free_dofs.size());
  }

  int rotationalDof() const;
  int translationalDof() const;
};

/**
 * Map an abstract joint to the constraint a physics engine should build.
 *
 * | Kind       | Free DOF                          | Axis     |
 * |------------|-----------------------------------|----------|
 * | FIXED      | none                              | ignored  |
 * | REVOLUTE   | 1 rotational about axis, bounded  | required |
 * | CONTINUOUS | 1 rotational about axis, unbounded| required |
 * | PRISMATIC  | 1 translational along axis        | required |
 * | SPHERICAL  | 3 rotational (joint X, Y, Z)      | ignored  |
 * | PLANAR     | unsupported                       |          |
 * | FLOATING   | unsupported                       |          |
 *
 * Returns std::nullopt only for CONTINUOUS when options.unbounded_revolute_supported is false;
 * the child is then left physically unconnected and a warning is reported.
 *
 * @throws CompileError UnsupportedJointKind, MissingAxis (absent, zero or non-finite axis),
 *         both naming `joint_name`.
 */
std::optional<ConstraintSpec> mapJointConstraint(const std::string& joint_name, components::JointType type,
                                                 const std::optional<Eigen::Vector3d>& axis,
                                                 const geometry::ResolvedFrame& anchor,
                                                 const CompileOptions& options = {});

const char* dofTypeToString(DofType type);

std::ostream& operator<<(std::ostream& os, const ConstraintSpec& spec);

}  // namespace kinematics
}  // namespace kinscene

#endif  // KINSCENE_KINEMATICS_JOINT_CONSTRAINT_H_
