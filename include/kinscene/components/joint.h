#ifndef KINSCENE_COMPONENTS_JOINT_H_
#define KINSCENE_COMPONENTS_JOINT_H_

#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>

#include <Eigen/Core>

#include <kinscene/geometry/transform.h>

namespace kinscene {
namespace components {

enum class JointType
{
  FIXED,       // No motion
  REVOLUTE,    // 1 DOF rotation, bounded
  CONTINUOUS,  // 1 DOF rotation, unbounded
  PRISMATIC,   // 1 DOF translation
  SPHERICAL,   // 3 DOF rotation
  PLANAR,      // 2 DOF translation + 1 DOF rotation (unsupported)
  FLOATING     // 6 DOF (unsupported)
};

struct JointDescriptor
{
  std::string name;
  JointType type = JointType::FIXED;
  std::string parent_link;
  std::string child_link;

  // Pose of the joint frame (and of the child link frame) in the parent link frame.
  geometry::Origin origin;

  // Expressed in the joint frame. Only meaningful for REVOLUTE, CONTINUOUS and PRISMATIC.
  std::optional<Eigen::Vector3d> axis;
};

inline bool jointTypeRequiresAxis(JointType type)
{
  return type == JointType::REVOLUTE || type == JointType::CONTINUOUS || type == JointType::PRISMATIC;
}

// Accepts both the URDF spelling ("revolute") and the capitalized one ("Revolute").
inline JointType jointTypeFromString(const std::string& s)
{
  if (s == "Fixed" || s == "fixed")
    return JointType::FIXED;
  if (s == "Revolute" || s == "revolute")
    return JointType::REVOLUTE;
  if (s == "Continuous" || s == "continuous")
    return JointType::CONTINUOUS;
  if (s == "Prismatic" || s == "prismatic")
    return JointType::PRISMATIC;
  if (s == "Spherical" || s == "spherical")
    return JointType::SPHERICAL;
  if (s == "Planar" || s == "planar")
    return JointType::PLANAR;
  if (s == "Floating" || s == "floating")
    return JointType::FLOATING;
  throw std::runtime_error("Unknown JointType: " + s);
}

inline std::string jointTypeToString(JointType type)
{
  switch (type)
  {
    case JointType::FIXED:
      return "Fixed";
    case JointType::REVOLUTE:
      return "Revolute";
    case JointType::CONTINUOUS:
      return "Continuous";
    case JointType::PRISMATIC:
      return "Prismatic";
    case JointType::SPHERICAL:
      return "Spherical";
    case JointType::PLANAR:
      return "Planar";
    case JointType::FLOATING:
      return "Floating";
    default:
      return "Unknown";
  }
}

inline std::ostream& operator<<(std::ostream& os, JointType type)
{
  return os << jointTypeToString(type);
}

}  // namespace components
}  // namespace kinscene

#endif  // KINSCENE_COMPONENTS_JOINT_H_
