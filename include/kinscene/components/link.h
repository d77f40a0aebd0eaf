#ifndef KINSCENE_COMPONENTS_LINK_H_
#define KINSCENE_COMPONENTS_LINK_H_

#include <optional>
#include <string>
#include <vector>

#include <Eigen/Core>

#include <kinscene/geometry/shape.h>
#include <kinscene/geometry/transform.h>

namespace kinscene {
namespace components {

struct InertialProperties
{
  double mass = 0.0;  // [kg]

  // origin.xyz is the center of mass in the link frame,
  // origin.rpy orients the frame the tensor is expressed in.
  geometry::Origin origin;

  // Symmetric, built from (ixx, ixy, ixz, iyy, iyz, izz). Zero means "no dynamics".
  Eigen::Matrix3d inertia_tensor = Eigen::Matrix3d::Zero();

  const Eigen::Vector3d& centerOfMass() const
  {
    return origin.xyz;
  }
};

inline Eigen::Matrix3d inertiaTensorFromEntries(double ixx, double ixy, double ixz, double iyy, double iyz, double izz)
{
  Eigen::Matrix3d I;
  I << ixx, ixy, ixz,  //
      ixy, iyy, iyz,   //
      ixz, iyz, izz;
  return I;
}

struct CollisionPrimitive
{
  std::string name;  // optional
  geometry::Origin origin;
  geometry::Geometry geometry;
};

struct Color
{
  double r = 0.0;
  double g = 0.0;
  double b = 0.0;
  double a = 1.0;
};

struct VisualMaterial
{
  std::string name;
  std::optional<Color> color;
  std::string texture_filename;  // passed through, never loaded here
};

struct VisualPrimitive
{
  std::string name;  // optional
  geometry::Origin origin;
  geometry::Geometry geometry;
  std::optional<VisualMaterial> material;
};

struct LinkDescriptor
{
  std::string name;
  std::optional<InertialProperties> inertial;
  std::vector<CollisionPrimitive> collisions;
  std::vector<VisualPrimitive> visuals;
};

}  // namespace components
}  // namespace kinscene

#endif  // KINSCENE_COMPONENTS_LINK_H_
