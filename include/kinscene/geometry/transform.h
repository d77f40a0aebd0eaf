#ifndef KINSCENE_GEOMETRY_TRANSFORM_H_
#define KINSCENE_GEOMETRY_TRANSFORM_H_

#include <iosfwd>

#include <Eigen/Geometry>

namespace kinscene {
namespace geometry {

// Authored placement of a frame relative to its parent, as found in the description.
struct Origin
{
  Eigen::Vector3d xyz = Eigen::Vector3d::Zero();  // [m]
  Eigen::Vector3d rpy = Eigen::Vector3d::Zero();  // roll, pitch, yaw [rad]
};

// Rigid transform produced by geometry::compose(). Immutable once built.
class ResolvedFrame
{
public:
  ResolvedFrame() = default;
  ResolvedFrame(const Eigen::Vector3d& translation, const Eigen::Quaterniond& rotation);

  static ResolvedFrame Identity();
  static ResolvedFrame fromIsometry(const Eigen::Isometry3d& iso);

  const Eigen::Vector3d& translation() const
  {
    return translation_;
  }

  const Eigen::Quaterniond& rotation() const
  {
    return rotation_;
  }

  Eigen::Isometry3d isometry() const;

  // this * other: `other` expressed in this frame.
  ResolvedFrame operator*(const ResolvedFrame& other) const;

  Eigen::Vector3d transformPoint(const Eigen::Vector3d& p) const;

  ResolvedFrame inverse() const;

  bool isApprox(const ResolvedFrame& other, double tol = 1e-9) const;

private:
  Eigen::Vector3d translation_ = Eigen::Vector3d::Zero();
  Eigen::Quaterniond rotation_ = Eigen::Quaterniond::Identity();
};

bool isFinite(const Origin& origin);

std::ostream& operator<<(std::ostream& os, const Origin& origin);
std::ostream& operator<<(std::ostream& os, const ResolvedFrame& frame);

}  // namespace geometry
}  // namespace kinscene

#endif  // KINSCENE_GEOMETRY_TRANSFORM_H_
