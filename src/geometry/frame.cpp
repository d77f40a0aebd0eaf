#include <kinscene/geometry/frame.h>

#include <cmath>

namespace kinscene {
namespace geometry {

Eigen::Quaterniond quaternionFromRPY(double roll, double pitch, double yaw)
{
  Eigen::AngleAxisd r(roll, Eigen::Vector3d::UnitX());
  Eigen::AngleAxisd p(pitch, Eigen::Vector3d::UnitY());
  Eigen::AngleAxisd y(yaw, Eigen::Vector3d::UnitZ());

  Eigen::Quaterniond q(y * p * r);
  q.normalize();
  return q;
}

ResolvedFrame compose(const Origin& origin)
{
  return ResolvedFrame(origin.xyz, quaternionFromRPY(origin.rpy.x(), origin.rpy.y(), origin.rpy.z()));
}

bool isUnitVector(const Eigen::Vector3d& v, double tol)
{
  return std::abs(v.norm() - 1.0) < tol;
}

bool areVectorsOrthonormal(const Eigen::Vector3d& a, const Eigen::Vector3d& b, const Eigen::Vector3d& c, double tol)
{
  // Check all are unit length
  if (std::abs(a.norm() - 1.0) > tol || std::abs(b.norm() - 1.0) > tol || std::abs(c.norm() - 1.0) > tol)
    return false;

  // Check pairwise orthogonality
  if (std::abs(a.dot(b)) > tol)
    return false;
  if (std::abs(a.dot(c)) > tol)
    return false;
  if (std::abs(b.dot(c)) > tol)
    return false;

  return true;
}

bool isRightHanded(const Eigen::Vector3d& X, const Eigen::Vector3d& Y, const Eigen::Vector3d& Z, double tol)
{
  // det of [X Y Z] equals scalar triple product X . (Y x Z)
  const double detR = X.dot(Y.cross(Z));
  return detR > 1.0 - tol;
}

bool isRightHandedOrthonormal(const Eigen::Vector3d& X, const Eigen::Vector3d& Y, const Eigen::Vector3d& Z, double tol)
{
  return areVectorsOrthonormal(X, Y, Z, tol) && isRightHanded(X, Y, Z, tol);
}

}  // namespace geometry
}  // namespace kinscene
