#include <kinscene/geometry/transform.h>

#include <cmath>
#include <ostream>

namespace kinscene {
namespace geometry {

ResolvedFrame::ResolvedFrame(const Eigen::Vector3d& translation, const Eigen::Quaterniond& rotation)
  : translation_(translation), rotation_(rotation.normalized())
{
}

ResolvedFrame ResolvedFrame::Identity()
{
  return ResolvedFrame();
}

ResolvedFrame ResolvedFrame::fromIsometry(const Eigen::Isometry3d& iso)
{
  return ResolvedFrame(iso.translation(), Eigen::Quaterniond(iso.rotation()));
}

Eigen::Isometry3d ResolvedFrame::isometry() const
{
  return Eigen::Translation3d(translation_) * rotation_;
}

ResolvedFrame ResolvedFrame::operator*(const ResolvedFrame& other) const
{
  return ResolvedFrame(translation_ + rotation_ * other.translation_, rotation_ * other.rotation_);
}

Eigen::Vector3d ResolvedFrame::transformPoint(const Eigen::Vector3d& p) const
{
  return translation_ + rotation_ * p;
}

ResolvedFrame ResolvedFrame::inverse() const
{
  const Eigen::Quaterniond inv = rotation_.conjugate();
  return ResolvedFrame(-(inv * translation_), inv);
}

bool ResolvedFrame::isApprox(const ResolvedFrame& other, double tol) const
{
  if ((translation_ - other.translation_).norm() > tol)
    return false;

  // q and -q are the same rotation
  return std::abs(std::abs(rotation_.dot(other.rotation_)) - 1.0) <= tol;
}

bool isFinite(const Origin& origin)
{
  return origin.xyz.allFinite() && origin.rpy.allFinite();
}

std::ostream& operator<<(std::ostream& os, const Origin& origin)
{
  os << "Origin{ xyz=[" << origin.xyz.x() << ", " << origin.xyz.y() << ", " << origin.xyz.z() << "], rpy=["
     << origin.rpy.x() << ", " << origin.rpy.y() << ", " << origin.rpy.z() << "] }";
  return os;
}

std::ostream& operator<<(std::ostream& os, const ResolvedFrame& frame)
{
  const auto& t = frame.translation();
  const auto& q = frame.rotation();
  os << "Frame{ t=[" << t.x() << ", " << t.y() << ", " << t.z() << "], q(xyzw)=[" << q.x() << ", " << q.y() << ", "
     << q.z() << ", " << q.w() << "] }";
  return os;
}

}  // namespace geometry
}  // namespace kinscene
