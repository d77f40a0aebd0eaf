#include <kinscene/physics/inertia.h>

#include <kinscene/errors.h>
#include <kinscene/geometry/frame.h>

#include <Eigen/Eigenvalues>

#include <algorithm>
#include <cmath>
#include <ostream>
#include <sstream>

namespace kinscene {
namespace physics {

namespace {

CompileError invalidTensor(const std::string& link_name, const std::string& detail)
{
  return CompileError(CompileErrorKind::InvalidInertiaTensor, link_name, detail);
}

std::string formatVec(const Eigen::Vector3d& v)
{
  std::ostringstream os;
  os << "[" << v.x() << ", " << v.y() << ", " << v.z() << "]";
  return os.str();
}

// Flip each column so its largest-magnitude component is positive. Makes the principal frame
// deterministic (an already diagonal tensor maps to the identity rotation).
void canonicalizeColumnSigns(Eigen::Matrix3d& R)
{
  for (int c = 0; c < 3; ++c)
  {
    Eigen::Index row = 0;
    R.col(c).cwiseAbs().maxCoeff(&row);
    if (R(row, c) < 0.0)
      R.col(c) = -R.col(c);
  }
}

}  // namespace

std::optional<MassProperties> diagonalizeInertia(const Eigen::Matrix3d& tensor, const Eigen::Vector3d& center_of_mass,
                                                 double mass, const std::string& link_name,
                                                 const CompileOptions& options)
{
  if (!tensor.allFinite())
    throw invalidTensor(link_name, "inertia tensor has non-finite entries");
  if (!center_of_mass.allFinite())
    throw invalidTensor(link_name, "center of mass has non-finite entries");
  if (!std::isfinite(mass) || mass < 0.0)
    throw invalidTensor(link_name, "mass must be finite and >= 0, got " + std::to_string(mass));

  // Exactly zero: the link contributes no dynamics.
  if ((tensor.array() == 0.0).all())
    return std::nullopt;

  if (mass < options.min_mass)
    reportWarning(options, "link '" + link_name + "' has near-zero mass (" + std::to_string(mass) +
                               " kg) but a non-zero inertia tensor");

  const double asym = (tensor - tensor.transpose()).cwiseAbs().maxCoeff();
  if (asym > options.eigenvalue_tolerance * tensor.cwiseAbs().maxCoeff())
    reportWarning(options, "link '" + link_name + "' inertia tensor is not symmetric (max deviation " +
                               std::to_string(asym) + "), using its lower triangle");

  Eigen::SelfAdjointEigenSolver<Eigen::Matrix3d> solver(tensor, Eigen::ComputeEigenvectors);
  if (solver.info() != Eigen::Success)
    throw invalidTensor(link_name, "eigen-decomposition of the inertia tensor did not converge");

  return massPropertiesFromEigenbasis(solver.eigenvalues(), solver.eigenvectors(), center_of_mass, mass, link_name,
                                      options);
}

MassProperties massPropertiesFromEigenbasis(const Eigen::Vector3d& eigenvalues, const Eigen::Matrix3d& eigenvectors,
                                            const Eigen::Vector3d& center_of_mass, double mass,
                                            const std::string& link_name, const CompileOptions& options)
{
  if (!eigenvalues.allFinite() || !eigenvectors.allFinite())
    throw invalidTensor(link_name, "eigen-decomposition produced non-finite values");

  Eigen::Matrix3d R = eigenvectors;
  const double tol = options.orthonormal_tolerance;
  if (!geometry::areVectorsOrthonormal(R.col(0), R.col(1), R.col(2), tol))
  {
    std::ostringstream os;
    os << "eigenbasis is not orthonormal within " << tol << " (tensor is not a valid symmetric tensor)";
    throw invalidTensor(link_name, os.str());
  }

  canonicalizeColumnSigns(R);

  // A reflection is not a rotation.
  if (R.determinant() < 0.0)
    R.col(2) = -R.col(2);

  // Principal moments: clamp round-off negatives, report real ones.
  // Tolerances scale with the largest moment, link inertias are often 1e-6 kg*m^2 or less.
  const double scale = eigenvalues.cwiseAbs().maxCoeff();
  const double eps = options.eigenvalue_tolerance * scale;
  const double triangle_eps = options.triangle_tolerance * scale;

  Eigen::Vector3d principal = eigenvalues;
  for (int i = 0; i < 3; ++i)
  {
    if (principal[i] >= 0.0)
      continue;
    if (principal[i] < -eps)
      throw invalidTensor(link_name, "negative principal moment of inertia " + std::to_string(principal[i]) +
                                         " (principal moments " + formatVec(eigenvalues) + ")");
    reportWarning(options, "link '" + link_name + "' principal moment " + std::to_string(principal[i]) +
                               " clamped to 0");
    principal[i] = 0.0;
  }

  // Any physical body satisfies I_a <= I_b + I_c. Rank <= 1 tensors do not.
  for (int i = 0; i < 3; ++i)
  {
    const double a = principal[i];
    const double b = principal[(i + 1) % 3];
    const double c = principal[(i + 2) % 3];
    if (b + c < a - triangle_eps)
      throw invalidTensor(link_name,
                          "principal moments " + formatVec(principal) + " violate the triangle inequality");
  }

  MassProperties props;
  props.mass = mass;
  props.local_center_of_mass = center_of_mass;
  props.principal_inertia = principal;
  props.principal_inertia_orientation = Eigen::Quaterniond(R).normalized();
  return props;
}

Eigen::Matrix3d reconstructInertiaTensor(const MassProperties& props)
{
  const Eigen::Matrix3d R = props.principal_inertia_orientation.toRotationMatrix();
  return R * props.principal_inertia.asDiagonal() * R.transpose();
}

std::ostream& operator<<(std::ostream& os, const MassProperties& props)
{
  const auto& q = props.principal_inertia_orientation;
  os << "MassProperties{ mass=" << props.mass << ", com=" << formatVec(props.local_center_of_mass)
     << ", principal_inertia=" << formatVec(props.principal_inertia) << ", q(xyzw)=[" << q.x() << ", " << q.y()
     << ", " << q.z() << ", " << q.w() << "] }";
  return os;
}

}  // namespace physics
}  // namespace kinscene
