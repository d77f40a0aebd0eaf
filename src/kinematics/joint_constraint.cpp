#include <kinscene/kinematics/joint_constraint.h>

#include <kinscene/errors.h>

#include <algorithm>
#include <ostream>

namespace kinscene {
namespace kinematics {

using components::JointType;

namespace {

constexpr double kMinAxisNorm = 1e-12;

Eigen::Vector3d requireAxis(const std::string& joint_name, JointType type,
                            const std::optional<Eigen::Vector3d>& axis)
{
  const std::string kind = components::jointTypeToString(type);
  if (!axis)
    throw CompileError(CompileErrorKind::MissingAxis, joint_name, kind + " joint requires an axis");
  if (!axis->allFinite())
    throw CompileError(CompileErrorKind::MissingAxis, joint_name, kind + " joint axis is not finite");

  const double n = axis->norm();
  if (n < kMinAxisNorm)
    throw CompileError(CompileErrorKind::MissingAxis, joint_name, kind + " joint axis has zero length");

  return *axis / n;
}

}  // namespace

int ConstraintSpec::rotationalDof() const
{
  return static_cast<int>(std::count_if(free_dofs.begin(), free_dofs.end(),
                                        [](const DegreeOfFreedom& d) { return d.type == DofType::ROTATIONAL; }));
}

int ConstraintSpec::translationalDof() const
{
  return static_cast<int>(std::count_if(free_dofs.begin(), free_dofs.end(),
                                        [](const DegreeOfFreedom& d) { return d.type == DofType::TRANSLATIONAL; }));
}

std::optional<ConstraintSpec> mapJointConstraint(const std::string& joint_name, JointType type,
                                                 const std::optional<Eigen::Vector3d>& axis,
                                                 const geometry::ResolvedFrame& anchor, const CompileOptions& options)
{
  ConstraintSpec spec;
  spec.kind = type;
  spec.parent_anchor = anchor;
  spec.child_anchor = geometry::ResolvedFrame::Identity();

  switch (type)
  {
    case JointType::FIXED:
      break;

    case JointType::REVOLUTE:
    {
      const Eigen::Vector3d a = requireAxis(joint_name, type, axis);
      spec.axis = a;
      spec.free_dofs.push_back({ DofType::ROTATIONAL, a });
      break;
    }

    case JointType::CONTINUOUS:
    {
      const Eigen::Vector3d a = requireAxis(joint_name, type, axis);
      if (!options.unbounded_revolute_supported)
      {
        reportWarning(options, "continuous joint '" + joint_name +
                                   "' has no constraint (unbounded revolute joints disabled); its child link is "
                                   "physically unconnected");
        return std::nullopt;
      }
      spec.axis = a;
      spec.bounded = false;
      spec.free_dofs.push_back({ DofType::ROTATIONAL, a });
      break;
    }

    case JointType::PRISMATIC:
    {
      const Eigen::Vector3d a = requireAxis(joint_name, type, axis);
      spec.axis = a;
      spec.free_dofs.push_back({ DofType::TRANSLATIONAL, a });
      break;
    }

    case JointType::SPHERICAL:
      spec.free_dofs.push_back({ DofType::ROTATIONAL, Eigen::Vector3d::UnitX() });
      spec.free_dofs.push_back({ DofType::ROTATIONAL, Eigen::Vector3d::UnitY() });
      spec.free_dofs.push_back({ DofType::ROTATIONAL, Eigen::Vector3d::UnitZ() });
      break;

    case JointType::PLANAR:
    case JointType::FLOATING:
      throw CompileError(CompileErrorKind::UnsupportedJointKind, joint_name,
                         components::jointTypeToString(type) + " joints are not supported");

    default:
      throw CompileError(CompileErrorKind::UnsupportedJointKind, joint_name, "unknown joint type");
  }

  return spec;
}

const char* dofTypeToString(DofType type)
{
  switch (type)
  {
    case DofType::ROTATIONAL:
      return "rotational";
    case DofType::TRANSLATIONAL:
      return "translational";
  }
  return "unknown";
}

std::ostream& operator<<(std::ostream& os, const ConstraintSpec& spec)
{
  os << "ConstraintSpec{ kind=" << components::jointTypeToString(spec.kind) << ", dof=" << spec.dof()
     << (spec.bounded ? "" : ", unbounded") << " }\n";
  os << "  parent_anchor: " << spec.parent_anchor << "\n";
  os << "  child_anchor: " << spec.child_anchor << "\n";
  for (std::size_t i = 0; i < spec.free_dofs.size(); ++i)
  {
    const auto& d = spec.free_dofs[i];
    os << "  free[" << i << "] = " << dofTypeToString(d.type) << " [" << d.axis.x() << ", " << d.axis.y() << ", "
       << d.axis.z() << "]\n";
  }
  return os;
}

}  // namespace kinematics
}  // namespace kinscene
