#include <kinscene/errors.h>

#include <ostream>

namespace kinscene {

namespace {

std::string formatMessage(CompileErrorKind kind, const std::string& entity, const std::string& detail)
{
  std::string msg = compileErrorKindToString(kind) + " '" + entity + "'";
  if (!detail.empty())
    msg += ": " + detail;
  return msg;
}

}  // namespace

std::string compileErrorKindToString(CompileErrorKind kind)
{
  switch (kind)
  {
    case CompileErrorKind::DuplicateLink:
      return "DuplicateLink";
    case CompileErrorKind::DuplicateJoint:
      return "DuplicateJoint";
    case CompileErrorKind::UnknownLinkReference:
      return "UnknownLinkReference";
    case CompileErrorKind::MultipleParents:
      return "MultipleParents";
    case CompileErrorKind::CyclicKinematics:
      return "CyclicKinematics";
    case CompileErrorKind::MissingAxis:
      return "MissingAxis";
    case CompileErrorKind::UnsupportedJointKind:
      return "UnsupportedJointKind";
    case CompileErrorKind::UnsupportedGeometry:
      return "UnsupportedGeometry";
    case CompileErrorKind::InvalidInertiaTensor:
      return "InvalidInertiaTensor";
    case CompileErrorKind::InvalidOrigin:
      return "InvalidOrigin";
    default:
      return "Unknown";
  }
}

std::ostream& operator<<(std::ostream& os, CompileErrorKind kind)
{
  return os << compileErrorKindToString(kind);
}

CompileError::CompileError(CompileErrorKind kind, const std::string& entity, const std::string& detail,
                           const std::string& related)
  : std::runtime_error(formatMessage(kind, entity, detail)), kind_(kind), entity_(entity), related_(related)
{
}

}  // namespace kinscene
