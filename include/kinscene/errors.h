#ifndef KINSCENE_ERRORS_H_
#define KINSCENE_ERRORS_H_

#include <iosfwd>
#include <stdexcept>
#include <string>

namespace kinscene {

enum class CompileErrorKind
{
  DuplicateLink,
  DuplicateJoint,
  UnknownLinkReference,
  MultipleParents,
  CyclicKinematics,
  MissingAxis,
  UnsupportedJointKind,
  UnsupportedGeometry,
  InvalidInertiaTensor,
  InvalidOrigin,
};

std::string compileErrorKindToString(CompileErrorKind kind);
std::ostream& operator<<(std::ostream& os, CompileErrorKind kind);

/**
 * Structural or numerical failure while compiling a robot description.
 *
 * `entity()` is the link or joint the error is attributed to. `related()` carries a second
 * name when one is involved (e.g. the missing link of an UnknownLinkReference), empty otherwise.
 */
class CompileError : public std::runtime_error
{
public:
  CompileError(CompileErrorKind kind, const std::string& entity, const std::string& detail,
               const std::string& related = {});

  CompileErrorKind kind() const
  {
    return kind_;
  }

  const std::string& entity() const
  {
    return entity_;
  }

  const std::string& related() const
  {
    return related_;
  }

private:
  CompileErrorKind kind_;
  std::string entity_;
  std::string related_;
};

}  // namespace kinscene

#endif  // KINSCENE_ERRORS_H_
