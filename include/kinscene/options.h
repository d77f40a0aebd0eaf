#ifndef KINSCENE_OPTIONS_H_
#define KINSCENE_OPTIONS_H_

#include <iostream>
#include <string>

namespace kinscene {

struct CompileOptions
{
  // When false, CONTINUOUS joints compile to no constraint and the child is left physically
  // unconnected (for engines without unbounded revolute joints).
  bool unbounded_revolute_supported = true;

  double min_mass = 1e-9;                // [kg] below this a massive link is reported as near-massless
  double orthonormal_tolerance = 1e-5;   // eigenbasis validation
  // Both relative to the largest principal moment.
  double eigenvalue_tolerance = 1e-9;    // tiny negative principal moments are clamped to 0
  double triangle_tolerance = 1e-5;      // slack on I_a <= I_b + I_c (rounded URDF values)

  // Non-fatal diagnostics, one line each. nullptr silences them.
  std::ostream* diagnostics = &std::cerr;
};

inline void reportWarning(const CompileOptions& options, const std::string& message)
{
  if (options.diagnostics)
    *options.diagnostics << "[kinscene] warning: " << message << std::endl;
}

}  // namespace kinscene

#endif  // KINSCENE_OPTIONS_H_
