#ifndef KINSCENE_COMPONENTS_ROBOT_H_
#define KINSCENE_COMPONENTS_ROBOT_H_

#include <string>
#include <vector>

#include <kinscene/components/joint.h>
#include <kinscene/components/link.h>

namespace kinscene {
namespace components {

// In-memory robot description. Order of `links` decides root order in the compiled scene.
struct RobotDescription
{
  std::string name;
  std::vector<LinkDescriptor> links;
  std::vector<JointDescriptor> joints;
};

}  // namespace components
}  // namespace kinscene

#endif  // KINSCENE_COMPONENTS_ROBOT_H_
