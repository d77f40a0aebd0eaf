#ifndef KINSCENE_XML_URDF_PARSER_H_
#define KINSCENE_XML_URDF_PARSER_H_

#include <memory>
#include <string>
#include <unordered_map>

#include <tinyxml2.h>

#include <kinscene/components/robot.h>

namespace kinscene {
namespace xml {

/**
 * @brief Reads a URDF document into a RobotDescription.
 *
 * Supported: <link> (<inertial>, <collision>, <visual>, <material>), <joint> (<parent>, <child>,
 * <origin>, <axis>), top-level named <material>s. Box sizes and cylinder/capsule lengths are
 * converted to half extents / half lengths. An omitted <axis> on revolute, continuous and
 * prismatic joints defaults to (1, 0, 0) as in URDF.
 *
 * Load functions return false (and print to std::cerr) when the XML itself cannot be read, and
 * throw std::runtime_error with the offending line for malformed URDF content.
 */
class UrdfParser
{
public:
  UrdfParser();
  ~UrdfParser();

  bool loadRobotFromFile(const std::string& filename, components::RobotDescription& robot);

  bool loadRobotFromText(const std::string& text, components::RobotDescription& robot);

private:
  void loadRobot(const tinyxml2::XMLDocument* document, components::RobotDescription& robot);

  std::unique_ptr<tinyxml2::XMLDocument> doc;

  // Top-level <material> definitions, referenced by name from visuals.
  std::unordered_map<std::string, components::VisualMaterial> materials;
};

}  // namespace xml
}  // namespace kinscene

#endif  // KINSCENE_XML_URDF_PARSER_H_
