#include <kinscene/xml/urdf_parser.h>
#include <kinscene/xml/element_parser.h>

#include <iostream>
#include <stdexcept>

namespace kinscene {
namespace xml {

UrdfParser::UrdfParser()
{
}

UrdfParser::~UrdfParser()
{
}

bool UrdfParser::loadRobotFromFile(const std::string& filename, components::RobotDescription& robot)
{
  doc = std::make_unique<tinyxml2::XMLDocument>();
  if (doc->LoadFile(filename.c_str()) != tinyxml2::XML_SUCCESS)
  {
    std::cerr << "Error loading URDF file: " << filename << " (" << doc->ErrorStr() << ")" << std::endl;
    return false;
  }
  loadRobot(doc.get(), robot);
  return true;
}

bool UrdfParser::loadRobotFromText(const std::string& text, components::RobotDescription& robot)
{
  doc = std::make_unique<tinyxml2::XMLDocument>();
  if (doc->Parse(text.c_str()) != tinyxml2::XML_SUCCESS)
  {
    std::cerr << "Error parsing URDF text (" << doc->ErrorStr() << ")" << std::endl;
    return false;
  }
  loadRobot(doc.get(), robot);
  return true;
}

void UrdfParser::loadRobot(const tinyxml2::XMLDocument* document, components::RobotDescription& robot)
{
  const tinyxml2::XMLElement* root = document->FirstChildElement("robot");
  if (!root)
    throw std::runtime_error("URDF document has no <robot> root element");

  components::RobotDescription out;
  out.name = evalTextAttribute(root, "name", "");

  materials.clear();
  for (const auto* m = root->FirstChildElement("material"); m; m = m->NextSiblingElement("material"))
  {
    auto material = parseMaterial(m);
    if (material.name.empty())
      throw std::runtime_error("Top-level <material> without a name at line " + std::to_string(m->GetLineNum()));
    const std::string name = material.name;
    materials[name] = std::move(material);
  }

  for (const auto* l = root->FirstChildElement("link"); l; l = l->NextSiblingElement("link"))
    out.links.push_back(parseLink(l, materials));

  for (const auto* j = root->FirstChildElement("joint"); j; j = j->NextSiblingElement("joint"))
    out.joints.push_back(parseJoint(j));

  robot = std::move(out);
}

}  // namespace xml
}  // namespace kinscene
