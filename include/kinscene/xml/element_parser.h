#ifndef KINSCENE_XML_ELEMENT_PARSER_H_
#define KINSCENE_XML_ELEMENT_PARSER_H_

#include <string>
#include <unordered_map>

#include <tinyxml2.h>
#include <Eigen/Core>

#include <kinscene/components/joint.h>
#include <kinscene/components/link.h>
#include <kinscene/geometry/shape.h>
#include <kinscene/geometry/transform.h>
#include <kinscene/xml/expression_parser.h>

namespace kinscene {
namespace xml {

/// Elements
geometry::Origin parseOrigin(const tinyxml2::XMLElement* origin_elem);  // nullptr -> zero origin
geometry::Geometry parseGeometry(const tinyxml2::XMLElement* geometry_elem);
components::VisualMaterial parseMaterial(const tinyxml2::XMLElement* material_elem);
components::InertialProperties parseInertial(const tinyxml2::XMLElement* inertial_elem);
components::CollisionPrimitive parseCollision(const tinyxml2::XMLElement* collision_elem);
components::VisualPrimitive parseVisual(const tinyxml2::XMLElement* visual_elem,
                                        const std::unordered_map<std::string, components::VisualMaterial>& materials);
components::LinkDescriptor parseLink(const tinyxml2::XMLElement* link_elem,
                                     const std::unordered_map<std::string, components::VisualMaterial>& materials);
components::JointDescriptor parseJoint(const tinyxml2::XMLElement* joint_elem);

}  // namespace xml
}  // namespace kinscene

#endif  // KINSCENE_XML_ELEMENT_PARSER_H_
