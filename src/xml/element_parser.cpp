#include <kinscene/xml/element_parser.h>

#include <stdexcept>

namespace kinscene {
namespace xml {

using namespace components;

namespace {

std::string where(const tinyxml2::XMLElement* elem)
{
  return std::string("<") + (elem ? elem->Name() : "?") + "> at line " + std::to_string(elem ? elem->GetLineNum() : 0);
}

const tinyxml2::XMLElement* requireChild(const tinyxml2::XMLElement* elem, const char* name)
{
  const auto* child = elem->FirstChildElement(name);
  if (!child)
    throw std::runtime_error(std::string("Missing required <") + name + "> element in " + where(elem));
  return child;
}

}  // namespace

geometry::Origin parseOrigin(const tinyxml2::XMLElement* origin_elem)
{
  geometry::Origin origin;
  if (!origin_elem)
    return origin;

  origin.xyz = evalVector3Attribute(origin_elem, "xyz", Eigen::Vector3d::Zero());
  origin.rpy = evalVector3Attribute(origin_elem, "rpy", Eigen::Vector3d::Zero());
  return origin;
}

geometry::Geometry parseGeometry(const tinyxml2::XMLElement* geometry_elem)
{
  const tinyxml2::XMLElement* shape = geometry_elem->FirstChildElement();
  if (!shape)
    throw std::runtime_error("Empty " + where(geometry_elem));
  if (shape->NextSiblingElement())
    throw std::runtime_error("More than one shape in " + where(geometry_elem));

  geometry::ShapeType type;
  try
  {
    type = geometry::shapeTypeFromString(shape->Name());
  }
  catch (const std::runtime_error& e)
  {
    throw std::runtime_error(std::string(e.what()) + " in " + where(shape));
  }

  switch (type)
  {
    case geometry::ShapeType::Box:
      return geometry::Box{ evalVector3AttributeRequired(shape, "size") / 2.0 };
    case geometry::ShapeType::Cylinder:
      return geometry::Cylinder{ evalNumberAttributeRequired(shape, "radius"),
                                 evalNumberAttributeRequired(shape, "length") / 2.0 };
    case geometry::ShapeType::Sphere:
      return geometry::Sphere{ evalNumberAttributeRequired(shape, "radius") };
    case geometry::ShapeType::Capsule:
      return geometry::Capsule{ evalNumberAttributeRequired(shape, "radius"),
                                evalNumberAttributeRequired(shape, "length") / 2.0 };
    case geometry::ShapeType::Mesh:
      return geometry::Mesh{ evalTextAttributeRequired(shape, "filename"),
                             evalVector3Attribute(shape, "scale", Eigen::Vector3d::Ones()) };
  }
  throw std::runtime_error("Unhandled shape in " + where(shape));
}

VisualMaterial parseMaterial(const tinyxml2::XMLElement* material_elem)
{
  VisualMaterial material;
  material.name = evalTextAttribute(material_elem, "name", "");

  if (const auto* color = material_elem->FirstChildElement("color"))
  {
    const auto rgba = evalNumberListAttributeRequired(color, "rgba");
    if (rgba.size() != 4)
      throw std::runtime_error("Attribute 'rgba' expects 4 numbers on " + where(color));
    material.color = Color{ rgba[0], rgba[1], rgba[2], rgba[3] };
  }

  if (const auto* texture = material_elem->FirstChildElement("texture"))
    material.texture_filename = evalTextAttributeRequired(texture, "filename");

  return material;
}

InertialProperties parseInertial(const tinyxml2::XMLElement* inertial_elem)
{
  InertialProperties inertial;
  inertial.origin = parseOrigin(inertial_elem->FirstChildElement("origin"));

  if (const auto* mass = inertial_elem->FirstChildElement("mass"))
    inertial.mass = evalNumberAttributeRequired(mass, "value");

  if (const auto* I = inertial_elem->FirstChildElement("inertia"))
  {
    inertial.inertia_tensor = inertiaTensorFromEntries(
        evalNumberAttribute(I, "ixx", 0.0), evalNumberAttribute(I, "ixy", 0.0), evalNumberAttribute(I, "ixz", 0.0),
        evalNumberAttribute(I, "iyy", 0.0), evalNumberAttribute(I, "iyz", 0.0), evalNumberAttribute(I, "izz", 0.0));
  }

  return inertial;
}

CollisionPrimitive parseCollision(const tinyxml2::XMLElement* collision_elem)
{
  CollisionPrimitive collision;
  collision.name = evalTextAttribute(collision_elem, "name", "");
  collision.origin = parseOrigin(collision_elem->FirstChildElement("origin"));
  collision.geometry = parseGeometry(requireChild(collision_elem, "geometry"));
  return collision;
}

VisualPrimitive parseVisual(const tinyxml2::XMLElement* visual_elem,
                            const std::unordered_map<std::string, VisualMaterial>& materials)
{
  VisualPrimitive visual;
  visual.name = evalTextAttribute(visual_elem, "name", "");
  visual.origin = parseOrigin(visual_elem->FirstChildElement("origin"));
  visual.geometry = parseGeometry(requireChild(visual_elem, "geometry"));

  if (const auto* mat = visual_elem->FirstChildElement("material"))
  {
    VisualMaterial material = parseMaterial(mat);

    // A bare <material name="..."/> refers to a top-level definition.
    if (!material.color && material.texture_filename.empty() && !material.name.empty())
    {
      auto it = materials.find(material.name);
      if (it != materials.end())
        material = it->second;
    }
    visual.material = std::move(material);
  }

  return visual;
}

LinkDescriptor parseLink(const tinyxml2::XMLElement* link_elem,
                         const std::unordered_map<std::string, VisualMaterial>& materials)
{
  LinkDescriptor link;
  link.name = evalTextAttributeRequired(link_elem, "name");
  if (link.name.empty())
    throw std::runtime_error("Link 'name' attribute cannot be empty at line " + std::to_string(link_elem->GetLineNum()));

  if (const auto* inertial = link_elem->FirstChildElement("inertial"))
    link.inertial = parseInertial(inertial);

  for (const auto* c = link_elem->FirstChildElement("collision"); c; c = c->NextSiblingElement("collision"))
    link.collisions.push_back(parseCollision(c));

  for (const auto* v = link_elem->FirstChildElement("visual"); v; v = v->NextSiblingElement("visual"))
    link.visuals.push_back(parseVisual(v, materials));

  return link;
}

JointDescriptor parseJoint(const tinyxml2::XMLElement* joint_elem)
{
  JointDescriptor joint;
  joint.name = evalTextAttributeRequired(joint_elem, "name");
  if (joint.name.empty())
    throw std::runtime_error("Joint 'name' attribute cannot be empty at line " +
                             std::to_string(joint_elem->GetLineNum()));

  const std::string type = evalTextAttributeRequired(joint_elem, "type");
  try
  {
    joint.type = jointTypeFromString(type);
  }
  catch (const std::runtime_error& e)
  {
    throw std::runtime_error("Joint '" + joint.name + "': " + e.what() + " at line " +
                             std::to_string(joint_elem->GetLineNum()));
  }

  joint.parent_link = evalTextAttributeRequired(requireChild(joint_elem, "parent"), "link");
  joint.child_link = evalTextAttributeRequired(requireChild(joint_elem, "child"), "link");
  joint.origin = parseOrigin(joint_elem->FirstChildElement("origin"));

  if (const auto* axis = joint_elem->FirstChildElement("axis"))
    joint.axis = evalVector3Attribute(axis, "xyz", Eigen::Vector3d::UnitX());
  else if (jointTypeRequiresAxis(joint.type))
    joint.axis = Eigen::Vector3d::UnitX();

  return joint;
}

}  // namespace xml
}  // namespace kinscene
