#include <kinscene/scene/scene_compiler.h>

#include <kinscene/errors.h>
#include <kinscene/geometry/frame.h>
#include <kinscene/kinematics/kinematic_tree.h>

namespace kinscene {
namespace scene {

namespace {

void requireFiniteOrigin(const geometry::Origin& origin, const std::string& entity, const std::string& what)
{
  if (!geometry::isFinite(origin))
    throw CompileError(CompileErrorKind::InvalidOrigin, entity, what + " origin has non-finite values");
}

std::optional<physics::MassProperties> compileMassProperties(const components::LinkDescriptor& link,
                                                             const CompileOptions& options)
{
  if (!link.inertial)
    return std::nullopt;

  const auto& inertial = *link.inertial;
  requireFiniteOrigin(inertial.origin, link.name, "inertial");

  // Express the tensor in the link frame before diagonalizing.
  const Eigen::Matrix3d R = geometry::compose(inertial.origin).rotation().toRotationMatrix();
  const Eigen::Matrix3d I_link = R * inertial.inertia_tensor * R.transpose();

  return physics::diagonalizeInertia(I_link, inertial.centerOfMass(), inertial.mass, link.name, options);
}

}  // namespace

CompiledLink compileLink(const components::LinkDescriptor& link, LinkId id, const CompileOptions& options)
{
  CompiledLink out;
  out.id = id;
  out.name = link.name;
  out.mass_properties = compileMassProperties(link, options);
  out.collider = physics::compileCollider(link.collisions, link.name);
  out.groups = physics::collisionGroupsFor(physics::BodyRole::ROBOT_BODY);

  out.visuals.reserve(link.visuals.size());
  for (const auto& v : link.visuals)
  {
    requireFiniteOrigin(v.origin, link.name, "visual");
    out.visuals.push_back(CompiledVisual{ v.name, geometry::compose(v.origin), v.geometry, v.material });
  }

  return out;
}

CompiledJoint compileJoint(const components::JointDescriptor& joint, JointId id, LinkId parent, LinkId child,
                           const CompileOptions& options)
{
  requireFiniteOrigin(joint.origin, joint.name, "joint");

  CompiledJoint out;
  out.id = id;
  out.name = joint.name;
  out.type = joint.type;
  out.parent = parent;
  out.child = child;
  out.constraint =
      kinematics::mapJointConstraint(joint.name, joint.type, joint.axis, geometry::compose(joint.origin), options);
  return out;
}

SceneGraph compileScene(const components::RobotDescription& robot, const CompileOptions& options)
{
  const kinematics::KinematicTree tree = kinematics::buildKinematicTree(robot.links, robot.joints);

  SceneGraph scene;
  scene.name_ = robot.name;

  // Pass 1: links, independent of each other.
  scene.links_.reserve(robot.links.size());
  for (LinkId id = 0; id < robot.links.size(); ++id)
  {
    CompiledLink link = compileLink(robot.links[id], id, options);

    const auto& node = tree.node(id);
    link.parent = node.parent;
    link.parent_joint = node.parent_joint;
    link.children = node.children;

    scene.link_index_.emplace(link.name, id);
    scene.links_.push_back(std::move(link));
  }

  // Pass 2: joints, both endpoints exist.
  scene.joints_.reserve(robot.joints.size());
  for (const auto& edge : tree.edges())
  {
    const auto& desc = robot.joints[edge.id];
    CompiledJoint joint = compileJoint(desc, edge.id, edge.parent, edge.child, options);

    scene.links_[edge.child].pose_in_parent = geometry::compose(desc.origin);

    scene.joint_index_.emplace(joint.name, joint.id);
    scene.joints_.push_back(std::move(joint));
  }

  // Parents precede children in depth-first order.
  for (LinkId id : tree.depthFirstOrder())
  {
    auto& link = scene.links_[id];
    link.rest_pose = link.parent ? scene.links_[*link.parent].rest_pose * link.pose_in_parent :
                                   geometry::ResolvedFrame::Identity();
  }

  scene.roots_ = tree.roots();
  return scene;
}

}  // namespace scene
}  // namespace kinscene
