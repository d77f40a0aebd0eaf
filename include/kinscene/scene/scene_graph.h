#ifndef KINSCENE_SCENE_SCENE_GRAPH_H_
#define KINSCENE_SCENE_SCENE_GRAPH_H_

#include <iosfwd>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <kinscene/components/joint.h>
#include <kinscene/components/link.h>
#include <kinscene/components/robot.h>
#include <kinscene/geometry/shape.h>
#include <kinscene/geometry/transform.h>
#include <kinscene/kinematics/joint_constraint.h>
#include <kinscene/kinematics/kinematic_tree.h>
#include <kinscene/physics/collider.h>
#include <kinscene/physics/collision_groups.h>
#include <kinscene/physics/inertia.h>
#include <kinscene/options.h>

namespace kinscene {
namespace scene {

using kinematics::JointId;
using kinematics::LinkId;

// Visual passed through to the presentation layer. Asset filenames are not resolved here.
struct CompiledVisual
{
  std::string name;
  geometry::ResolvedFrame local;  // in the link frame
  geometry::Geometry geometry;
  std::optional<components::VisualMaterial> material;
};

struct CompiledLink
{
  LinkId id = 0;
  std::string name;

  std::optional<physics::CompoundShape> collider;         // absent: no collision response
  std::optional<physics::MassProperties> mass_properties;  // absent: massless
  physics::CollisionGroups groups;

  std::optional<LinkId> parent;
  std::optional<JointId> parent_joint;
  std::vector<LinkId> children;

  geometry::ResolvedFrame pose_in_parent;  // joint origin, identity for roots
  geometry::ResolvedFrame rest_pose;       // in the root frame of its tree, all joints at zero

  std::vector<CompiledVisual> visuals;
};

struct CompiledJoint
{
  JointId id = 0;
  std::string name;
  components::JointType type = components::JointType::FIXED;
  LinkId parent = 0;
  LinkId child = 0;

  // Absent only for a CONTINUOUS joint when unbounded revolute joints are disabled.
  std::optional<kinematics::ConstraintSpec> constraint;
};

enum class BodyMotion
{
  STATIC,
  DYNAMIC,
};

// Body outside the robot (ground, props, balls).
struct CompiledBody
{
  std::string name;
  physics::BodyRole role = physics::BodyRole::ENVIRONMENT;
  BodyMotion motion = BodyMotion::STATIC;
  geometry::ResolvedFrame pose;  // world
  physics::CompoundShape collider;
  physics::CollisionGroups groups;
  double restitution = 0.0;
};

/**
 * Compiled, ready-to-simulate scene. Links and joints are arenas indexed by LinkId / JointId.
 *
 * Every joint's endpoints are links of this graph and the parent -> child relation is a forest.
 */
class SceneGraph
{
public:
  SceneGraph() = default;

  const std::string& name() const
  {
    return name_;
  }

  const std::vector<CompiledLink>& links() const
  {
    return links_;
  }

  const std::vector<CompiledJoint>& joints() const
  {
    return joints_;
  }

  const std::vector<LinkId>& roots() const
  {
    return roots_;
  }

  const std::vector<CompiledBody>& bodies() const
  {
    return bodies_;
  }

  const CompiledLink& link(LinkId id) const;
  const CompiledJoint& joint(JointId id) const;

  const CompiledLink* findLink(const std::string& name) const;
  const CompiledJoint* findJoint(const std::string& name) const;
  const CompiledBody* findBody(const std::string& name) const;

  /// Adds a non-robot body. Names share one namespace with links.
  /// @throws CompileError DuplicateLink when the name is taken.
  void addBody(CompiledBody body);

private:
  friend SceneGraph compileScene(const components::RobotDescription& robot, const CompileOptions& options);

  std::string name_;
  std::vector<CompiledLink> links_;
  std::vector<CompiledJoint> joints_;
  std::vector<LinkId> roots_;
  std::vector<CompiledBody> bodies_;

  std::unordered_map<std::string, LinkId> link_index_;
  std::unordered_map<std::string, JointId> joint_index_;
  std::unordered_map<std::string, std::size_t> body_index_;
};

std::ostream& operator<<(std::ostream& os, const SceneGraph& scene);

}  // namespace scene
}  // namespace kinscene

#endif  // KINSCENE_SCENE_SCENE_GRAPH_H_
