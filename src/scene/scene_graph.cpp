#include <kinscene/scene/scene_graph.h>

#include <kinscene/errors.h>

#include <ostream>
#include <stdexcept>

namespace kinscene {
namespace scene {

const CompiledLink& SceneGraph::link(LinkId id) const
{
  if (id >= links_.size())
    throw std::out_of_range("SceneGraph::link: id " + std::to_string(id) + " out of range");
  return links_[id];
}

const CompiledJoint& SceneGraph::joint(JointId id) const
{
  if (id >= joints_.size())
    throw std::out_of_range("SceneGraph::joint: id " + std::to_string(id) + " out of range");
  return joints_[id];
}

const CompiledLink* SceneGraph::findLink(const std::string& name) const
{
  auto it = link_index_.find(name);
  return it == link_index_.end() ? nullptr : &links_[it->second];
}

const CompiledJoint* SceneGraph::findJoint(const std::string& name) const
{
  auto it = joint_index_.find(name);
  return it == joint_index_.end() ? nullptr : &joints_[it->second];
}

const CompiledBody* SceneGraph::findBody(const std::string& name) const
{
  auto it = body_index_.find(name);
  return it == body_index_.end() ? nullptr : &bodies_[it->second];
}

void SceneGraph::addBody(CompiledBody body)
{
  if (link_index_.count(body.name) || body_index_.count(body.name))
    throw CompileError(CompileErrorKind::DuplicateLink, body.name, "body name clashes with an existing link or body");

  body_index_.emplace(body.name, bodies_.size());
  bodies_.push_back(std::move(body));
}

std::ostream& operator<<(std::ostream& os, const SceneGraph& scene)
{
  os << "SceneGraph '" << scene.name() << "' { links=" << scene.links().size()
     << ", joints=" << scene.joints().size() << ", roots=" << scene.roots().size()
     << ", bodies=" << scene.bodies().size() << " }\n";

  for (const auto& l : scene.links())
  {
    os << "  link[" << l.id << "] " << l.name;
    if (l.parent)
      os << " parent=" << scene.link(*l.parent).name;
    os << " colliders=" << (l.collider ? l.collider->size() : 0);
    os << " mass=" << (l.mass_properties ? l.mass_properties->mass : 0.0);
    os << " visuals=" << l.visuals.size() << "\n";
  }

  for (const auto& j : scene.joints())
  {
    os << "  joint[" << j.id << "] " << j.name << " (" << components::jointTypeToString(j.type) << ") "
       << scene.link(j.parent).name << " -> " << scene.link(j.child).name;
    if (j.constraint)
      os << " dof=" << j.constraint->dof();
    else
      os << " unconstrained";
    os << "\n";
  }

  for (const auto& b : scene.bodies())
    os << "  body " << b.name << " (" << physics::bodyRoleToString(b.role) << ", "
       << (b.motion == BodyMotion::STATIC ? "static" : "dynamic") << ") " << b.pose << "\n";

  return os;
}

}  // namespace scene
}  // namespace kinscene
