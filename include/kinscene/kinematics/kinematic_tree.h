#ifndef KINSCENE_KINEMATICS_KINEMATIC_TREE_H_
#define KINSCENE_KINEMATICS_KINEMATIC_TREE_H_

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <kinscene/components/joint.h>
#include <kinscene/components/link.h>

namespace kinscene {
namespace kinematics {

// Dense indices: LinkId is the position of the link in the input list, JointId the position of
// the joint in the input list.
using LinkId = std::size_t;
using JointId = std::size_t;

struct KinematicNode
{
  LinkId id = 0;
  std::string name;
  std::optional<LinkId> parent;
  std::optional<JointId> parent_joint;
  std::vector<LinkId> children;      // in joint input order
  std::vector<JointId> child_joints;  // child_joints[i] connects to children[i]
};

struct KinematicEdge
{
  JointId id = 0;
  std::string name;
  LinkId parent = 0;
  LinkId child = 0;
};

/**
 * Forest of links connected by joints. Built by buildKinematicTree(), read-only afterwards.
 */
class KinematicTree
{
public:
  std::size_t size() const
  {
    return nodes_.size();
  }

  const std::vector<KinematicNode>& nodes() const
  {
    return nodes_;
  }

  const std::vector<KinematicEdge>& edges() const
  {
    return edges_;
  }

  // Links that are never a child, in input order.
  const std::vector<LinkId>& roots() const
  {
    return roots_;
  }

  const KinematicNode& node(LinkId id) const;

  std::optional<LinkId> find(const std::string& link_name) const;

  // Pre-order from each root (roots in input order, children in joint order). Parents always
  // precede their children.
  std::vector<LinkId> depthFirstOrder() const;

  // Graphviz export, one edge per joint labelled with the joint name.
  void writeDot(std::ostream& os, const std::string& graph_name = "kinematics") const;

private:
  friend KinematicTree buildKinematicTree(const std::vector<components::LinkDescriptor>& links,
                                          const std::vector<components::JointDescriptor>& joints);

  std::vector<KinematicNode> nodes_;
  std::vector<KinematicEdge> edges_;
  std::vector<LinkId> roots_;
  std::unordered_map<std::string, LinkId> index_;
};

/**
 * Resolve named links and joints into a forest.
 *
 * Checks, in this order (first failure wins):
 *   DuplicateLink, DuplicateJoint, UnknownLinkReference (joint order, parent before child),
 *   MultipleParents, CyclicKinematics.
 *
 * @throws CompileError
 */
KinematicTree buildKinematicTree(const std::vector<components::LinkDescriptor>& links,
                                 const std::vector<components::JointDescriptor>& joints);

std::ostream& operator<<(std::ostream& os, const KinematicTree& tree);

}  // namespace kinematics
}  // namespace kinscene

#endif  // KINSCENE_KINEMATICS_KINEMATIC_TREE_H_
