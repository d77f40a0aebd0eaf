#include <kinscene/kinematics/kinematic_tree.h>

#include <kinscene/errors.h>

#include <boost/graph/adjacency_list.hpp>
#include <boost/graph/depth_first_search.hpp>

#include <ostream>
#include <stdexcept>
#include <unordered_set>

namespace kinscene {
namespace kinematics {

namespace {

using G = boost::adjacency_list<boost::vecS, boost::vecS, boost::directedS>;
using V = G::vertex_descriptor;

// The DFS color map is the visited (black) / in-progress (gray) bookkeeping; an edge into a gray
// vertex closes a cycle.
struct cycle_visitor : boost::default_dfs_visitor
{
  struct found
  {
    V vertex;
  };

  template <class Edge, class Graph>
  void back_edge(Edge e, const Graph& g)
  {
    throw found{ boost::target(e, g) };
  }
};

std::string dotQuote(const std::string& s)
{
  std::string out = "\"";
  for (char c : s)
  {
    if (c == '"' || c == '\\')
      out += '\\';
    out += c;
  }
  out += '"';
  return out;
}

}  // namespace

const KinematicNode& KinematicTree::node(LinkId id) const
{
  if (id >= nodes_.size())
    throw std::out_of_range("KinematicTree::node: link id " + std::to_string(id) + " out of range");
  return nodes_[id];
}

std::optional<LinkId> KinematicTree::find(const std::string& link_name) const
{
  auto it = index_.find(link_name);
  if (it == index_.end())
    return std::nullopt;
  return it->second;
}

std::vector<LinkId> KinematicTree::depthFirstOrder() const
{
  std::vector<LinkId> order;
  order.reserve(nodes_.size());

  std::vector<LinkId> stack;
  for (LinkId root : roots_)
  {
    stack.push_back(root);
    while (!stack.empty())
    {
      const LinkId id = stack.back();
      stack.pop_back();
      order.push_back(id);

      const auto& children = nodes_[id].children;
      for (auto it = children.rbegin(); it != children.rend(); ++it)
        stack.push_back(*it);
    }
  }
  return order;
}

void KinematicTree::writeDot(std::ostream& os, const std::string& graph_name) const
{
  os << "digraph " << dotQuote(graph_name) << " {\n"
     << "  rankdir=TB\n"
     << "  node[shape=\"box\"]\n";

  for (const auto& n : nodes_)
    os << "  " << dotQuote(n.name) << (n.parent ? "" : " [style=\"bold\"]") << "\n";

  for (const auto& e : edges_)
    os << "  " << dotQuote(nodes_[e.parent].name) << " -> " << dotQuote(nodes_[e.child].name)
       << " [label=" << dotQuote(e.name) << "]\n";

  os << "}\n";
}

KinematicTree buildKinematicTree(const std::vector<components::LinkDescriptor>& links,
                                 const std::vector<components::JointDescriptor>& joints)
{
  KinematicTree tree;
  tree.nodes_.reserve(links.size());
  tree.index_.reserve(links.size());

  // name -> id
  for (const auto& link : links)
  {
    const LinkId id = tree.nodes_.size();
    auto [it, inserted] = tree.index_.emplace(link.name, id);
    if (!inserted)
      throw CompileError(CompileErrorKind::DuplicateLink, link.name,
                         "link name already used by link #" + std::to_string(it->second));

    KinematicNode node;
    node.id = id;
    node.name = link.name;
    tree.nodes_.push_back(std::move(node));
  }

  std::unordered_set<std::string> joint_names;
  for (const auto& joint : joints)
  {
    if (!joint_names.insert(joint.name).second)
      throw CompileError(CompileErrorKind::DuplicateJoint, joint.name, "joint name is used more than once");
  }

  // resolve endpoints
  tree.edges_.reserve(joints.size());
  for (JointId jid = 0; jid < joints.size(); ++jid)
  {
    const auto& joint = joints[jid];

    auto resolve = [&](const std::string& link_name, const char* role) -> LinkId {
      auto found = tree.find(link_name);
      if (!found)
        throw CompileError(CompileErrorKind::UnknownLinkReference, joint.name,
                           std::string(role) + " link '" + link_name + "' does not exist", link_name);
      return *found;
    };

    const LinkId parent = resolve(joint.parent_link, "parent");
    const LinkId child = resolve(joint.child_link, "child");
    tree.edges_.push_back(KinematicEdge{ jid, joint.name, parent, child });
  }

  // single parent
  for (const auto& edge : tree.edges_)
  {
    auto& child = tree.nodes_[edge.child];
    if (child.parent)
      throw CompileError(CompileErrorKind::MultipleParents, child.name,
                         "child of both joint '" + tree.edges_[*child.parent_joint].name + "' and joint '" +
                             edge.name + "'",
                         edge.name);

    child.parent = edge.parent;
    child.parent_joint = edge.id;
    tree.nodes_[edge.parent].children.push_back(edge.child);
    tree.nodes_[edge.parent].child_joints.push_back(edge.id);
  }

  // acyclic
  G g(tree.nodes_.size());
  for (const auto& edge : tree.edges_)
    boost::add_edge(edge.parent, edge.child, g);

  try
  {
    boost::depth_first_search(g, boost::visitor(cycle_visitor{}));
  }
  catch (const cycle_visitor::found& cycle)
  {
    throw CompileError(CompileErrorKind::CyclicKinematics, tree.nodes_[cycle.vertex].name,
                       "joints form a cycle through this link");
  }

  for (const auto& n : tree.nodes_)
  {
    if (!n.parent)
      tree.roots_.push_back(n.id);
  }

  return tree;
}

std::ostream& operator<<(std::ostream& os, const KinematicTree& tree)
{
  os << "KinematicTree{ links=" << tree.size() << ", joints=" << tree.edges().size()
     << ", roots=" << tree.roots().size() << " }\n";

  // indent by depth
  std::vector<int> depth(tree.size(), 0);
  for (LinkId id : tree.depthFirstOrder())
  {
    const auto& n = tree.node(id);
    if (n.parent)
      depth[id] = depth[*n.parent] + 1;

    os << std::string(2 * (depth[id] + 1), ' ') << n.name;
    if (n.parent_joint)
      os << "  (via " << tree.edges()[*n.parent_joint].name << ")";
    os << "\n";
  }
  return os;
}

}  // namespace kinematics
}  // namespace kinscene
