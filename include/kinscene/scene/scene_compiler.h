#ifndef KINSCENE_SCENE_SCENE_COMPILER_H_
#define KINSCENE_SCENE_SCENE_COMPILER_H_

#include <kinscene/components/robot.h>
#include <kinscene/options.h>
#include <kinscene/scene/scene_graph.h>

namespace kinscene {
namespace scene {

/**
 * Compile a robot description into a scene graph.
 *
 *   1. kinematic tree (names, parents, cycles)
 *   2. pass 1, per link: mass properties, compound collider, collision groups, visual frames
 *   3. pass 2, per joint: joint frame, constraint, child placement
 *   4. rest poses, root to leaf
 *
 * All or nothing: the first error is thrown and no partial scene is returned.
 *
 * @throws CompileError
 */
SceneGraph compileScene(const components::RobotDescription& robot, const CompileOptions& options = {});

/// Pass 1 for a single link. Tree fields (parent, children, poses) are left for the caller.
CompiledLink compileLink(const components::LinkDescriptor& link, LinkId id, const CompileOptions& options = {});

/// Pass 2 for a single joint whose endpoints are already resolved.
CompiledJoint compileJoint(const components::JointDescriptor& joint, JointId id, LinkId parent, LinkId child,
                           const CompileOptions& options = {});

}  // namespace scene
}  // namespace kinscene

#endif  // KINSCENE_SCENE_SCENE_COMPILER_H_
