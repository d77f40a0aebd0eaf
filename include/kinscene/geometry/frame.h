#ifndef KINSCENE_GEOMETRY_FRAME_H_
#define KINSCENE_GEOMETRY_FRAME_H_

#include <Eigen/Core>
#include <Eigen/Geometry>

#include <kinscene/geometry/transform.h>

namespace kinscene {
namespace geometry {

/*
yaw:
    A yaw is a counterclockwise rotation of alpha about the z-axis.

    R_z
    |cos(alpha) -sin(alpha) 0|
    |sin(alpha)  cos(alpha) 0|
    |    0            0     1|

pitch:
    A pitch is a counterclockwise rotation of beta about the y-axis.

    R_y
    |cos(beta)  0   sin(beta)|
    |0          1       0    |
    |-sin(beta) 0   cos(beta)|

roll:
    A roll is a counterclockwise rotation of gamma about the x-axis.

    R_x
    |1          0           0|
    |0 cos(gamma) -sin(gamma)|
    |0 sin(gamma)  cos(gamma)|

    R_z R_y R_x performs the roll first, then the pitch, and finally the yaw (fixed axes),
    which is the URDF convention. Every origin in the library goes through this one order.
*/
Eigen::Quaterniond quaternionFromRPY(double roll, double pitch, double yaw);

/**
 * @brief Resolve an authored origin (xyz + rpy) into a rigid transform.
 *        Total over finite input. Non-finite input must be rejected by the caller (see isFinite).
 */
ResolvedFrame compose(const Origin& origin);

// ---- Validation utilities ---------------------------------------------------

bool isUnitVector(const Eigen::Vector3d& v, double tol = 1e-8);

bool areVectorsOrthonormal(const Eigen::Vector3d& a, const Eigen::Vector3d& b, const Eigen::Vector3d& c,
                           double tol = 1e-8);

bool isRightHanded(const Eigen::Vector3d& X, const Eigen::Vector3d& Y, const Eigen::Vector3d& Z, double tol = 1e-8);

bool isRightHandedOrthonormal(const Eigen::Vector3d& X, const Eigen::Vector3d& Y, const Eigen::Vector3d& Z,
                              double tol = 1e-8);

}  // namespace geometry
}  // namespace kinscene

#endif  // KINSCENE_GEOMETRY_FRAME_H_
