#ifndef EIGEN_TYPES_H_
#define EIGEN_TYPES_H_

#include <Eigen/Core>
#include "game_constants.h"

typedef Eigen::Array<double, Eigen::Dynamic, 1> TrustVector;
typedef Eigen::Array<bool, Eigen::Dynamic, 1> PinMask;
typedef Eigen::Array<int, Eigen::Dynamic, 1> CountVector;

#endif // EIGEN_TYPES_H_
