#ifndef ABCPOP_TYPEDEFS_H
#define ABCPOP_TYPEDEFS_H

#include <vector>
#include <Eigen/Dense>

namespace ABCPOP {

typedef double float_type;

// Row is about parameter or metric features, Col is about particle features
typedef Eigen::Matrix<float_type, Eigen::Dynamic, Eigen::Dynamic> Mat2D;
typedef Eigen::Matrix<float_type, 1, Eigen::Dynamic> Row;
typedef Eigen::Matrix<float_type, Eigen::Dynamic, 1> Col;

// a parameter point, as produced by a draw function
typedef std::vector<float_type> Theta;
// the summary statistics produced by one simulation
typedef std::vector<float_type> SumStat;

}

#endif // ABCPOP_TYPEDEFS_H
