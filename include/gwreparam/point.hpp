#pragma once

/// @file include/gwreparam/point.hpp
/// @brief Name-keyed Point helpers and Eigen conversions.

#include "gwreparam/types.hpp"

#include <Eigen/Dense>

#include <span>
#include <string>

namespace gwreparam {

/// Look up `name` in `point`.
///
/// # Throws
/// DomainError (value NaN) if the parameter is missing.
[[nodiscard]] double value_of(const Point& point, const std::string& name);

/// Pack the named values of `point` into a vector, in `names` order.
///
/// # Throws
/// DomainError if any name is missing.
[[nodiscard]] Eigen::VectorXd to_vector(const Point& point, const ParameterNames& names);

/// Unpack a vector into a point keyed by `names`; surplus entries on either
/// side are ignored.
[[nodiscard]] Point to_point(const Eigen::VectorXd& values, const ParameterNames& names);

/// Stack points into a matrix (rows = points, cols = `names`).
[[nodiscard]] Eigen::MatrixXd to_matrix(std::span<const Point> points,
                                        const ParameterNames& names);

/// Names of a point in key order.
[[nodiscard]] ParameterNames names_of(const Point& point);

} // namespace gwreparam
