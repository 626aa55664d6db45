/// @file src/core/point.cpp
/// @brief Point lookup and Eigen packing helpers.

#include "gwreparam/point.hpp"
#include "gwreparam/errors.hpp"

#include <algorithm>
#include <limits>

namespace gwreparam {

double value_of(const Point& point, const std::string& name) {
    const auto it = point.find(name);
    if (it == point.end()) {
        throw DomainError(name, std::numeric_limits<double>::quiet_NaN(),
                          "parameter missing from point");
    }
    return it->second;
}

Eigen::VectorXd to_vector(const Point& point, const ParameterNames& names) {
    Eigen::VectorXd v(static_cast<Eigen::Index>(names.size()));
    for (std::size_t i = 0; i < names.size(); ++i) {
        v(static_cast<Eigen::Index>(i)) = value_of(point, names[i]);
    }
    return v;
}

Point to_point(const Eigen::VectorXd& values, const ParameterNames& names) {
    Point p;
    const auto n = std::min<std::size_t>(names.size(), static_cast<std::size_t>(values.size()));
    for (std::size_t i = 0; i < n; ++i) {
        p.emplace(names[i], values(static_cast<Eigen::Index>(i)));
    }
    return p;
}

Eigen::MatrixXd to_matrix(std::span<const Point> points, const ParameterNames& names) {
    Eigen::MatrixXd m(static_cast<Eigen::Index>(points.size()),
                      static_cast<Eigen::Index>(names.size()));
    for (std::size_t r = 0; r < points.size(); ++r) {
        m.row(static_cast<Eigen::Index>(r)) = to_vector(points[r], names).transpose();
    }
    return m;
}

ParameterNames names_of(const Point& point) {
    ParameterNames names;
    names.reserve(point.size());
    for (const auto& [name, value] : point) {
        names.push_back(name);
    }
    return names;
}

} // namespace gwreparam
