#pragma once

/// @file include/gwreparam/parameter.hpp
/// @brief ParameterDescriptor — static metadata for one physical parameter.
///
/// # Module: Parameter Descriptor
///
/// ## Responsibility
/// Hold the name, prior bounds and boundary topology of a physical
/// parameter, and answer whether a value lies in its domain.
///
/// ## Topologies
///   - Linear     — unbounded (or optionally bounded) real line
///   - Bounded    — hard bounds, values outside are rejected
///   - Periodic   — wraps at the bounds, domain is [lower, upper)
///   - Reflective — values past a bound are folded back into range
///   - Composite  — must be transformed jointly with named partners
///
/// ## Guarantees
/// - Immutable once constructed
/// - Construction validates bounds and throws ConfigurationError otherwise

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gwreparam {

enum class Topology {
    Linear,
    Bounded,
    Periodic,
    Reflective,
    Composite,
};

[[nodiscard]] const char* to_string(Topology t) noexcept;

class ParameterDescriptor {
public:
    /// # Throws
    /// ConfigurationError if the name is empty, a bound is non-finite,
    /// lower >= upper, or a non-linear topology is missing a bound.
    ParameterDescriptor(std::string name,
                        std::optional<double> lower,
                        std::optional<double> upper,
                        Topology topology,
                        std::vector<std::string> partners = {});

    // ── Factories ────────────────────────────────────────────────────────────

    static ParameterDescriptor linear(std::string name);
    static ParameterDescriptor bounded(std::string name, double lower, double upper);
    static ParameterDescriptor periodic(std::string name, double lower, double upper);
    static ParameterDescriptor reflective(std::string name, double lower, double upper);
    static ParameterDescriptor composite(std::string name, double lower, double upper,
                                         std::vector<std::string> partners);

    // ── Accessors ────────────────────────────────────────────────────────────

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] std::optional<double> lower() const noexcept { return lower_; }
    [[nodiscard]] std::optional<double> upper() const noexcept { return upper_; }
    [[nodiscard]] Topology topology() const noexcept { return topology_; }
    [[nodiscard]] const std::vector<std::string>& partners() const noexcept { return partners_; }

    /// True if both bounds are present.
    [[nodiscard]] bool is_bounded() const noexcept;

    /// upper − lower. Precondition: is_bounded().
    [[nodiscard]] double width() const noexcept;

    /// True if `value` is finite and inside the domain implied by the
    /// topology: [lower, upper) for periodic, [lower, upper] otherwise.
    [[nodiscard]] bool contains(double value) const noexcept;

private:
    std::string              name_;
    std::optional<double>    lower_;
    std::optional<double>    upper_;
    Topology                 topology_;
    std::vector<std::string> partners_;
};

using ParameterSet = std::vector<ParameterDescriptor>;

/// Find a descriptor by exact name, or nullptr.
[[nodiscard]] const ParameterDescriptor*
find_parameter(const ParameterSet& parameters, std::string_view name) noexcept;

} // namespace gwreparam
