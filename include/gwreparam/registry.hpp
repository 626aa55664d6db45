#pragma once

/// @file include/gwreparam/registry.hpp
/// @brief ReparameterisationRegistry — named reparameterisation kinds with
///        default options.
///
/// # Module: Reparameterisation Registry
///
/// Kind keys understood by `known()`:
///
/// | Key(s)                           | Transform        | Defaults                   |
/// |----------------------------------|------------------|----------------------------|
/// | identity, none                   | Identity         |                            |
/// | rescale, default                 | RescaleToBounds  |                            |
/// | time, mass                       | RescaleToBounds  | update_bounds              |
/// | logit, bounded                   | Logit            |                            |
/// | reflective                       | Reflective       | reflect both               |
/// | mass_ratio                       | RescaleToBounds  | update_bounds, invert upper |
/// | periodic, angle-2pi, angle-pi    | Angle            |                            |
/// | angle-sine                       | SineAngle        |                            |
/// | sky-ra-dec / sky-az-zen          | SkyPair          | ra-dec / az-zen convention |
/// | distance                         | Distance         | power 2, reflect upper     |
/// | delta_phase, delta-phase         | DeltaPhase       |                            |
/// | lisa-extrinsic                   | LisaExtrinsicSymmetry | random mode, uniform weights |

#include "gwreparam/angles.hpp"
#include "gwreparam/bounded.hpp"
#include "gwreparam/constants.hpp"
#include "gwreparam/lisa.hpp"
#include "gwreparam/parameter.hpp"
#include "gwreparam/reparameterisation.hpp"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gwreparam {

/// Per-kind construction options. Fields a kind does not use are ignored.
/// `reflect` is the reflected side for reflective and distance kinds and
/// the inverted side for rescale kinds.
struct ReparameterisationOptions {
    bool                             update_bounds  = false;
    std::optional<ReflectBoundaries> reflect        = std::nullopt;
    double                           distance_power = constants::DEFAULT_DISTANCE_POWER;
    SkyConvention                    sky            = SkyConvention::RaDec;
    LisaOptions                      lisa           = {};
};

/// Builds a transform over `parameters` (the descriptors it consumes).
using ReparameterisationFactory =
    std::function<ReparameterisationPtr(const ParameterSet& parameters,
                                        const ReparameterisationOptions& options)>;

class ReparameterisationRegistry {
public:
    /// Register `kind`. Re-registering a key replaces the previous entry.
    void add(std::string kind,
             ReparameterisationFactory factory,
             ReparameterisationOptions defaults = {});

    [[nodiscard]] bool contains(std::string_view kind) const;

    /// # Throws
    /// ConfigurationError for an unknown kind.
    [[nodiscard]] const ReparameterisationOptions& defaults(std::string_view kind) const;

    /// Build `kind` over `parameters` with the registered defaults.
    ///
    /// # Throws
    /// ConfigurationError for an unknown kind or unsuitable parameters.
    [[nodiscard]] ReparameterisationPtr create(std::string_view kind,
                                               const ParameterSet& parameters) const;

    /// Build `kind` with explicit options (start from `defaults(kind)` to
    /// override individual fields).
    [[nodiscard]] ReparameterisationPtr create(std::string_view kind,
                                               const ParameterSet& parameters,
                                               const ReparameterisationOptions& options) const;

    /// Registered keys in lexicographic order.
    [[nodiscard]] std::vector<std::string> kinds() const;

    /// Registry pre-populated with every built-in kind.
    [[nodiscard]] static const ReparameterisationRegistry& known();

private:
    struct Entry {
        ReparameterisationFactory factory;
        ReparameterisationOptions defaults;
    };

    [[nodiscard]] const Entry& entry(std::string_view kind) const;

    std::map<std::string, Entry, std::less<>> entries_;
};

} // namespace gwreparam
