#pragma once

/// @file include/gwreparam/lisa.hpp
/// @brief LisaExtrinsicSymmetry — folds the discrete degeneracies of the
///        LISA extrinsic parameters onto a single mode.
///
/// # Module: LISA Extrinsic Symmetry
///
/// ## Responsibility
/// The LISA response is (approximately) invariant under shifting the
/// ecliptic longitude λ by multiples of π/2 (with a matching shift of ψ),
/// under reflecting the ecliptic latitude β through the ecliptic (with
/// ι → π − ι, ψ → π − ψ) and, when the orbital phase is sampled, under
/// φ → φ + π. The transform folds every sample onto the reference mode and
/// records which of the 8 (or 16, with phase) modes it came from:
///
///   mode_index = long_num + 4 · lat_num + 8 · phase_num
///
/// where long_num = ⌊λ/(π/2)⌋, lat_num = [β ≥ 0], phase_num = ⌊φ/π⌋.
///
/// ## Variants
/// - With `include_mode_index` the map is one-to-one: `mode_index` is part
///   of the transformed point and log|J| = 0 in both directions. The
///   inverse rounds `mode_index` to the nearest integer and rejects values
///   outside [0, n_modes) with DomainError.
/// - Without it (the default) the inverse draws the mode from the mode
///   weights w with the transform's own engine, and log|J| is log w_m
///   forward and −log w_m inverse, so the unfolded density stays
///   normalised. The weights are uniform unless `estimate_mode_weights`
///   refits them to the mode counts of the live points.

#include "gwreparam/constants.hpp"
#include "gwreparam/reparameterisation.hpp"

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace gwreparam {

/// Bin indices of a sample in the folded parameter space.
struct LisaMode {
    int long_num;   ///< λ bin, 0..3
    int lat_num;    ///< 1 above the ecliptic, 0 below
    int phase_num;  ///< φ bin, 0..1 (always 0 without phase)
    int index;      ///< long_num + 4·lat_num + 8·phase_num
};

/// Explicit parameter roles. Any role left empty is inferred from the
/// known names in `parameters`:
///   λ: eclipticlongitude, lambda     β: eclipticlatitude, beta
///   ψ: polarization, psi             ι: iota, inclination
///   φ: phase, coa_phase (optional)
struct LisaParameterNames {
    std::optional<std::string> lambda;
    std::optional<std::string> beta;
    std::optional<std::string> psi;
    std::optional<std::string> iota;
    std::optional<std::string> phase;
};

struct LisaOptions {
    /// Carry `mode_index` in the transformed point.
    bool include_mode_index = false;
    /// Refit the mode weights to the live points. Requires
    /// `include_mode_index == false`.
    bool estimate_mode_weights = false;
    /// Floor applied to each estimated weight before renormalising.
    std::optional<double> minimum_mode_weight = std::nullopt;
    /// Seed of the engine that draws modes on inverse.
    std::uint64_t seed = constants::DEFAULT_SEED;
};

class LisaExtrinsicSymmetry final : public Reparameterisation {
public:
    /// # Throws
    /// ConfigurationError if a role cannot be resolved unambiguously, a
    /// named role is not among `parameters`, a parameter is left without a
    /// role, or its prior bounds differ from λ, φ ∈ [0, 2π], β ∈ [−π/2, π/2],
    /// ψ, ι ∈ [0, π]; also if `options` estimate mode weights together
    /// with a mode index, or the minimum weight is outside [0, 1).
    explicit LisaExtrinsicSymmetry(const ParameterSet& parameters,
                                   const LisaParameterNames& names = {},
                                   const LisaOptions& options = {});

    double forward_into(const Point& physical, Point& transformed) const override;
    double inverse_into(const Point& transformed, Point& physical) const override;

    [[nodiscard]] std::string_view kind() const noexcept override { return "lisa-extrinsic"; }
    [[nodiscard]] bool is_fitted() const noexcept override { return options_.estimate_mode_weights; }

    /// Copy whose mode weights are the mode frequencies of `live_points`,
    /// floored at `minimum_mode_weight` and renormalised. nullptr unless
    /// the weights are estimated; no live points keep the current weights.
    [[nodiscard]] std::shared_ptr<const Reparameterisation>
    refit(std::span<const Point> live_points) const override;

    [[nodiscard]] bool includes_mode_index() const noexcept { return options_.include_mode_index; }

    /// Probability of each mode index; sums to one.
    [[nodiscard]] const std::vector<double>& mode_weights() const noexcept { return weights_; }

    /// 16 with a phase parameter, 8 without.
    [[nodiscard]] int n_modes() const noexcept { return phase_ ? 16 : 8; }

    /// Mode of a physical point.
    [[nodiscard]] LisaMode determine_mode(const Point& physical) const;

    /// Decompose a mode index into its bins.
    [[nodiscard]] static LisaMode unfold_mode(int index) noexcept;

private:
    LisaExtrinsicSymmetry(const LisaParameterNames& resolved,
                          const ParameterSet& parameters,
                          const LisaOptions& options);

    /// Mode index read from `transformed`, or drawn from the weights.
    [[nodiscard]] int mode_of(const Point& transformed) const;

    /// log w of mode `index`. DomainError for a mode with zero weight.
    [[nodiscard]] double log_mode_weight(int index) const;

    /// Fill every role of `names` from `parameters`.
    [[nodiscard]] static LisaParameterNames resolve(const ParameterSet& parameters,
                                                    const LisaParameterNames& names);

    std::string                lambda_;
    std::string                beta_;
    std::string                psi_;
    std::string                iota_;
    std::optional<std::string> phase_;
    ParameterSet               descriptors_;
    LisaOptions                options_;
    std::vector<double>        weights_;
    mutable std::mt19937_64    rng_;
};

} // namespace gwreparam
