/// @file src/proposal/proposal_registry.cpp
/// @brief Proposal variant keys and construction by key.

#include "gwreparam/proposal.hpp"
#include "gwreparam/errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <utility>

namespace gwreparam {

namespace {

constexpr std::array<ProposalVariant, 4> ALL_VARIANTS = {
    ProposalVariant::Plain,
    ProposalVariant::Augmented,
    ProposalVariant::Clustering,
    ProposalVariant::Mcmc,
};

} // namespace

const char* to_string(ProposalVariant v) noexcept {
    switch (v) {
        case ProposalVariant::Plain:      return "gwflowproposal";
        case ProposalVariant::Augmented:  return "augmentedgwflowproposal";
        case ProposalVariant::Clustering: return "clusteringgwflowproposal";
        case ProposalVariant::Mcmc:       return "mcmcgwflowproposal";
    }
    return "unknown";
}

ProposalVariant proposal_variant_from_string(std::string_view key) {
    std::string lowered(key);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (ProposalVariant v : ALL_VARIANTS) {
        if (lowered == to_string(v)) {
            return v;
        }
    }
    throw ConfigurationError(fmt::format("unknown proposal '{}'", key));
}

std::unique_ptr<GWFlowProposal>
make_proposal(std::string_view key, ProposalConfig config, BaseProposal& base) {
    config.variant = proposal_variant_from_string(key);
    return std::make_unique<GWFlowProposal>(std::move(config), base);
}

} // namespace gwreparam
