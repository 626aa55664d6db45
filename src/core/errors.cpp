/// @file src/core/errors.cpp
/// @brief Message formatting for the gwreparam exception types.

#include "gwreparam/errors.hpp"

#include <fmt/format.h>

#include <utility>

namespace gwreparam {

DomainError::DomainError(std::string parameter, double value, std::string_view reason)
    : Error(fmt::format("domain error for '{}' at value {}: {}", parameter, value, reason)),
      parameter_(std::move(parameter)),
      value_(value) {}

ProposalExhaustedError::ProposalExhaustedError(std::size_t retry_count,
                                               std::string last_failure)
    : Error(fmt::format("proposal exhausted after {} retries; last failure: {}",
                        retry_count, last_failure)),
      retry_count_(retry_count),
      last_failure_(std::move(last_failure)) {}

} // namespace gwreparam
