#pragma once

/// @file include/gwreparam/errors.hpp
/// @brief Exception taxonomy for the reparameterisation and proposal layers.
///
/// | Error                    | Raised                                  | Recovery            |
/// |--------------------------|-----------------------------------------|---------------------|
/// | ConfigurationError       | construction (coverage, bounds, options) | none — fatal        |
/// | DomainError              | transform outside its valid domain      | discard candidate   |
/// | ProposalExhaustedError   | `sample` retry budget exhausted         | host engine decides |
///
/// Numeric kernels below this layer return `std::optional`; the
/// reparameterisation layer turns an empty result into a `DomainError`.

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace gwreparam {

/// Root of all gwreparam exceptions.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Malformed or incomplete configuration, detected at construction time.
class ConfigurationError : public Error {
public:
    using Error::Error;
};

/// A transform was invoked outside its valid domain, or produced a
/// non-finite Jacobian.
class DomainError : public Error {
public:
    DomainError(std::string parameter, double value, std::string_view reason);

    [[nodiscard]] const std::string& parameter() const noexcept { return parameter_; }
    [[nodiscard]] double value() const noexcept { return value_; }

private:
    std::string parameter_;
    double      value_;
};

/// `sample` ran out of retries while discarding out-of-domain candidates.
class ProposalExhaustedError : public Error {
public:
    ProposalExhaustedError(std::size_t retry_count, std::string last_failure);

    [[nodiscard]] std::size_t retry_count() const noexcept { return retry_count_; }
    [[nodiscard]] const std::string& last_failure() const noexcept { return last_failure_; }

private:
    std::size_t retry_count_;
    std::string last_failure_;
};

} // namespace gwreparam
