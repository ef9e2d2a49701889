#pragma once

/// @file include/drawstat/errors.hpp
/// @brief Exception types raised for caller misuse.
///
/// Analysis queries degrade to neutral defaults instead of throwing. The
/// types below cover the cases where no meaningful default exists:
///   - a combination of the wrong arity or with an out-of-range value
///   - a draw that does not fit its snapshot's layout
///   - cross-validation on too few draws
///   - a cooperative cancellation request observed between folds

#include <cstddef>
#include <stdexcept>
#include <string>

namespace drawstat {

/// Base class for drawstat runtime failures.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Fewer draws than an operation's stated minimum, where no neutral default
/// makes sense (k-fold cross-validation).
class InsufficientDataError : public Error {
public:
    InsufficientDataError(std::size_t have, std::size_t need);

    [[nodiscard]] std::size_t have() const noexcept { return have_; }
    [[nodiscard]] std::size_t need() const noexcept { return need_; }

private:
    std::size_t have_;
    std::size_t need_;
};

/// A draw's arity or values do not match the snapshot layout.
class InvalidDrawError : public Error {
public:
    using Error::Error;
};

/// Cross-validation was cancelled between folds.
class CancelledError : public Error {
public:
    CancelledError() : Error("operation cancelled") {}
};

/// Wrong arity or out-of-range value in a candidate combination.
class InvalidCombinationError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

}  // namespace drawstat
