#pragma once

#include <expected>
#include <utility>

namespace Convida {

/**
 * Result<T, E>: thin wrapper around std::expected.
 *
 * Used where a failure is an expected outcome the caller should handle
 * (configuration parsing, name lookup). Programming errors and bounds
 * violations throw instead.
 */
template <typename successT, typename failureT>
class Result {
private:
    std::expected<successT, failureT> inner_;

public:
    Result(successT value) : inner_(std::move(value)) {}
    Result(std::unexpected<failureT> err) : inner_(std::move(err)) {}

    static Result<successT, failureT> okay(successT value)
    {
        return Result<successT, failureT>(std::move(value));
    }

    static Result<successT, failureT> error(failureT err)
    {
        return Result<successT, failureT>(std::unexpected(std::move(err)));
    }

    bool isValue() const { return inner_.has_value(); }
    bool isError() const { return !inner_.has_value(); }

    // Throws std::bad_expected_access when called on an error.
    const successT& value() const& { return inner_.value(); }
    successT value() && { return std::move(inner_).value(); }

    const failureT& errorValue() const& { return inner_.error(); }
    failureT errorValue() && { return std::move(inner_).error(); }
};

} // namespace Convida
