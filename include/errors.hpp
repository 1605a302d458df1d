#pragma once

/**
 * Error taxonomy for the analysis core.
 *
 * Every failure the core reports is an AnalysisError carrying:
 * - a machine-readable ErrorKind
 * - a human-readable message
 * - optional ticker / parameter context
 *
 * Batch analysis catches AnalysisError per ticker; everything else
 * is a programming error and propagates.
 */

#include <stdexcept>
#include <string>
#include <utility>

namespace quantcode {

enum class ErrorKind {
    Validation,       // Bad or missing scalar input
    InsufficientData, // Series shorter than a required window
    InvalidBar,       // Malformed OHLC bar or bad ordering
    UpstreamData,     // Price-history provider failed
    NotFound          // Journal record lookup miss
};

inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Validation:
        return "validation_error";
    case ErrorKind::InsufficientData:
        return "insufficient_data";
    case ErrorKind::InvalidBar:
        return "invalid_bar";
    case ErrorKind::UpstreamData:
        return "upstream_data_error";
    case ErrorKind::NotFound:
        return "not_found";
    }
    return "unknown";
}

class AnalysisError : public std::runtime_error {
public:
    AnalysisError(ErrorKind kind, const std::string& message, std::string ticker = "",
                  std::string parameter = "")
        : std::runtime_error(message)
        , kind_(kind)
        , ticker_(std::move(ticker))
        , parameter_(std::move(parameter)) {}

    ErrorKind kind() const { return kind_; }
    const char* kind_name() const { return error_kind_to_string(kind_); }
    const std::string& ticker() const { return ticker_; }
    const std::string& parameter() const { return parameter_; }

    // Attach ticker context once the failing analysis is known
    void set_ticker(const std::string& ticker) {
        if (ticker_.empty())
            ticker_ = ticker;
    }

private:
    ErrorKind kind_;
    std::string ticker_;
    std::string parameter_;
};

class ValidationError : public AnalysisError {
public:
    explicit ValidationError(const std::string& message, std::string parameter = "", std::string ticker = "")
        : AnalysisError(ErrorKind::Validation, message, std::move(ticker), std::move(parameter)) {}
};

// Entry equals stop: risk per share would be zero
class InvalidRiskParametersError : public ValidationError {
public:
    explicit InvalidRiskParametersError(const std::string& message)
        : ValidationError(message, "stop_loss_price") {}
};

class InsufficientDataError : public AnalysisError {
public:
    InsufficientDataError(const std::string& message, size_t required, size_t available, std::string ticker = "")
        : AnalysisError(ErrorKind::InsufficientData, message, std::move(ticker))
        , required_(required)
        , available_(available) {}

    size_t required() const { return required_; }
    size_t available() const { return available_; }

private:
    size_t required_;
    size_t available_;
};

class InvalidBarError : public AnalysisError {
public:
    InvalidBarError(const std::string& message, size_t index, std::string ticker = "")
        : AnalysisError(ErrorKind::InvalidBar, message, std::move(ticker))
        , index_(index) {}

    size_t index() const { return index_; }

private:
    size_t index_;
};

class UpstreamDataError : public AnalysisError {
public:
    explicit UpstreamDataError(const std::string& message, std::string ticker = "")
        : AnalysisError(ErrorKind::UpstreamData, message, std::move(ticker)) {}
};

class NotFoundError : public AnalysisError {
public:
    explicit NotFoundError(const std::string& message, std::string parameter = "id")
        : AnalysisError(ErrorKind::NotFound, message, "", std::move(parameter)) {}
};

} // namespace quantcode
