#pragma once

#include <stdexcept>
#include <string>

namespace canopy::error {

// Every engine failure carries the status a transport would surface it as.
class Error : public std::runtime_error {
public:
    Error(const std::string& what, const unsigned short status)
        : std::runtime_error(what), status_(status) {}

    [[nodiscard]] unsigned short httpStatus() const noexcept { return status_; }

private:
    unsigned short status_;
};

class NotFoundError final : public Error {
public:
    explicit NotFoundError(const std::string& what) : Error(what, 404) {}
};

class PermissionDeniedError final : public Error {
public:
    explicit PermissionDeniedError(const std::string& what) : Error(what, 403) {}
};

class InvalidParentError final : public Error {
public:
    explicit InvalidParentError(const std::string& what) : Error(what, 422) {}
};

class ParentNotFoundError final : public Error {
public:
    explicit ParentNotFoundError(const std::string& what) : Error(what, 422) {}
};

class CycleError final : public Error {
public:
    explicit CycleError(const std::string& what) : Error(what, 422) {}
};

class InvalidOperationError final : public Error {
public:
    explicit InvalidOperationError(const std::string& what) : Error(what, 422) {}
};

class ClockSkewError final : public Error {
public:
    explicit ClockSkewError(const std::string& what) : Error(what, 503) {}
};

}
