/*******************************************************************************
    Project: Volcano Controller Manager

    File: errors.h

    Description:
        Exception types shared across the controller manager. Everything
        derives from std::runtime_error so worker loops can catch
        std::exception, log e.what() and carry on.

        ApiError      - cluster API calls (external object store)
        PluginError   - job plugin construction and lifecycle hooks
        LockError     - leader election lock construction and lock store I/O
        ConfigError   - option validation and cluster config building
*******************************************************************************/

#ifndef ERRORS_H
#define ERRORS_H

#include <stdexcept>
#include <string>

namespace volcano {

enum class ApiErrorCode {
    NOT_FOUND,
    ALREADY_EXISTS,
    CONFLICT,
    INTERNAL
};

class ApiError : public std::runtime_error {
private:
    ApiErrorCode code_;

public:
    ApiError(ApiErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ApiErrorCode code() const { return code_; }
};

inline bool is_not_found(const ApiError& e) { return e.code() == ApiErrorCode::NOT_FOUND; }
inline bool is_already_exists(const ApiError& e) { return e.code() == ApiErrorCode::ALREADY_EXISTS; }

class PluginError : public std::runtime_error {
public:
    explicit PluginError(const std::string& message) : std::runtime_error(message) {}
};

class LockError : public std::runtime_error {
public:
    explicit LockError(const std::string& message) : std::runtime_error(message) {}
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace volcano

#endif // ERRORS_H
