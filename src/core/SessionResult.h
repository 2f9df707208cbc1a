#pragma once
#include "core/SessionError.h"
#include <optional>
#include <stdexcept>
#include <utility>
#include <variant>

// Value-or-error returned by every store operation.
template <typename T>
class SessionResult {
public:
    SessionResult(T value) : data_(std::in_place_index<0>, std::move(value)) {}
    SessionResult(SessionError error) : data_(std::in_place_index<1>, std::move(error)) {}

    bool ok() const { return data_.index() == 0; }
    explicit operator bool() const { return ok(); }

    const T& value() const& {
        ensureValue();
        return std::get<0>(data_);
    }
    T& value() & {
        ensureValue();
        return std::get<0>(data_);
    }
    T&& value() && {
        ensureValue();
        return std::get<0>(std::move(data_));
    }

    const SessionError& error() const {
        if (ok()) {
            throw std::logic_error("SessionResult holds a value, not an error");
        }
        return std::get<1>(data_);
    }

    // Only meaningful when !ok()
    bool is(SessionErrorKind kind) const { return !ok() && std::get<1>(data_).kind() == kind; }

private:
    void ensureValue() const {
        if (!ok()) {
            throw std::logic_error("SessionResult holds an error: " + std::get<1>(data_).message());
        }
    }

    std::variant<T, SessionError> data_;
};

template <>
class SessionResult<void> {
public:
    SessionResult() = default;
    SessionResult(SessionError error) : error_(std::move(error)) {}

    static SessionResult success() { return SessionResult(); }

    bool ok() const { return !error_.has_value(); }
    explicit operator bool() const { return ok(); }

    const SessionError& error() const {
        if (ok()) {
            throw std::logic_error("SessionResult holds a value, not an error");
        }
        return *error_;
    }

    bool is(SessionErrorKind kind) const { return error_.has_value() && error_->kind() == kind; }

private:
    std::optional<SessionError> error_;
};
