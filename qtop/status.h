#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace qtop {

// Status/Result for the inner helpers (number parsing, alert delivery).
// The configuration boundary throws instead; see UsageErrorV1.
class StatusV1 {
   public:
    static StatusV1 Ok() { return StatusV1(true, ""); }
    static StatusV1 Error(std::string msg) { return StatusV1(false, std::move(msg)); }

    bool ok() const { return ok_; }
    const std::string& message() const { return msg_; }

    // "ctx: message" on error, unchanged when ok.
    StatusV1 with_context(const std::string& ctx) const { return ok_ ? *this : Error(ctx + ": " + msg_); }

    void throw_if_error() const {
        if (!ok_) throw std::runtime_error(msg_.empty() ? "StatusV1 error" : msg_);
    }

   private:
    StatusV1(bool ok, std::string msg) : ok_(ok), msg_(std::move(msg)) {}

    bool ok_ = true;
    std::string msg_;
};

template <typename T>
class ResultV1 {
   public:
    ResultV1(T v) : value_(std::move(v)), status_(StatusV1::Ok()) {}
    ResultV1(StatusV1 s) : status_(std::move(s)) {
        if (status_.ok()) status_ = StatusV1::Error("ResultV1 constructed with Ok() status but no value");
    }

    bool ok() const { return value_.has_value(); }
    const StatusV1& status() const { return status_; }

    // Throws std::runtime_error carrying the status message when !ok().
    const T& value() const {
        if (!value_) status_.throw_if_error();
        return *value_;
    }

    T value_or(T fallback) const { return value_ ? *value_ : std::move(fallback); }

   private:
    std::optional<T> value_;
    StatusV1 status_;
};

}  // namespace qtop
