#pragma once

#include <string>
#include <utility>

namespace tandem {

// Outcome of an operation that can be rejected. Carries the reason on failure.
struct Status {
    bool ok{true};
    std::string message;

    static Status success() { return Status{}; }
    static Status error(std::string msg) { return Status{false, std::move(msg)}; }

    explicit operator bool() const { return ok; }
};

} // namespace tandem
