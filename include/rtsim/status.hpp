#pragma once
#include <string>
#include <utility>

namespace rtsim {

enum class ErrorCode {
    Ok,
    InvalidTaskSet,
    InvalidConfig,
    SimulationDivergence,
    DeadlockUnresolved,
};

struct Status {
    ErrorCode code{ErrorCode::Ok};
    std::string message;

    bool ok() const { return code == ErrorCode::Ok; }

    static Status success() { return {}; }
    static Status failure(ErrorCode code, std::string message) {
        return {code, std::move(message)};
    }
};

const char* error_name(ErrorCode code);

} // namespace rtsim
