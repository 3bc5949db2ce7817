#pragma once

#include "conduit_result.hpp"

namespace conduit {

    enum class Error {
        NotFound,
        ValidationFailed,
        UnwiredInput,
    };

    inline const char* to_str(Error error) {
        switch (error) {
            case Error::NotFound: return "Node not found";
            case Error::ValidationFailed: return "Validation failed";
            case Error::UnwiredInput: return "Input channel is not wired";
            default: return "Unknown error";
        }
    }

} // namespace conduit
