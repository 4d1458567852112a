#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace MT {

struct Error {
    enum class Code {
        InvalidError = 0,
        UnknownError,
        NodeNotFound,
        MotherNotClause,
        MotherIdNotSmaller,
        ContainerMismatch,
        SameNode,
        Cycle,
        DepthLimit,
        RootifyDisabled,
        NoHistory,
        InvalidScope,
        MalformedInput,
        NotFound
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

// Broad classes a caller needs to tell apart; all of them leave engine state unchanged.
enum class ErrorSeverity {
    NotFound,
    Rejected,
    NoHistory,
    Internal
};

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::InvalidError:
        return "INVALID_ERROR";
    case Error::Code::UnknownError:
        return "UNKNOWN_ERROR";
    case Error::Code::NodeNotFound:
        return "NODE_NOT_FOUND";
    case Error::Code::MotherNotClause:
        return "MOTHER_NOT_CLAUSE";
    case Error::Code::MotherIdNotSmaller:
        return "MOTHER_ID_NOT_SMALLER";
    case Error::Code::ContainerMismatch:
        return "CONTAINER_MISMATCH";
    case Error::Code::SameNode:
        return "SAME_NODE";
    case Error::Code::Cycle:
        return "CYCLE";
    case Error::Code::DepthLimit:
        return "DEPTH_LIMIT";
    case Error::Code::RootifyDisabled:
        return "ROOTIFY_DISABLED";
    case Error::Code::NoHistory:
        return "NO_HISTORY";
    case Error::Code::InvalidScope:
        return "INVALID_SCOPE";
    case Error::Code::MalformedInput:
        return "MALFORMED_INPUT";
    case Error::Code::NotFound:
        return "NOT_FOUND";
    }
    return "UNKNOWN_ERROR";
}

[[nodiscard]] inline auto errorSeverity(Error::Code code) -> ErrorSeverity {
    switch (code) {
    case Error::Code::NodeNotFound:
        return ErrorSeverity::NotFound;
    case Error::Code::MotherNotClause:
    case Error::Code::MotherIdNotSmaller:
    case Error::Code::ContainerMismatch:
    case Error::Code::SameNode:
    case Error::Code::Cycle:
    case Error::Code::DepthLimit:
    case Error::Code::RootifyDisabled:
        return ErrorSeverity::Rejected;
    case Error::Code::NoHistory:
        return ErrorSeverity::NoHistory;
    case Error::Code::InvalidError:
    case Error::Code::UnknownError:
    case Error::Code::InvalidScope:
    case Error::Code::MalformedInput:
    case Error::Code::NotFound:
        return ErrorSeverity::Internal;
    }
    return ErrorSeverity::Internal;
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    if (error.message && !error.message->empty()) {
        std::string description;
        description.reserve(label.size() + 1 + error.message->size());
        description.append(label.data(), label.size());
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
        return description;
    }
    return std::string{label};
}

} // namespace MT
