#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace WC {

struct Error {
    enum class Code {
        InvalidError = 0,
        UnknownError,
        InvalidWidget,
        NotFocusable,
        InvalidArgument,
        MalformedInput,
        NotFound,
        HandlerFailed
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::InvalidError:
        return "invalid_error";
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::InvalidWidget:
        return "invalid_widget";
    case Error::Code::NotFocusable:
        return "not_focusable";
    case Error::Code::InvalidArgument:
        return "invalid_argument";
    case Error::Code::MalformedInput:
        return "malformed_input";
    case Error::Code::NotFound:
        return "not_found";
    case Error::Code::HandlerFailed:
        return "handler_failed";
    }
    return "unknown_error";
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

} // namespace WC
