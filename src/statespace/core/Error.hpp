#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace STS {

struct Error {
    enum class Code {
        InvalidError = 0,
        UnknownError,
        InvalidPath,
        NotFound,
        MalformedInput,
        SchemaValidation,
        EmptyHistory,
        AssetFetch,
        DeliveryFailed,
        IoFailure,
        NotSupported
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
    case Error::Code::InvalidPath:
        return "invalid_path";
    case Error::Code::NotFound:
        return "not_found";
    case Error::Code::MalformedInput:
        return "malformed_input";
    case Error::Code::SchemaValidation:
        return "schema_validation";
    case Error::Code::EmptyHistory:
        return "empty_history";
    case Error::Code::AssetFetch:
        return "asset_fetch";
    case Error::Code::DeliveryFailed:
        return "delivery_failed";
    case Error::Code::IoFailure:
        return "io_failure";
    case Error::Code::NotSupported:
        return "not_supported";
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

// The human readable part of an error, as returned to HTTP clients.
[[nodiscard]] inline auto errorMessage(Error const& error) -> std::string {
    if (error.message && !error.message->empty())
        return *error.message;
    return std::string{errorCodeToString(error.code)};
}

} // namespace STS
