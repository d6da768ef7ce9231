// =============================================================================
// zcodec - Error Handling Framework
// =============================================================================
// Every failure raised by the storage and codec layers is a ZcodecException
// carrying an ErrorCode. The codes double as process exit codes for the CLI:
//
//   0 success            4 encode error
//   1 usage error        5 invalid byte range
//   2 storage error      6 unsupported codec
//   3 decode error       7 invalid configuration
//
// As the error crosses layers it picks up an ErrorContext (store key, codec
// stage, request index); the innermost layer's fields win.
//
// Validation helpers return Result/VoidResult (std::expected) and callers
// turn them into exceptions with unwrapOrThrow().
//
// Absence of a stored value is never an error: it is reported as
// std::nullopt by every layer.
// =============================================================================

#ifndef ZCODEC_COMMON_ERROR_H
#define ZCODEC_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace zcodec {

/// @brief Failure category; the numeric value is the CLI exit code.
enum class ErrorCode : std::uint8_t {
    kSuccess = 0,
    /// @brief Bad arguments, malformed keys or paths, out-of-grid indices.
    kUsageError = 1,
    /// @brief The backing store could not be reached or written.
    kStorageError = 2,
    /// @brief Malformed header, inconsistent lengths, corrupt block table
    ///        or a block that fails to decompress.
    kDecodeError = 3,
    kEncodeError = 4,
    /// @brief A requested range resolves outside the value. Never clamped.
    kInvalidByteRange = 5,
    kUnsupportedCodec = 6,
    /// @brief Codec parameters or stage ordering are invalid.
    kInvalidConfig = 7
};

/// @brief Short lowercase name used as the what() prefix.
[[nodiscard]] std::string_view errorCodeName(ErrorCode code) noexcept;

// =============================================================================
// ErrorContext
// =============================================================================

/// @brief Where in the store/codec stack an error was raised.
struct ErrorContext {
    std::string storeKey;
    /// @brief Codec stage name, e.g. "blosc".
    std::string codecName;
    /// @brief Position of the failing range in a partial decode request.
    std::optional<std::size_t> requestIndex;
    std::optional<std::uint64_t> byteOffset;
    std::source_location location;

    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    explicit ErrorContext(std::string key,
                          std::source_location loc = std::source_location::current())
        : storeKey(std::move(key)), location(loc) {}

    ErrorContext& withKey(std::string key) {
        storeKey = std::move(key);
        return *this;
    }

    ErrorContext& withCodec(std::string name) {
        codecName = std::move(name);
        return *this;
    }

    ErrorContext& withRequest(std::size_t index) {
        requestIndex = index;
        return *this;
    }

    ErrorContext& withOffset(std::uint64_t offset) {
        byteOffset = offset;
        return *this;
    }

    /// @brief Fill fields that are still unset from an outer layer's context.
    void fillFrom(const ErrorContext& outer);

    /// @brief "key: a/c/0, codec: blosc, request: 1"; empty when nothing is set.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Exceptions
// =============================================================================

/// @brief Base of every exception raised by zcodec.
class ZcodecException : public std::exception {
public:
    ZcodecException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    ZcodecException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    /// @brief "[decode error] message (key: ..., codec: ...)".
    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] int exitCode() const noexcept { return static_cast<int>(code_); }

    /// @brief Message without the code prefix or context.
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }
    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

protected:
    void resetContext(ErrorContext context) {
        context_ = std::move(context);
        formatWhat();
    }

private:
    void formatWhat();

    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
    std::string what_;
};

/// @brief Exception type bound to one error code, so callers can catch a
///        single category.
template <ErrorCode Code>
class CodedError : public ZcodecException {
public:
    static constexpr ErrorCode kCode = Code;

    explicit CodedError(std::string message) : ZcodecException(Code, std::move(message)) {}

    CodedError(std::string message, ErrorContext context)
        : ZcodecException(Code, std::move(message), std::move(context)) {}
};

using UsageError = CodedError<ErrorCode::kUsageError>;
/// @brief Raised on invalid encoded values; the call yields no partial results.
using DecodeError = CodedError<ErrorCode::kDecodeError>;
using EncodeError = CodedError<ErrorCode::kEncodeError>;
using InvalidByteRangeError = CodedError<ErrorCode::kInvalidByteRange>;
using UnsupportedCodecError = CodedError<ErrorCode::kUnsupportedCodec>;
using ConfigError = CodedError<ErrorCode::kInvalidConfig>;

/// @brief Failure reaching the backing store, optionally with the OS error.
/// @note Never retried by the codec layer; retry policy belongs to the store.
class StorageError : public CodedError<ErrorCode::kStorageError> {
public:
    using CodedError::CodedError;

    StorageError(const std::string& message, std::error_code ec)
        : CodedError(withSystemError(message, ec)), systemError_(ec) {}

    StorageError(const std::string& message, std::error_code ec, ErrorContext context)
        : CodedError(withSystemError(message, ec), std::move(context)), systemError_(ec) {}

    [[nodiscard]] const std::optional<std::error_code>& systemError() const noexcept {
        return systemError_;
    }

    /// @brief Copy with the context replaced; message and OS error are kept.
    [[nodiscard]] StorageError withContext(ErrorContext context) const {
        StorageError copy(*this);
        copy.resetContext(std::move(context));
        return copy;
    }

private:
    static std::string withSystemError(const std::string& message, std::error_code ec);

    std::optional<std::error_code> systemError_;
};

// =============================================================================
// Result
// =============================================================================

/// @brief Error half of a Result: a code and a message, no context.
class Error {
public:
    Error(ErrorCode code, std::string message) : code_(code), message_(std::move(message)) {}

    explicit Error(const ZcodecException& ex) : code_(ex.code()), message_(ex.message()) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief Throw the exception class registered for code().
    [[noreturn]] void throwException(std::optional<ErrorContext> context = std::nullopt) const;

private:
    ErrorCode code_;
    std::string message_;
};

template <typename T, typename E = Error>
using Result = std::expected<T, E>;

using VoidResult = Result<std::monostate>;

template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

[[nodiscard]] inline VoidResult makeVoidSuccess() {
    return VoidResult{std::monostate{}};
}

[[nodiscard]] inline VoidResult makeVoidError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (!result.has_value()) {
        result.error().throwException();
    }
    return std::move(*result);
}

inline void unwrapOrThrow(const VoidResult& result) {
    if (!result.has_value()) {
        result.error().throwException();
    }
}

/// @brief Rethrow with the outer layer's context merged in, keeping the
///        exception class. Fields set by inner layers take priority.
[[noreturn]] void rethrowWithContext(const ZcodecException& ex, const ErrorContext& outer);

/// @brief Run func and capture a ZcodecException as an Error.
/// @note Exceptions not derived from ZcodecException propagate unchanged.
template <typename F>
[[nodiscard]] auto tryExecute(F&& func) -> Result<std::conditional_t<
    std::is_void_v<decltype(func())>, std::monostate, decltype(func())>> {
    try {
        if constexpr (std::is_void_v<decltype(func())>) {
            func();
            return std::monostate{};
        } else {
            return func();
        }
    } catch (const ZcodecException& ex) {
        return std::unexpected(Error{ex});
    }
}

}  // namespace zcodec

#endif  // ZCODEC_COMMON_ERROR_H
