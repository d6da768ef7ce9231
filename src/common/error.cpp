// =============================================================================
// zcodec - Error Handling Framework Implementation
// =============================================================================

#include "zcodec/common/error.h"

#include <format>

namespace zcodec {

namespace {

template <typename E>
[[noreturn]] void raise(const std::string& message, std::optional<ErrorContext>& context) {
    if (context.has_value()) {
        throw E(message, std::move(*context));
    }
    throw E(message);
}

}  // namespace

std::string_view errorCodeName(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kUsageError:
            return "usage error";
        case ErrorCode::kStorageError:
            return "storage error";
        case ErrorCode::kDecodeError:
            return "decode error";
        case ErrorCode::kEncodeError:
            return "encode error";
        case ErrorCode::kInvalidByteRange:
            return "invalid byte range";
        case ErrorCode::kUnsupportedCodec:
            return "unsupported codec";
        case ErrorCode::kInvalidConfig:
            return "invalid configuration";
    }
    return "unknown error";
}

// =============================================================================
// ErrorContext
// =============================================================================

void ErrorContext::fillFrom(const ErrorContext& outer) {
    if (storeKey.empty()) {
        storeKey = outer.storeKey;
    }
    if (codecName.empty()) {
        codecName = outer.codecName;
    }
    if (!requestIndex.has_value()) {
        requestIndex = outer.requestIndex;
    }
    if (!byteOffset.has_value()) {
        byteOffset = outer.byteOffset;
    }
}

std::string ErrorContext::format() const {
    std::string out;
    auto field = [&out](std::string_view label, const auto& value) {
        out += out.empty() ? "" : ", ";
        out += std::format("{}: {}", label, value);
    };

    if (!storeKey.empty()) {
        field("key", storeKey);
    }
    if (!codecName.empty()) {
        field("codec", codecName);
    }
    if (requestIndex.has_value()) {
        field("request", *requestIndex);
    }
    if (byteOffset.has_value()) {
        field("offset", *byteOffset);
    }
#ifndef NDEBUG
    if (!out.empty()) {
        out += std::format(" (at {}:{})", location.file_name(), location.line());
    }
#endif
    return out;
}

// =============================================================================
// Exceptions
// =============================================================================

void ZcodecException::formatWhat() {
    what_ = std::format("[{}] {}", errorCodeName(code_), message_);
    if (context_.has_value()) {
        const std::string where = context_->format();
        if (!where.empty()) {
            what_ += std::format(" ({})", where);
        }
    }
}

std::string StorageError::withSystemError(const std::string& message, std::error_code ec) {
    return std::format("{}: {} (errno {})", message, ec.message(), ec.value());
}

[[noreturn]] void Error::throwException(std::optional<ErrorContext> context) const {
    switch (code_) {
        case ErrorCode::kUsageError:
            raise<UsageError>(message_, context);
        case ErrorCode::kStorageError:
            raise<StorageError>(message_, context);
        case ErrorCode::kDecodeError:
            raise<DecodeError>(message_, context);
        case ErrorCode::kEncodeError:
            raise<EncodeError>(message_, context);
        case ErrorCode::kInvalidByteRange:
            raise<InvalidByteRangeError>(message_, context);
        case ErrorCode::kUnsupportedCodec:
            raise<UnsupportedCodecError>(message_, context);
        case ErrorCode::kInvalidConfig:
            raise<ConfigError>(message_, context);
        case ErrorCode::kSuccess:
            break;
    }
    if (context.has_value()) {
        throw ZcodecException(code_, message_, std::move(*context));
    }
    throw ZcodecException(code_, message_);
}

[[noreturn]] void rethrowWithContext(const ZcodecException& ex, const ErrorContext& outer) {
    ErrorContext merged = ex.context().value_or(outer);
    merged.fillFrom(outer);
    if (const auto* storage = dynamic_cast<const StorageError*>(&ex); storage != nullptr) {
        throw storage->withContext(std::move(merged));
    }
    Error{ex}.throwException(std::move(merged));
}

}  // namespace zcodec
