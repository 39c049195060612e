#pragma once

#include <string>
#include <map>
#include <unordered_map>
#include <stdexcept>
#include <utility>

namespace livebar {
namespace common {

template<typename EnumType>
struct ErrorInfo {
    EnumType code;
    const char* code_str;
    const char* default_message;
};

struct ErrorContext {
    std::string component;
    std::map<std::string, std::string> details;
};

template<typename EnumType>
class ErrorRegistry {
public:
    static const ErrorInfo<EnumType>& getInfo(EnumType code) {
        const auto& map = getInfoMap();
        auto it = map.find(code);
        if (it != map.end()) {
            return it->second;
        }
        static ErrorInfo<EnumType> fallback{code, "UNKNOWN_ERROR", "Unknown error"};
        return fallback;
    }

    static const char* toString(EnumType code) {
        return getInfo(code).code_str;
    }

    static const char* getMessage(EnumType code) {
        return getInfo(code).default_message;
    }

protected:
    static const std::unordered_map<EnumType, ErrorInfo<EnumType>>& getInfoMap();
};

inline std::string formatContext(const ErrorContext& ctx) {
    std::string result;
    for (const auto& [key, value] : ctx.details) {
        if (!result.empty()) {
            result += " | ";
        }
        result += key + "=" + value;
    }
    return result;
}

// Exception carrying a registered error code plus the context it was raised in.
template<typename EnumType>
class CodedError : public std::runtime_error {
public:
    CodedError(EnumType code, ErrorContext context)
        : std::runtime_error(buildMessage(code, context)),
          code_(code),
          context_(std::move(context)) {}

    EnumType code() const noexcept { return code_; }
    const char* codeString() const noexcept { return ErrorRegistry<EnumType>::toString(code_); }
    const ErrorContext& context() const noexcept { return context_; }

private:
    EnumType code_;
    ErrorContext context_;

    static std::string buildMessage(EnumType code, const ErrorContext& context) {
        std::string message = ErrorRegistry<EnumType>::getMessage(code);
        std::string details = formatContext(context);
        if (!details.empty()) {
            message += " (" + details + ")";
        }
        return message;
    }
};

}}
