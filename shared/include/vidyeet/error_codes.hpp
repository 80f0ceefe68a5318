/**
 * vidyeet - Error codes, categories and the exception type shared by every layer.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace vidyeet
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        FileNotFound = 1,
        NotAFile = 2,
        FileTooLarge = 3,
        UnsupportedFormat = 4,
        FileIo = 5,
        InvalidConfiguration = 6,
        CredentialsMissing = 7,
        AuthenticationFailed = 8,
        NetworkFailure = 9,
        RequestTimeout = 10,
        RateLimited = 11,
        ServerError = 12,
        ClientError = 13,
        QuotaExceeded = 14,
        InvalidResponse = 15,
        RetriesExhausted = 16,
        AssetErrored = 17,
        AssetTimedOut = 18,
        Cancelled = 19,
        InternalError = 20
    };

    enum class ErrorCategory : std::uint8_t
    {
        Input,
        Configuration,
        TransientTransport,
        TerminalTransport,
        Timeout,
        Cancelled,
        Internal
    };

    std::string_view to_string(ErrorCode code) noexcept;

    std::string_view to_string(ErrorCategory category) noexcept;

    ErrorCategory category_of(ErrorCode code) noexcept;

    // Only transient transport failures are worth another attempt.
    inline bool is_retryable(ErrorCode code) noexcept
    {
        return category_of(code) == ErrorCategory::TransientTransport;
    }

    int exit_code(ErrorCategory category) noexcept;

    std::optional<std::string_view> remediation_hint(ErrorCode code) noexcept;

    // Maps an HTTP status to the code it should surface as. Status 0 means no response arrived.
    ErrorCode classify_http_status(int status_code) noexcept;

    class Error : public std::runtime_error
    {
    public:
        Error(ErrorCode code, const std::string &message, std::string step = {});

        ErrorCode code() const noexcept { return code_; }
        ErrorCategory category() const noexcept { return category_of(code_); }
        const std::string &step() const noexcept { return step_; }
        const std::string &detail() const noexcept { return detail_; }

        Error with_step(const std::string &step) const;

    private:
        ErrorCode code_;
        std::string step_;
        std::string detail_;
    };

} // namespace vidyeet
