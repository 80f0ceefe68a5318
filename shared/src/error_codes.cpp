#include "vidyeet/error_codes.hpp"

#include <array>

namespace vidyeet
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 21> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::FileNotFound, "file_not_found"},
            {ErrorCode::NotAFile, "not_a_file"},
            {ErrorCode::FileTooLarge, "file_too_large"},
            {ErrorCode::UnsupportedFormat, "unsupported_format"},
            {ErrorCode::FileIo, "file_io"},
            {ErrorCode::InvalidConfiguration, "invalid_configuration"},
            {ErrorCode::CredentialsMissing, "credentials_missing"},
            {ErrorCode::AuthenticationFailed, "authentication_failed"},
            {ErrorCode::NetworkFailure, "network_failure"},
            {ErrorCode::RequestTimeout, "request_timeout"},
            {ErrorCode::RateLimited, "rate_limited"},
            {ErrorCode::ServerError, "server_error"},
            {ErrorCode::ClientError, "client_error"},
            {ErrorCode::QuotaExceeded, "quota_exceeded"},
            {ErrorCode::InvalidResponse, "invalid_response"},
            {ErrorCode::RetriesExhausted, "retries_exhausted"},
            {ErrorCode::AssetErrored, "asset_errored"},
            {ErrorCode::AssetTimedOut, "asset_timed_out"},
            {ErrorCode::Cancelled, "cancelled"},
            {ErrorCode::InternalError, "internal_error"},
        }};

        std::string compose_message(const std::string &step, const std::string &detail)
        {
            if (step.empty())
            {
                return detail;
            }
            return step + ": " + detail;
        }
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    std::string_view to_string(ErrorCategory category) noexcept
    {
        switch (category)
        {
        case ErrorCategory::Input:
            return "input";
        case ErrorCategory::Configuration:
            return "configuration";
        case ErrorCategory::TransientTransport:
            return "transient_transport";
        case ErrorCategory::TerminalTransport:
            return "terminal_transport";
        case ErrorCategory::Timeout:
            return "timeout";
        case ErrorCategory::Cancelled:
            return "cancelled";
        case ErrorCategory::Internal:
            return "internal";
        }
        return "unknown";
    }

    ErrorCategory category_of(ErrorCode code) noexcept
    {
        switch (code)
        {
        case ErrorCode::FileNotFound:
        case ErrorCode::NotAFile:
        case ErrorCode::FileTooLarge:
        case ErrorCode::UnsupportedFormat:
            return ErrorCategory::Input;
        case ErrorCode::InvalidConfiguration:
        case ErrorCode::CredentialsMissing:
        case ErrorCode::AuthenticationFailed:
            return ErrorCategory::Configuration;
        case ErrorCode::NetworkFailure:
        case ErrorCode::RequestTimeout:
        case ErrorCode::RateLimited:
        case ErrorCode::ServerError:
            return ErrorCategory::TransientTransport;
        case ErrorCode::ClientError:
        case ErrorCode::QuotaExceeded:
        case ErrorCode::InvalidResponse:
        case ErrorCode::RetriesExhausted:
        case ErrorCode::AssetErrored:
        case ErrorCode::FileIo:
            return ErrorCategory::TerminalTransport;
        case ErrorCode::AssetTimedOut:
            return ErrorCategory::Timeout;
        case ErrorCode::Cancelled:
            return ErrorCategory::Cancelled;
        case ErrorCode::Ok:
        case ErrorCode::InternalError:
            return ErrorCategory::Internal;
        }
        return ErrorCategory::Internal;
    }

    int exit_code(ErrorCategory category) noexcept
    {
        switch (category)
        {
        case ErrorCategory::Input:
            return 1;
        case ErrorCategory::Configuration:
            return 2;
        case ErrorCategory::Timeout:
            return 4;
        case ErrorCategory::Cancelled:
            return 130;
        case ErrorCategory::TransientTransport:
        case ErrorCategory::TerminalTransport:
        case ErrorCategory::Internal:
            return 3;
        }
        return 3;
    }

    std::optional<std::string_view> remediation_hint(ErrorCode code) noexcept
    {
        switch (code)
        {
        case ErrorCode::FileNotFound:
            return "Check the file path and make sure the file exists.";
        case ErrorCode::NotAFile:
            return "Specify a file, not a directory.";
        case ErrorCode::FileTooLarge:
            return "Compress the video or upload a smaller file.";
        case ErrorCode::UnsupportedFormat:
            return "Supported formats: mp4, mov, avi, wmv, flv, mkv, webm.";
        case ErrorCode::CredentialsMissing:
            return "Run 'vidyeet login' to store your access token.";
        case ErrorCode::AuthenticationFailed:
            return "The access token was rejected. Run 'vidyeet login' with a valid token.";
        case ErrorCode::InvalidConfiguration:
            return "Review the command options and the config file.";
        case ErrorCode::QuotaExceeded:
            return "Delete old assets or upgrade your plan.";
        case ErrorCode::RetriesExhausted:
        case ErrorCode::NetworkFailure:
        case ErrorCode::RequestTimeout:
            return "Check your network connection and try again.";
        case ErrorCode::AssetTimedOut:
            return "The asset may still become ready; check it later with 'vidyeet list'.";
        default:
            return std::nullopt;
        }
    }

    ErrorCode classify_http_status(int status_code) noexcept
    {
        if (status_code <= 0)
        {
            return ErrorCode::NetworkFailure;
        }
        if (status_code >= 200 && status_code < 300)
        {
            return ErrorCode::Ok;
        }
        if (status_code == 401 || status_code == 403)
        {
            return ErrorCode::AuthenticationFailed;
        }
        if (status_code == 408)
        {
            return ErrorCode::RequestTimeout;
        }
        if (status_code == 429)
        {
            return ErrorCode::RateLimited;
        }
        if (status_code >= 500)
        {
            return ErrorCode::ServerError;
        }
        return ErrorCode::ClientError;
    }

    Error::Error(ErrorCode code, const std::string &message, std::string step)
        : std::runtime_error(compose_message(step, message)),
          code_(code),
          step_(std::move(step)),
          detail_(message) {}

    Error Error::with_step(const std::string &step) const
    {
        return Error(code_, detail_, step);
    }

} // namespace vidyeet
