/**
 * vidyeet - HTTP transport capability and its libcurl implementation.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace vidyeet
{
    class CancellationToken;
}

namespace vidyeet::http
{

    enum class Method : std::uint8_t
    {
        Get,
        Post,
        Put,
        Delete
    };

    std::string_view to_string(Method method) noexcept;

    enum class TransportError : std::uint8_t
    {
        None,
        Timeout,
        Connection,
        Aborted,
        Other
    };

    struct Request
    {
        Method method{Method::Get};
        std::string url;
        std::map<std::string, std::string> headers;
        std::string body;
    };

    struct Response
    {
        int status_code{0};
        std::string body;
        std::map<std::string, std::string> headers;
        TransportError error{TransportError::None};
        std::string error_message;

        bool success() const noexcept
        {
            return error == TransportError::None && status_code >= 200 && status_code < 300;
        }
    };

    class Transport
    {
    public:
        virtual ~Transport() = default;

        // Never throws for HTTP-level failures; those are reported through the response.
        virtual Response perform(const Request &request, const CancellationToken *cancel) = 0;
    };

    class CurlTransport : public Transport
    {
    public:
        explicit CurlTransport(std::chrono::seconds timeout = std::chrono::seconds(300));
        ~CurlTransport() override;

        CurlTransport(const CurlTransport &) = delete;
        CurlTransport &operator=(const CurlTransport &) = delete;

        CurlTransport(CurlTransport &&) noexcept;
        CurlTransport &operator=(CurlTransport &&) noexcept;

        Response perform(const Request &request, const CancellationToken *cancel) override;

    private:
        class impl;
        std::unique_ptr<impl> pimpl_;
    };

} // namespace vidyeet::http
