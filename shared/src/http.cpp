#include "vidyeet/http.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <mutex>
#include <sstream>
#include <stdexcept>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include "vidyeet/cancellation.hpp"
#include "vidyeet/version.hpp"

namespace vidyeet::http
{

    namespace
    {

        std::string to_lower(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch)
                           { return static_cast<char>(std::tolower(ch)); });
            return value;
        }

        std::string trim(const std::string &input)
        {
            const auto begin = input.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
            {
                return "";
            }
            const auto end = input.find_last_not_of(" \t\r\n");
            return input.substr(begin, end - begin + 1);
        }

        std::string strip_query(const std::string &url)
        {
            return url.substr(0, url.find('?'));
        }

        void ensure_curl_global_init()
        {
            static std::once_flag flag;
            std::call_once(flag, []()
                           {
                               if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
                               {
                                   throw std::runtime_error("curl_global_init failed");
                               } });
        }

        struct UploadCursor
        {
            const std::string *body{};
            std::size_t offset{};
        };

        std::size_t write_callback(char *ptr, std::size_t size, std::size_t nmemb, void *userdata)
        {
            auto *target = static_cast<std::string *>(userdata);
            target->append(ptr, size * nmemb);
            return size * nmemb;
        }

        std::size_t header_callback(char *ptr, std::size_t size, std::size_t nmemb, void *userdata)
        {
            auto *target = static_cast<std::string *>(userdata);
            target->append(ptr, size * nmemb);
            return size * nmemb;
        }

        std::size_t read_callback(char *buffer, std::size_t size, std::size_t nitems, void *userdata)
        {
            auto *cursor = static_cast<UploadCursor *>(userdata);
            const auto remaining = cursor->body->size() - cursor->offset;
            const auto count = std::min(remaining, size * nitems);
            std::memcpy(buffer, cursor->body->data() + cursor->offset, count);
            cursor->offset += count;
            return count;
        }

        struct AbortWatch
        {
            const CancellationToken *cancel;
        };

        int progress_callback(void *userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t)
        {
            const auto *watch = static_cast<AbortWatch *>(userdata);
            return watch->cancel != nullptr && watch->cancel->cancelled() ? 1 : 0;
        }

        TransportError classify_curl_error(CURLcode code) noexcept
        {
            switch (code)
            {
            case CURLE_OPERATION_TIMEDOUT:
                return TransportError::Timeout;
            case CURLE_COULDNT_RESOLVE_HOST:
            case CURLE_COULDNT_RESOLVE_PROXY:
            case CURLE_COULDNT_CONNECT:
            case CURLE_SEND_ERROR:
            case CURLE_RECV_ERROR:
            case CURLE_GOT_NOTHING:
            case CURLE_PARTIAL_FILE:
            case CURLE_SSL_CONNECT_ERROR:
                return TransportError::Connection;
            case CURLE_ABORTED_BY_CALLBACK:
                return TransportError::Aborted;
            default:
                return TransportError::Other;
            }
        }

        void parse_response_headers(const std::string &raw, Response &response)
        {
            std::istringstream stream(raw);
            std::string line;
            while (std::getline(stream, line))
            {
                const auto colon_pos = line.find(':');
                if (colon_pos == std::string::npos)
                {
                    // Status lines of intermediate responses (100 Continue, redirects) reset the set.
                    if (line.rfind("HTTP/", 0) == 0)
                    {
                        response.headers.clear();
                    }
                    continue;
                }
                response.headers[to_lower(trim(line.substr(0, colon_pos)))] = trim(line.substr(colon_pos + 1));
            }
        }

    } // namespace

    std::string_view to_string(Method method) noexcept
    {
        switch (method)
        {
        case Method::Get:
            return "GET";
        case Method::Post:
            return "POST";
        case Method::Put:
            return "PUT";
        case Method::Delete:
            return "DELETE";
        }
        return "GET";
    }

    class CurlTransport::impl
    {
    public:
        explicit impl(std::chrono::seconds timeout) : timeout(timeout)
        {
            ensure_curl_global_init();
            handle = curl_easy_init();
            if (!handle)
            {
                throw std::runtime_error("Failed to initialize curl handle");
            }
        }

        ~impl()
        {
            if (handle)
            {
                curl_easy_cleanup(handle);
            }
        }

        impl(const impl &) = delete;
        impl &operator=(const impl &) = delete;

        CURL *handle{};
        std::chrono::seconds timeout;
        std::string user_agent{std::string("vidyeet/") + std::string(version())};
    };

    CurlTransport::CurlTransport(std::chrono::seconds timeout) : pimpl_(std::make_unique<impl>(timeout)) {}

    CurlTransport::~CurlTransport() = default;

    CurlTransport::CurlTransport(CurlTransport &&) noexcept = default;
    CurlTransport &CurlTransport::operator=(CurlTransport &&) noexcept = default;

    Response CurlTransport::perform(const Request &request, const CancellationToken *cancel)
    {
        Response response;
        std::string body;
        std::string raw_headers;
        UploadCursor cursor{&request.body, 0};
        AbortWatch watch{cancel};

        CURL *curl = pimpl_->handle;
        curl_easy_reset(curl);

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_USERAGENT, pimpl_->user_agent.c_str());
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(pimpl_->timeout.count()));
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 30L);
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &raw_headers);
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &watch);

        switch (request.method)
        {
        case Method::Get:
            curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
            break;
        case Method::Post:
            curl_easy_setopt(curl, CURLOPT_POST, 1L);
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
            break;
        case Method::Put:
            curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
            curl_easy_setopt(curl, CURLOPT_READFUNCTION, read_callback);
            curl_easy_setopt(curl, CURLOPT_READDATA, &cursor);
            curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
            break;
        case Method::Delete:
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
            break;
        }

        struct curl_slist *header_list = nullptr;
        for (const auto &[name, value] : request.headers)
        {
            const std::string header_line = name + ": " + value;
            header_list = curl_slist_append(header_list, header_line.c_str());
        }
        // Chunk bodies are sent straight away instead of waiting on 100-continue.
        header_list = curl_slist_append(header_list, "Expect:");
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);

        spdlog::debug("HTTP {} {} ({} body bytes)", to_string(request.method), strip_query(request.url),
                      request.body.size());
        const CURLcode result = curl_easy_perform(curl);

        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, nullptr);
        curl_slist_free_all(header_list);

        if (result != CURLE_OK)
        {
            response.error = classify_curl_error(result);
            response.error_message = curl_easy_strerror(result);
            spdlog::debug("HTTP {} failed: {}", to_string(request.method), response.error_message);
            return response;
        }

        long status_code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status_code);
        response.status_code = static_cast<int>(status_code);
        parse_response_headers(raw_headers, response);
        response.body = std::move(body);
        spdlog::debug("HTTP {} -> {}", to_string(request.method), response.status_code);
        return response;
    }

} // namespace vidyeet::http
