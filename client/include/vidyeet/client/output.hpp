#pragma once

#include <iosfwd>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "vidyeet/error_codes.hpp"
#include "vidyeet/protocol.hpp"
#include "vidyeet/settings.hpp"
#include "vidyeet/upload/orchestrator.hpp"
#include "vidyeet/upload/progress.hpp"

namespace vidyeet::client
{

    // Human-readable text goes to `err`; machine mode writes one JSON object per line to `out`.
    class Output
    {
    public:
        Output(bool machine, std::ostream &out, std::ostream &err);

        bool machine() const noexcept { return machine_; }

        void progress(const upload::ProgressEvent &event);

        void login(bool was_logged_in);
        void logout(bool was_logged_in);
        void status(bool authenticated, const std::optional<std::string> &masked_token_id);
        void asset_list(const protocol::AssetList &list, const StreamingSettings &streaming);
        void asset_detail(const protocol::Asset &asset, const StreamingSettings &streaming);
        void deleted(const std::string &asset_id);
        void delete_declined(const std::string &asset_id);
        void upload(const upload::UploadResult &result);
        void help();
        void version();
        void failure(const Error &error);

    private:
        void write_json(const nlohmann::json &json);

        bool machine_;
        std::ostream &out_;
        std::ostream &err_;
        bool waiting_announced_{false};
    };

    std::string help_text();

    // "12.34 MB" style size used in human output.
    std::string format_megabytes(std::uint64_t bytes);

} // namespace vidyeet::client
