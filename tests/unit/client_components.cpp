#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "fake_transport.hpp"
#include "vidyeet/cancellation.hpp"
#include "vidyeet/client/commands.hpp"
#include "vidyeet/client/config.hpp"
#include "vidyeet/client/credential_store.hpp"
#include "vidyeet/client/output.hpp"
#include "vidyeet/error_codes.hpp"

using namespace vidyeet;
using namespace vidyeet::client;
using vidyeet::testing::FakeTransport;
using vidyeet::testing::FakeVideoService;
using vidyeet::testing::TempDir;
using vidyeet::testing::fast_settings;
using vidyeet::testing::json_response;
using vidyeet::testing::status_response;

namespace
{

    // Owns argv storage for parse_arguments.
    class Args
    {
    public:
        Args(std::initializer_list<std::string> args) : storage_(args)
        {
            storage_.insert(storage_.begin(), "vidyeet");
            for (auto &arg : storage_)
            {
                pointers_.push_back(arg.data());
            }
        }

        int argc() const { return static_cast<int>(pointers_.size()); }
        char **argv() { return pointers_.data(); }

    private:
        std::vector<std::string> storage_;
        std::vector<char *> pointers_;
    };

    ClientConfig parse(std::initializer_list<std::string> args)
    {
        Args holder(args);
        return parse_arguments(holder.argc(), holder.argv());
    }

    void expect_usage_error(std::initializer_list<std::string> args)
    {
        try
        {
            parse(args);
            assert(false && "expected a usage error");
        }
        catch (const Error &ex)
        {
            assert(ex.code() == ErrorCode::InvalidConfiguration);
        }
    }

    std::vector<nlohmann::json> json_lines(const std::string &text)
    {
        std::vector<nlohmann::json> lines;
        std::istringstream stream(text);
        std::string line;
        while (std::getline(stream, line))
        {
            if (!line.empty())
            {
                lines.push_back(nlohmann::json::parse(line));
            }
        }
        return lines;
    }

    // Bundles the pieces a command needs so each test only sets what it cares about.
    struct CommandHarness
    {
        explicit CommandHarness(ClientConfig cfg, bool machine = true)
            : config(std::move(cfg)),
              store(dir.path() / "config" / "config.json"),
              output(machine, out, err),
              transport(std::ref(service))
        {
        }

        void run(bool interactive = false)
        {
            CommandContext context{
                .config = config,
                .settings = fast_settings(),
                .store = store,
                .transport = transport,
                .output = output,
                .cancel = cancel,
                .input = input,
                .interactive = interactive,
            };
            run_command(context);
        }

        void store_credentials()
        {
            store.save(UserConfig{.token_id = "token-id-1234", .token_secret = "token-secret"});
        }

        TempDir dir;
        ClientConfig config;
        CredentialStore store;
        std::ostringstream out;
        std::ostringstream err;
        std::istringstream input;
        Output output;
        FakeVideoService service;
        FakeTransport transport;
        CancellationToken cancel;
    };

    void test_credential_store_round_trip()
    {
        TempDir dir;
        CredentialStore store(dir.path() / "nested" / "config.json");
        assert(!store.lookup());
        assert(!store.load().default_title);

        store.save(UserConfig{.token_id = "id-1", .token_secret = "secret-1", .default_title = "Holiday"});
        const auto credentials = store.lookup();
        assert(credentials);
        assert(credentials->token_id == "id-1");
        assert(credentials->token_secret == "secret-1");
        assert(store.load().default_title == std::optional<std::string>("Holiday"));

        const auto perms = std::filesystem::status(store.path()).permissions();
        assert((perms & std::filesystem::perms::group_all) == std::filesystem::perms::none);
        assert((perms & std::filesystem::perms::others_all) == std::filesystem::perms::none);

        assert(store.clear_credentials());
        assert(!store.lookup());
        assert(store.load().default_title == std::optional<std::string>("Holiday"));
        assert(!store.clear_credentials());
    }

    void test_credential_store_default_path()
    {
        TempDir dir;
        const auto previous = std::getenv("VIDYEET_CONFIG_DIR");
        const std::string saved = previous ? previous : "";
        ::setenv("VIDYEET_CONFIG_DIR", dir.path().c_str(), 1);
        assert(CredentialStore::default_config_path() == dir.path() / "config.json");
        CredentialStore store;
        assert(store.path() == dir.path() / "config.json");
        if (previous)
        {
            ::setenv("VIDYEET_CONFIG_DIR", saved.c_str(), 1);
        }
        else
        {
            ::unsetenv("VIDYEET_CONFIG_DIR");
        }
    }

    void test_credential_store_rejects_malformed_file()
    {
        TempDir dir;
        const auto path = dir.path() / "config.json";
        {
            std::ofstream out(path);
            out << "{ not json";
        }
        CredentialStore store(path);
        try
        {
            store.load();
            assert(false && "malformed config should fail");
        }
        catch (const Error &ex)
        {
            assert(ex.code() == ErrorCode::InvalidConfiguration);
        }

        {
            std::ofstream out(path, std::ios::trunc);
            out << R"({"token_id": "id-only"})";
        }
        assert(!store.lookup());
    }

    void test_parse_commands()
    {
        assert(parse({}).command == Command::Help);
        assert(parse({"--version"}).command == Command::Version);

        const auto upload = parse({"--machine", "upload", "clip.mp4", "--progress", "--chunk-size", "8", "--title",
                                   "My clip", "--timeout", "600", "--no-reclaim", "--progress-interval", "2"});
        assert(upload.command == Command::Upload);
        assert(upload.machine_output);
        assert(upload.positional == std::vector<std::string>{"clip.mp4"});
        assert(upload.show_progress);
        assert(upload.chunk_size_mib == std::optional<std::uint64_t>(8));
        assert(upload.title == std::optional<std::string>("My clip"));
        assert(upload.timeout_seconds == std::optional<std::uint32_t>(600));
        assert(upload.no_reclaim);
        assert(upload.progress_interval_seconds == std::optional<std::uint32_t>(2));

        const auto remove = parse({"delete", "asset-1", "--force", "-v", "--log", "/tmp/vidyeet.log"});
        assert(remove.command == Command::Delete);
        assert(remove.force);
        assert(remove.verbose);
        assert(remove.log_path == std::optional<std::filesystem::path>("/tmp/vidyeet.log"));

        assert(parse({"login", "--stdin"}).credentials_from_stdin);
    }

    void test_parse_rejects_bad_usage()
    {
        expect_usage_error({"frobnicate"});
        expect_usage_error({"upload"});
        expect_usage_error({"show", "a", "b"});
        expect_usage_error({"list", "--force"});
        expect_usage_error({"upload", "clip.mp4", "--chunk-size"});
        expect_usage_error({"upload", "clip.mp4", "--chunk-size", "eight"});
        expect_usage_error({"upload", "clip.mp4", "--timeout", "-5"});
        expect_usage_error({"--stdin", "login"});

        Args args{"upload", "--machine", "--bogus"};
        assert(wants_machine_output(args.argc(), args.argv()));
    }

    void test_upload_overrides()
    {
        UploadSettings settings;
        const auto config = parse({"upload", "clip.mp4", "--chunk-size", "8", "--no-reclaim", "--timeout", "120"});
        apply_upload_overrides(config, std::string("Stored title"), settings);
        assert(settings.chunk_size == 8 * kMiB);
        assert(!settings.reclaim_on_quota);
        assert(settings.upload_timeout_seconds == 120);
        assert(settings.title == std::optional<std::string>("Stored title"));

        UploadSettings explicit_title;
        apply_upload_overrides(parse({"upload", "clip.mp4", "--title", "Given"}), std::string("Stored title"),
                               explicit_title);
        assert(explicit_title.title == std::optional<std::string>("Given"));
        assert(explicit_title.reclaim_on_quota);
    }

    void test_machine_failure_output()
    {
        std::ostringstream out;
        std::ostringstream err;
        Output output(true, out, err);
        output.failure(Error(ErrorCode::FileNotFound, "video.mp4 does not exist", "validate"));

        const auto lines = json_lines(out.str());
        assert(lines.size() == 1);
        const auto &json = lines.front();
        assert(json.at("success") == false);
        assert(json.at("exit_code") == 1);
        assert(json.at("error").at("category") == "input");
        assert(json.at("error").at("code") == "file_not_found");
        assert(json.at("error").at("step") == "validate");
        assert(json.at("error").at("hint").is_string());
        assert(err.str().empty());
    }

    void test_human_failure_output()
    {
        std::ostringstream out;
        std::ostringstream err;
        Output output(false, out, err);
        output.failure(Error(ErrorCode::CredentialsMissing, "not logged in"));
        assert(out.str().empty());
        assert(err.str().find("ERROR: ") == 0);
        assert(err.str().find("[credentials_missing]") != std::string::npos);
        assert(err.str().find("Hint: ") != std::string::npos);
    }

    void test_machine_progress_output()
    {
        std::ostringstream out;
        std::ostringstream err;
        Output output(true, out, err);
        output.progress(upload::ProgressEvent{.payload = upload::events::TargetCreated{.upload_id = "up-1"}});
        const auto lines = json_lines(out.str());
        assert(lines.size() == 1);
        assert(lines.front().at("progress").at("phase") == "target_created");
        assert(lines.front().at("progress").at("upload_id") == "up-1");
    }

    void test_format_megabytes()
    {
        assert(format_megabytes(0) == "0.00 MB");
        assert(format_megabytes(1048576) == "1.00 MB");
        assert(format_megabytes(100000000) == "95.37 MB");
        assert(help_text().find("upload <file>") != std::string::npos);
    }

    void test_login_verifies_and_stores()
    {
        CommandHarness harness(parse({"login", "--stdin"}));
        harness.input.str("token-id-1234\n  token-secret  \n");
        harness.run();

        assert(harness.transport.count(http::Method::Get, "/video/v1/assets?limit=1") == 1);
        const auto &request = harness.transport.requests.front();
        assert(request.headers.at("Authorization").rfind("Basic ", 0) == 0);
        const auto credentials = harness.store.lookup();
        assert(credentials);
        assert(credentials->token_secret == "token-secret");

        const auto lines = json_lines(harness.out.str());
        assert(lines.size() == 1);
        assert(lines.front().at("command") == "login");
        assert(lines.front().at("was_logged_in") == false);
    }

    void test_login_rejected_token_is_not_stored()
    {
        CommandHarness harness(parse({"login", "--stdin"}));
        harness.input.str("bad-id\nbad-secret\n");
        harness.transport.set_handler([](const http::Request &)
                                      { return json_response(401, {{"error", {{"type", "unauthorized"}}}}); });
        try
        {
            harness.run();
            assert(false && "rejected token should fail login");
        }
        catch (const Error &ex)
        {
            assert(ex.code() == ErrorCode::AuthenticationFailed);
        }
        assert(!harness.store.lookup());
    }

    void test_login_requires_both_lines()
    {
        CommandHarness harness(parse({"login", "--stdin"}));
        harness.input.str("only-the-id\n");
        try
        {
            harness.run();
            assert(false && "truncated input should fail");
        }
        catch (const Error &ex)
        {
            assert(ex.code() == ErrorCode::InvalidConfiguration);
        }
        assert(harness.transport.requests.empty());
    }

    void test_status_reports_rejected_token()
    {
        CommandHarness logged_out(parse({"status"}));
        logged_out.run();
        assert(json_lines(logged_out.out.str()).front().at("is_authenticated") == false);
        assert(logged_out.transport.requests.empty());

        CommandHarness rejected(parse({"status"}));
        rejected.store_credentials();
        rejected.transport.set_handler([](const http::Request &)
                                       { return status_response(401); });
        rejected.run();
        const auto json = json_lines(rejected.out.str()).front();
        assert(json.at("is_authenticated") == false);
        assert(json.at("token_id") == "toke***1234");

        CommandHarness accepted(parse({"status"}));
        accepted.store_credentials();
        accepted.run();
        assert(json_lines(accepted.out.str()).front().at("is_authenticated") == true);
    }

    void test_logout_clears_credentials()
    {
        CommandHarness harness(parse({"logout"}));
        harness.store_credentials();
        harness.run();
        assert(!harness.store.lookup());
        assert(json_lines(harness.out.str()).front().at("was_logged_in") == true);
    }

    void test_list_requires_login()
    {
        CommandHarness harness(parse({"list"}));
        try
        {
            harness.run();
            assert(false && "list needs credentials");
        }
        catch (const Error &ex)
        {
            assert(ex.code() == ErrorCode::CredentialsMissing);
        }
        assert(harness.transport.requests.empty());
    }

    void test_list_and_show()
    {
        CommandHarness list(parse({"list"}));
        list.store_credentials();
        list.service.existing_assets = {
            {{"id", "asset-1"}, {"status", "ready"}, {"created_at", "1700000000"}, {"playback_ids", {{{"id", "pb-1"}, {"policy", "public"}}}}},
        };
        list.run();
        const auto listed = json_lines(list.out.str()).front();
        assert(listed.at("total_count") == 1);
        assert(listed.at("videos").at(0).at("hls_url") == "https://stream.mux.com/pb-1.m3u8");

        CommandHarness show(parse({"show", "asset-1"}));
        show.store_credentials();
        show.run();
        const auto shown = json_lines(show.out.str()).front();
        assert(shown.at("asset_id") == "asset-1");
        assert(shown.at("mp4_status") == "generating");
    }

    void test_delete_needs_force_when_not_interactive()
    {
        CommandHarness refused(parse({"delete", "asset-1"}));
        refused.store_credentials();
        try
        {
            refused.run();
            assert(false && "delete without --force should be refused");
        }
        catch (const Error &ex)
        {
            assert(ex.code() == ErrorCode::InvalidConfiguration);
        }
        assert(refused.service.deleted_assets.empty());

        CommandHarness forced(parse({"delete", "asset-1", "--force"}));
        forced.store_credentials();
        forced.run();
        assert(forced.service.deleted_assets == std::vector<std::string>{"asset-1"});
        assert(json_lines(forced.out.str()).front().at("asset_id") == "asset-1");
    }

    void test_delete_confirmation_prompt()
    {
        CommandHarness declined(parse({"delete", "asset-1"}), false);
        declined.store_credentials();
        declined.input.str("maybe\nn\n");
        declined.run(true);
        assert(declined.service.deleted_assets.empty());
        assert(declined.err.str().find("Deletion cancelled.") != std::string::npos);

        CommandHarness confirmed(parse({"delete", "asset-1"}), false);
        confirmed.store_credentials();
        confirmed.input.str("yes\n");
        confirmed.run(true);
        assert(confirmed.service.deleted_assets == std::vector<std::string>{"asset-1"});
    }

    void test_upload_command_reports_result()
    {
        CommandHarness harness(parse({"upload", "placeholder", "--progress"}));
        harness.config.positional = {harness.dir.write_file("clip.mp4", 1000).string()};
        harness.store_credentials();
        harness.run();

        const auto lines = json_lines(harness.out.str());
        assert(lines.size() > 2);
        assert(lines.front().at("progress").at("phase") == "validating_file");
        const auto &result = lines.back();
        assert(result.at("success") == true);
        assert(result.at("command") == "upload");
        assert(result.at("asset_id") == "asset-1");
        assert(result.at("file_size") == 1000);
        const auto posted = nlohmann::json::parse(harness.transport.requests.front().body);
        assert(posted.at("new_asset_settings").at("meta").at("title") == "clip.mp4");
    }

} // namespace

void run_client_component_tests()
{
    test_credential_store_round_trip();
    test_credential_store_default_path();
    test_credential_store_rejects_malformed_file();
    test_parse_commands();
    test_parse_rejects_bad_usage();
    test_upload_overrides();
    test_machine_failure_output();
    test_human_failure_output();
    test_machine_progress_output();
    test_format_megabytes();
    test_login_verifies_and_stores();
    test_login_rejected_token_is_not_stored();
    test_login_requires_both_lines();
    test_status_reports_rejected_token();
    test_logout_clears_credentials();
    test_list_requires_login();
    test_list_and_show();
    test_delete_needs_force_when_not_interactive();
    test_delete_confirmation_prompt();
    test_upload_command_reports_result();
}
