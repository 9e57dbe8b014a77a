/**
 * @file upload_example.cpp
 * @brief Single video upload with progress reporting and error handling
 *
 * This example demonstrates:
 * - Wiring the credential store, token refresher and resumable client
 * - Establishing a credential obtained outside the library
 * - Using progress callbacks to monitor an upload
 * - Scheduling a publish time and choosing the visibility
 * - Waiting for completion and reading the upload history
 */

#include <media_upload/media_upload.h>

#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace media_upload;

namespace {

struct options {
    std::filesystem::path video;
    std::string title;
    std::string description;
    std::optional<std::string> schedule;
    std::string visibility = "private";
    std::filesystem::path credentials_dir = default_credentials_directory();
    std::filesystem::path history_file = default_history_file();
    std::optional<std::filesystem::path> organize_dir;
    std::optional<std::string> access_token;
    std::string refresh_token;
    std::string client_id;
    std::string client_secret;
    std::chrono::seconds max_wait{3600};
};

void print_usage(const char* program) {
    std::cout << "Upload Example - Media Upload" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <video> <title> <description>" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -s, --schedule <time>     Publish time, RFC3339 UTC (e.g. 2030-01-01T00:00:00Z)" << std::endl;
    std::cout << "  -v, --visibility <value>  private, unlisted or public (default: private)" << std::endl;
    std::cout << "  --credentials <dir>       Credential directory (default: ~/.media_uploader/private)" << std::endl;
    std::cout << "  --history <file>          Upload history file (default: ~/.media_uploader/upload_history.json)" << std::endl;
    std::cout << "  --organize <dir>          Move the video into <dir>/YYYY-MM-DD after upload" << std::endl;
    std::cout << "  --access-token <token>    Establish this access token before uploading" << std::endl;
    std::cout << "  --refresh-token <token>   Refresh token stored with --access-token" << std::endl;
    std::cout << "  --client-id <id>          OAuth client id used for refreshes" << std::endl;
    std::cout << "  --client-secret <secret>  OAuth client secret used for refreshes" << std::endl;
    std::cout << "  --max-wait <seconds>      Give up waiting after this long (default: 3600)" << std::endl;
    std::cout << "  --help                    Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program << " holiday.mp4 \"Holiday\" \"Two weeks at the coast\"" << std::endl;
    std::cout << "  " << program << " -v unlisted -s 2030-01-01T00:00:00Z talk.mov \"Talk\" \"Conference talk\"" << std::endl;
}

/**
 * @brief Parse the command line
 * @return Parsed options, or nullopt after printing the reason
 */
auto parse_arguments(int argc, char* argv[]) -> std::optional<options> {
    options opts;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](const char* name) -> std::optional<std::string> {
            if (++i >= argc) {
                std::cerr << "Error: " << name << " requires an argument" << std::endl;
                return std::nullopt;
            }
            return std::string(argv[i]);
        };

        if (arg == "--help") {
            print_usage(argv[0]);
            return std::nullopt;
        } else if (arg == "-s" || arg == "--schedule") {
            auto value = next("--schedule");
            if (!value) return std::nullopt;
            opts.schedule = *value;
        } else if (arg == "-v" || arg == "--visibility") {
            auto value = next("--visibility");
            if (!value) return std::nullopt;
            opts.visibility = *value;
        } else if (arg == "--credentials") {
            auto value = next("--credentials");
            if (!value) return std::nullopt;
            opts.credentials_dir = *value;
        } else if (arg == "--history") {
            auto value = next("--history");
            if (!value) return std::nullopt;
            opts.history_file = *value;
        } else if (arg == "--organize") {
            auto value = next("--organize");
            if (!value) return std::nullopt;
            opts.organize_dir = std::filesystem::path(*value);
        } else if (arg == "--access-token") {
            auto value = next("--access-token");
            if (!value) return std::nullopt;
            opts.access_token = *value;
        } else if (arg == "--refresh-token") {
            auto value = next("--refresh-token");
            if (!value) return std::nullopt;
            opts.refresh_token = *value;
        } else if (arg == "--client-id") {
            auto value = next("--client-id");
            if (!value) return std::nullopt;
            opts.client_id = *value;
        } else if (arg == "--client-secret") {
            auto value = next("--client-secret");
            if (!value) return std::nullopt;
            opts.client_secret = *value;
        } else if (arg == "--max-wait") {
            auto value = next("--max-wait");
            if (!value) return std::nullopt;
            opts.max_wait = std::chrono::seconds(std::stoll(*value));
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 3) {
        std::cerr << "Error: <video>, <title> and <description> are required" << std::endl;
        print_usage(argv[0]);
        return std::nullopt;
    }
    opts.video = positional[0];
    opts.title = positional[1];
    opts.description = positional[2];
    return opts;
}

void print_progress(const progress_snapshot& snapshot) {
    constexpr int bar_width = 30;
    int filled = snapshot.percent * bar_width / 100;

    std::cout << "\r[";
    for (int i = 0; i < bar_width; ++i) {
        if (i < filled) std::cout << "=";
        else if (i == filled) std::cout << ">";
        else std::cout << " ";
    }
    std::cout << "] " << std::setw(3) << snapshot.percent << "% "
              << std::left << std::setw(50) << snapshot.message << std::right << std::flush;

    if (is_terminal(snapshot.state)) {
        std::cout << std::endl;
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    std::optional<options> parsed;
    try {
        parsed = parse_arguments(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    if (!parsed) {
        return 1;
    }
    const auto& opts = *parsed;

    std::cout << "========================================" << std::endl;
    std::cout << "       Video Upload Example" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << std::endl;
    std::cout << "Configuration:" << std::endl;
    std::cout << "  Video: " << opts.video << std::endl;
    std::cout << "  Title: " << opts.title << std::endl;
    std::cout << "  Visibility: " << opts.visibility << std::endl;
    std::cout << "  Schedule: " << opts.schedule.value_or("publish immediately") << std::endl;
    std::cout << "  Credentials: " << opts.credentials_dir << std::endl;
    std::cout << std::endl;

    // Collaborators
    std::cout << "[1/4] Preparing services..." << std::endl;
    auto http = make_network_http_client();
    if (!http->is_available()) {
        std::cerr << "This build has no HTTP transport (network_system not found)." << std::endl;
        return 1;
    }

    auto store = std::make_shared<file_credential_store>(opts.credentials_dir);
    auto auth = std::make_shared<auth_session>(
        store, std::make_shared<oauth_token_refresher>(http));
    auto history = std::make_shared<upload_history>(opts.history_file);

    if (opts.access_token) {
        credential cred;
        cred.access_token = *opts.access_token;
        cred.refresh_token = opts.refresh_token;
        cred.client_id = opts.client_id;
        cred.client_secret = opts.client_secret;
        cred.scopes = {"https://www.googleapis.com/auth/youtube.upload"};
        auto established = auth->establish(std::move(cred));
        if (!established) {
            std::cerr << "Failed to store credential: " << established.error().message << std::endl;
            return 1;
        }
    }

    upload_manager::builder builder;
    builder.with_auth_session(auth)
        .with_transfer_client(std::make_shared<resumable_upload_client>(http))
        .with_result_sink(history)
        .with_visibility(opts.visibility);
    if (opts.organize_dir) {
        builder.with_file_organizer(std::make_shared<file_organizer>(*opts.organize_dir));
    }
    auto manager_result = builder.build();
    if (!manager_result) {
        std::cerr << "Failed to create upload manager: " << manager_result.error().message << std::endl;
        return 1;
    }
    auto& manager = manager_result.value();

    manager.on_job_progress([](const job_id&, const progress_snapshot& snapshot) {
        print_progress(snapshot);
    });

    // Validation happens before anything is sent
    std::cout << "[2/4] Validating request..." << std::endl;
    upload_request request{opts.video, opts.title, opts.description, opts.schedule};
    auto checked = manager.validate_request(request);
    if (!checked) {
        std::cerr << "Invalid request: " << checked.error().message << std::endl;
        if (checked.error().code == error_code::not_authenticated) {
            std::cerr << "Hint: pass --access-token (and --refresh-token) from your OAuth client" << std::endl;
        }
        return 1;
    }

    std::cout << "[3/4] Uploading..." << std::endl;
    auto submitted = manager.submit(request);
    if (!submitted) {
        std::cerr << "Failed to submit upload: " << submitted.error().message << std::endl;
        return 1;
    }

    auto result = manager.wait_for(submitted.value(), opts.max_wait);
    if (!result) {
        std::cerr << "Error while waiting for upload: " << result.error().message << std::endl;
        manager.cancel(submitted.value());
        return 1;
    }

    std::cout << std::endl;
    std::cout << "[4/4] Result" << std::endl;
    const auto& outcome = result.value();
    if (outcome.success) {
        std::cout << "  Upload successful!" << std::endl;
        std::cout << "  Video URL: " << outcome.video_url << std::endl;
        if (outcome.organized_path) {
            std::cout << "  File moved to: " << outcome.organized_path->string() << std::endl;
        }
    } else {
        std::cout << "  Upload " << to_string(outcome.state) << ": " << outcome.message << std::endl;
        if (outcome.code == error_code::transfer_access_denied) {
            std::cout << "  Hint: the daily API quota may be exhausted" << std::endl;
        }
    }

    auto stats = history->stats();
    std::cout << std::endl;
    std::cout << "History: " << stats.total_uploads << " uploads, "
              << stats.completed << " completed, " << stats.failed << " failed" << std::endl;

    return outcome.success ? 0 : 1;
}
