/**
 * @file test_fixtures.h
 * @brief Shared fixtures for upload manager tests
 */

#ifndef MEDIA_UPLOAD_TEST_FIXTURES_H
#define MEDIA_UPLOAD_TEST_FIXTURES_H

#include <gtest/gtest.h>

#include "mocks/mock_services.h"

#include <media_upload/media_upload.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace media_upload::test {

/**
 * @brief Test fixture for temporary directory management
 */
class TempDirectoryFixture : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("media_upload_test_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    /**
     * @brief Create a video file of @p size bytes
     *
     * Large files are sparse; only the size is observed by the mocks.
     */
    auto create_video(const std::string& name, uint64_t size = 4096)
        -> std::filesystem::path {
        auto path = test_dir_ / name;
        {
            std::ofstream file(path, std::ios::binary);
            file << "video";
        }
        std::filesystem::resize_file(path, size);
        return path;
    }

    std::filesystem::path test_dir_;
};

/**
 * @brief Thread-safe record of every event a manager emits
 */
class event_recorder {
public:
    void attach(upload_manager& manager) {
        manager.on_job_started([this](const job_id& id) {
            std::lock_guard lock(mutex_);
            started_.push_back(id);
        });
        manager.on_job_progress([this](const job_id& id, const progress_snapshot& snapshot) {
            std::lock_guard lock(mutex_);
            progress_[id.str()].push_back(snapshot);
        });
        manager.on_job_completed([this](const job_result& result) {
            std::lock_guard lock(mutex_);
            completed_.push_back(result);
        });
        manager.on_batch_progress([this](const batch_progress& progress) {
            std::lock_guard lock(mutex_);
            batch_updates_.push_back(progress);
        });
        manager.on_batch_completed([this](const batch_progress& progress) {
            std::lock_guard lock(mutex_);
            batch_completions_.push_back(progress);
        });
    }

    auto started() const -> std::vector<job_id> {
        std::lock_guard lock(mutex_);
        return started_;
    }

    auto progress(const job_id& id) const -> std::vector<progress_snapshot> {
        std::lock_guard lock(mutex_);
        auto it = progress_.find(id.str());
        return it == progress_.end() ? std::vector<progress_snapshot>{} : it->second;
    }

    auto percents(const job_id& id) const -> std::vector<int> {
        std::vector<int> values;
        for (const auto& snapshot : progress(id)) {
            values.push_back(snapshot.percent);
        }
        return values;
    }

    auto completed() const -> std::vector<job_result> {
        std::lock_guard lock(mutex_);
        return completed_;
    }

    auto completed_for(const job_id& id) const -> std::vector<job_result> {
        std::vector<job_result> matches;
        for (const auto& result : completed()) {
            if (result.id == id) {
                matches.push_back(result);
            }
        }
        return matches;
    }

    auto batch_updates() const -> std::vector<batch_progress> {
        std::lock_guard lock(mutex_);
        return batch_updates_;
    }

    auto batch_completions() const -> std::vector<batch_progress> {
        std::lock_guard lock(mutex_);
        return batch_completions_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<job_id> started_;
    std::map<std::string, std::vector<progress_snapshot>> progress_;
    std::vector<job_result> completed_;
    std::vector<batch_progress> batch_updates_;
    std::vector<batch_progress> batch_completions_;
};

/**
 * @brief Records results handed to the manager's sink
 */
class recording_sink : public result_sink {
public:
    auto record(const job_result& result) -> media_upload::result<void> override {
        std::lock_guard lock(mutex_);
        records_.push_back(result);
        if (fail_) {
            return unexpected{error{error_code::internal_error, "disk full"}};
        }
        return {};
    }

    void fail_writes() {
        std::lock_guard lock(mutex_);
        fail_ = true;
    }

    auto records() const -> std::vector<job_result> {
        std::lock_guard lock(mutex_);
        return records_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<job_result> records_;
    bool fail_ = false;
};

/**
 * @brief Temporary directory plus an upload_manager wired to mocks
 */
class UploadManagerFixture : public TempDirectoryFixture {
protected:
    static constexpr auto wait_timeout = std::chrono::seconds(10);

    void SetUp() override {
        TempDirectoryFixture::SetUp();
        transfer_ = std::make_shared<mock_transfer_client>();
        auth_ = make_signed_in_session();
        sink_ = std::make_shared<recording_sink>();
    }

    auto manager_builder() -> upload_manager::builder {
        upload_manager::builder b;
        b.with_auth_session(auth_)
         .with_transfer_client(transfer_)
         .with_result_sink(sink_)
         .with_checkpoint_delays(std::chrono::milliseconds(0), std::chrono::milliseconds(0));
        return b;
    }

    auto make_manager() -> upload_manager {
        return make_manager(manager_builder());
    }

    auto make_manager(upload_manager::builder b) -> upload_manager {
        auto built = b.build();
        if (!built) {
            throw std::runtime_error("manager build failed: " + built.error().message);
        }
        return std::move(built).value();
    }

    auto make_request(const std::string& name, const std::string& title = "Holiday",
                      uint64_t size = 4096) -> upload_request {
        upload_request request;
        request.resource = create_video(name, size);
        request.title = title;
        request.description = "Filmed on the beach";
        return request;
    }

    std::shared_ptr<mock_transfer_client> transfer_;
    std::shared_ptr<auth_session> auth_;
    std::shared_ptr<recording_sink> sink_;
};

}  // namespace media_upload::test

#endif  // MEDIA_UPLOAD_TEST_FIXTURES_H
