#pragma once

#include "core/digest.hpp"
#include "sandbox/dataset_resolver.hpp"

#include <atomic>
#include <filesystem>
#include <format>
#include <map>
#include <mutex>
#include <string>

namespace sqlsandbox::testing {

/**
 * @brief Resolver over a fixed bucket/key -> local file table
 *
 * Staged files are the fixtures themselves (temporary = false), so the
 * engine never deletes them. Unknown locators fail like a missing object.
 */
class FakeDatasetResolver : public IDatasetResolver {
public:
    void add(const std::string& bucket, const std::string& key, std::filesystem::path file) {
        std::lock_guard<std::mutex> lock(mutex_);
        files_[bucket + "/" + key] = std::move(file);
    }

    [[nodiscard]] Result<StagedDataset> resolve(
        const std::string& bucket, const std::string& key) override {
        resolve_count_.fetch_add(1, std::memory_order_relaxed);
        std::filesystem::path file;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = files_.find(bucket + "/" + key);
            if (it == files_.end()) {
                return Result<StagedDataset>::error(ErrorCategory::DATASET_LOAD_ERROR,
                    std::format("Bucket '{}' is not allowed", bucket));
            }
            file = it->second;
        }
        StagedDataset staged;
        staged.local_path = file;
        staged.integrity_tag = Sha256::file_hex(file);
        staged.size_bytes = std::filesystem::file_size(file);
        staged.temporary = false;
        return Result<StagedDataset>::ok(std::move(staged));
    }

    [[nodiscard]] uint64_t resolve_count() const {
        return resolve_count_.load(std::memory_order_relaxed);
    }

private:
    std::mutex mutex_;
    std::map<std::string, std::filesystem::path> files_;
    std::atomic<uint64_t> resolve_count_{0};
};

} // namespace sqlsandbox::testing
