#pragma once

#include "core/error.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace sqlsandbox {

/**
 * @brief A dataset file copied to local staging
 */
struct StagedDataset {
    std::filesystem::path local_path;
    std::string integrity_tag;      // Content digest, used for change detection
    uint64_t size_bytes = 0;
    bool temporary = true;          // Caller removes local_path once loaded
};

/**
 * @brief Outbound interface: bucket/key to a locally staged file
 *
 * Network retrieval lives behind this seam; the sandbox engine only
 * consumes staged paths.
 */
class IDatasetResolver {
public:
    virtual ~IDatasetResolver() = default;

    [[nodiscard]] virtual Result<StagedDataset> resolve(
        const std::string& bucket, const std::string& key) = 0;
};

/**
 * @brief Resolver over a directory of bucket directories
 *
 * <root>/<bucket>/<key> is validated (bucket allow-list, no traversal,
 * size ceiling, known extension), digested with SHA-256 and copied into
 * the staging directory under a unique name.
 */
class LocalDatasetResolver : public IDatasetResolver {
public:
    struct Config {
        std::filesystem::path root;
        std::filesystem::path staging_dir;
        std::vector<std::string> allowed_buckets;   // Empty: any bucket under root
        uint64_t max_file_size_bytes = 100ULL * 1024 * 1024;
    };

    explicit LocalDatasetResolver(const Config& config);

    [[nodiscard]] Result<StagedDataset> resolve(
        const std::string& bucket, const std::string& key) override;

    [[nodiscard]] static bool is_safe_bucket(const std::string& bucket);
    [[nodiscard]] static bool is_safe_key(const std::string& key);
    [[nodiscard]] static bool has_supported_extension(const std::string& key);

private:
    [[nodiscard]] bool bucket_allowed(const std::string& bucket) const;

    Config config_;
};

} // namespace sqlsandbox
