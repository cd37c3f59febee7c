#include "sandbox/dataset_resolver.hpp"
#include "core/digest.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <system_error>

namespace sqlsandbox {

namespace fs = std::filesystem;

LocalDatasetResolver::LocalDatasetResolver(const Config& config)
    : config_(config) {
    if (config_.staging_dir.empty()) {
        config_.staging_dir = fs::temp_directory_path() / "sqlsandbox-staging";
    }
    std::error_code ec;
    fs::create_directories(config_.staging_dir, ec);
    if (ec) {
        utils::log::warn(std::format("Dataset staging dir {} unavailable: {}",
            config_.staging_dir.string(), ec.message()));
    }
}

bool LocalDatasetResolver::bucket_allowed(const std::string& bucket) const {
    if (config_.allowed_buckets.empty()) return true;
    return std::ranges::find(config_.allowed_buckets, bucket) != config_.allowed_buckets.end();
}

// S3-style bucket name: lowercase letters, digits, '-' and '.', 3-63 chars
bool LocalDatasetResolver::is_safe_bucket(const std::string& bucket) {
    if (bucket.size() < 3 || bucket.size() > 63) return false;
    if (bucket.find("..") != std::string::npos) return false;
    for (const char c : bucket) {
        const auto u = static_cast<unsigned char>(c);
        if (!(std::islower(u) || std::isdigit(u) || c == '-' || c == '.')) return false;
    }
    return std::isalnum(static_cast<unsigned char>(bucket.front())) != 0;
}

bool LocalDatasetResolver::is_safe_key(const std::string& key) {
    if (key.empty() || key.front() == '/') return false;
    if (key.find('\\') != std::string::npos || key.find('\0') != std::string::npos) {
        return false;
    }
    for (const auto& segment : utils::split(key, '/')) {
        if (segment.empty() || segment == "." || segment == "..") return false;
    }
    return true;
}

bool LocalDatasetResolver::has_supported_extension(const std::string& key) {
    const auto ext = utils::to_lower(fs::path(key).extension().string());
    return ext == ".parquet" || ext == ".csv";
}

Result<StagedDataset> LocalDatasetResolver::resolve(
    const std::string& bucket, const std::string& key) {

    // Bucket names double as directory names
    if (!is_safe_bucket(bucket) || !bucket_allowed(bucket)) {
        return Result<StagedDataset>::error(ErrorCategory::DATASET_LOAD_ERROR,
            std::format("Bucket '{}' is not allowed", bucket));
    }
    if (!is_safe_key(key)) {
        return Result<StagedDataset>::error(ErrorCategory::DATASET_LOAD_ERROR,
            std::format("Dataset key '{}' is not a valid relative path", key));
    }
    if (!has_supported_extension(key)) {
        return Result<StagedDataset>::error(ErrorCategory::DATASET_LOAD_ERROR,
            std::format("Dataset key '{}' has an unsupported file type", key));
    }

    const fs::path bucket_dir = config_.root / bucket;
    const fs::path source = bucket_dir / key;

    std::error_code ec;
    if (!fs::is_directory(bucket_dir, ec)) {
        return Result<StagedDataset>::error(ErrorCategory::DATASET_LOAD_ERROR,
            std::format("Bucket '{}' does not exist", bucket));
    }
    const fs::path canonical_bucket = fs::weakly_canonical(bucket_dir, ec);
    const fs::path canonical_source = fs::weakly_canonical(source, ec);
    if (ec) {
        return Result<StagedDataset>::error(ErrorCategory::DATASET_LOAD_ERROR,
            std::format("Cannot resolve {}/{}: {}", bucket, key, ec.message()));
    }
    // Symlinks must not lead out of the bucket
    const auto rel = canonical_source.lexically_relative(canonical_bucket);
    if (rel.empty() || *rel.begin() == "..") {
        return Result<StagedDataset>::error(ErrorCategory::DATASET_LOAD_ERROR,
            std::format("Dataset {}/{} escapes its bucket", bucket, key));
    }
    if (!fs::is_regular_file(canonical_source, ec)) {
        return Result<StagedDataset>::error(ErrorCategory::DATASET_LOAD_ERROR,
            std::format("Dataset {}/{} not found", bucket, key));
    }

    const auto size = fs::file_size(canonical_source, ec);
    if (ec) {
        return Result<StagedDataset>::error(ErrorCategory::DATASET_LOAD_ERROR,
            std::format("Cannot stat {}/{}: {}", bucket, key, ec.message()));
    }
    if (size > config_.max_file_size_bytes) {
        return Result<StagedDataset>::error(ErrorCategory::DATASET_LOAD_ERROR,
            std::format("Dataset {}/{} is {} bytes, limit is {}",
                        bucket, key, size, config_.max_file_size_bytes));
    }

    StagedDataset staged;
    staged.size_bytes = size;
    staged.local_path = config_.staging_dir /
        std::format("{}-{}", utils::generate_uuid(), canonical_source.filename().string());

    if (!fs::copy_file(canonical_source, staged.local_path,
                       fs::copy_options::overwrite_existing, ec) || ec) {
        return Result<StagedDataset>::error(ErrorCategory::DATASET_LOAD_ERROR,
            std::format("Cannot stage {}/{}: {}", bucket, key, ec.message()));
    }

    try {
        staged.integrity_tag = Sha256::file_hex(staged.local_path);
    } catch (const std::exception& e) {
        fs::remove(staged.local_path, ec);
        return Result<StagedDataset>::error(ErrorCategory::DATASET_LOAD_ERROR,
            std::format("Cannot digest {}/{}: {}", bucket, key, e.what()));
    }

    return Result<StagedDataset>::ok(std::move(staged));
}

} // namespace sqlsandbox
