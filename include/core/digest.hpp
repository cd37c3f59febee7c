#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace sqlsandbox {

/**
 * @brief Incremental SHA-256 over OpenSSL EVP
 *
 * Throws std::runtime_error if OpenSSL refuses an operation; the context is
 * released in the destructor either way.
 */
class Sha256 {
public:
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    void update(const void* data, size_t len);
    void update(std::string_view data) { update(data.data(), data.size()); }

    // Lowercase hex digest; the object cannot be updated afterwards
    [[nodiscard]] std::string finish_hex();

    [[nodiscard]] static std::string hex(std::string_view data);

    // Streams the file in fixed-size blocks
    [[nodiscard]] static std::string file_hex(const std::filesystem::path& path);

private:
    EVP_MD_CTX* ctx_;
    bool finished_ = false;
};

} // namespace sqlsandbox
