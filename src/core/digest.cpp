#include "core/digest.hpp"
#include "core/utils.hpp"

#include <openssl/evp.h>

#include <array>
#include <fstream>
#include <stdexcept>

namespace sqlsandbox {

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
}

Sha256::~Sha256() {
    EVP_MD_CTX_free(ctx_);
}

void Sha256::update(const void* data, size_t len) {
    if (finished_) {
        throw std::logic_error("Sha256::update after finish");
    }
    if (len == 0) return;
    if (EVP_DigestUpdate(ctx_, data, len) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
}

std::string Sha256::finish_hex() {
    if (finished_) {
        throw std::logic_error("Sha256::finish_hex called twice");
    }
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx_, digest, &len) != 1) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    finished_ = true;
    return utils::bytes_to_hex(digest, len);
}

std::string Sha256::hex(std::string_view data) {
    Sha256 sha;
    sha.update(data);
    return sha.finish_hex();
}

std::string Sha256::file_hex(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Cannot open " + path.string());
    }
    Sha256 sha;
    std::array<char, 64 * 1024> block{};
    while (in) {
        in.read(block.data(), static_cast<std::streamsize>(block.size()));
        const auto got = in.gcount();
        if (got > 0) sha.update(block.data(), static_cast<size_t>(got));
    }
    if (in.bad()) {
        throw std::runtime_error("Read error on " + path.string());
    }
    return sha.finish_hex();
}

} // namespace sqlsandbox
