#include "resinslice/Hasher.hpp"
#include <openssl/evp.h>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <memory>

namespace resinslice {

    namespace {
        using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

        DigestContext beginSha256() {
            DigestContext ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
            if (!ctx) {
                throw std::runtime_error("Failed to create hash context");
            }
            if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
                throw std::runtime_error("Failed to initialize SHA256 hash");
            }
            return ctx;
        }

        void update(EVP_MD_CTX* ctx, const void* data, std::size_t size) {
            if (EVP_DigestUpdate(ctx, data, size) != 1) {
                throw std::runtime_error("Failed to update hash");
            }
        }

        std::string finish(EVP_MD_CTX* ctx) {
            unsigned char hash[EVP_MAX_MD_SIZE];
            unsigned int hashLen;
            if (EVP_DigestFinal_ex(ctx, hash, &hashLen) != 1) {
                throw std::runtime_error("Failed to finalize hash");
            }

            std::ostringstream oss;
            for (unsigned int i = 0; i < hashLen; ++i) {
                oss << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
            }
            return oss.str();
        }
    }

    std::string Hasher::sha256_file(const std::string& path) {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            throw std::runtime_error("Unable to open file for hashing: " + path);
        }

        DigestContext ctx = beginSha256();

        char buffer[4096];
        while (file.read(buffer, sizeof(buffer))) {
            update(ctx.get(), buffer, static_cast<std::size_t>(file.gcount()));
        }

        // Last partial read
        if (file.gcount() > 0) {
            update(ctx.get(), buffer, static_cast<std::size_t>(file.gcount()));
        }

        return finish(ctx.get());
    }

    std::string Hasher::sha256(const void* data, std::size_t size) {
        DigestContext ctx = beginSha256();
        update(ctx.get(), data, size);
        return finish(ctx.get());
    }

    std::string Hasher::sha256(const std::string& data) {
        return sha256(data.data(), data.size());
    }

} // namespace resinslice
