#include "file_hash.h"
#include "transfer_error.h"
#include <openssl/evp.h>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace {
    struct MdCtxFree {
        void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
    };
    using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxFree>;

    MdCtxPtr new_sha256_ctx() {
        MdCtxPtr ctx(EVP_MD_CTX_new());
        if (!ctx) {
            throw std::runtime_error("EVP_MD_CTX_new failed");
        }
        if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
            throw std::runtime_error("EVP_DigestInit_ex(EVP_sha256) failed");
        }
        return ctx;
    }

    std::vector<uint8_t> finish(EVP_MD_CTX* ctx) {
        std::vector<uint8_t> out(EVP_MAX_MD_SIZE);
        unsigned int len = 0;
        if (EVP_DigestFinal_ex(ctx, out.data(), &len) != 1) {
            throw std::runtime_error("EVP_DigestFinal_ex failed");
        }
        out.resize(len);
        return out;
    }
}

std::vector<uint8_t> sha256_bytes(const std::string& data) {
    MdCtxPtr ctx = new_sha256_ctx();
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
    return finish(ctx.get());
}

std::string sha256_file_hex(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw TransferError(TransferErrorKind::LocalIo, "cannot open " + path + " for hashing");
    }

    MdCtxPtr ctx = new_sha256_ctx();
    std::vector<char> buf(64 * 1024);
    while (in) {
        in.read(buf.data(), (std::streamsize)buf.size());
        std::streamsize got = in.gcount();
        if (got > 0 && EVP_DigestUpdate(ctx.get(), buf.data(), (size_t)got) != 1) {
            throw std::runtime_error("EVP_DigestUpdate failed");
        }
    }
    if (in.bad()) {
        throw TransferError(TransferErrorKind::LocalIo, "read error while hashing " + path);
    }
    return hex_encode(finish(ctx.get()));
}

std::string hex_encode(const std::vector<uint8_t>& data) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (uint8_t b : data) {
        oss << std::setw(2) << (int)b;
    }
    return oss.str();
}
