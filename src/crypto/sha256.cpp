#include "crypto/sha256.hpp"

#include "io/file_reader.hpp"

#include <openssl/evp.h>

#include <array>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <memory>
#include <vector>

namespace splitpack {

namespace {

std::string HexEncode(std::span<const std::uint8_t> bytes) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(bytes.size() * 2);
    for (size_t i = 0; i < bytes.size(); ++i) {
        out[i * 2] = kHex[(bytes[i] >> 4) & 0xF];
        out[i * 2 + 1] = kHex[bytes[i] & 0xF];
    }
    return out;
}

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

constexpr std::size_t kDigestLen = 32;

} // namespace

struct Sha256Hasher::Impl {
    EvpMdCtxPtr ctx{EVP_MD_CTX_new()};
    // Set once a call into OpenSSL failed or FinalHex() ran.
    bool done = false;
};

Sha256Hasher::Sha256Hasher() : impl_(std::make_unique<Impl>()) {
    if (!impl_->ctx || EVP_DigestInit_ex(impl_->ctx.get(), EVP_sha256(), nullptr) != 1) {
        impl_->done = true;
    }
}

Sha256Hasher::Sha256Hasher(Sha256Hasher&&) noexcept = default;
Sha256Hasher& Sha256Hasher::operator=(Sha256Hasher&&) noexcept = default;
Sha256Hasher::~Sha256Hasher() = default;

void Sha256Hasher::Update(std::span<const std::uint8_t> data) {
    if (!impl_ || impl_->done || data.empty()) return;
    if (EVP_DigestUpdate(impl_->ctx.get(), data.data(), data.size()) != 1) {
        impl_->done = true;
    }
}

std::string Sha256Hasher::FinalHex() {
    if (!impl_ || impl_->done) return {};
    impl_->done = true;
    std::array<std::uint8_t, kDigestLen> digest{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(impl_->ctx.get(), digest.data(), &len) != 1 || len != kDigestLen) return {};
    return HexEncode(digest);
}

std::string Sha256Hex(std::span<const std::uint8_t> data) {
    Sha256Hasher hasher;
    hasher.Update(data);
    return hasher.FinalHex();
}

std::string Sha256Hex(IReader& reader) {
    Sha256Hasher hasher;

    std::vector<std::uint8_t> buf(256 * 1024);
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0) break;
        if (n < 0) return {};
        hasher.Update(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)));
    }
    return hasher.FinalHex();
}

Result Sha256HexFile(const std::string& path, std::string& out_hex) {
    FileReader reader;
    auto r = FileReader::Open(path, reader);
    if (!r.is_ok()) return r.WithPath(path);
    out_hex = Sha256Hex(reader);
    if (out_hex.empty()) return Result::Fail(EIO, "sha256 failed: " + path).WithPath(path);
    return Result::Ok();
}

bool DigestEquals(std::string_view a, std::string_view b) {
    if (a.empty() || a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace splitpack
