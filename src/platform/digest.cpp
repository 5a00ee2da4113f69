// The low-level SHA256_* API is the only OpenSSL interface whose context
// fields are public, which is what lets the accumulator be persisted.
#define OPENSSL_SUPPRESS_DEPRECATED
#include "digest.hpp"
#include <fmt/format.h>
#include <sstream>
#include <vector>

static constexpr const char* STATE_PREFIX = "sha256:v1";

Sha256Digest::Sha256Digest() {
    reset();
}

void Sha256Digest::reset() {
    SHA256_Init(&ctx_);
    dirty_ = false;
}

void Sha256Digest::update(const char* data, size_t len) {
    SHA256_Update(&ctx_, data, len);
    dirty_ = true;
}

std::string Sha256Digest::save_state() const {
    if (!dirty_) return "";

    // sha256:v1 h0..h7 Nl Nh d0..d15 num md_len
    std::string out = STATE_PREFIX;
    for (int i = 0; i < 8; ++i) out += fmt::format(" {:08x}", ctx_.h[i]);
    out += fmt::format(" {:08x} {:08x}", ctx_.Nl, ctx_.Nh);
    for (int i = 0; i < SHA_LBLOCK; ++i) out += fmt::format(" {:08x}", ctx_.data[i]);
    out += fmt::format(" {} {}", ctx_.num, ctx_.md_len);
    return out;
}

bool Sha256Digest::load_state(const std::string& state) {
    if (state.empty()) {
        reset();
        return true;
    }

    std::istringstream in(state);
    std::string prefix;
    in >> prefix;
    if (prefix != STATE_PREFIX) return false;

    std::vector<unsigned long> words;
    std::string tok;
    for (int i = 0; i < 8 + 2 + SHA_LBLOCK; ++i) {
        if (!(in >> tok)) return false;
        try {
            words.push_back(std::stoul(tok, nullptr, 16));
        } catch (const std::exception&) {
            return false;
        }
    }
    unsigned int num = 0;
    unsigned int md_len = 0;
    if (!(in >> num >> md_len)) return false;
    if (num >= SHA256_CBLOCK || md_len != SHA256_DIGEST_LENGTH) return false;

    SHA256_CTX ctx;
    SHA256_Init(&ctx);
    size_t w = 0;
    for (int i = 0; i < 8; ++i) ctx.h[i] = static_cast<SHA_LONG>(words[w++]);
    ctx.Nl = static_cast<SHA_LONG>(words[w++]);
    ctx.Nh = static_cast<SHA_LONG>(words[w++]);
    for (int i = 0; i < SHA_LBLOCK; ++i) ctx.data[i] = static_cast<SHA_LONG>(words[w++]);
    ctx.num = num;
    ctx.md_len = md_len;

    ctx_ = ctx;
    dirty_ = true;
    return true;
}

std::string Sha256Digest::hex() const {
    SHA256_CTX copy = ctx_;
    unsigned char md[SHA256_DIGEST_LENGTH];
    SHA256_Final(md, &copy);
    std::string out;
    out.reserve(SHA256_DIGEST_LENGTH * 2);
    for (unsigned char b : md) out += fmt::format("{:02x}", b);
    return out;
}

DigestFactory sha256_factory() {
    return [] { return std::unique_ptr<Digest>(new Sha256Digest()); };
}

std::string sha256_hex(const std::string& data) {
    Sha256Digest d;
    d.update(data.data(), data.size());
    return d.hex();
}
