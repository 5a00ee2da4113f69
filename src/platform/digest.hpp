#pragma once

#include <string>
#include <memory>
#include <functional>
#include <cstddef>
#include <openssl/sha.h>

// Incremental digest whose running state can be persisted next to a transfer
// cursor and restored after a restart, so hashing resumes at exactly the
// checkpointed offset.
class Digest {
public:
    virtual ~Digest() = default;

    virtual std::string algorithm() const = 0;
    virtual void reset() = 0;
    virtual void update(const char* data, size_t len) = 0;

    // Serialized accumulator; "" for a freshly reset digest.
    virtual std::string save_state() const = 0;
    // Restore from save_state(); "" resets. Returns false on a malformed state.
    virtual bool load_state(const std::string& state) = 0;

    // Hex digest of everything fed so far. Does not disturb the accumulator.
    virtual std::string hex() const = 0;
};

using DigestFactory = std::function<std::unique_ptr<Digest>()>;

class Sha256Digest : public Digest {
public:
    Sha256Digest();

    std::string algorithm() const override { return "sha256"; }
    void reset() override;
    void update(const char* data, size_t len) override;
    std::string save_state() const override;
    bool load_state(const std::string& state) override;
    std::string hex() const override;

private:
    SHA256_CTX ctx_;
    bool dirty_ = false;
};

DigestFactory sha256_factory();

// One-shot SHA-256 hex of a string.
std::string sha256_hex(const std::string& data);
