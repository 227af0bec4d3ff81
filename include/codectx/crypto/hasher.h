#pragma once

#include <codectx/core/types.h>

#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace codectx::crypto {

// Interface for content hashers
class IContentHasher {
public:
    virtual ~IContentHasher() = default;

    // Stream-based hashing
    virtual void init() = 0;
    virtual void update(std::span<const std::byte> data) = 0;
    virtual std::string finalize() = 0;

    std::string hash(std::string_view text) {
        init();
        update(std::as_bytes(std::span(text.data(), text.size())));
        return finalize();
    }
};

// SHA-256 implementation, hex-encoded lowercase output
class SHA256Hasher : public IContentHasher {
public:
    SHA256Hasher();
    ~SHA256Hasher();

    SHA256Hasher(const SHA256Hasher&) = delete;
    SHA256Hasher& operator=(const SHA256Hasher&) = delete;
    SHA256Hasher(SHA256Hasher&&) noexcept;
    SHA256Hasher& operator=(SHA256Hasher&&) noexcept;

    void init() override;
    void update(std::span<const std::byte> data) override;
    std::string finalize() override;

    // One-shot hashing of text content
    static std::string hashText(std::string_view text);

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

std::unique_ptr<IContentHasher> createSHA256Hasher();

} // namespace codectx::crypto
