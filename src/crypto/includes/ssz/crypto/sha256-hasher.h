#pragma once

#include "ssz/core/types.h"
#include <cstddef>

namespace ssz::crypto {

// RAII wrapper for OpenSSL SHA-256 EVP API
class Sha256Hasher
{
public:
    Sha256Hasher();
    ~Sha256Hasher();

    // Not copyable or movable
    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher&
    operator=(const Sha256Hasher&) = delete;

    /**
     * Update the hash with more data.
     * @param data Pointer to data to hash
     * @param len Length of data in bytes
     * @throws std::runtime_error if the update fails
     */
    void
    update(const void* data, size_t len);

    /**
     * Finalize the digest and return it as a Node.
     * The hasher is re-initialised afterwards and can digest a new message.
     * @throws std::runtime_error if finalization fails
     */
    Node
    finalize();

private:
    // Throws std::runtime_error if context is not valid
    void
    check_context() const;

    void
    cleanup_and_throw(const char* msg);

    void
    init();

    void* ctx_;  // opaque pointer to avoid including openssl headers here
};

}  // namespace ssz::crypto
