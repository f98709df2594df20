#include "ssz/crypto/sha256-hasher.h"
#include <openssl/evp.h>
#include <stdexcept>

namespace ssz::crypto {

Sha256Hasher::Sha256Hasher() : ctx_(nullptr)
{
    ctx_ = EVP_MD_CTX_new();
    if (!ctx_)
    {
        throw std::runtime_error("Sha256Hasher: EVP_MD_CTX_new() failed");
    }
    init();
}

Sha256Hasher::~Sha256Hasher()
{
    if (ctx_)
    {
        EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(ctx_));
    }
}

void
Sha256Hasher::init()
{
    if (EVP_DigestInit_ex(
            static_cast<EVP_MD_CTX*>(ctx_), EVP_sha256(), nullptr) != 1)
    {
        cleanup_and_throw("Sha256Hasher: EVP_DigestInit_ex() failed");
    }
}

void
Sha256Hasher::check_context() const
{
    if (!ctx_)
    {
        throw std::runtime_error("Sha256Hasher: context is not valid");
    }
}

void
Sha256Hasher::cleanup_and_throw(const char* msg)
{
    EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(ctx_));
    ctx_ = nullptr;
    throw std::runtime_error(msg);
}

void
Sha256Hasher::update(const void* data, size_t len)
{
    check_context();
    if (EVP_DigestUpdate(static_cast<EVP_MD_CTX*>(ctx_), data, len) != 1)
    {
        cleanup_and_throw("Sha256Hasher: EVP_DigestUpdate failed");
    }
}

Node
Sha256Hasher::finalize()
{
    check_context();
    Node out;
    unsigned int out_len = 0;
    if (EVP_DigestFinal_ex(
            static_cast<EVP_MD_CTX*>(ctx_), out.data(), &out_len) != 1 ||
        out_len != Node::size())
    {
        cleanup_and_throw("Sha256Hasher: EVP_DigestFinal_ex failed");
    }
    init();
    return out;
}

}  // namespace ssz::crypto
