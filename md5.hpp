#ifndef __MD5_H__
#define __MD5_H__

#include <array>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <openssl/evp.h>

const size_t DIGEST_SIZE = 16;

typedef std::array<unsigned char, DIGEST_SIZE> Digest;
typedef std::vector<Digest> DigestList;

// Incremental MD5 over OpenSSL EVP. Used for S3 compatibility, not security.
class Md5 {
  public:
    Md5();
    void update(const void* data, size_t len);
    Digest finish(void);
    void reset(void);
  private:
    struct CtxDeleter {
        void operator() (EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
    };
    std::unique_ptr<EVP_MD_CTX, CtxDeleter> ctx;
};

Digest md5Of(const void* data, size_t len);

std::string toHex(const Digest& digest);

#endif  //__MD5_H__
