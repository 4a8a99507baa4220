#include "md5.hpp"

#include <iomanip>
#include <new>
#include <sstream>
#include <stdexcept>

Md5::Md5() : ctx(EVP_MD_CTX_new()) {
    if (!this->ctx) {
        throw std::bad_alloc();
    }
    this->reset();
}

void Md5::reset(void) {
    if (EVP_DigestInit_ex(this->ctx.get(), EVP_md5(), nullptr) != 1) {
        throw std::runtime_error("Unable to initialise MD5 digest");
    }
}

void Md5::update(const void* data, size_t len) {
    if (len && EVP_DigestUpdate(this->ctx.get(), data, len) != 1) {
        throw std::runtime_error("MD5 update failed");
    }
}

Digest Md5::finish(void) {
    Digest out;
    unsigned int out_len = 0;
    if (EVP_DigestFinal_ex(this->ctx.get(), out.data(), &out_len) != 1 || out_len != DIGEST_SIZE) {
        throw std::runtime_error("MD5 finalisation failed");
    }
    this->reset();
    return out;
}

Digest md5Of(const void* data, size_t len) {
    Md5 md;
    md.update(data, len);
    return md.finish();
}

std::string toHex(const Digest& digest) {
    std::stringstream sstream;
    sstream << std::hex << std::setfill('0');
    for (unsigned char b : digest) {
        sstream << std::setw(2) << static_cast<unsigned int>(b);
    }
    return sstream.str();
}
