#include "digest_combiner.hpp"
#include "errors.hpp"

#include <boost/log/trivial.hpp>

std::string combineDigests(const DigestList& digests) {
    if (digests.empty()) {
        throw InvalidInput("Cannot build an ETag from zero digests");
    }
    if (digests.size() == 1) {
        return toHex(digests.front());
    }

    Md5 md;
    for (const Digest& d : digests) {
        md.update(d.data(), d.size());
    }
    std::string tag = toHex(md.finish()) + "-" + std::to_string(digests.size());
    BOOST_LOG_TRIVIAL(debug) << "Combiner: " << digests.size() << " parts -> " << tag;
    return tag;
}
