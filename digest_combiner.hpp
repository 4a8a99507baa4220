#ifndef __DIGEST_COMBINER_H__
#define __DIGEST_COMBINER_H__

#include "md5.hpp"

#include <string>

// One digest: its hex. Several: hex MD5 of the concatenated raw digests, then "-<count>".
std::string combineDigests(const DigestList& digests);

#endif  //__DIGEST_COMBINER_H__
