#ifndef __BLOCK_SIZE_H__
#define __BLOCK_SIZE_H__

#include <cstddef>
#include <cstdint>
#include <string>

// Multipart uploads start from 1 MiB parts and double until under the part limit.
const int64_t INFERENCE_START_BLOCK_SIZE = 1 << 20;

typedef struct parsed_tag {
    std::string hex;      // lowercase, 32 digits
    size_t parts;         // 0 when the tag has no part-count suffix
} ParsedTag;

// Accepts quoted tags as returned by object stores ("\"<hex>-<n>\"").
ParsedTag parseTag(const std::string& tag);

// Lowercase, unquoted form of a valid tag.
std::string normalizeTag(const std::string& tag);

int64_t inferBlockSize(int64_t file_length, const std::string& tag);

#endif  //__BLOCK_SIZE_H__
