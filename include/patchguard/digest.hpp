#pragma once

#include <string>

namespace patchguard {

// ============================================================================
// MD5 Hashing
// ============================================================================
//
// The file library records content hashes as upper-case MD5 hex, and the
// deterministic component identifiers append the same form, so both are
// produced here.

struct HashResult {
    bool ok = false;
    std::string error;
    std::string hex_digest;     // Upper-case hex string (32 chars)
};

// MD5 of the UTF-8 bytes of a string
HashResult compute_md5(const std::string& data);

// MD5 of a file's contents, streamed
HashResult compute_file_md5(const std::string& file_path);

// Case-insensitive comparison of two hex digests
bool digests_equal(const std::string& a, const std::string& b);

} // namespace patchguard
