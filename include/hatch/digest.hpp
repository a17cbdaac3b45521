#pragma once

#include <string>

namespace hatch {

struct HashResult {
    bool ok = false;
    std::string error;
    std::string hex_digest;     // lowercase, 64 chars
};

// SHA-256 of a file's contents, read in chunks
HashResult compute_file_sha256(const std::string& file_path);

} // namespace hatch
