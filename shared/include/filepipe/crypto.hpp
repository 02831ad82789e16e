/**
 * filepipe - Content hashing built on libsodium (BLAKE2b).
 */
#pragma once

#include <filesystem>
#include <istream>
#include <string>

namespace filepipe::crypto
{

    void ensure_sodium_init();

    // Lowercase hex BLAKE2b-256 digest of everything left in `input`.
    std::string hash_stream(std::istream &input);

    std::string hash_file(const std::filesystem::path &path);

} // namespace filepipe::crypto
