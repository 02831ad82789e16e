#include "filepipe/crypto.hpp"

#include <array>
#include <fstream>
#include <mutex>
#include <stdexcept>

#include <sodium.h>

namespace filepipe::crypto
{

    void ensure_sodium_init()
    {
        static std::once_flag once;
        std::call_once(once, []()
                       {
            if (sodium_init() < 0)
            {
                throw std::runtime_error("libsodium initialization failed");
            } });
    }

    std::string hash_stream(std::istream &input)
    {
        ensure_sodium_init();
        crypto_generichash_state state;
        if (crypto_generichash_init(&state, nullptr, 0, crypto_generichash_BYTES) != 0)
        {
            throw std::runtime_error("Could not start BLAKE2b digest");
        }

        std::array<char, 64 * 1024> block{};
        while (input.read(block.data(), block.size()) || input.gcount() > 0)
        {
            const auto *bytes = reinterpret_cast<const unsigned char *>(block.data());
            if (crypto_generichash_update(&state, bytes, static_cast<unsigned long long>(input.gcount())) != 0)
            {
                throw std::runtime_error("Could not update BLAKE2b digest");
            }
        }
        if (input.bad())
        {
            throw std::runtime_error("Read error while hashing");
        }

        std::array<unsigned char, crypto_generichash_BYTES> digest{};
        if (crypto_generichash_final(&state, digest.data(), digest.size()) != 0)
        {
            throw std::runtime_error("Could not finish BLAKE2b digest");
        }
        std::array<char, crypto_generichash_BYTES * 2 + 1> hex{};
        sodium_bin2hex(hex.data(), hex.size(), digest.data(), digest.size());
        return std::string(hex.data());
    }

    std::string hash_file(const std::filesystem::path &path)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file)
        {
            throw std::runtime_error("Cannot open " + path.string() + " for hashing");
        }
        return hash_stream(file);
    }

} // namespace filepipe::crypto
