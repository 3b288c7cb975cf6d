#include "peerdrop/crypto.hpp"

#include <cerrno>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <vector>

#include <sodium.h>

namespace peerdrop::crypto
{

    static_assert(kDigestSize == crypto_hash_sha256_BYTES, "digest size must match SHA-256");

    namespace
    {

        constexpr std::size_t kReadBlockSize = 64 * 1024;

        void throw_if_sodium_init_failed(int status)
        {
            if (status < 0)
            {
                throw std::runtime_error("libsodium initialization failed");
            }
        }

        std::once_flag &sodium_once_flag()
        {
            static std::once_flag flag;
            return flag;
        }

        void ensure_initialized_once()
        {
            std::call_once(sodium_once_flag(), []()
                           { throw_if_sodium_init_failed(sodium_init()); });
        }

    } // namespace

    void ensure_sodium_init()
    {
        ensure_initialized_once();
    }

    Digest sha256_bytes(std::span<const std::byte> data)
    {
        ensure_initialized_once();
        Digest digest{};
        if (crypto_hash_sha256(digest.data(), reinterpret_cast<const unsigned char *>(data.data()), data.size()) != 0)
        {
            throw std::runtime_error("crypto_hash_sha256 failed");
        }
        return digest;
    }

    Digest sha256_stream(std::istream &input)
    {
        ensure_initialized_once();
        crypto_hash_sha256_state state;
        if (crypto_hash_sha256_init(&state) != 0)
        {
            throw std::runtime_error("crypto_hash_sha256_init failed");
        }

        std::vector<unsigned char> buffer(kReadBlockSize);
        while (input)
        {
            input.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
            const auto read_count = static_cast<std::size_t>(input.gcount());
            if (read_count > 0)
            {
                if (crypto_hash_sha256_update(&state, buffer.data(), read_count) != 0)
                {
                    throw std::runtime_error("crypto_hash_sha256_update failed");
                }
            }
        }
        if (input.bad())
        {
            throw std::runtime_error("read failed while hashing");
        }

        Digest digest{};
        if (crypto_hash_sha256_final(&state, digest.data()) != 0)
        {
            throw std::runtime_error("crypto_hash_sha256_final failed");
        }
        return digest;
    }

    Digest sha256_file(const std::filesystem::path &path)
    {
        errno = 0;
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
        {
            const int error = errno != 0 ? errno : EIO;
            throw std::system_error(error, std::generic_category(), "open for hashing");
        }
        return sha256_stream(file);
    }

    std::string to_hex(std::span<const std::uint8_t> data)
    {
        static constexpr char kHexDigits[] = "0123456789abcdef";
        std::string result;
        result.resize(data.size() * 2);
        for (std::size_t i = 0; i < data.size(); ++i)
        {
            const auto byte = data[i];
            result[2 * i] = kHexDigits[(byte >> 4) & 0x0F];
            result[2 * i + 1] = kHexDigits[byte & 0x0F];
        }
        return result;
    }

} // namespace peerdrop::crypto
