#include "renderxfer/digest.hpp"

#include <fstream>
#include <mutex>
#include <span>
#include <vector>

#include <sodium.h>

#include "renderxfer/transfer_error.hpp"

namespace renderxfer::digest
{

    namespace
    {

        std::string to_hex(std::span<const unsigned char> data)
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

        void ensure_initialized_once()
        {
            static std::once_flag flag;
            std::call_once(flag, []()
                           {
                if (sodium_init() < 0)
                {
                    throw TransferError(ErrorCode::InternalError, "libsodium initialization failed");
                } });
        }

        void check(int status, const char *operation)
        {
            if (status != 0)
            {
                throw TransferError(ErrorCode::InternalError, std::string(operation) + " failed");
            }
        }

    } // namespace

    std::string hash_stream(std::istream &input)
    {
        ensure_initialized_once();
        crypto_generichash_state state;
        check(crypto_generichash_init(&state, nullptr, 0, crypto_generichash_BYTES), "crypto_generichash_init");

        std::vector<unsigned char> buffer(64 * 1024);
        while (input)
        {
            input.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
            const auto read_count = static_cast<std::size_t>(input.gcount());
            if (read_count > 0)
            {
                check(crypto_generichash_update(&state, buffer.data(), read_count), "crypto_generichash_update");
            }
        }
        if (input.bad())
        {
            throw TransferError(ErrorCode::FileIo, "Read error while hashing");
        }

        std::vector<unsigned char> digest(crypto_generichash_BYTES);
        check(crypto_generichash_final(&state, digest.data(), digest.size()), "crypto_generichash_final");
        return to_hex(digest);
    }

    std::string hash_file(const std::filesystem::path &path)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
        {
            throw TransferError(ErrorCode::FileIo, "Failed to open file for hashing: " + path.string());
        }
        return hash_stream(file);
    }

} // namespace renderxfer::digest
