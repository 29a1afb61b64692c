/**
 * renderxfer - BLAKE2b file digests for transfer audit logs, built on libsodium.
 */
#pragma once

#include <filesystem>
#include <istream>
#include <string>

namespace renderxfer::digest
{

    // Lower-case hex BLAKE2b (crypto_generichash_BYTES) of everything left in input.
    std::string hash_stream(std::istream &input);

    std::string hash_file(const std::filesystem::path &path);

} // namespace renderxfer::digest
