#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace batch_core {

/**
 * @brief A custom exception for key service errors.
 */
class KeyServiceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Supplies the SQLCipher key for the task database.
 *
 * The key comes from the BATCHFORGE_DB_KEY environment variable when it is
 * set, otherwise from a key file readable only by the owner.
 */
class EncryptionKeyService {
public:
    static constexpr const char* ENV_VAR_NAME = "BATCHFORGE_DB_KEY";

    /**
     * @brief Gets the database encryption key.
     *
     * If the key file exists its contents are returned. If not, a new
     * 256-bit key is generated, written hex-encoded with mode 0600, and
     * returned.
     *
     * @param key_file Location of the key file.
     * @return The hex-encoded key.
     * @throws KeyServiceError if the key cannot be read, generated or stored.
     */
    static std::string get_database_key(const std::filesystem::path& key_file);

    /**
     * @brief Default key file location for a database path: "<db>.key".
     */
    static std::filesystem::path default_key_file(const std::filesystem::path& db_path);

private:
    static std::string read_key_file(const std::filesystem::path& key_file);
    static void write_key_file(const std::filesystem::path& key_file, const std::string& key);

    /**
     * @brief Generates 32 random bytes with OpenSSL and hex-encodes them.
     */
    static std::string generate_new_key();
};

}  // namespace batch_core
