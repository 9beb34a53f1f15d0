#include "batch_core/services/encryption_key_service.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace batch_core {

namespace {

constexpr int kKeyBytes = 32;

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

}  // namespace

std::string EncryptionKeyService::get_database_key(const std::filesystem::path& key_file) {
    const char* env_key = std::getenv(ENV_VAR_NAME);
    if (env_key && *env_key) {
        return env_key;
    }

    try {
        std::string key = read_key_file(key_file);
        if (!key.empty()) {
            return key;
        }

        std::string new_key = generate_new_key();
        write_key_file(key_file, new_key);
        return new_key;
    } catch (const std::exception& e) {
        throw KeyServiceError("Failed to get or create database key: " + std::string(e.what()));
    }
}

std::filesystem::path EncryptionKeyService::default_key_file(const std::filesystem::path& db_path) {
    std::filesystem::path key_file = db_path;
    key_file += ".key";
    return key_file;
}

std::string EncryptionKeyService::read_key_file(const std::filesystem::path& key_file) {
    if (!std::filesystem::exists(key_file)) {
        return "";
    }
    std::ifstream in(key_file);
    if (!in) {
        throw std::runtime_error("Cannot open key file " + key_file.string());
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return trim(buffer.str());
}

void EncryptionKeyService::write_key_file(const std::filesystem::path& key_file,
                                          const std::string& key) {
    if (key_file.has_parent_path()) {
        std::filesystem::create_directories(key_file.parent_path());
    }
    {
        std::ofstream out(key_file, std::ios::trunc);
        if (!out) {
            throw std::runtime_error("Cannot write key file " + key_file.string());
        }
        out << key << '\n';
    }
    std::filesystem::permissions(key_file,
                                 std::filesystem::perms::owner_read |
                                     std::filesystem::perms::owner_write,
                                 std::filesystem::perm_options::replace);
}

std::string EncryptionKeyService::generate_new_key() {
    unsigned char bytes[kKeyBytes];
    if (RAND_bytes(bytes, kKeyBytes) != 1) {
        throw std::runtime_error("RAND_bytes failed: " +
                                 std::string(ERR_error_string(ERR_get_error(), nullptr)));
    }
    std::ostringstream hex;
    for (unsigned char byte : bytes) {
        hex << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
    }
    return hex.str();
}

}  // namespace batch_core
