#include "KeyPairProvisioner.hpp"

#include "ZoneErrors.hpp"

#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {
constexpr int kRsaBits = 2048;

std::mutex& KeyGenerationMutex() {
    static std::mutex mutex;
    return mutex;
}

std::string OpenSslError(const std::string& what) {
    const unsigned long code = ERR_get_error();
    char buffer[256] = {};
    if (code != 0) {
        ERR_error_string_n(code, buffer, sizeof(buffer));
        return what + ": " + buffer;
    }
    return what;
}

std::string ErrnoMessage(const std::string& what, const std::string& path) {
    return what + " " + path + ": " + std::strerror(errno);
}

// Holds an flock for the lifetime of the object.
class FileLock {
public:
    explicit FileLock(const std::string& path) {
        fd_ = open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
        if (fd_ < 0) {
            throw KeyPairError(ErrnoMessage("Unable to open lock file", path));
        }
        while (flock(fd_, LOCK_EX) != 0) {
            if (errno != EINTR) {
                const std::string message = ErrnoMessage("Unable to lock", path);
                close(fd_);
                throw KeyPairError(message);
            }
        }
    }
    ~FileLock() {
        flock(fd_, LOCK_UN);
        close(fd_);
    }

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

private:
    int fd_ = -1;
};

void AppendUint32(std::vector<unsigned char>& out, uint32_t value) {
    out.push_back(static_cast<unsigned char>(value >> 24));
    out.push_back(static_cast<unsigned char>(value >> 16));
    out.push_back(static_cast<unsigned char>(value >> 8));
    out.push_back(static_cast<unsigned char>(value));
}

void AppendString(std::vector<unsigned char>& out, const std::string& value) {
    AppendUint32(out, static_cast<uint32_t>(value.size()));
    out.insert(out.end(), value.begin(), value.end());
}

// RFC 4251 mpint from unsigned big-endian bytes.
void AppendMpint(std::vector<unsigned char>& out, const std::string& magnitude) {
    size_t start = 0;
    while (start < magnitude.size() && magnitude[start] == '\0') {
        ++start;
    }
    std::string trimmed = magnitude.substr(start);
    if (!trimmed.empty() && (static_cast<unsigned char>(trimmed.front()) & 0x80) != 0) {
        trimmed.insert(trimmed.begin(), '\0');
    }
    AppendString(out, trimmed);
}

std::string Base64(const std::vector<unsigned char>& data) {
    std::string encoded(4 * ((data.size() + 2) / 3), '\0');
    const int length = EVP_EncodeBlock(
        reinterpret_cast<unsigned char*>(&encoded[0]), data.data(), static_cast<int>(data.size()));
    if (length < 0) {
        throw KeyPairError("Base64 encoding failed");
    }
    encoded.resize(static_cast<size_t>(length));
    return encoded;
}

std::string BignumBytes(EVP_PKEY* pkey, const char* param) {
    BIGNUM* raw = nullptr;
    if (EVP_PKEY_get_bn_param(pkey, param, &raw) != 1) {
        throw KeyPairError(OpenSslError(std::string("Unable to read RSA parameter ") + param));
    }
    std::unique_ptr<BIGNUM, decltype(&BN_free)> bn(raw, &BN_free);

    std::string bytes(static_cast<size_t>(BN_num_bytes(bn.get())), '\0');
    BN_bn2bin(bn.get(), reinterpret_cast<unsigned char*>(&bytes[0]));
    return bytes;
}

void WriteAtomically(const std::string& path, const std::string& content, mode_t mode) {
    const std::string tempPath = path + ".tmp." + std::to_string(getpid());
    const int fd = open(tempPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode);
    if (fd < 0) {
        throw KeyPairError(ErrnoMessage("Unable to create", tempPath));
    }

    // open() honours the umask; the mode must be exact.
    if (fchmod(fd, mode) != 0) {
        const std::string message = ErrnoMessage("Unable to set permissions on", tempPath);
        close(fd);
        unlink(tempPath.c_str());
        throw KeyPairError(message);
    }

    size_t offset = 0;
    while (offset < content.size()) {
        const ssize_t written = write(fd, content.data() + offset, content.size() - offset);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            const std::string message = ErrnoMessage("Unable to write", tempPath);
            close(fd);
            unlink(tempPath.c_str());
            throw KeyPairError(message);
        }
        offset += static_cast<size_t>(written);
    }

    const bool synced = fsync(fd) == 0;
    const bool closed = close(fd) == 0;
    if (!synced || !closed) {
        const std::string message = ErrnoMessage("Unable to flush", tempPath);
        unlink(tempPath.c_str());
        throw KeyPairError(message);
    }

    if (rename(tempPath.c_str(), path.c_str()) != 0) {
        const std::string message = ErrnoMessage("Unable to move key into place at", path);
        unlink(tempPath.c_str());
        throw KeyPairError(message);
    }
}
} // namespace

KeyPairProvisioner::KeyPairProvisioner(
    std::string publicKeyPath,
    std::string privateKeyPath,
    std::string comment,
    KeyGenerator generator)
    : publicKeyPath_(std::move(publicKeyPath)),
      privateKeyPath_(std::move(privateKeyPath)),
      comment_(std::move(comment)),
      generator_(generator ? std::move(generator) : KeyGenerator(GenerateRsaKeyPair)) {}

bool KeyPairProvisioner::Ensure() {
    if (KeyPairExists()) {
        return false;
    }

    std::lock_guard<std::mutex> guard(KeyGenerationMutex());

    const std::filesystem::path privatePath(privateKeyPath_);
    std::error_code error;
    for (const auto& dir : {privatePath.parent_path(), std::filesystem::path(publicKeyPath_).parent_path()}) {
        if (dir.empty() || std::filesystem::exists(dir)) {
            continue;
        }
        std::filesystem::create_directories(dir, error);
        if (error) {
            throw KeyPairError("Unable to create key directory " + dir.string() + ": " + error.message());
        }
        std::filesystem::permissions(dir, std::filesystem::perms::owner_all,
            std::filesystem::perm_options::replace, error);
        if (error) {
            throw KeyPairError("Unable to restrict key directory " + dir.string() + ": " + error.message());
        }
    }

    FileLock fileLock(privateKeyPath_ + ".lock");

    // Another thread or process may have finished while we waited.
    if (KeyPairExists()) {
        return false;
    }

    std::cout << "[Keys] Generating SSH key pair at " << privateKeyPath_ << std::endl;
    const GeneratedKeyPair pair = generator_(comment_);
    WriteSecureFile(privateKeyPath_, pair.privateKey);
    WriteSecureFile(publicKeyPath_, pair.publicKey);
    return true;
}

bool KeyPairProvisioner::KeyPairExists() const {
    std::error_code error;
    return std::filesystem::exists(publicKeyPath_, error) && std::filesystem::exists(privateKeyPath_, error);
}

std::string KeyPairProvisioner::ReadPublicKey() const {
    std::ifstream input(publicKeyPath_, std::ios::binary);
    if (!input) {
        throw KeyPairError("Unable to read public key " + publicKeyPath_);
    }

    std::ostringstream buffer;
    buffer << input.rdbuf();
    std::string key = buffer.str();
    while (!key.empty() && (key.back() == '\n' || key.back() == '\r')) {
        key.pop_back();
    }
    return key;
}

GeneratedKeyPair KeyPairProvisioner::GenerateRsaKeyPair(const std::string& comment) {
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> ctx(
        EVP_PKEY_CTX_new_from_name(nullptr, "RSA", nullptr), &EVP_PKEY_CTX_free);
    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1
        || EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), kRsaBits) != 1) {
        throw KeyPairError(OpenSslError("Unable to initialize RSA key generation"));
    }

    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_generate(ctx.get(), &raw) != 1) {
        throw KeyPairError(OpenSslError("RSA key generation failed"));
    }
    std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> pkey(raw, &EVP_PKEY_free);

    std::unique_ptr<BIO, decltype(&BIO_free)> bio(BIO_new(BIO_s_mem()), &BIO_free);
    if (!bio || PEM_write_bio_PrivateKey_traditional(bio.get(), pkey.get(), nullptr, nullptr, 0, nullptr, nullptr) != 1) {
        throw KeyPairError(OpenSslError("Unable to encode private key"));
    }
    char* pem = nullptr;
    const long pemLength = BIO_get_mem_data(bio.get(), &pem);

    GeneratedKeyPair pair;
    pair.privateKey.assign(pem, static_cast<size_t>(pemLength));
    pair.publicKey = EncodeSshRsaPublicKey(
        BignumBytes(pkey.get(), OSSL_PKEY_PARAM_RSA_E),
        BignumBytes(pkey.get(), OSSL_PKEY_PARAM_RSA_N),
        comment);
    return pair;
}

std::string KeyPairProvisioner::EncodeSshRsaPublicKey(
    const std::string& exponent,
    const std::string& modulus,
    const std::string& comment) {
    std::vector<unsigned char> blob;
    AppendString(blob, "ssh-rsa");
    AppendMpint(blob, exponent);
    AppendMpint(blob, modulus);

    std::string line = "ssh-rsa " + Base64(blob);
    if (!comment.empty()) {
        line += " " + comment;
    }
    return line;
}

void KeyPairProvisioner::WriteSecureFile(const std::string& path, const std::string& content) {
    WriteAtomically(path, content, 0600);
}
