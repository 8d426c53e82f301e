#pragma once

#include <functional>
#include <mutex>
#include <string>

struct GeneratedKeyPair {
    // PEM, as written to the private key file.
    std::string privateKey;
    // Single authorized_keys line without trailing newline.
    std::string publicKey;
};

// Keeps one RSA key pair on disk for all runs. Generation is serialized by a
// process-wide mutex and an flock on "<private key>.lock", and both checks
// for existing files happen again once the locks are held.
class KeyPairProvisioner {
public:
    using KeyGenerator = std::function<GeneratedKeyPair(const std::string& comment)>;

    KeyPairProvisioner(std::string publicKeyPath, std::string privateKeyPath, std::string comment,
        KeyGenerator generator = KeyGenerator());

    // Returns true when this call generated the pair.
    bool Ensure();

    bool KeyPairExists() const;
    std::string ReadPublicKey() const;

    static GeneratedKeyPair GenerateRsaKeyPair(const std::string& comment);
    static std::string EncodeSshRsaPublicKey(const std::string& exponent, const std::string& modulus,
        const std::string& comment);

private:
    static void WriteSecureFile(const std::string& path, const std::string& content);

    std::string publicKeyPath_;
    std::string privateKeyPath_;
    std::string comment_;
    KeyGenerator generator_;
};
