#pragma once
#include <stdexcept>
#include <string>

enum class VaultErrc {
    KeyNotFound,
    VersionNotFound,
    TagNotFound,
    DuplicateKey,
    CorruptData,
    AuthenticationFailed,
    IOError
};

const char* toString(VaultErrc code);

// Base of every failure in the vault engine's error taxonomy.
class VaultError : public std::runtime_error {
public:
    VaultError(VaultErrc code, const std::string& what)
    : std::runtime_error(what), m_code(code) {}

    VaultErrc code() const noexcept { return m_code; }

private:
    VaultErrc m_code;
};

class KeyNotFoundError : public VaultError {
public:
    explicit KeyNotFoundError(const std::string& key)
    : VaultError(VaultErrc::KeyNotFound, "Prompt '" + key + "' does not exist") {}
};

class VersionNotFoundError : public VaultError {
public:
    explicit VersionNotFoundError(const std::string& what)
    : VaultError(VaultErrc::VersionNotFound, what) {}
};

class TagNotFoundError : public VaultError {
public:
    TagNotFoundError(const std::string& key, const std::string& tag)
    : VaultError(VaultErrc::TagNotFound, "Tag '" + tag + "' not found for prompt '" + key + "'") {}
};

class DuplicateKeyError : public VaultError {
public:
    explicit DuplicateKeyError(const std::string& key)
    : VaultError(VaultErrc::DuplicateKey, "Prompt '" + key + "' already exists") {}
};

class CorruptDataError : public VaultError {
public:
    explicit CorruptDataError(const std::string& what)
    : VaultError(VaultErrc::CorruptData, "corrupt vault data: " + what) {}
};

class AuthenticationFailedError : public VaultError {
public:
    explicit AuthenticationFailedError(const std::string& what)
    : VaultError(VaultErrc::AuthenticationFailed, what) {}
};

class VaultIOError : public VaultError {
public:
    explicit VaultIOError(const std::string& what)
    : VaultError(VaultErrc::IOError, what) {}
};
