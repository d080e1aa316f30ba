#include "VaultErrors.hpp"

const char* toString(VaultErrc code) {
    switch (code) {
        case VaultErrc::KeyNotFound:          return "KeyNotFound";
        case VaultErrc::VersionNotFound:      return "VersionNotFound";
        case VaultErrc::TagNotFound:          return "TagNotFound";
        case VaultErrc::DuplicateKey:         return "DuplicateKey";
        case VaultErrc::CorruptData:          return "CorruptData";
        case VaultErrc::AuthenticationFailed: return "AuthenticationFailed";
        case VaultErrc::IOError:              return "IOError";
    }
    return "Unknown";
}
