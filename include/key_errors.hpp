#pragma once

#include <stdexcept>
#include <string>

namespace wkd {

// Base of every failure raised by the key store and its collaborators.
class KeyError : public std::runtime_error {
public:
    explicit KeyError(const std::string& what) : std::runtime_error(what) {}
};

// Certificate bytes could not be decoded (or the file could not be read).
class ParseError : public KeyError {
public:
    explicit ParseError(const std::string& what) : KeyError(what) {}
};

// The certificate could not be evaluated under the current validity policy.
class PolicyError : public KeyError {
public:
    explicit PolicyError(const std::string& what) : KeyError(what) {}
};

// Unknown path, fingerprint or identity.
class NotFoundError : public KeyError {
public:
    explicit NotFoundError(const std::string& what) : KeyError(what) {}
};

// The store lock could not be acquired.
class LockError : public KeyError {
public:
    explicit LockError(const std::string& what) : KeyError(what) {}
};

// The filesystem notification subsystem failed to initialize or degraded.
class WatchSubsystemError : public KeyError {
public:
    explicit WatchSubsystemError(const std::string& what) : KeyError(what) {}
};

}
