#pragma once
#include <stdexcept>
#include <string>

class ManifestlyError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Digest name not known to libcrypto.
class UnsupportedAlgorithm : public ManifestlyError {
public:
    explicit UnsupportedAlgorithm(const std::string& name)
        : ManifestlyError("unsupported hash algorithm: " + name)
        , name_(name)
    {}
    const std::string& name() const { return name_; }

private:
    std::string name_;
};

class StorageError : public ManifestlyError {
public:
    using ManifestlyError::ManifestlyError;
};

class ArchiveError : public ManifestlyError {
public:
    using ManifestlyError::ManifestlyError;
};
