#pragma once

#include <exception>
#include <string>

// Base class for every error the asset core surfaces to its callers
class AssetShelfError : public std::exception {
protected:
    std::string message_;
public:
    explicit AssetShelfError(const std::string& message) : message_(message) {}
    const char* what() const noexcept override { return message_.c_str(); }
};

// Bad caller input (empty name, unknown category, missing source path). No state change.
class ValidationError : public AssetShelfError {
public:
    using AssetShelfError::AssetShelfError;
};

// Unknown asset id or category. No state change.
class NotFoundError : public AssetShelfError {
public:
    using AssetShelfError::AssetShelfError;
};

class DuplicateError : public AssetShelfError {
public:
    using AssetShelfError::AssetShelfError;
};

class ProtectedCategoryError : public AssetShelfError {
public:
    using AssetShelfError::AssetShelfError;
};

// I/O failure while importing content into the library tree.
// Any partial copy has been removed by the time this is thrown.
class ImportError : public AssetShelfError {
public:
    using AssetShelfError::AssetShelfError;
};

// Import stopped by the caller's cancellation flag between per-file steps
class ImportCancelledError : public ImportError {
public:
    using ImportError::ImportError;
};

// The metadata store could not be written (disk full, permission denied)
class PersistenceError : public AssetShelfError {
public:
    using AssetShelfError::AssetShelfError;
};

// The metadata store exists but cannot be parsed
class CorruptStoreError : public AssetShelfError {
public:
    using AssetShelfError::AssetShelfError;
};
