/*
 * Storage errors - transferd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <stdexcept>
#include <string>

namespace transferd {

struct StorageError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Read/write/rename failed. The store keeps its previous in-memory state.
struct StorageIOError : StorageError {
    using StorageError::StorageError;
};

// A patch or a loaded document does not describe a well-typed record.
struct StorageValidationError : StorageError {
    using StorageError::StorageError;
};

// Primary file unparsable and no backup could be read.
struct StorageCorruptionError : StorageError {
    using StorageError::StorageError;
};

// Generated id already present. Should never happen with uuid ids.
struct StorageIdCollisionError : StorageError {
    using StorageError::StorageError;
};

} // namespace transferd
