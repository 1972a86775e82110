#pragma once

#include <stdexcept>
#include <string>

namespace BatchStore {

/**
 * @brief Embedded store failure (open, pragma, statement or transaction)
 */
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief A record could not be accepted by its category buffer.
 *
 * Raised when the forced overflow flush fails (buffer stays at capacity)
 * or when the writer has already been shut down.
 */
class EnqueueRejected : public std::runtime_error {
public:
    explicit EnqueueRejected(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Column count does not match the category's insert statement
 */
class RecordArityError : public std::invalid_argument {
public:
    explicit RecordArityError(const std::string& what) : std::invalid_argument(what) {}
};

} // namespace BatchStore
