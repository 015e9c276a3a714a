#ifndef MERKSEAL_ERRORS_HPP
#define MERKSEAL_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace merkseal {

/**
 * @brief Base class for every error raised by the batch integrity core.
 */
class MerksealError : public std::runtime_error {
public:
  explicit MerksealError(const std::string &message)
      : std::runtime_error(message) {}
};

/// A root was requested over zero leaves, or a batch holds no files.
class EmptyInputError : public MerksealError {
public:
  explicit EmptyInputError(const std::string &message)
      : MerksealError(message) {}
};

/**
 * @brief Filesystem failure while reading or writing batch data.
 *
 * Carries the path that failed and the operating system reason.
 */
class StorageError : public MerksealError {
public:
  StorageError(const std::string &path, const std::string &reason)
      : MerksealError("Storage error on " + path + ": " + reason), path_(path),
        reason_(reason) {}

  const std::string &path() const { return path_; }
  const std::string &reason() const { return reason_; }

private:
  std::string path_;
  std::string reason_;
};

/// No batch record exists for the requested identifier.
class NotFoundError : public MerksealError {
public:
  explicit NotFoundError(uint64_t batchId)
      : MerksealError("Batch " + std::to_string(batchId) + " not found"),
        batchId_(batchId) {}

  uint64_t batchId() const { return batchId_; }

private:
  uint64_t batchId_;
};

/// The persisted batch record exists but cannot be parsed.
class CorruptRecordError : public MerksealError {
public:
  CorruptRecordError(uint64_t batchId, const std::string &detail)
      : MerksealError("Batch " + std::to_string(batchId) +
                      " has a corrupt record: " + detail),
        batchId_(batchId) {}

  uint64_t batchId() const { return batchId_; }

private:
  uint64_t batchId_;
};

/**
 * @brief The external anchor registry could not answer.
 *
 * NotFound means the registry answered but holds no batch under the id.
 * Transport covers connection, TLS, HTTP and JSON-RPC protocol failures.
 */
class AnchorLookupError : public MerksealError {
public:
  enum class Kind { NotFound, Transport };

  AnchorLookupError(Kind kind, const std::string &message)
      : MerksealError(message), kind_(kind) {}

  Kind kind() const { return kind_; }

private:
  Kind kind_;
};

/// Invalid or incomplete runtime configuration.
class ConfigError : public MerksealError {
public:
  explicit ConfigError(const std::string &message) : MerksealError(message) {}
};

} // namespace merkseal

#endif // MERKSEAL_ERRORS_HPP
