#ifndef TOOLDOCK_ERRORS_HPP
#define TOOLDOCK_ERRORS_HPP

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace tooldock {

enum class ErrorKind {
  Configuration, // missing or malformed persisted settings
  Installation,  // download / extract / remove / navigate path
  IO             // raw filesystem faults not otherwise classified
};

const char *errorKindLabel(ErrorKind kind);

// Base of every error the core raises. An error names the operation that
// failed (context) and optionally what caused it: either another Error, kept
// whole so its kind stays queryable, or the message of a foreign exception.
class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string &context);
  Error(ErrorKind kind, const std::string &context, const Error &cause);
  Error(ErrorKind kind, const std::string &context,
        const std::exception &cause);

  ErrorKind kind() const noexcept { return kind_; }
  const std::string &context() const noexcept { return context_; }

  // Nullptr when the cause was a foreign exception or there was none.
  const Error *cause() const noexcept { return cause_.get(); }
  const std::string &detail() const noexcept { return detail_; }

  // True if this error or anything down its cause chain has the given kind.
  bool involves(ErrorKind kind) const noexcept;

private:
  static std::string render(const std::string &context,
                            const std::string &cause);

  ErrorKind kind_;
  std::string context_;
  std::shared_ptr<const Error> cause_;
  std::string detail_;
};

class ConfigurationError : public Error {
public:
  explicit ConfigurationError(const std::string &context)
      : Error(ErrorKind::Configuration, context) {}
  ConfigurationError(const std::string &context, const std::exception &cause)
      : Error(ErrorKind::Configuration, context, cause) {}
};

class InstallationError : public Error {
public:
  explicit InstallationError(const std::string &context)
      : Error(ErrorKind::Installation, context) {}
  InstallationError(const std::string &context, const std::exception &cause)
      : Error(ErrorKind::Installation, context, cause) {}
};

class IOError : public Error {
public:
  explicit IOError(const std::string &context)
      : Error(ErrorKind::IO, context) {}
  IOError(const std::string &context, const std::exception &cause)
      : Error(ErrorKind::IO, context, cause) {}
};

} // namespace tooldock

#endif // TOOLDOCK_ERRORS_HPP
