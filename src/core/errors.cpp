#include "tooldock/errors.hpp"

namespace tooldock {

const char *errorKindLabel(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Configuration:
    return "configuration";
  case ErrorKind::Installation:
    return "installation";
  case ErrorKind::IO:
    return "io";
  default:
    return "unknown";
  }
}

Error::Error(ErrorKind kind, const std::string &context)
    : std::runtime_error(context), kind_(kind), context_(context) {}

Error::Error(ErrorKind kind, const std::string &context, const Error &cause)
    : std::runtime_error(render(context, cause.what())), kind_(kind),
      context_(context), cause_(std::make_shared<Error>(cause)) {}

Error::Error(ErrorKind kind, const std::string &context,
             const std::exception &cause)
    : std::runtime_error(render(context, cause.what())), kind_(kind),
      context_(context) {
  if (auto *err = dynamic_cast<const Error *>(&cause)) {
    cause_ = std::make_shared<Error>(*err);
  } else {
    detail_ = cause.what();
  }
}

bool Error::involves(ErrorKind kind) const noexcept {
  for (const Error *e = this; e != nullptr; e = e->cause()) {
    if (e->kind() == kind)
      return true;
  }
  return false;
}

std::string Error::render(const std::string &context,
                          const std::string &cause) {
  if (cause.empty())
    return context;
  return context + ": " + cause;
}

} // namespace tooldock
