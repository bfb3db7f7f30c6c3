#ifndef TOOLDOCK_VERSION_HPP
#define TOOLDOCK_VERSION_HPP

#include <string>

namespace tooldock {

const std::string TOOLDOCK_VERSION_STRING = "1.0.0";

// Bumped whenever the layout of settings.json changes.
const std::string TOOLDOCK_SETTINGS_SCHEMA = "1.0";

} // namespace tooldock

#endif // TOOLDOCK_VERSION_HPP
