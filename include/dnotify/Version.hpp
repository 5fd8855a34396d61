#pragma once

namespace dnotify {

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 3;
constexpr int VERSION_PATCH = 0;

} // namespace dnotify

#define DNOTIFY_VERSION_STRING "0.3.0"
