#ifndef __PTYHOST_ERRORS_HPP__
#define __PTYHOST_ERRORS_HPP__

#include "Headers.hpp"

namespace ptyhost {
/**
 * @brief Malformed startup arguments.  Fatal, raised before any resource is
 * allocated.
 */
class ArgumentError : public std::runtime_error {
 public:
  explicit ArgumentError(const string& what) : std::runtime_error(what) {}
};

/**
 * @brief The pseudo-terminal pair or the child process could not be created.
 */
class AllocationError : public std::runtime_error {
 public:
  explicit AllocationError(const string& what) : std::runtime_error(what) {}
};

/**
 * @brief A resize request carried invalid dimensions or arrived after the
 * backend was torn down.  Recovered by the caller.
 */
class ResizeError : public std::runtime_error {
 public:
  explicit ResizeError(const string& what) : std::runtime_error(what) {}
};

/** @brief A resize directive whose body could not be parsed. */
class DecodeError : public std::runtime_error {
 public:
  explicit DecodeError(const string& what) : std::runtime_error(what) {}
};
}  // namespace ptyhost

#endif  // __PTYHOST_ERRORS_HPP__
