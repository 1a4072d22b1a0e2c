#ifndef EXECUTOR_ERRORS_HPP
#define EXECUTOR_ERRORS_HPP

#include <stdint.h>

#include <stdexcept>
#include <string>

namespace executor {

// The requested language is not in the registry.
class unsupported_language : public std::domain_error {
 public:
  explicit unsupported_language(const std::string& language)
      : std::domain_error("Unsupported language: " + language),
        language_(language) {}
  const std::string& language() const { return language_; }

 private:
  std::string language_;
};

// The environment could not be created or a command could not be started in
// it. This is a failure of the system, not of the submitted code.
class provisioning_error : public std::runtime_error {
 public:
  explicit provisioning_error(const std::string& msg)
      : std::runtime_error(msg) {}
};

// A command exceeded its wall clock limit and was killed.
class execution_timeout : public std::runtime_error {
 public:
  explicit execution_timeout(int64_t timeout_millis)
      : std::runtime_error("Execution timed out after " +
                           std::to_string(timeout_millis) + "ms"),
        timeout_millis_(timeout_millis) {}
  int64_t timeout_millis() const { return timeout_millis_; }

 private:
  int64_t timeout_millis_;
};

// A command exceeded the memory or output limits of the environment and was
// killed.
class resource_exceeded : public std::runtime_error {
 public:
  explicit resource_exceeded(const std::string& msg)
      : std::runtime_error(msg) {}
};

}  // namespace executor

#endif
