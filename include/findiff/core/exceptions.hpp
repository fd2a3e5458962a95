#pragma once
#include <format>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace findiff::core {

class FindiffException : public std::exception {
private:
  std::string message_;
  std::source_location location_;
  std::vector<std::string> call_stack_;

public:
  explicit FindiffException(std::string message, std::source_location location = std::source_location::current())
      : message_(std::move(message)), location_(location) {}

  [[nodiscard]] const char* what() const noexcept override { return message_.c_str(); }

  [[nodiscard]] auto location() const noexcept -> const std::source_location& { return location_; }

  [[nodiscard]] auto message() const noexcept -> const std::string& { return message_; }

  void add_context(std::string context) { call_stack_.push_back(std::move(context)); }

  [[nodiscard]] auto call_stack() const noexcept -> const std::vector<std::string>& { return call_stack_; }

  [[nodiscard]] auto full_message() const -> std::string {
    std::string ctx;
    if (!call_stack_.empty()) {
      ctx.append(" | context: ");
      for (std::size_t i = 0; i < call_stack_.size(); ++i) {
        ctx.append(call_stack_[i]);
        if (i + 1 < call_stack_.size()) {
          ctx.append(" -> ");
        }
      }
    }
    return std::format("{} [{}:{}:{}]{}", message_, location_.file_name(), location_.line(),
                       location_.function_name(), ctx);
  }
};

class ConfigurationError : public FindiffException {
public:
  explicit ConfigurationError(std::string_view message, std::source_location location = std::source_location::current())
      : FindiffException(std::format("Configuration Error: {}", message), location) {}
};

class FileError : public FindiffException {
public:
  explicit FileError(std::string_view message, std::string_view filename,
                     std::source_location location = std::source_location::current())
      : FindiffException(std::format("File Error ({}): {}", filename, message), location) {}
};

// Configuration error attached to one named field
class ValidationError : public ConfigurationError {
public:
  explicit ValidationError(std::string_view field_name, std::string_view message,
                           std::source_location location = std::source_location::current())
      : ConfigurationError(std::format("Field '{}': {}", field_name, message), location) {}
};

// The target function threw or returned a malformed value at a required point
class EvaluationError : public FindiffException {
public:
  explicit EvaluationError(std::string_view message, std::source_location location = std::source_location::current())
      : FindiffException(std::format("Evaluation Error: {}", message), location) {}
};

} // namespace findiff::core
