//
// Copyright (C) 2025 The Android Open Source Project
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <android-base/logging.h>
#include <android-base/result.h>  // IWYU pragma: export
#include <fmt/core.h>             // IWYU pragma: export

namespace wsabridge {

class StackTraceError;

// One frame of an error: where it was raised and what the caller added.
class StackTraceEntry {
 public:
  StackTraceEntry(std::string file, size_t line, std::string pretty_function,
                  std::string expression)
      : file_(std::move(file)),
        line_(line),
        pretty_function_(std::move(pretty_function)),
        expression_(std::move(expression)) {}

  StackTraceEntry(const StackTraceEntry& other)
      : file_(other.file_),
        line_(other.line_),
        pretty_function_(other.pretty_function_),
        expression_(other.expression_),
        message_(other.message_.str()) {}

  StackTraceEntry(StackTraceEntry&&) = default;
  StackTraceEntry& operator=(const StackTraceEntry& other) {
    file_ = other.file_;
    line_ = other.line_;
    pretty_function_ = other.pretty_function_;
    expression_ = other.expression_;
    message_.str(other.message_.str());
    return *this;
  }
  StackTraceEntry& operator=(StackTraceEntry&&) = default;

  template <typename T>
  StackTraceEntry& operator<<(T&& message_ext) & {
    message_ << std::forward<T>(message_ext);
    return *this;
  }
  template <typename T>
  StackTraceEntry operator<<(T&& message_ext) && {
    message_ << std::forward<T>(message_ext);
    return std::move(*this);
  }

  operator StackTraceError() &&;
  template <typename T>
  operator android::base::expected<T, StackTraceError>() &&;

  bool HasMessage() const { return !message_.str().empty(); }

  void Write(std::ostream& stream) const {
    if (HasMessage()) {
      stream << message_.str() << "\n";
    }
  }
  void WriteVerbose(std::ostream& stream) const {
    auto str = message_.str();
    stream << (str.empty() ? "Failure" : str) << "\n";
    stream << " at " << file_ << ":" << line_ << "\n";
    stream << " in " << pretty_function_;
    if (!expression_.empty()) {
      stream << " for WB_EXPECT(" << expression_ << ")";
    }
    stream << "\n";
  }

 private:
  std::string file_;
  size_t line_;
  std::string pretty_function_;
  std::string expression_;
  std::stringstream message_;
};

#define WB_STACK_TRACE_ENTRY(expression) \
  ::wsabridge::StackTraceEntry(__FILE__, __LINE__, __PRETTY_FUNCTION__, \
                               expression)

class StackTraceError {
 public:
  StackTraceError& PushEntry(StackTraceEntry entry) & {
    stack_.emplace_back(std::move(entry));
    return *this;
  }
  StackTraceError PushEntry(StackTraceEntry entry) && {
    stack_.emplace_back(std::move(entry));
    return std::move(*this);
  }
  const std::vector<StackTraceEntry>& Stack() const { return stack_; }

  // Innermost message first, one line per frame that carried a message.
  std::string Message() const {
    std::stringstream writer;
    for (const auto& entry : stack_) {
      entry.Write(writer);
    }
    return writer.str();
  }

  std::string Trace() const {
    std::stringstream writer;
    for (const auto& entry : stack_) {
      entry.WriteVerbose(writer);
    }
    return writer.str();
  }

  template <typename T>
  operator android::base::expected<T, StackTraceError>() && {
    return android::base::unexpected(std::move(*this));
  }

 private:
  std::vector<StackTraceEntry> stack_;
};

inline StackTraceEntry::operator StackTraceError() && {
  return StackTraceError().PushEntry(std::move(*this));
}

template <typename T>
inline StackTraceEntry::operator android::base::expected<T,
                                                         StackTraceError>() && {
  return android::base::unexpected(StackTraceError().PushEntry(std::move(*this)));
}

template <typename T>
using Result = android::base::expected<T, StackTraceError>;

/**
 * Error return macros that record the location of the failure.
 *
 * Example usage:
 *
 *     if (truncate(path.c_str(), size) != 0) {
 *       return WB_ERRNO("truncate(\"" << path << "\") failed: "
 *                       << strerror(errno));
 *     }
 */
#define WB_ERR(MSG) (WB_STACK_TRACE_ENTRY("") << MSG)
#define WB_ERRNO(MSG) (WB_STACK_TRACE_ENTRY("") << MSG)
#define WB_ERRF(MSG, ...) \
  (WB_STACK_TRACE_ENTRY("") << fmt::format(FMT_STRING(MSG), __VA_ARGS__))

template <typename T>
T OutcomeDereference(std::optional<T>&& value) {
  return std::move(*value);
}

template <typename T>
typename std::conditional_t<std::is_void_v<T>, bool, T> OutcomeDereference(
    Result<T>&& result) {
  if constexpr (std::is_void<T>::value) {
    return result.ok();
  } else {
    return std::move(*result);
  }
}

template <typename T>
typename std::enable_if<std::is_convertible_v<T, bool>, T>::type
OutcomeDereference(T&& value) {
  return std::forward<T>(value);
}

inline bool TypeIsSuccess(bool value) { return value; }

template <typename T>
bool TypeIsSuccess(std::optional<T>& value) {
  return value.has_value();
}

template <typename T>
bool TypeIsSuccess(Result<T>& value) {
  return value.ok();
}

template <typename T>
bool TypeIsSuccess(Result<T>&& value) {
  return value.ok();
}

inline auto ErrorFromType(bool) { return StackTraceError(); }

template <typename T>
inline auto ErrorFromType(std::optional<T>) {
  return StackTraceError();
}

template <typename T>
auto ErrorFromType(Result<T>& value) {
  return value.error();
}

template <typename T>
auto ErrorFromType(Result<T>&& value) {
  return value.error();
}

#define WB_EXPECT_OVERLOAD(_1, _2, NAME, ...) NAME

#define WB_EXPECT2(RESULT, MSG)                                          \
  ({                                                                     \
    decltype(RESULT)&& macro_intermediate_result = RESULT;               \
    if (!::wsabridge::TypeIsSuccess(macro_intermediate_result)) {        \
      auto current_entry = WB_STACK_TRACE_ENTRY(#RESULT);                \
      current_entry << MSG;                                              \
      auto error = ::wsabridge::ErrorFromType(macro_intermediate_result); \
      error.PushEntry(std::move(current_entry));                         \
      return std::move(error);                                           \
    };                                                                   \
    ::wsabridge::OutcomeDereference(                                     \
        std::move(macro_intermediate_result));                           \
  })

#define WB_EXPECT1(RESULT) WB_EXPECT2(RESULT, "")

/**
 * Error propagation macro usable as an expression.
 *
 * The argument is a Result, an optional, or anything convertible to bool. On
 * success the contained value is produced; on failure the enclosing function
 * (which must return a Result) returns an error that includes this call site
 * and the optional message.
 *
 *     Result<Sectors> TargetFor(const std::string& image) {
 *       Sectors apparent = WB_EXPECT(ApparentSize(image), "No size");
 *       return apparent * 2;
 *     }
 */
#define WB_EXPECT(...) \
  WB_EXPECT_OVERLOAD(__VA_ARGS__, WB_EXPECT2, WB_EXPECT1)(__VA_ARGS__)

#define WB_EXPECTF(RESULT, MSG, ...) \
  WB_EXPECT(RESULT, fmt::format(FMT_STRING(MSG), __VA_ARGS__))

#define WB_COMPARE_EXPECT4(COMPARE_OP, LHS_RESULT, RHS_RESULT, MSG)         \
  ({                                                                        \
    auto&& lhs_macro_intermediate_result = LHS_RESULT;                      \
    auto&& rhs_macro_intermediate_result = RHS_RESULT;                      \
    bool comparison_result = lhs_macro_intermediate_result COMPARE_OP       \
        rhs_macro_intermediate_result;                                      \
    if (!comparison_result) {                                               \
      auto current_entry = WB_STACK_TRACE_ENTRY("");                        \
      current_entry << "Expected \"" << #LHS_RESULT << "\" " << #COMPARE_OP \
                    << " \"" << #RHS_RESULT << "\" but was "                \
                    << lhs_macro_intermediate_result << " vs "              \
                    << rhs_macro_intermediate_result << ". ";               \
      current_entry << MSG;                                                 \
      auto error = ::wsabridge::ErrorFromType(false);                       \
      error.PushEntry(std::move(current_entry));                            \
      return std::move(error);                                              \
    };                                                                      \
    comparison_result;                                                      \
  })

#define WB_COMPARE_EXPECT3(COMPARE_OP, LHS_RESULT, RHS_RESULT) \
  WB_COMPARE_EXPECT4(COMPARE_OP, LHS_RESULT, RHS_RESULT, "")

#define WB_COMPARE_EXPECT_OVERLOAD(_1, _2, _3, _4, NAME, ...) NAME

#define WB_COMPARE_EXPECT(...)                                \
  WB_COMPARE_EXPECT_OVERLOAD(__VA_ARGS__, WB_COMPARE_EXPECT4, \
                             WB_COMPARE_EXPECT3)              \
  (__VA_ARGS__)

#define WB_EXPECT_EQ(LHS_RESULT, RHS_RESULT, ...) \
  WB_COMPARE_EXPECT(==, LHS_RESULT, RHS_RESULT, ##__VA_ARGS__)
#define WB_EXPECT_NE(LHS_RESULT, RHS_RESULT, ...) \
  WB_COMPARE_EXPECT(!=, LHS_RESULT, RHS_RESULT, ##__VA_ARGS__)
#define WB_EXPECT_LE(LHS_RESULT, RHS_RESULT, ...) \
  WB_COMPARE_EXPECT(<=, LHS_RESULT, RHS_RESULT, ##__VA_ARGS__)
#define WB_EXPECT_LT(LHS_RESULT, RHS_RESULT, ...) \
  WB_COMPARE_EXPECT(<, LHS_RESULT, RHS_RESULT, ##__VA_ARGS__)
#define WB_EXPECT_GE(LHS_RESULT, RHS_RESULT, ...) \
  WB_COMPARE_EXPECT(>=, LHS_RESULT, RHS_RESULT, ##__VA_ARGS__)
#define WB_EXPECT_GT(LHS_RESULT, RHS_RESULT, ...) \
  WB_COMPARE_EXPECT(>, LHS_RESULT, RHS_RESULT, ##__VA_ARGS__)

}  // namespace wsabridge
