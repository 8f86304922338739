/*******************************************************************************
 * Copyright (c) 2024  xiedeacc.com.
 * All rights reserved.
 *******************************************************************************/

#ifndef BYTECMP_UTIL_UTIL_H
#define BYTECMP_UTIL_UTIL_H

#include <charconv>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include "google/protobuf/message.h"
#include "src/common/defs.h"

namespace bytecmp {
namespace util {

class Util final {
 private:
  Util() {}
  ~Util() {}

 public:
  static bool Exists(const std::string &path);
  static bool Mkdir(const std::string &path);
  static bool Remove(const std::string &path);
  static int32_t WriteToFile(const std::string &path,
                             const std::string &content,
                             const bool append = false);
  static bool LoadSmallFile(const std::string &path, std::string *content);

  template <class TypeName>
  static bool ToInt(std::string_view str, TypeName *value, int base = 10) {
    if (str.empty()) {
      return false;
    }
    auto result =
        std::from_chars(str.data(), str.data() + str.size(), *value, base);
    if (result.ec != std::errc{} || result.ptr != str.data() + str.size()) {
      return false;
    }
    return true;
  }

  // optional leading +, then 0x prefix: hexadecimal, leading 0: octal,
  // otherwise decimal. Negative values are rejected.
  static bool ParseOffset(const std::string &str, int64_t *offset);

  static bool StartWith(const std::string &str, const std::string &prefix);

  static std::string ToOctStr(const uint8_t in);

  static bool MessageToJson(const google::protobuf::Message &msg,
                            std::string *json);
  static bool JsonToMessage(const std::string &json,
                            google::protobuf::Message *msg);

  static std::optional<std::string> GetEnv(const char *var_name) {
    const char *value = std::getenv(var_name);
    if (value) {
      return std::string(value);
    } else {
      return std::nullopt;
    }
  }
};

}  // namespace util
}  // namespace bytecmp

#endif /* BYTECMP_UTIL_UTIL_H */
