/*******************************************************************************
 * Copyright (c) 2024  xiedeacc.com.
 * All rights reserved.
 *******************************************************************************/

#include "src/util/util.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <ios>
#include <iterator>
#include <string>

#include "boost/algorithm/string/predicate.hpp"
#include "fmt/core.h"
#include "glog/logging.h"
#include "google/protobuf/util/json_util.h"

using google::protobuf::util::JsonParseOptions;
using google::protobuf::util::JsonPrintOptions;
using std::string;

namespace bytecmp {
namespace util {

bool Util::Exists(const string &path) {
  try {
    return std::filesystem::exists(std::filesystem::symlink_status(path));
  } catch (const std::filesystem::filesystem_error &e) {
  }
  return false;
}

bool Util::Mkdir(const string &path) {
  try {
    if (!Exists(path)) {
      return std::filesystem::create_directories(path);
    }
  } catch (const std::filesystem::filesystem_error &e) {
    LOG(ERROR) << "Mkdir error: " << path << ", " << e.what();
    return false;
  }
  return true;
}

bool Util::Remove(const string &path) {
  try {
    if (Exists(path)) {
      return std::filesystem::remove_all(path);
    }
  } catch (const std::filesystem::filesystem_error &e) {
    LOG(ERROR) << "Remove error: " << path << ", " << e.what();
    return false;
  }

  return true;
}

int32_t Util::WriteToFile(const string &path, const string &content,
                          const bool append) {
  try {
    if (!std::filesystem::exists(path)) {
      std::filesystem::path s_path(path);
      if (s_path.has_parent_path()) {
        std::filesystem::create_directories(s_path.parent_path());
      }
    }

    std::ofstream ofs(path, (append ? std::ios::app : std::ios::trunc) |
                                std::ios::out | std::ios::binary);
    if (ofs && ofs.is_open()) {
      ofs.write(content.data(), content.size());
      ofs.close();
      return Err_Success;
    } else {
      if (errno == EACCES) {
        return Err_File_permission;
      } else if (errno == ENOSPC) {
        return Err_File_disk_full;
      }
      LOG(INFO) << std::strerror(errno);
      return Err_Fail;
    }
  } catch (const std::filesystem::filesystem_error &e) {
    LOG(ERROR) << "Write error: " << path << ", " << e.what();
  }
  return Err_Fail;
}

bool Util::LoadSmallFile(const string &path, string *content) {
  std::ifstream in(path, std::ios::binary);
  if (!in || !in.is_open()) {
    LOG(ERROR) << "Fail to open " << path
               << ", please check file exists and file permission";
    return false;
  }

  in.seekg(0, std::ios::end);
  content->reserve(in.tellg());
  in.seekg(0, std::ios::beg);

  std::copy((std::istreambuf_iterator<char>(in)),
            std::istreambuf_iterator<char>(), std::back_inserter(*content));
  in.close();
  return true;
}

bool Util::ParseOffset(const string &str, int64_t *offset) {
  const string token = StartWith(str, "+") ? str.substr(1) : str;
  std::string_view digits(token);

  int base = 10;
  if (StartWith(token, "0x") || StartWith(token, "0X")) {
    base = 16;
    digits.remove_prefix(2);
  } else if (token.size() > 1 && token[0] == '0') {
    base = 8;
    digits.remove_prefix(1);
  }

  // from_chars takes a minus sign but never a second sign
  if (digits.empty() || digits.front() == '-' || digits.front() == '+') {
    return false;
  }

  int64_t value = 0;
  if (!ToInt(digits, &value, base)) {
    return false;
  }
  *offset = value;
  return true;
}

bool Util::StartWith(const string &str, const string &prefix) {
  return boost::starts_with(str, prefix);
}

string Util::ToOctStr(const uint8_t in) { return fmt::format("{:02o}", in); }

bool Util::MessageToJson(const google::protobuf::Message &msg, string *json) {
  JsonPrintOptions option;
  option.add_whitespace = false;
  option.preserve_proto_field_names = true;
  if (!google::protobuf::util::MessageToJsonString(msg, json, option).ok()) {
    return false;
  }
  return true;
}

bool Util::JsonToMessage(const string &json, google::protobuf::Message *msg) {
  JsonParseOptions option;
  option.ignore_unknown_fields = true;
  if (!google::protobuf::util::JsonStringToMessage(json, msg, option).ok()) {
    return false;
  }
  return true;
}

}  // namespace util
}  // namespace bytecmp
