#pragma once
#include <string_view>

namespace fdk {

constexpr std::string_view LIBRARY_VERSION = "0.1.0";
constexpr std::string_view FDK_VERSION     = "fdk-cpp/0.1.0";
constexpr std::string_view FDK_RUNTIME     = "cpp/17";
constexpr std::string_view FN_FORMAT       = "http-stream";

} // namespace fdk
