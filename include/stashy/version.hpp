#pragma once

namespace stashy {

constexpr const char* VERSION = "0.4.0";
constexpr const char* USER_AGENT = "stashy/0.4.0";

}  // namespace stashy
