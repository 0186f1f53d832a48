#include "http_utils.h"

namespace http_utils {

std::string FormatOneParam(const char* str) {
  return str;
}
std::string FormatOneParam(const std::string& str) {
  // request bodies carry candidate output; only log their size
  return "(" + std::to_string(str.size()) + " bytes)";
}
std::string FormatOneParam(const httplib::Headers&) {
  return "";
}

std::string FormatParam() {
  return "(none)";
}

} // namespace http_utils
