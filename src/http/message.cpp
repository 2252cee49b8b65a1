#include "rawx/http/message.hpp"
#include <algorithm>
#include <cctype>

namespace rawx {
namespace http {

bool FieldLess::operator()(const std::string& a, const std::string& b) const {
  return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(),
    [](unsigned char x, unsigned char y) {
      return std::tolower(x) < std::tolower(y);
    });
}

std::string Request::header(const std::string& name) const {
  auto it = headers.find(name);
  if (it == headers.end()) {
    return "";
  }
  return it->second;
}

} // namespace http
} // namespace rawx
