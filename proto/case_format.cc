#include "proto/case_format.h"

#include <string>
#include <string_view>

#include "absl/strings/ascii.h"
#include "absl/strings/str_split.h"

namespace protosym {
namespace proto {

std::string LowerUnderscoreToLowerCamel(std::string_view const input) {
  std::string result;
  result.reserve(input.size());
  bool first = true;
  for (std::string_view const word : absl::StrSplit(input, '_')) {
    if (first) {
      result += absl::AsciiStrToLower(word);
      first = false;
    } else if (!word.empty()) {
      result += absl::ascii_toupper(word.front());
      result += absl::AsciiStrToLower(word.substr(1));
    }
  }
  return result;
}

std::string UnderscoresToCamelCase(std::string_view const input, bool const capitalize_first) {
  std::string result;
  result.reserve(input.size());
  bool capitalize_next = capitalize_first;
  for (size_t i = 0; i < input.size(); ++i) {
    char const ch = input[i];
    if (absl::ascii_islower(ch)) {
      result += capitalize_next ? absl::ascii_toupper(ch) : ch;
      capitalize_next = false;
    } else if (absl::ascii_isupper(ch)) {
      // Capital letters are preserved except for the very first one.
      result += (i == 0 && !capitalize_first) ? absl::ascii_tolower(ch) : ch;
      capitalize_next = false;
    } else if (absl::ascii_isdigit(ch)) {
      result += ch;
      capitalize_next = true;
    } else {
      capitalize_next = true;
    }
  }
  return result;
}

}  // namespace proto
}  // namespace protosym
