#ifndef __PROTOSYM_PROTO_CASE_FORMAT_H__
#define __PROTOSYM_PROTO_CASE_FORMAT_H__

#include <string>
#include <string_view>

namespace protosym {
namespace proto {

// Converts a `lower_underscore` identifier to `lowerCamel` case. The first underscore-separated
// word is lowercased entirely, every following word is lowercased except for its first letter,
// which is capitalized. Empty words (e.g. from consecutive underscores) contribute nothing.
//
// Example:
//
//   LowerUnderscoreToLowerCamel("user_id");     // "userId"
//   LowerUnderscoreToLowerCamel("HTTP_proxy");  // "httpProxy"
//
std::string LowerUnderscoreToLowerCamel(std::string_view input);

// Converts an identifier to camel case following the naming rules of the class-based runtime's
// protobuf compiler: any character that is neither a letter nor a digit is dropped and causes the
// next letter to be capitalized, as does a digit. The first character is lowercased unless
// `capitalize_first` is true. Other capital letters are preserved.
//
// Example:
//
//   UnderscoresToCamelCase("foo_bar2baz", false);  // "fooBar2Baz"
//   UnderscoresToCamelCase("my_file", true);       // "MyFile"
//
std::string UnderscoresToCamelCase(std::string_view input, bool capitalize_first);

}  // namespace proto
}  // namespace protosym

#endif  // __PROTOSYM_PROTO_CASE_FORMAT_H__
