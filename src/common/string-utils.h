#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <ranges>
#include <algorithm>
#include <cctype>

namespace common {

template <class CharT>
inline void string_replace_all(std::basic_string<CharT>& s, const std::basic_string<CharT>& from, const std::basic_string<CharT>& to) {
  if (from.empty())
    return;
  size_t start_pos = 0;
  while ((start_pos = s.find(from, start_pos)) != std::basic_string<CharT>::npos) {
    s.replace(start_pos, from.length(), to);
    start_pos += to.length(); // In case 'to' contains 'from', like replacing 'x' with 'yx'
  }
}

template<typename T>
inline const typename T::value_type* value_of_starts_with(
    const T& arg,
    const typename T::value_type* name) {

  static_assert(std::is_same_v<typename T::value_type, char> ||
                  std::is_same_v<typename T::value_type, wchar_t>);

  std::basic_string_view<typename T::value_type> arg_view(arg);
  std::basic_string_view<typename T::value_type> name_view(name);

  if (arg_view.starts_with(name_view)) {
    return arg.data() + name_view.length();
  }

  return nullptr;
}

inline std::string_view trim(std::string_view s) {
  constexpr std::string_view blanks = " \t\r\n";
  auto start = s.find_first_not_of(blanks);
  if (start == std::string_view::npos) {
    return {};
  }
  auto end = s.find_last_not_of(blanks);
  return s.substr(start, end - start + 1);
}

// non-empty trimmed lines, \r\n tolerated
inline std::vector<std::string> split_lines(std::string_view text) {
  auto v = text
           | std::views::split('\n')
           | std::views::transform([](auto &&line) {
               return std::string(trim(std::string_view(line.begin(), line.end())));
             })
           | std::views::filter([](const std::string &line) {
               return !line.empty();
             });

  return std::vector<std::string>(v.begin(), v.end());
}

inline std::string join(const std::vector<std::string> &parts, std::string_view sep) {
  std::string out;
  for (auto &part : parts) {
    if (!out.empty())
      out += sep;
    out += part;
  }
  return out;
}

inline std::string to_lower(std::string_view s) {
  std::string out(s);
  std::ranges::transform(out, out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

inline bool contains(std::string_view text, std::string_view needle) {
  return text.find(needle) != std::string_view::npos;
}

inline bool contains_icase(std::string_view text, std::string_view needle) {
  return contains(to_lower(text), to_lower(needle));
}

} // namespace common
