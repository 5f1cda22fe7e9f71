#include "./common.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>

namespace argmatch {

string repr(string_view s) {
  string x;
  x += '\'';
  for (char c : s) {
    switch (c) {
    case '\'':
      x += "\\'";
      break;
    case '\\':
      x += "\\\\";
      break;
    case '\n':
      x += "\\n";
      break;
    case '\t':
      x += "\\t";
      break;
    default:
      x += c;
      break;
    }
  }
  x += '\'';
  return x;
}

namespace util {

bool starts_with(string_view s, string_view prefix) {
  return s.size() >= prefix.size() && std::memcmp(s.data(), prefix.data(), prefix.size() * sizeof(string_view::value_type)) == 0;
}

string ascii_to_upper(string_view s) {
  string result;
  result.reserve(s.size());
  for (auto x : s)
    result.push_back((char)std::toupper(static_cast<unsigned char>(x)));
  return result;
}

string replace_all(string_view s, string_view find_str, string_view replace_str) {
  string result;
  size_t start_pos = 0;
  for (size_t pos; (pos = s.find(find_str, start_pos)) != string_view::npos; start_pos = pos + find_str.size()) {
    result.append(s.data() + start_pos, pos - start_pos);
    result.append(replace_str.begin(), replace_str.end());
  }
  result.append(s.data() + start_pos, s.size() - start_pos);
  return result;
}

size_t edit_distance(string_view a, string_view b) {
  // Only two rows of the dynamic programming table are live at any time
  vector<size_t> prev(b.size() + 1), cur(b.size() + 1);
  for (size_t j = 0; j <= b.size(); ++j)
    prev[j] = j;

  for (size_t i = 1; i <= a.size(); ++i) {
    cur[0] = i;
    for (size_t j = 1; j <= b.size(); ++j) {
      if (a[i - 1] == b[j - 1])
        cur[j] = prev[j - 1];
      else
        cur[j] = 1 + std::min({prev[j], cur[j - 1], prev[j - 1]});
    }
    std::swap(prev, cur);
  }
  return prev[b.size()];
}

} // namespace argmatch::util

} // namespace argmatch
