#pragma once

#include <cctype>
#include <cstddef>
#include <string>

namespace StringUtils {

inline constexpr const char *REPORT_SUFFIX = "_SiteReport.pdf";

// Replaces every character that is not an ASCII letter or digit with '_'.
inline std::string SanitizeFileComponent(const std::string &s) {
  std::string out;
  out.reserve(s.size());
  for (unsigned char ch : s)
    out.push_back(std::isalnum(ch) && ch < 0x80 ? static_cast<char>(ch) : '_');
  return out;
}

inline std::string ReportFileName(const std::string &projectName) {
  std::string base = SanitizeFileComponent(projectName);
  if (base.empty())
    base = "Untitled";
  return base + REPORT_SUFFIX;
}

inline std::string ToUpper(std::string s) {
  for (char &ch : s) {
    unsigned char c = static_cast<unsigned char>(ch);
    if (c < 0x80)
      ch = static_cast<char>(std::toupper(c));
  }
  return s;
}

// Keeps the first maxChars UTF-8 code points and appends "..." when the
// text was longer.
inline std::string TruncateWithEllipsis(const std::string &s, size_t maxChars) {
  size_t count = 0;
  for (size_t i = 0; i < s.size(); ++i) {
    if ((static_cast<unsigned char>(s[i]) & 0xC0) == 0x80)
      continue;
    if (count == maxChars)
      return s.substr(0, i) + "...";
    ++count;
  }
  return s;
}

} // namespace StringUtils
