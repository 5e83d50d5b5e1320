#include "net/hostlist.h"

#include "common/errors.h"

#include <unordered_set>

namespace sweepflux {

namespace {

std::string Trim(const std::string &input) {
  auto start = input.find_first_not_of(" \t\r\n");
  auto end = input.find_last_not_of(" \t\r\n");
  if (start == std::string::npos) {
    return "";
  }
  return input.substr(start, end - start + 1);
}

// Splits on commas that are not inside brackets.
std::vector<std::string> SplitTopLevel(const std::string &text) {
  std::vector<std::string> parts;
  std::string current;
  int depth = 0;
  for (char c : text) {
    if (c == '[') {
      ++depth;
    } else if (c == ']') {
      --depth;
      if (depth < 0)
        throw ConfigurationError("unbalanced ']' in host list: " + text);
    }
    if (c == ',' && depth == 0) {
      parts.push_back(current);
      current.clear();
    } else {
      current.push_back(c);
    }
  }
  if (depth != 0)
    throw ConfigurationError("unbalanced '[' in host list: " + text);
  parts.push_back(current);
  return parts;
}

int ParseIndex(const std::string &digits, const std::string &context) {
  if (digits.empty() ||
      digits.find_first_not_of("0123456789") != std::string::npos) {
    throw ConfigurationError("invalid range bound '" + digits +
                             "' in host list: " + context);
  }
  return std::stoi(digits);
}

std::string Pad(int value, std::size_t width) {
  std::string s = std::to_string(value);
  if (s.size() < width)
    s.insert(0, width - s.size(), '0');
  return s;
}

void ExpandOne(const std::string &item, std::vector<std::string> &out) {
  auto open = item.find('[');
  if (open == std::string::npos) {
    out.push_back(item);
    return;
  }
  auto close = item.find(']', open);
  if (close == std::string::npos || item.find('[', open + 1) != std::string::npos) {
    throw ConfigurationError("unsupported host list entry: " + item);
  }
  std::string prefix = item.substr(0, open);
  std::string suffix = item.substr(close + 1);
  std::string body = item.substr(open + 1, close - open - 1);

  std::size_t pos = 0;
  while (pos <= body.size()) {
    auto comma = body.find(',', pos);
    std::string range = body.substr(
        pos, comma == std::string::npos ? std::string::npos : comma - pos);
    auto dash = range.find('-');
    if (dash == std::string::npos) {
      ParseIndex(range, item);
      out.push_back(prefix + range + suffix);
    } else {
      std::string lo_text = range.substr(0, dash);
      int lo = ParseIndex(lo_text, item);
      int hi = ParseIndex(range.substr(dash + 1), item);
      if (hi < lo) {
        throw ConfigurationError("descending range '" + range +
                                 "' in host list: " + item);
      }
      for (int i = lo; i <= hi; ++i)
        out.push_back(prefix + Pad(i, lo_text.size()) + suffix);
    }
    if (comma == std::string::npos)
      break;
    pos = comma + 1;
  }
}

} // namespace

std::vector<std::string> ExpandHostList(const std::string &hostlist) {
  std::vector<std::string> expanded;
  for (const auto &raw : SplitTopLevel(Trim(hostlist))) {
    auto item = Trim(raw);
    if (item.empty())
      continue;
    ExpandOne(item, expanded);
  }

  std::vector<std::string> unique;
  std::unordered_set<std::string> seen;
  for (auto &host : expanded) {
    if (seen.insert(host).second)
      unique.push_back(std::move(host));
  }
  return unique;
}

} // namespace sweepflux
