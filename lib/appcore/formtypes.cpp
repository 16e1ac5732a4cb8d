#include "formtypes.hpp"

#include "utils.hpp"

std::vector<std::string> splitList(const std::string &value) {
  std::vector<std::string> items;
  size_t start = 0;
  while (start <= value.size()) {
    size_t comma = value.find(',', start);
    if (comma == std::string::npos)
      comma = value.size();
    std::string item = trim(value.substr(start, comma - start));
    if (!item.empty())
      items.push_back(item);
    start = comma + 1;
  }
  return items;
}

std::string joinList(const std::vector<std::string> &items) {
  std::string out;
  for (const auto &item : items) {
    if (!out.empty())
      out += ",";
    out += item;
  }
  return out;
}
