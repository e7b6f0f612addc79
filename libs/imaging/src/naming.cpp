/**
 * @file naming.cpp
 * @brief Output artifact naming implementation.
 * @author Watosn
 */

#include "ringsky/imaging/naming.hpp"

namespace ringsky::imaging {

std::string dec_tag(const std::string& dec) {
  std::string tag;
  tag.reserve(dec.size());
  for (const char c : dec) {
    if (c == '-') {
      tag.push_back('m');
    } else if (c == '+') {
      tag.push_back('p');
    } else if (c != 'd' && c != '.') {
      tag.push_back(c);
    }
  }
  return tag;
}

std::string image_name(const std::string& output_base, const std::string& dec) {
  return output_base + "_dec" + dec_tag(dec);
}

}  // namespace ringsky::imaging
