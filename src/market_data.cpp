#include "bags/market_data.hpp"

namespace bags {

std::string excerpt(const std::string& body, size_t max_length) {
  if (body.size() <= max_length) {
    return body;
  }
  return body.substr(0, max_length) + "...";
}

} // namespace bags
