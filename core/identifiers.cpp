#include "core/identifiers.hpp"

#include <cctype>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>

namespace ledger {
namespace core {

namespace {

std::mt19937_64& generator() {
  thread_local std::mt19937_64 engine(std::random_device{}());
  return engine;
}

}  // namespace

std::string newUuid() {
  std::uniform_int_distribution<std::uint64_t> dist;
  std::uint64_t high = dist(generator());
  std::uint64_t low = dist(generator());

  // Version 4, RFC 4122 variant.
  high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

  std::stringstream ss;
  ss << std::hex << std::setfill('0')
     << std::setw(8) << (high >> 32) << "-"
     << std::setw(4) << ((high >> 16) & 0xFFFF) << "-"
     << std::setw(4) << (high & 0xFFFF) << "-"
     << std::setw(4) << (low >> 48) << "-"
     << std::setw(12) << (low & 0xFFFFFFFFFFFFULL);
  return ss.str();
}

bool isUuid(const std::string& text) {
  if (text.size() != 36) return false;
  for (size_t i = 0; i < text.size(); ++i) {
    if (i == 8 || i == 13 || i == 18 || i == 23) {
      if (text[i] != '-') return false;
    } else if (!std::isxdigit(static_cast<unsigned char>(text[i]))) {
      return false;
    }
  }
  return true;
}

std::string canonicalId(const std::string& id) {
  std::string canonical = id;
  for (char& c : canonical) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return canonical;
}

std::string randomDigits(int count) {
  std::uniform_int_distribution<int> dist(0, 9);
  std::string digits;
  digits.reserve(count);
  for (int i = 0; i < count; ++i) {
    digits.push_back(static_cast<char>('0' + dist(generator())));
  }
  return digits;
}

}  // namespace core
}  // namespace ledger
