#include "core/id.h"

#include <cstdint>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>

namespace wake::core {

std::string generate_id() {
  static std::mutex mutex;
  static std::random_device rd;
  static std::mt19937_64 gen(rd());
  static std::uniform_int_distribution<std::uint64_t> dis;

  std::uint64_t hi = 0;
  std::uint64_t lo = 0;
  {
    std::lock_guard<std::mutex> lock(mutex);
    hi = dis(gen);
    lo = dis(gen);
  }
  hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL; // version 4
  lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL; // variant 1

  std::ostringstream ss;
  ss << std::hex << std::setfill('0') << std::setw(8) << (hi >> 32) << '-'
     << std::setw(4) << ((hi >> 16) & 0xFFFF) << '-' << std::setw(4)
     << (hi & 0xFFFF) << '-' << std::setw(4) << (lo >> 48) << '-'
     << std::setw(12) << (lo & 0xFFFFFFFFFFFFULL);
  return ss.str();
}

} // namespace wake::core
