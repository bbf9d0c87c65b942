#include "endon/request_context.hpp"

#include <random>

namespace endon {

std::string make_request_id() {
  static constexpr char kAlphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
  static constexpr std::size_t kLen = 12;
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  std::uniform_int_distribution<std::size_t> pick(0, sizeof(kAlphabet) - 2);
  std::string id(kLen, '0');
  for (auto &c : id)
    c = kAlphabet[pick(rng)];
  return id;
}

} // namespace endon
