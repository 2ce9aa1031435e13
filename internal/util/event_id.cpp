#include "event_id.hpp"

#include <random>

namespace relations::util {

namespace {

constexpr std::string_view kAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";
constexpr std::size_t      kLocalpartLength = 24;

} // namespace

std::string GenerateEventId(std::string_view server_name) {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  std::string id;
  id.reserve(1 + kLocalpartLength + 1 + server_name.size());
  id.push_back('$');
  for (std::size_t i = 0; i < kLocalpartLength; ++i) {
    id.push_back(kAlphabet[rng() % kAlphabet.size()]);
  }
  id.push_back(':');
  id.append(server_name);
  return id;
}

} // namespace relations::util
