/*
 * notevault C++17 - Fixed resource ceilings
 *
 * None of these are configurable: the vault is exposed to an untrusted
 * caller and the limits are part of the contract.
 */
#ifndef notevault_CORE_LIMITS_HPP
#define notevault_CORE_LIMITS_HPP

#include <cstddef>

namespace notevault {
namespace limits {

constexpr std::size_t kMaxReadBytes = 10 * 1024 * 1024;
constexpr std::size_t kMaxWriteBytes = 1000000;
constexpr std::size_t kMaxNamesPerRead = 50;
constexpr std::size_t kMaxPartialMatches = 5;
constexpr std::size_t kMaxPathLength = 512;
constexpr std::size_t kMaxPathDepth = 10;

// One JSON-RPC line. Large enough for a maximal write request.
constexpr std::size_t kMaxMessageBytes = 16 * 1024 * 1024;

} // namespace limits
} // namespace notevault

#endif // notevault_CORE_LIMITS_HPP
