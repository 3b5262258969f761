#pragma once

#include <cstddef> // size_t
#include <cstdint> // uint8_t
#include <span>
#include <vector>

using ByteVector = std::vector<uint8_t>;
using BytePtr = uint8_t*;
using ConstBytePtr = const BytePtr;

using ByteSpan = std::span<uint8_t>;
using ConstByteSpan = std::span<const uint8_t>;

constexpr size_t DEFAULT_PART_SIZE = 10 << 20; // 10 MiB
constexpr size_t MIN_S3_PART_SIZE = 5 << 20;   // 5 MiB
constexpr size_t MAX_S3_PART_SIZE = size_t(5) << 30;
constexpr uint32_t MAX_PART_COUNT = 10000;
constexpr uint32_t DEFAULT_MAX_IN_FLIGHT = 4;
constexpr uint32_t MAX_CONCURRENT_UPLOADS = 64;
