#pragma once

#include "part.hh"

#include <optional>
#include <queue>
#include <vector>

namespace s3zip {
/**
 * @brief Accumulates stream bytes and slices them into numbered parts.
 * @details Every part but the last holds exactly `part_size` bytes. Part
 * numbers start at 1 and increase by one for each part, in the order the
 * bytes were appended. Not thread-safe; owned by the producing thread.
 */
class PartBuffer
{
  public:
    explicit PartBuffer(size_t part_size);

    /**
     * @brief Append producer output to the buffer.
     * @param data The bytes to append.
     * @throws std::runtime_error if the remainder was already flushed.
     */
    void append(ConstByteSpan data);

    /**
     * @brief Remove every full part accumulated so far, in FIFO order.
     * @return The full parts, numbered in order. Possibly empty.
     */
    std::vector<Part> drain_full_parts();

    /**
     * @brief Emit whatever remains as the final part.
     * @details Call once, after end-of-stream and after draining full parts.
     * @return The final part, or nullopt if no bytes remain.
     */
    std::optional<Part> flush_remainder();

    size_t bytes_buffered() const;
    uint64_t bytes_appended() const { return bytes_appended_; }
    uint32_t next_part_number() const { return next_part_number_; }

  private:
    const size_t part_size_;

    ByteVector current_;                // the part being filled
    std::queue<ByteVector> full_parts_; // filled, not yet drained

    uint32_t next_part_number_;
    uint64_t bytes_appended_;
    bool flushed_;

    Part make_part_(ByteVector&& bytes);
};
} // namespace s3zip
