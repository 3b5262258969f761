#include "part.buffer.hh"
#include "macros.hh"

#include <algorithm>

s3zip::PartBuffer::PartBuffer(size_t part_size)
  : part_size_{ part_size }
  , next_part_number_{ 1 }
  , bytes_appended_{ 0 }
  , flushed_{ false }
{
    EXPECT(part_size_ > 0, "Part size must be positive");
    current_.reserve(part_size_);
}

void
s3zip::PartBuffer::append(ConstByteSpan data)
{
    EXPECT(!flushed_, "Cannot append to a part buffer after the final part");

    auto begin = data.begin();
    while (begin != data.end()) {
        const auto n = std::min(static_cast<size_t>(data.end() - begin),
                                part_size_ - current_.size());
        current_.insert(current_.end(), begin, begin + n);
        begin += n;

        if (current_.size() == part_size_) {
            full_parts_.push(std::move(current_));
            current_ = ByteVector();
            current_.reserve(part_size_);
        }
    }

    bytes_appended_ += data.size();
}

std::vector<s3zip::Part>
s3zip::PartBuffer::drain_full_parts()
{
    std::vector<Part> parts;
    parts.reserve(full_parts_.size());

    while (!full_parts_.empty()) {
        parts.push_back(make_part_(std::move(full_parts_.front())));
        full_parts_.pop();
    }

    return parts;
}

std::optional<s3zip::Part>
s3zip::PartBuffer::flush_remainder()
{
    EXPECT(full_parts_.empty(),
           "Drain the ",
           full_parts_.size(),
           " full part(s) before flushing the remainder");

    if (flushed_) {
        return std::nullopt;
    }
    flushed_ = true;

    if (current_.empty()) {
        return std::nullopt; // a zero-size part is never uploaded
    }

    current_.shrink_to_fit();
    return make_part_(std::move(current_));
}

size_t
s3zip::PartBuffer::bytes_buffered() const
{
    return current_.size() + full_parts_.size() * part_size_;
}

s3zip::Part
s3zip::PartBuffer::make_part_(ByteVector&& bytes)
{
    return Part{ .number = next_part_number_++,
                 .payload =
                   std::make_shared<const ByteVector>(std::move(bytes)) };
}
