#pragma once

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>

namespace lungo {

/**
 * SegmentView
 * @brief Lazy view that slices a buffer into segmentSize pieces, the last piece may be shorter.
 *        Iterating does not touch the buffer, so the view can be walked any number of times.
 */
class SegmentView {
public:
  class Iterator {
  public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = std::string_view;
    using difference_type = std::ptrdiff_t;
    using pointer = const std::string_view*;
    using reference = std::string_view;

    Iterator() = default;
    Iterator(std::string_view buffer, size_t segmentSize, size_t offset)
        : buffer_(buffer), segmentSize_(segmentSize), offset_(offset) {}

    reference operator*() const { return buffer_.substr(offset_, segmentSize_); }
    Iterator& operator++() {
      offset_ = std::min(offset_ + segmentSize_, buffer_.size());
      return *this;
    }
    Iterator operator++(int) {
      auto copy = *this;
      ++(*this);
      return copy;
    }
    bool operator==(const Iterator& rhs) const noexcept {
      return buffer_.data() == rhs.buffer_.data() && offset_ == rhs.offset_;
    }
    bool operator!=(const Iterator& rhs) const noexcept { return !(*this == rhs); }

  private:
    std::string_view buffer_;
    size_t segmentSize_ = 0;
    size_t offset_ = 0;
  };

  /// @throws std::invalid_argument if segmentSize is 0
  SegmentView(std::string_view buffer, size_t segmentSize);

  [[nodiscard]] Iterator begin() const { return {buffer_, segmentSize_, 0}; }
  [[nodiscard]] Iterator end() const { return {buffer_, segmentSize_, buffer_.size()}; }
  [[nodiscard]] size_t size() const noexcept {
    return (buffer_.size() + segmentSize_ - 1) / segmentSize_;
  }
  [[nodiscard]] bool empty() const noexcept { return buffer_.empty(); }

private:
  std::string_view buffer_;
  size_t segmentSize_;
};

SegmentView segment(std::string_view buffer, size_t segmentSize);

/**
 * SegmentAccumulator
 * @brief Incremental version of segment() for live audio. Chunks of any size go in, whole
 *        segments come out as soon as enough audio is buffered.
 */
class SegmentAccumulator {
public:
  /// @throws std::invalid_argument if segmentSize is 0
  explicit SegmentAccumulator(size_t segmentSize);

  void append(std::string_view chunk);
  /// @brief Next complete segment, std::nullopt if less than a segment is buffered
  std::optional<std::string> nextSegment();
  /// @brief Whatever is left over (possibly nothing), the accumulator is empty afterwards
  std::string takeRemainder();

  [[nodiscard]] size_t buffered() const noexcept { return buffer_.size() - readOffset_; }
  [[nodiscard]] size_t segmentSize() const noexcept { return segmentSize_; }

private:
  void compact();

  size_t segmentSize_;
  std::string buffer_;
  size_t readOffset_ = 0;
};

} // namespace lungo
