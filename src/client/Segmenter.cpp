#include <stdexcept>

#include <spdlog/spdlog.h>

#include "Segmenter.hpp"

namespace lungo {

SegmentView::SegmentView(std::string_view buffer, size_t segmentSize)
    : buffer_(buffer), segmentSize_(segmentSize) {
  if (segmentSize_ == 0) {
    throw std::invalid_argument("segment size must be greater than zero");
  }
}

SegmentView segment(std::string_view buffer, size_t segmentSize) {
  return SegmentView(buffer, segmentSize);
}

SegmentAccumulator::SegmentAccumulator(size_t segmentSize) : segmentSize_(segmentSize) {
  if (segmentSize_ == 0) {
    throw std::invalid_argument("segment size must be greater than zero");
  }
  buffer_.reserve(segmentSize_ * 2);
}

void SegmentAccumulator::append(std::string_view chunk) { buffer_.append(chunk); }

std::optional<std::string> SegmentAccumulator::nextSegment() {
  if (buffered() < segmentSize_) {
    return std::nullopt;
  }
  std::string out = buffer_.substr(readOffset_, segmentSize_);
  readOffset_ += segmentSize_;
  compact();
  return out;
}

std::string SegmentAccumulator::takeRemainder() {
  std::string out = buffer_.substr(readOffset_);
  buffer_.clear();
  readOffset_ = 0;
  return out;
}

/**
 * SegmentAccumulator::compact
 * @brief Drops consumed bytes once they make up most of the buffer
 */
void SegmentAccumulator::compact() {
  if (readOffset_ == buffer_.size()) {
    buffer_.clear();
    readOffset_ = 0;
  } else if (readOffset_ >= segmentSize_ * 4 && readOffset_ * 2 > buffer_.size()) {
    SPDLOG_TRACE("Compacting segment buffer, dropping {} consumed bytes", readOffset_);
    buffer_.erase(0, readOffset_);
    readOffset_ = 0;
  }
}

} // namespace lungo
