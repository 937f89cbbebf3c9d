#ifndef __VT_FRAME_CODEC_H__
#define __VT_FRAME_CODEC_H__

#include "ControlMessage.hpp"
#include "Headers.hpp"

namespace vt {
/** @brief Bytes in the big-endian length prefix. */
const size_t FRAME_HEADER_LENGTH = 4;
/** @brief Largest payload accepted on the wire. */
const uint32_t MAX_FRAME_LENGTH = 10 * 1024 * 1024;

/**
 * @brief Prefixes a UTF-8 JSON payload with its 4-byte big-endian length.
 * @throws std::runtime_error if the payload is empty or larger than
 * MAX_FRAME_LENGTH.
 */
string encodeFramePayload(const string& payload);

/** @brief Serializes and frames a message. */
string encodeFrame(const ControlMessage& message);

/**
 * @brief Incremental decoder for one byte stream.
 *
 * The accumulator holds complete but unprocessed frames followed by at most
 * one incomplete frame.  A length header that is zero or above
 * MAX_FRAME_LENGTH discards everything buffered.  A well-framed payload that
 * is not a valid message is logged and skipped on its own.
 */
class FrameDecoder {
 public:
  FrameDecoder();

  /**
   * @brief Appends bytes and returns every message that is now complete, in
   * arrival order.
   */
  vector<ControlMessage> feed(const char* data, size_t length);
  vector<ControlMessage> feed(const string& data) {
    return feed(data.data(), data.size());
  }

  size_t bufferedBytes() const { return buffer.size(); }
  /** @brief Number of times a bad length header reset the buffer. */
  int64_t resetCount() const { return resets; }
  /** @brief Number of framed payloads that failed to parse. */
  int64_t parseErrorCount() const { return parseErrors; }

  void clear() { buffer.clear(); }

 protected:
  string buffer;
  int64_t resets;
  int64_t parseErrors;
};
}  // namespace vt

#endif  // __VT_FRAME_CODEC_H__
