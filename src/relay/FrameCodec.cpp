#include "FrameCodec.hpp"

namespace vt {
string encodeFramePayload(const string& payload) {
  if (payload.empty()) {
    throw std::runtime_error("Cannot frame an empty payload");
  }
  if (payload.size() > MAX_FRAME_LENGTH) {
    throw std::runtime_error("Payload of " + to_string(payload.size()) +
                             " bytes exceeds the frame limit");
  }
  uint32_t length = htonl(uint32_t(payload.size()));
  string frame;
  frame.reserve(FRAME_HEADER_LENGTH + payload.size());
  frame.append((const char*)&length, FRAME_HEADER_LENGTH);
  frame.append(payload);
  return frame;
}

string encodeFrame(const ControlMessage& message) {
  return encodeFramePayload(message.toJsonString());
}

FrameDecoder::FrameDecoder() : resets(0), parseErrors(0) {}

vector<ControlMessage> FrameDecoder::feed(const char* data, size_t length) {
  vector<ControlMessage> messages;
  buffer.append(data, length);
  VLOG(3) << "Received " << length << " bytes, buffer size: " << buffer.size();

  size_t offset = 0;
  while (buffer.size() - offset >= FRAME_HEADER_LENGTH) {
    uint32_t networkLength;
    memcpy(&networkLength, buffer.data() + offset, FRAME_HEADER_LENGTH);
    uint32_t frameLength = ntohl(networkLength);

    if (frameLength == 0 || frameLength > MAX_FRAME_LENGTH) {
      LOG(ERROR) << "Invalid frame length " << frameLength << " (max "
                 << MAX_FRAME_LENGTH << "), discarding " << buffer.size()
                 << " buffered bytes";
      buffer.clear();
      offset = 0;
      ++resets;
      break;
    }

    if (buffer.size() - offset < FRAME_HEADER_LENGTH + frameLength) {
      VLOG(3) << "Waiting for more data: have " << buffer.size() - offset
              << ", need " << FRAME_HEADER_LENGTH + frameLength;
      break;
    }

    string payload =
        buffer.substr(offset + FRAME_HEADER_LENGTH, frameLength);
    offset += FRAME_HEADER_LENGTH + frameLength;

    try {
      messages.push_back(ControlMessage::fromJsonString(payload));
      VLOG(1) << "Decoded " << messages.back();
    } catch (const std::runtime_error& re) {
      ++parseErrors;
      LOG(ERROR) << "Failed to parse framed message (" << frameLength
                 << " bytes): " << re.what();
      VLOG(4) << "Raw message: " << previewString(payload, 200);
    }
  }

  if (offset > 0) {
    buffer.erase(0, offset);
  }
  return messages;
}
}  // namespace vt
