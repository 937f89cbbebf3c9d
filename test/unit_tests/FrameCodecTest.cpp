#include "FrameCodec.hpp"

#include "TestHeaders.hpp"

using namespace vt;

namespace {
string lengthHeader(uint32_t length) {
  uint32_t networkLength = htonl(length);
  return string((const char*)&networkLength, FRAME_HEADER_LENGTH);
}

ControlMessage pingRequest() {
  return ControlMessage::createRequest(ControlCategory::SYSTEM, "ping");
}
}  // namespace

TEST_CASE("Frames carry a big-endian length prefix", "[FrameCodec]") {
  string frame = encodeFramePayload("abc");
  REQUIRE(frame.size() == 7);
  REQUIRE(frame[0] == 0);
  REQUIRE(frame[1] == 0);
  REQUIRE(frame[2] == 0);
  REQUIRE(frame[3] == 3);
  REQUIRE(frame.substr(4) == "abc");

  string big(300, 'x');
  string bigFrame = encodeFramePayload(big);
  REQUIRE((unsigned char)bigFrame[2] == 1);
  REQUIRE((unsigned char)bigFrame[3] == 44);
}

TEST_CASE("Encoding rejects empty and oversized payloads", "[FrameCodec]") {
  REQUIRE_THROWS_AS(encodeFramePayload(""), std::runtime_error);
  REQUIRE_THROWS_AS(encodeFramePayload(string(MAX_FRAME_LENGTH + 1, 'x')),
                    std::runtime_error);
  REQUIRE_NOTHROW(encodeFramePayload(string(MAX_FRAME_LENGTH, 'x')));
}

TEST_CASE("Decoder returns whole messages in order", "[FrameCodec]") {
  FrameDecoder decoder;
  auto first = pingRequest();
  auto second = ControlMessage::createEvent(ControlCategory::SCREENCAP,
                                            "state-change",
                                            json{{"state", "capturing"}});

  SECTION("Several frames in one read") {
    auto messages = decoder.feed(encodeFrame(first) + encodeFrame(second));
    REQUIRE(messages.size() == 2);
    REQUIRE(messages[0] == first);
    REQUIRE(messages[1] == second);
    REQUIRE(decoder.bufferedBytes() == 0);
  }

  SECTION("Split at every byte boundary") {
    string stream = encodeFrame(first) + encodeFrame(second);
    for (size_t split = 1; split < stream.size(); ++split) {
      FrameDecoder splitDecoder;
      auto head = splitDecoder.feed(stream.substr(0, split));
      auto tail = splitDecoder.feed(stream.substr(split));
      head.insert(head.end(), tail.begin(), tail.end());
      REQUIRE(head.size() == 2);
      REQUIRE(head[0] == first);
      REQUIRE(head[1] == second);
      REQUIRE(splitDecoder.bufferedBytes() == 0);
    }
  }

  SECTION("One byte at a time") {
    string stream = encodeFrame(first);
    vector<ControlMessage> messages;
    for (char c : stream) {
      auto decoded = decoder.feed(&c, 1);
      messages.insert(messages.end(), decoded.begin(), decoded.end());
    }
    REQUIRE(messages.size() == 1);
    REQUIRE(messages[0] == first);
  }

  SECTION("Incomplete frame stays buffered") {
    string frame = encodeFrame(first);
    REQUIRE(decoder.feed(frame.substr(0, 2)).empty());
    REQUIRE(decoder.bufferedBytes() == 2);
    REQUIRE(decoder.feed(frame.substr(2, frame.size() - 3)).empty());
    REQUIRE(decoder.bufferedBytes() == frame.size() - 1);
    REQUIRE(decoder.feed(frame.substr(frame.size() - 1)).size() == 1);
  }
}

TEST_CASE("Bad length headers reset the buffer", "[FrameCodec]") {
  FrameDecoder decoder;
  auto ping = pingRequest();

  SECTION("Zero length") {
    auto messages = decoder.feed(lengthHeader(0) + "trailing garbage");
    REQUIRE(messages.empty());
    REQUIRE(decoder.resetCount() == 1);
    REQUIRE(decoder.bufferedBytes() == 0);
  }

  SECTION("Length above the limit") {
    auto messages = decoder.feed(lengthHeader(MAX_FRAME_LENGTH + 1) + "{}");
    REQUIRE(messages.empty());
    REQUIRE(decoder.resetCount() == 1);
    REQUIRE(decoder.bufferedBytes() == 0);
  }

  SECTION("Valid frames before the bad header are kept") {
    auto messages =
        decoder.feed(encodeFrame(ping) + lengthHeader(0xFFFFFFFF) + "junk");
    REQUIRE(messages.size() == 1);
    REQUIRE(messages[0] == ping);
    REQUIRE(decoder.resetCount() == 1);
  }

  SECTION("Decoding resumes with the next read") {
    decoder.feed(lengthHeader(0));
    auto messages = decoder.feed(encodeFrame(ping));
    REQUIRE(messages.size() == 1);
    REQUIRE(messages[0] == ping);
  }
}

TEST_CASE("Malformed payloads are skipped on their own", "[FrameCodec]") {
  FrameDecoder decoder;
  auto ping = pingRequest();

  auto messages = decoder.feed(
      encodeFramePayload("{this is not json") + encodeFrame(ping) +
      encodeFramePayload(R"({"id":"1","type":"request","category":"bogus"})") +
      encodeFramePayload(R"({"type":"event","category":"system","action":"x"})"));
  REQUIRE(messages.size() == 1);
  REQUIRE(messages[0] == ping);
  REQUIRE(decoder.parseErrorCount() == 3);
  REQUIRE(decoder.resetCount() == 0);
  REQUIRE(decoder.bufferedBytes() == 0);
}
