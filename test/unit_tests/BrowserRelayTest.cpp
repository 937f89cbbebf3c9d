#include "BrowserRelay.hpp"

#include "RelayTestFakes.hpp"
#include "TestHeaders.hpp"

using namespace vt;

namespace {
ControlMessage screencapRequest(const string& action) {
  return ControlMessage::createRequest(ControlCategory::SCREENCAP, action,
                                       json{{"method", "GET"}});
}
}  // namespace

TEST_CASE("New browsers are greeted", "[BrowserRelay]") {
  FakePeerLink peer;
  BrowserRelay relay(&peer);
  auto browser = make_shared<FakeBrowserSocket>("b1");

  SECTION("Without a peer") {
    relay.addBrowser(browser);
    REQUIRE(relay.browserCount() == 1);
    auto received = browser->received();
    REQUIRE(received.size() == 1);
    REQUIRE(received[0].isEvent());
    REQUIRE(received[0].category == ControlCategory::SCREENCAP);
    REQUIRE(received[0].action == "ready");
    REQUIRE(received[0].payload.value()["message"] ==
            "Control channel connected");
    REQUIRE(received[0].payload.value()["peerConnected"] == false);
    REQUIRE(peer.injected.empty());
  }

  SECTION("With a peer, mac-ready is replayed") {
    peer.connected = true;
    relay.addBrowser(browser);
    auto received = browser->received();
    REQUIRE(received[0].payload.value()["peerConnected"] == true);
    REQUIRE(peer.injected.size() == 1);
    REQUIRE(peer.injected[0].category == ControlCategory::SCREENCAP);
    REQUIRE(peer.injected[0].action == "mac-ready");
    REQUIRE(peer.injected[0].isEvent());
  }
}

TEST_CASE("Browser messages are forwarded to the peer", "[BrowserRelay]") {
  FakePeerLink peer;
  BrowserRelay relay(&peer);
  auto browser = make_shared<FakeBrowserSocket>("b1");
  relay.addBrowser(browser);
  browser->clearSent();

  SECTION("Peer connected") {
    peer.connected = true;
    auto request = screencapRequest("api-request");
    relay.onBrowserMessage("b1", request.toJsonString());
    REQUIRE(peer.sent.size() == 1);
    REQUIRE(peer.sent[0] == request);
    REQUIRE(browser->sentCount() == 0);
  }

  SECTION("Peer not connected") {
    auto request = screencapRequest("api-request");
    relay.onBrowserMessage("b1", request.toJsonString());
    REQUIRE(peer.sent.empty());
    auto received = browser->received();
    REQUIRE(received.size() == 1);
    REQUIRE(received[0].isResponse());
    REQUIRE(received[0].id == request.id);
    REQUIRE(received[0].error.value() == "Mac app is not connected");
  }

  SECTION("Peer not connected, events get no reply") {
    auto event = ControlMessage::createEvent(ControlCategory::SCREENCAP,
                                             "ice-candidate");
    relay.onBrowserMessage("b1", event.toJsonString());
    REQUIRE(browser->sentCount() == 0);
  }

  SECTION("Send failure") {
    peer.connected = true;
    peer.sendSucceeds = false;
    auto request = screencapRequest("start-capture");
    relay.onBrowserMessage("b1", request.toJsonString());
    auto received = browser->received();
    REQUIRE(received.size() == 1);
    REQUIRE(received[0].error.value() == "Failed to send to Mac app");
  }

  SECTION("Other categories are ignored") {
    peer.connected = true;
    auto request = ControlMessage::createRequest(ControlCategory::TERMINAL,
                                                 "spawn");
    relay.onBrowserMessage("b1", request.toJsonString());
    REQUIRE(peer.sent.empty());
    REQUIRE(browser->sentCount() == 0);
  }

  SECTION("Unparseable text") {
    peer.connected = true;
    relay.onBrowserMessage("b1", "{oops");
    REQUIRE(peer.sent.empty());
    auto received = browser->received();
    REQUIRE(received.size() == 1);
    REQUIRE(received[0].category == ControlCategory::SYSTEM);
    REQUIRE(received[0].action == "error");
    REQUIRE(received[0].payload.value()["error"].get<string>().find(
                "Invalid JSON") != string::npos);
  }
}

TEST_CASE("Peer responses go back to the browser that asked",
          "[BrowserRelay]") {
  FakePeerLink peer;
  peer.connected = true;
  BrowserRelay relay(&peer);
  auto b1 = make_shared<FakeBrowserSocket>("b1");
  auto b2 = make_shared<FakeBrowserSocket>("b2");
  relay.addBrowser(b1);
  relay.addBrowser(b2);
  b1->clearSent();
  b2->clearSent();

  auto request = screencapRequest("api-request");
  relay.onBrowserMessage("b2", request.toJsonString());
  auto response =
      ControlMessage::createResponse(request, json{{"displays", json::array()}});

  SECTION("Routed to the requester") {
    REQUIRE(relay.routeResponse(response) == 1);
    REQUIRE(b1->sentCount() == 0);
    auto received = b2->received();
    REQUIRE(received.size() == 1);
    REQUIRE(received[0] == response);

    // The route is used once; a repeat goes to everyone.
    REQUIRE(relay.routeResponse(response) == 2);
  }

  SECTION("Requester left, response is broadcast") {
    relay.removeBrowser("b2");
    REQUIRE(relay.routeResponse(response) == 1);
    REQUIRE(b1->sentCount() == 1);
  }

  SECTION("Routes cleared when the peer goes away") {
    relay.clearForwardedRequests();
    REQUIRE(relay.routeResponse(response) == 2);
  }
}

TEST_CASE("Broadcast reaches every open browser", "[BrowserRelay]") {
  FakePeerLink peer;
  BrowserRelay relay(&peer);
  auto b1 = make_shared<FakeBrowserSocket>("b1");
  auto b2 = make_shared<FakeBrowserSocket>("b2");
  auto b3 = make_shared<FakeBrowserSocket>("b3");
  relay.addBrowser(b1);
  relay.addBrowser(b2);
  relay.addBrowser(b3);
  b2->open = false;
  b3->failSends = true;

  auto offer = ControlMessage::createEvent(ControlCategory::SCREENCAP, "offer",
                                           json{{"sdp", "v=0"}});
  REQUIRE(relay.broadcast(offer) == 1);
  REQUIRE(b1->received().back() == offer);

  REQUIRE(relay.sendTo("missing", offer) == false);

  relay.removeBrowser("b1");
  relay.removeBrowser("b1");
  REQUIRE(relay.browserCount() == 2);
  auto ids = relay.getBrowserIds();
  REQUIRE(ids == vector<string>({"b2", "b3"}));
}
