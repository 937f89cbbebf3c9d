#include "ControlUnixHandler.hpp"

#include "RelayTestFakes.hpp"
#include "TestHeaders.hpp"

using namespace vt;

namespace {
class RelayHarness {
 public:
  RelayHarness() : subprocess(new FakeSubprocessUtils()) {
    config.socketPath = socketDir.path("control.sock");
    config.websocketPort = 0;
    config.requestTimeout = std::chrono::milliseconds(300);
    config.initialDataDelay = std::chrono::milliseconds(20);
    config.pathSyncReenableDelay = std::chrono::milliseconds(100);
    config.terminalLauncher = "vibetunnel-test";
  }

  ~RelayHarness() { stop(); }

  void start() {
    handler.reset(new ControlUnixHandler(
        config, shared_ptr<PipeSocketHandler>(new PipeSocketHandler()),
        subprocess));
    handler->start();
    loop = std::thread([this]() { handler->run(); });
  }

  void stop() {
    if (handler) {
      handler->requestStop();
    }
    if (loop.joinable()) {
      loop.join();
    }
  }

  /** Connects a host peer and consumes its system:ready greeting. */
  unique_ptr<PeerTestClient> connectPeer() {
    unique_ptr<PeerTestClient> client(
        new PeerTestClient(handler->getSocketEndpoint()));
    REQUIRE(client->isConnected());
    REQUIRE(client->waitForAction("system", "ready"));
    REQUIRE(waitUntil([this]() { return handler->isPeerConnected(); }));
    return client;
  }

  TemporarySocketDirectory socketDir;
  RelayConfig config;
  shared_ptr<FakeSubprocessUtils> subprocess;
  unique_ptr<ControlUnixHandler> handler;
  std::thread loop;
};

optional<ControlMessage> roundTrip(PeerTestClient* client,
                                   const ControlMessage& request) {
  client->send(request);
  return client->waitFor([&request](const ControlMessage& m) {
    return m.isResponse() && m.id == request.id;
  });
}

bool browserReceived(shared_ptr<FakeBrowserSocket> browser,
                     std::function<bool(const ControlMessage&)> predicate) {
  return waitUntil([browser, predicate]() {
    for (const auto& m : browser->received()) {
      if (predicate(m)) {
        return true;
      }
    }
    return false;
  });
}
}  // namespace

TEST_CASE("Peer requests are answered", "[ControlUnixHandler]") {
  RelayHarness harness;
  harness.start();
  auto peer = harness.connectPeer();

  SECTION("system:ping") {
    auto response = roundTrip(
        peer.get(), ControlMessage::createRequest(ControlCategory::SYSTEM, "ping"));
    REQUIRE(response);
    REQUIRE(response->payload.value()["status"] == "ok");
  }

  SECTION("Unknown system action") {
    auto response = roundTrip(
        peer.get(), ControlMessage::createRequest(ControlCategory::SYSTEM, "bogus"));
    REQUIRE(response);
    REQUIRE(response->error.value() == "Unknown action: bogus");
  }

  SECTION("Category without a handler") {
    // Events for it are dropped without a reply, so the next reply is the
    // request's.
    peer->send(ControlMessage::createEvent(ControlCategory::GIT, "status"));
    auto request = ControlMessage::createRequest(ControlCategory::GIT, "status");
    peer->send(request);
    auto reply = peer->waitFor(
        [](const ControlMessage& m) { return m.isResponse(); });
    REQUIRE(reply);
    REQUIRE(reply->id == request.id);
    REQUIRE(reply->error.value() == "Unknown category: git");
  }

  SECTION("Category outside the protocol") {
    peer->sendRaw(encodeFramePayload(
        R"({"id":"t9","type":"request","category":"bogus","action":"x"})"));
    auto reply = peer->waitForId("t9");
    REQUIRE(reply);
    REQUIRE(reply->isResponse());
    REQUIRE(reply->categoryName() == "bogus");
    REQUIRE(reply->error.value() == "Unknown category: bogus");
  }

  SECTION("terminal:spawn") {
    auto response = roundTrip(
        peer.get(),
        ControlMessage::createRequest(ControlCategory::TERMINAL, "spawn",
                                      json{{"sessionId", "abc"},
                                           {"command", "zsh"}}));
    REQUIRE(response);
    REQUIRE(response->payload.value()["success"] == true);
    auto spawned = harness.subprocess->getSpawned();
    REQUIRE(spawned.size() == 1);
    REQUIRE(spawned[0].first == "vibetunnel-test");
    REQUIRE(spawned[0].second == vector<string>({"launch", "--command", "zsh",
                                                 "--session-id", "abc"}));
  }

  SECTION("Screencap ping") {
    auto response = roundTrip(
        peer.get(),
        ControlMessage::createRequest(ControlCategory::SCREENCAP, "ping"));
    REQUIRE(response);
    REQUIRE(response->action == "pong");
  }

  SECTION("Stray responses are not answered") {
    auto orphan = ControlMessage::createRequest(ControlCategory::SYSTEM, "ping");
    peer->send(ControlMessage::createErrorResponse(orphan, "nobody asked"));
    auto response = roundTrip(
        peer.get(), ControlMessage::createRequest(ControlCategory::SYSTEM, "ping"));
    REQUIRE(response);
    REQUIRE_FALSE(peer->waitFor(
        [&orphan](const ControlMessage& m) { return m.id == orphan.id; },
        std::chrono::milliseconds(100)));
  }
}

TEST_CASE("Relay requests are correlated with peer responses",
          "[ControlUnixHandler]") {
  RelayHarness harness;
  harness.start();

  SECTION("No peer") {
    auto future = harness.handler->sendControlMessage(
        ControlMessage::createRequest(ControlCategory::SYSTEM, "ping"));
    REQUIRE(future.wait_for(std::chrono::seconds(1)) ==
            std::future_status::ready);
    REQUIRE_FALSE(future.get());
  }

  SECTION("Answered") {
    auto peer = harness.connectPeer();
    auto request = ControlMessage::createRequest(
        ControlCategory::SCREENCAP, "api-request", json{{"method", "GET"}});
    auto future = harness.handler->sendControlMessage(request);

    auto received = peer->waitForId(request.id);
    REQUIRE(received);
    REQUIRE(received->isRequest());
    peer->send(
        ControlMessage::createResponse(*received, json{{"displays", 2}}));

    REQUIRE(future.wait_for(std::chrono::seconds(3)) ==
            std::future_status::ready);
    auto response = future.get();
    REQUIRE(response);
    REQUIRE(response->payload.value()["displays"] == 2);
    REQUIRE(harness.handler->getRequestCorrelator()->pendingCount() == 0);
  }

  SECTION("Timed out, then answered late") {
    auto peer = harness.connectPeer();
    auto request = ControlMessage::createRequest(ControlCategory::SYSTEM, "ping");
    auto future = harness.handler->sendControlMessage(request);
    REQUIRE(peer->waitForId(request.id));

    REQUIRE(future.wait_for(std::chrono::seconds(3)) ==
            std::future_status::ready);
    REQUIRE_FALSE(future.get());

    // The late response is dropped and the relay keeps working.
    peer->send(ControlMessage::createResponse(request, json{{"late", true}}));
    auto response = roundTrip(
        peer.get(), ControlMessage::createRequest(ControlCategory::SYSTEM, "ping"));
    REQUIRE(response);
  }

  SECTION("Shutdown resolves pending requests") {
    auto peer = harness.connectPeer();
    auto future = harness.handler->sendControlMessage(
        ControlMessage::createRequest(ControlCategory::SYSTEM, "ping"));
    harness.stop();
    REQUIRE(future.wait_for(std::chrono::seconds(1)) ==
            std::future_status::ready);
    REQUIRE_FALSE(future.get());
  }
}

TEST_CASE("Repository path sync", "[ControlUnixHandler]") {
  std::mutex updatesMutex;
  vector<string> updates;
  RelayHarness harness;
  harness.start();
  harness.handler->setConfigUpdateCallback(
      [&updatesMutex, &updates](const string& path) {
        lock_guard<std::mutex> guard(updatesMutex);
        updates.push_back(path);
      });
  auto peer = harness.connectPeer();

  SECTION("Peer update is applied and not echoed") {
    auto response = roundTrip(
        peer.get(),
        ControlMessage::createRequest(ControlCategory::SYSTEM,
                                      "repository-path-update",
                                      json{{"path", "/Users/me/Code"}}));
    REQUIRE(response);
    REQUIRE(response->payload.value()["success"] == true);
    REQUIRE(response->payload.value()["path"] == "/Users/me/Code");
    REQUIRE(harness.handler->getRepositoryPath() == "/Users/me/Code");
    {
      lock_guard<std::mutex> guard(updatesMutex);
      REQUIRE(updates == vector<string>({"/Users/me/Code"}));
    }

    // Inside the suppression window the server side change stays local.
    REQUIRE(harness.handler->updateRepositoryPath("/Users/me/Code"));
    REQUIRE_FALSE(peer->waitFor(
        [](const ControlMessage& m) {
          return m.isRequest() && m.action == "repository-path-update";
        },
        std::chrono::milliseconds(50)));

    // Afterwards it is sent to the peer.
    REQUIRE(waitUntil([&harness]() {
      return harness.handler->getSystemHandler()->isPathSyncEnabled();
    }));
    REQUIRE(harness.handler->updateRepositoryPath("/srv/elsewhere"));
    auto sync = peer->waitFor([](const ControlMessage& m) {
      return m.isRequest() && m.action == "repository-path-update";
    });
    REQUIRE(sync);
    REQUIRE(sync->category == ControlCategory::SYSTEM);
    REQUIRE(sync->payload.value()["path"] == "/srv/elsewhere");
    REQUIRE(sync->payload.value()["source"] == "web");
  }

  SECTION("Missing path") {
    auto response = roundTrip(
        peer.get(), ControlMessage::createRequest(ControlCategory::SYSTEM,
                                                  "repository-path-update",
                                                  json::object()));
    REQUIRE(response);
    REQUIRE(response->error.value() == "Missing path in payload");
  }
}

TEST_CASE("Browsers and the capture peer", "[ControlUnixHandler]") {
  RelayHarness harness;
  harness.start();
  auto relay = harness.handler->getBrowserRelay();
  auto browser = make_shared<FakeBrowserSocket>("browser-1");
  relay->addBrowser(browser);

  auto greeting = browser->received();
  REQUIRE(greeting.size() == 1);
  REQUIRE(greeting[0].payload.value()["peerConnected"] == false);

  SECTION("No peer") {
    auto request = ControlMessage::createRequest(ControlCategory::SCREENCAP,
                                                 "api-request");
    relay->onBrowserMessage(browser->getId(), request.toJsonString());
    REQUIRE(browserReceived(browser, [&request](const ControlMessage& m) {
      return m.id == request.id && m.error &&
             *m.error == "Mac app is not connected";
    }));
  }

  SECTION("Signaling round trip") {
    auto peer = harness.connectPeer();

    auto macReady = ControlMessage::createEvent(
        ControlCategory::SCREENCAP, "mac-ready", json{{"mode", "desktop"}});
    peer->send(macReady);
    REQUIRE(browserReceived(browser, [](const ControlMessage& m) {
      return m.action == "ready" && m.payload &&
             m.payload->value("message", "") == "Mac peer connected";
    }));
    auto initialDataRequest =
        peer->waitForAction("screencap", "get-initial-data");
    REQUIRE(initialDataRequest);
    REQUIRE(initialDataRequest->isRequest());

    auto request = ControlMessage::createRequest(
        ControlCategory::SCREENCAP, "api-request",
        json{{"method", "GET"}, {"endpoint", "/processes"}});
    relay->onBrowserMessage(browser->getId(), request.toJsonString());
    auto forwarded = peer->waitForId(request.id);
    REQUIRE(forwarded);
    REQUIRE(*forwarded == request);

    auto response =
        ControlMessage::createResponse(request, json{{"processes", 3}});
    peer->send(response);
    REQUIRE(browserReceived(browser, [&response](const ControlMessage& m) {
      return m == response;
    }));

    SECTION("Peer disconnect reaches the browser") {
      peer->disconnect();
      REQUIRE(browserReceived(browser, [](const ControlMessage& m) {
        return m.action == "error" && m.payload &&
               m.payload->value("error", "") == "Mac disconnected";
      }));
      REQUIRE(waitUntil(
          [&harness]() { return !harness.handler->isPeerConnected(); }));
    }
  }

  SECTION("Late browser gets the capture handshake") {
    auto peer = harness.connectPeer();
    auto second = make_shared<FakeBrowserSocket>("browser-2");
    relay->addBrowser(second);
    REQUIRE(browserReceived(second, [](const ControlMessage& m) {
      return m.action == "ready" && m.payload &&
             m.payload->value("message", "") == "Mac peer connected";
    }));
    REQUIRE(peer->waitForAction("screencap", "get-initial-data"));
  }
}

TEST_CASE("A new host connection replaces the old one", "[ControlUnixHandler]") {
  RelayHarness harness;
  harness.start();
  auto first = harness.connectPeer();
  auto second = harness.connectPeer();
  REQUIRE(first->waitForClose(std::chrono::milliseconds(3000)));

  auto response = roundTrip(
      second.get(), ControlMessage::createRequest(ControlCategory::SYSTEM, "ping"));
  REQUIRE(response);
  REQUIRE(harness.handler->getServer()->getAcceptCount() == 2);
}
