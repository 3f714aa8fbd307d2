#include "CollaborationChannel.hpp"

#include "FakeRelayConnection.hpp"
#include "TestHeaders.hpp"

using namespace wt;

namespace {
class CollaborationFixture {
 public:
  CollaborationFixture() : nextId(0) {}

  shared_ptr<FakeRelayConnection> connect(const string &sessionId,
                                          const string &userId) {
    auto connection = std::make_shared<FakeRelayConnection>(
        "c" + to_string(++nextId), ChannelKind::COLLABORATION);
    connection->onClose = [this](const string &id) {
      channel.handleClose(id);
    };
    map<string, string> params;
    if (!sessionId.empty()) {
      params["sessionId"] = sessionId;
    }
    if (!userId.empty()) {
      params["userId"] = userId;
    }
    channel.handleOpen(connection, params);
    return connection;
  }

  void join(shared_ptr<FakeRelayConnection> connection, const string &name,
            const string &color) {
    channel.handleMessage(connection, dumpJson({{"type", "collab:join"},
                                                {"userName", name},
                                                {"userColor", color}}));
  }

  CollaborationChannel channel;
  int nextId;
};
}  // namespace

TEST_CASE_METHOD(CollaborationFixture, "CollaborationChannel parameters",
                 "[CollaborationChannel]") {
  SECTION("Missing user id") {
    auto connection = connect("s1", "");
    REQUIRE(connection->last()["code"] == "MISSING_PARAMETERS");
    REQUIRE(connection->closed);
    REQUIRE(channel.getConnectionCount() == 0);
  }

  SECTION("Missing session id") {
    auto connection = connect("", "u1");
    REQUIRE(connection->last()["code"] == "MISSING_PARAMETERS");
    REQUIRE(connection->closed);
  }

  SECTION("Valid parameters join silently") {
    auto connection = connect("s1", "u1");
    REQUIRE(connection->sent.empty());
    REQUIRE(channel.getConnectionCount("s1") == 1);
  }
}

TEST_CASE_METHOD(CollaborationFixture, "CollaborationChannel presence",
                 "[CollaborationChannel]") {
  auto ada = connect("s1", "u-ada");
  auto bob = connect("s1", "u-bob");
  auto elsewhere = connect("s2", "u-eve");

  SECTION("Only joined connections appear, and everyone gets the roster") {
    join(ada, "Ada", "#ff0000");
    REQUIRE(ada->types() == vector<string>({"collab:presence"}));
    REQUIRE(bob->types() == vector<string>({"collab:presence"}));
    auto roster = ada->last()["collaborators"];
    REQUIRE(roster.size() == 1);
    REQUIRE(roster[0]["id"] == "u-ada");
    REQUIRE(roster[0]["name"] == "Ada");
    REQUIRE(roster[0]["color"] == "#ff0000");
    REQUIRE(roster[0]["isTyping"] == false);
    REQUIRE(roster[0]["lastSeen"].get<int64_t>() > 0);
    REQUIRE_FALSE(roster[0].contains("cursor"));

    join(bob, "Bob", "#00ff00");
    roster = ada->last()["collaborators"];
    REQUIRE(roster.size() == 2);
    REQUIRE(bob->last()["collaborators"] == roster);
    REQUIRE(elsewhere->sent.empty());
  }

  SECTION("Join without a name falls back to the user id") {
    channel.handleMessage(ada, R"({"type":"collab:join"})");
    auto roster = ada->last()["collaborators"];
    REQUIRE(roster[0]["name"] == "u-ada");
    REQUIRE_FALSE(roster[0]["color"].get<string>().empty());
  }

  SECTION("Leaving recomputes the roster") {
    join(ada, "Ada", "#ff0000");
    join(bob, "Bob", "#00ff00");
    ada->close();
    auto roster = bob->last()["collaborators"];
    REQUIRE(roster.size() == 1);
    REQUIRE(roster[0]["id"] == "u-bob");
    REQUIRE(channel.getPresence("s1").size() == 1);
  }

  SECTION("Last one out prunes the room") {
    ada->close();
    bob->terminate();
    REQUIRE_FALSE(channel.hasRoom("s1"));
    REQUIRE(channel.hasRoom("s2"));
  }

  SECTION("Typing and cursor update the roster") {
    join(ada, "Ada", "#ff0000");
    channel.handleMessage(ada, R"({"type":"collab:typing","isTyping":true})");
    channel.handleMessage(
        ada, R"({"type":"collab:cursor","cursor":{"line":4,"ch":2}})");
    auto roster = channel.getPresence("s1");
    REQUIRE(roster[0]["isTyping"] == true);
    REQUIRE(roster[0]["cursor"]["line"] == 4);
  }
}

TEST_CASE_METHOD(CollaborationFixture, "CollaborationChannel relay",
                 "[CollaborationChannel]") {
  auto ada = connect("s1", "u-ada");
  auto bob = connect("s1", "u-bob");
  auto cat = connect("s1", "u-cat");
  auto elsewhere = connect("s2", "u-eve");

  SECTION("Chat goes to everyone but the sender") {
    channel.handleMessage(
        ada, R"({"type":"collab:chat","message":{"text":"hello","at":1}})");
    REQUIRE(ada->sent.empty());
    REQUIRE(elsewhere->sent.empty());
    for (auto &connection : {bob, cat}) {
      auto relayed = connection->last();
      REQUIRE(relayed["type"] == "collab:chat");
      REQUIRE(relayed["message"] == json({{"text", "hello"}, {"at", 1}}));
      REQUIRE(relayed["userId"] == "u-ada");
    }
  }

  SECTION("Cursor and typing carry the sender") {
    channel.handleMessage(bob, R"({"type":"collab:typing","isTyping":true})");
    channel.handleMessage(bob, R"({"type":"collab:cursor","cursor":[1,2]})");
    REQUIRE(bob->sent.empty());
    auto messages = ada->messages();
    REQUIRE(messages.size() == 2);
    REQUIRE(messages[0]["type"] == "collab:typing");
    REQUIRE(messages[0]["userId"] == "u-bob");
    REQUIRE(messages[1]["cursor"] == json({1, 2}));
  }

  SECTION("Nothing is buffered for latecomers") {
    channel.handleMessage(ada, R"({"type":"collab:chat","message":"early"})");
    auto late = connect("s1", "u-late");
    REQUIRE(late->sent.empty());
  }

  SECTION("Heartbeat refreshes lastSeen without a broadcast") {
    join(ada, "Ada", "#ff0000");
    bob->sent.clear();
    int64_t before = channel.getPresence("s1")[0]["lastSeen"].get<int64_t>();
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    channel.handleMessage(ada, R"({"type":"collab:heartbeat"})");
    int64_t after = channel.getPresence("s1")[0]["lastSeen"].get<int64_t>();
    REQUIRE(after > before);
    REQUIRE(bob->sent.empty());
  }

  SECTION("Bad messages are reported to the sender only") {
    channel.handleMessage(ada, R"({"type":"collab:wave"})");
    REQUIRE(ada->last()["code"] == "UNKNOWN_MESSAGE_TYPE");
    REQUIRE(bob->sent.empty());
  }
}
