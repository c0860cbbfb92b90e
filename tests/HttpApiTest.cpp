/**
 * @file HttpApiTest.cpp
 * @brief Routing, validation and CORS of the plain HTTP surface
 */

#include <gtest/gtest.h>
#include "api/HttpApi.h"
#include "pairing/PairingRegistry.h"

#include <boost/asio/io_context.hpp>
#include <boost/beast/http.hpp>
#include <boost/json.hpp>

#include <chrono>
#include <memory>
#include <string>

using namespace signalrelay;
using namespace std::chrono_literals;
namespace http = boost::beast::http;
namespace json = boost::json;

class HttpApiTest : public ::testing::Test {
protected:
    void SetUp() override {
        now_ = pairing::PairingRegistry::Clock::now();
        pairing_ = std::make_unique<pairing::PairingRegistry>(
            ioc_.get_executor(), 300.0, [this] { return now_; });
        api_ = std::make_unique<api::HttpApi>(*pairing_);
    }

    static api::Request get(const std::string& target) {
        api::Request req{http::verb::get, target, 11};
        req.set(http::field::host, "relay.test");
        return req;
    }

    static api::Request upgrade(const std::string& target) {
        auto req = get(target);
        req.set(http::field::connection, "Upgrade");
        req.set(http::field::upgrade, "websocket");
        req.set(http::field::sec_websocket_key, "dGhlIHNhbXBsZSBub25jZQ==");
        req.set(http::field::sec_websocket_version, "13");
        return req;
    }

    static api::Request post_json(const std::string& target, const std::string& body,
                                  const std::string& content_type = "application/json") {
        api::Request req{http::verb::post, target, 11};
        req.set(http::field::host, "relay.test");
        req.set(http::field::content_type, content_type);
        req.body() = body;
        req.prepare_payload();
        return req;
    }

    static json::object valid_info() {
        return json::object{
            {"device_id", "daemon-01"},
            {"public_key", "MCowBQYDK2VuAyEA"},
            {"relay_url", "wss://relay.test/room/r1"},
            {"expires", 1760000300}
        };
    }

    static std::string pair_body(const std::string& code, json::value info = valid_info()) {
        return json::serialize(json::object{{"code", code}, {"info", std::move(info)}});
    }

    static json::value body_of(const api::Response& res) { return json::parse(res.body()); }

    static std::string error_of(const api::Response& res) {
        return std::string(body_of(res).as_object().at("error").as_string().c_str());
    }

    static std::string header(const api::Response& res, http::field f) {
        auto v = res[f];
        return std::string(v.data(), v.size());
    }

    api::Response handle(const api::Request& req) { return api_->handle(req); }

    boost::asio::io_context ioc_;
    pairing::PairingRegistry::Clock::time_point now_;
    std::unique_ptr<pairing::PairingRegistry> pairing_;
    std::unique_ptr<api::HttpApi> api_;
};

// ============================================================================
// HEALTH / CORS / FALLBACK
// ============================================================================

TEST_F(HttpApiTest, Health_RootAndHealth_Ok) {
    for (const char* path : {"/", "/health", "/health?probe=1"}) {
        auto res = handle(get(path));
        EXPECT_EQ(res.result(), http::status::ok) << path;
        EXPECT_EQ(res.body(), R"({"status":"ok"})");
        EXPECT_EQ(header(res, http::field::content_type), "application/json");
        EXPECT_EQ(header(res, http::field::access_control_allow_origin), "*");
    }
}

TEST_F(HttpApiTest, Options_AnyPath_AdvertisesMethods) {
    api::Request req{http::verb::options, "/pair", 11};

    auto res = handle(req);

    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(header(res, http::field::access_control_allow_origin), "*");
    EXPECT_EQ(header(res, http::field::access_control_allow_methods), "GET, POST, OPTIONS");
    EXPECT_NE(header(res, http::field::access_control_allow_headers).find("Sec-WebSocket-Key"), std::string::npos);
}

TEST_F(HttpApiTest, UnknownRoute_NotFound) {
    for (const char* path : {"/nope", "/room", "/room/", "/room/bad.id", "/room/a/b", "/pair/"}) {
        auto res = handle(get(path));
        EXPECT_EQ(res.result(), http::status::not_found) << path;
        EXPECT_EQ(error_of(res), "Not found");
        EXPECT_EQ(header(res, http::field::access_control_allow_origin), "*");
    }
}

TEST_F(HttpApiTest, PairWithWrongMethod_NotFound) {
    EXPECT_EQ(handle(get("/pair")).result(), http::status::not_found);
    EXPECT_EQ(handle(post_json("/pair/ABC", "{}")).result(), http::status::not_found);
}

// ============================================================================
// ROOM ENDPOINT
// ============================================================================

TEST_F(HttpApiTest, Room_WithoutUpgrade_426) {
    auto res = handle(get("/room/abc"));

    EXPECT_EQ(res.result(), http::status::upgrade_required);
    EXPECT_EQ(error_of(res), "Expected WebSocket upgrade");
}

TEST_F(HttpApiTest, Room_SixtyFourCharacterId_Upgradable) {
    const std::string id(64, 'r');
    std::string room_id;

    EXPECT_TRUE(api::HttpApi::wants_room_upgrade(upgrade("/room/" + id), room_id));
    EXPECT_EQ(room_id, id);
}

TEST_F(HttpApiTest, Room_SixtyFiveCharacterId_RejectedBeforeUpgrade) {
    const std::string id(65, 'r');
    std::string room_id;

    EXPECT_FALSE(api::HttpApi::wants_room_upgrade(upgrade("/room/" + id), room_id));

    auto res = handle(upgrade("/room/" + id));
    EXPECT_EQ(res.result(), http::status::bad_request);
    EXPECT_EQ(error_of(res), "Room ID too long");
}

TEST_F(HttpApiTest, Room_UpgradeRequiresGetAndValidId) {
    std::string room_id;
    auto post = upgrade("/room/abc");
    post.method(http::verb::post);

    EXPECT_FALSE(api::HttpApi::wants_room_upgrade(post, room_id));
    EXPECT_FALSE(api::HttpApi::wants_room_upgrade(upgrade("/room/a b"), room_id));
    EXPECT_FALSE(api::HttpApi::wants_room_upgrade(get("/room/abc"), room_id));
    EXPECT_TRUE(api::HttpApi::wants_room_upgrade(upgrade("/room/Abc_-9?token=x"), room_id));
    EXPECT_EQ(room_id, "Abc_-9");
}

TEST(MatchRoomTest, Classifies) {
    using Kind = api::RoomRoute::Kind;

    EXPECT_EQ(api::match_room("/room/x").kind, Kind::Accepted);
    EXPECT_EQ(api::match_room("/room/" + std::string(64, '1')).kind, Kind::Accepted);
    EXPECT_EQ(api::match_room("/room/" + std::string(65, '1')).kind, Kind::IdTooLong);
    EXPECT_EQ(api::match_room("/room/").kind, Kind::NotRoom);
    EXPECT_EQ(api::match_room("/rooms/x").kind, Kind::NotRoom);
    EXPECT_EQ(api::match_room("/room/%41").kind, Kind::NotRoom);
}

// ============================================================================
// PAIRING: REGISTER
// ============================================================================

TEST_F(HttpApiTest, Register_Valid_OkAndLookupReturnsInfo) {
    auto res = handle(post_json("/pair", pair_body("AXBK-7392")));
    ASSERT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res.body(), R"({"ok":true})");
    EXPECT_EQ(header(res, http::field::access_control_allow_origin), "*");

    auto found = handle(get("/pair/AXBK-7392"));
    EXPECT_EQ(found.result(), http::status::ok);
    EXPECT_EQ(body_of(found), json::value(valid_info()));
}

TEST_F(HttpApiTest, Register_ContentTypeWithCharset_Accepted) {
    auto res = handle(post_json("/pair", pair_body("ABC"), "application/json; charset=utf-8"));

    EXPECT_EQ(res.result(), http::status::ok);
}

TEST_F(HttpApiTest, Register_WrongContentType_400) {
    auto res = handle(post_json("/pair", pair_body("ABC"), "text/plain"));

    EXPECT_EQ(res.result(), http::status::bad_request);
    EXPECT_EQ(error_of(res), "Content-Type must be application/json");
}

TEST_F(HttpApiTest, Register_NotJson_400) {
    auto res = handle(post_json("/pair", "{code: ABC"));

    EXPECT_EQ(res.result(), http::status::bad_request);
    EXPECT_EQ(error_of(res), "Invalid JSON body");
}

TEST_F(HttpApiTest, Register_CodeLengthBoundaries) {
    EXPECT_EQ(handle(post_json("/pair", pair_body("AB"))).result(), http::status::bad_request);
    EXPECT_EQ(handle(post_json("/pair", pair_body("ABC"))).result(), http::status::ok);
    EXPECT_EQ(handle(post_json("/pair", pair_body(std::string(20, 'C')))).result(), http::status::ok);

    auto res = handle(post_json("/pair", pair_body(std::string(21, 'C'))));
    EXPECT_EQ(res.result(), http::status::bad_request);
    EXPECT_EQ(error_of(res), "Invalid code: must be a string of 3-20 characters");
}

TEST_F(HttpApiTest, Register_NonAsciiCode_CountsCharactersNotBytes) {
    // U+00C4 is two UTF-8 bytes, U+1F600 four bytes and two UTF-16 units.
    const std::string a_umlaut = "\xC3\x84";
    const std::string smiley = "\xF0\x9F\x98\x80";

    std::string seven;
    for (int i = 0; i < 7; ++i) seven += a_umlaut;
    EXPECT_EQ(handle(post_json("/pair", pair_body(seven))).result(), http::status::ok);

    std::string twenty;
    for (int i = 0; i < 20; ++i) twenty += a_umlaut;
    EXPECT_EQ(handle(post_json("/pair", pair_body(twenty))).result(), http::status::ok);

    std::string eleven_smileys;
    for (int i = 0; i < 11; ++i) eleven_smileys += smiley;
    EXPECT_EQ(handle(post_json("/pair", pair_body(eleven_smileys))).result(), http::status::bad_request);

    EXPECT_EQ(handle(post_json("/pair", pair_body(a_umlaut + "b"))).result(), http::status::bad_request);
}

TEST_F(HttpApiTest, Register_CodeNotString_400) {
    auto body = json::serialize(json::object{{"code", 12345}, {"info", valid_info()}});

    EXPECT_EQ(handle(post_json("/pair", body)).result(), http::status::bad_request);
    EXPECT_EQ(handle(post_json("/pair", "[]")).result(), http::status::bad_request);
}

TEST_F(HttpApiTest, Register_InfoNotObject_400) {
    auto res = handle(post_json("/pair", pair_body("ABCD", json::value("a string"))));

    EXPECT_EQ(res.result(), http::status::bad_request);
    EXPECT_EQ(error_of(res), "Invalid info: must be an object");
}

TEST_F(HttpApiTest, Register_InfoMissingFields_400AndNothingStored) {
    const std::string expected = "Invalid info: must contain device_id, public_key, relay_url, and expires";

    for (const char* field : {"device_id", "public_key", "relay_url", "expires"}) {
        auto info = valid_info();
        info.erase(field);
        auto res = handle(post_json("/pair", pair_body("ABCD", info)));
        EXPECT_EQ(res.result(), http::status::bad_request) << field;
        EXPECT_EQ(error_of(res), expected) << field;
    }

    auto empty_id = valid_info();
    empty_id["device_id"] = "";
    EXPECT_EQ(handle(post_json("/pair", pair_body("ABCD", empty_id))).result(), http::status::bad_request);

    auto string_expiry = valid_info();
    string_expiry["expires"] = "1760000300";
    EXPECT_EQ(handle(post_json("/pair", pair_body("ABCD", string_expiry))).result(), http::status::bad_request);

    EXPECT_EQ(pairing_->stored_count(), 0u);
}

TEST_F(HttpApiTest, Register_ExplicitTtl_Honoured) {
    auto body = json::serialize(json::object{{"code", "SHORT"}, {"info", valid_info()}, {"ttl", 1}});
    ASSERT_EQ(handle(post_json("/pair", body)).result(), http::status::ok);

    now_ += 1500ms;
    auto res = handle(get("/pair/SHORT"));

    EXPECT_EQ(res.result(), http::status::not_found);
    EXPECT_EQ(error_of(res), "Expired");
}

TEST_F(HttpApiTest, Register_AstronomicalTtl_StoredUntilCap) {
    auto body = json::serialize(json::object{{"code", "FOREVER"}, {"info", valid_info()}, {"ttl", 1e300}});
    ASSERT_EQ(handle(post_json("/pair", body)).result(), http::status::ok);

    now_ += 30 * 24h;
    auto res = handle(get("/pair/FOREVER"));

    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(body_of(res), json::value(valid_info()));
}

TEST_F(HttpApiTest, Register_NoTtl_DefaultApplies) {
    ASSERT_EQ(handle(post_json("/pair", pair_body("DEFLT"))).result(), http::status::ok);

    now_ += 200s;
    EXPECT_EQ(handle(get("/pair/DEFLT")).result(), http::status::ok);
}

// ============================================================================
// PAIRING: LOOKUP
// ============================================================================

TEST_F(HttpApiTest, Lookup_Unknown_404NotFound) {
    auto res = handle(get("/pair/UNKNOWN"));

    EXPECT_EQ(res.result(), http::status::not_found);
    EXPECT_EQ(error_of(res), "Not found");
}

TEST_F(HttpApiTest, Lookup_Expired_404ExpiredThenNotFound) {
    pairing_->register_code("GONE", valid_info(), 1);
    now_ += 2s;

    auto first = handle(get("/pair/GONE"));
    EXPECT_EQ(first.result(), http::status::not_found);
    EXPECT_EQ(error_of(first), "Expired");

    auto second = handle(get("/pair/GONE"));
    EXPECT_EQ(error_of(second), "Not found");
}

TEST_F(HttpApiTest, Lookup_RepeatedBeforeExpiry_SameInfo) {
    pairing_->register_code("AGAIN", valid_info(), 60);

    auto a = handle(get("/pair/AGAIN"));
    auto b = handle(get("/pair/AGAIN"));

    EXPECT_EQ(a.result(), http::status::ok);
    EXPECT_EQ(a.body(), b.body());
}
