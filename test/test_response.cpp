#include <gtest/gtest.h>

#include <string>

#include "castlink/cast_event.hpp"
#include "castlink/error.hpp"
#include "castlink/response.hpp"

using namespace castlink;

TEST(Resolver, ReceiverStatus)
{
    decoded_message msg = resolve(R"({
        "type": "RECEIVER_STATUS",
        "requestId": 12,
        "status": {
            "applications": [{
                "appId": "CC1AD845",
                "displayName": "Default Media Receiver",
                "sessionId": "session-1",
                "transportId": "transport-1",
                "namespaces": [{"name": "urn:x-cast:com.google.cast.media"}]
            }],
            "volume": {"level": 0.5, "muted": false}
        }
    })");

    auto status = std::get_if<receiver_status_response>(&msg);
    ASSERT_NE(status, nullptr);
    EXPECT_EQ(status->request_id, 12u);
    ASSERT_EQ(status->status.applications.size(), 1u);
    EXPECT_EQ(status->status.applications[0].transport_id, "transport-1");
    EXPECT_EQ(status->status.applications[0].namespaces.at(0), "urn:x-cast:com.google.cast.media");
    EXPECT_DOUBLE_EQ(status->status.vol.level.value(), 0.5);

    const application* app = status->status.find_application("CC1AD845");
    ASSERT_NE(app, nullptr);
    EXPECT_EQ(app->session_id, "session-1");
    EXPECT_EQ(status->status.find_application("other"), nullptr);
}

TEST(Resolver, ResponseTypeTakesPrecedenceOverType)
{
    decoded_message msg = resolve(R"({"responseType":"GET_APP_AVAILABILITY","type":"MEDIA_STATUS","requestId":3,
        "availability":{"CC1AD845":"APP_AVAILABLE","ABC":"APP_UNAVAILABLE"}})");

    auto avail = std::get_if<app_availability_response>(&msg);
    ASSERT_NE(avail, nullptr);
    EXPECT_TRUE(avail->available("CC1AD845"));
    EXPECT_FALSE(avail->available("ABC"));
    EXPECT_FALSE(avail->available("missing"));
}

TEST(Resolver, MediaStatusList)
{
    decoded_message msg = resolve(R"({"type":"MEDIA_STATUS","requestId":0,"status":[
        {"mediaSessionId": 1, "playerState": "PLAYING", "currentTime": 12.5},
        {"mediaSessionId": 2, "playerState": "IDLE", "idleReason": "FINISHED"}
    ]})");

    auto media = std::get_if<media_status_response>(&msg);
    ASSERT_NE(media, nullptr);
    ASSERT_EQ(media->statuses.size(), 2u);
    EXPECT_EQ(media->statuses[0].player_state, "PLAYING");
    EXPECT_DOUBLE_EQ(media->statuses[0].current_time, 12.5);
    EXPECT_EQ(media->statuses[1].idle_reason, "FINISHED");
}

TEST(Resolver, MediaStatusBareObjectIsFallback)
{
    decoded_message msg = resolve(R"({"type":"MEDIA_STATUS","mediaSessionId":7,"playerState":"PAUSED"})");

    auto media = std::get_if<media_status_response>(&msg);
    ASSERT_NE(media, nullptr);
    ASSERT_EQ(media->statuses.size(), 1u);
    EXPECT_EQ(media->statuses[0].media_session_id, 7);
    EXPECT_EQ(media->statuses[0].player_state, "PAUSED");
}

TEST(Resolver, MediaStatusListWinsOverBareFields)
{
    decoded_message msg = resolve(R"({"type":"MEDIA_STATUS","mediaSessionId":99,
        "status":[{"mediaSessionId":1,"playerState":"BUFFERING"}]})");

    auto media = std::get_if<media_status_response>(&msg);
    ASSERT_NE(media, nullptr);
    ASSERT_EQ(media->statuses.size(), 1u);
    EXPECT_EQ(media->statuses[0].media_session_id, 1);
}

TEST(Resolver, ErrorFamily)
{
    for(const char* type : {"ERROR", "INVALID_PLAYER_STATE", "INVALID_REQUEST", "LOAD_CANCELLED", "LOAD_FAILED"})
    {
        json payload {{"type", type}, {"requestId", 5}, {"reason", "INVALID_COMMAND"}};
        decoded_message msg = resolve(payload.dump());

        auto err = std::get_if<error_response>(&msg);
        ASSERT_NE(err, nullptr) << type;
        EXPECT_EQ(err->type, type);
        EXPECT_EQ(err->reason, "INVALID_COMMAND");
        EXPECT_EQ(err->request_id, 5u);
    }
}

TEST(Resolver, LaunchError)
{
    decoded_message msg = resolve(R"({"type":"LAUNCH_ERROR","reason":"NOT_FOUND","requestId":8})");
    auto err = std::get_if<launch_error_response>(&msg);
    ASSERT_NE(err, nullptr);
    EXPECT_EQ(err->reason, "NOT_FOUND");
}

TEST(Resolver, MultizoneAndDeviceEvents)
{
    EXPECT_TRUE(std::holds_alternative<multizone_status_response>(
        resolve(R"({"type":"MULTIZONE_STATUS","status":{"devices":[]}})")));
    EXPECT_TRUE(std::holds_alternative<device_added_response>(
        resolve(R"({"type":"DEVICE_ADDED","device":{"deviceId":"a"}})")));
    EXPECT_TRUE(std::holds_alternative<device_updated_response>(
        resolve(R"({"type":"DEVICE_UPDATED","device":{"deviceId":"a"}})")));

    decoded_message removed = resolve(R"({"type":"DEVICE_REMOVED","deviceId":"a"})");
    ASSERT_TRUE(std::holds_alternative<device_removed_response>(removed));
    EXPECT_EQ(std::get<device_removed_response>(removed).device_id, "a");
}

TEST(Resolver, HeartbeatAndClose)
{
    EXPECT_TRUE(std::holds_alternative<ping_response>(resolve(R"({"type":"PING"})")));
    EXPECT_TRUE(std::holds_alternative<pong_response>(resolve(R"({"type":"PONG"})")));
    EXPECT_TRUE(std::holds_alternative<close_response>(resolve(R"({"type":"CLOSE"})")));
}

TEST(Resolver, UnknownDiscriminatorKeepsPayload)
{
    decoded_message msg = resolve(R"({"type":"SOMETHING_NEW","requestId":77,"value":[1,2,3]})");

    auto unknown = std::get_if<unknown_message>(&msg);
    ASSERT_NE(unknown, nullptr);
    EXPECT_EQ(unknown->request_id, 77u);
    ASSERT_TRUE(unknown->payload);
    EXPECT_EQ((*unknown->payload)["value"].size(), 3u);
}

TEST(Resolver, MissingDiscriminatorIsUnknown)
{
    EXPECT_TRUE(std::holds_alternative<unknown_message>(resolve(R"({"hello":"world"})")));
    EXPECT_TRUE(std::holds_alternative<unknown_message>(resolve(R"({"type":42})")));
    EXPECT_TRUE(std::holds_alternative<unknown_message>(resolve(R"([1,2,3])")));
}

TEST(Resolver, WrongFieldTypesFallBackToUnknown)
{
    decoded_message msg = resolve(R"({"type":"LAUNCH_ERROR","reason":12})");
    EXPECT_TRUE(std::holds_alternative<unknown_message>(msg));
}

TEST(Resolver, MalformedJsonIsParseFailure)
{
    decoded_message msg = resolve("{not json");
    auto failure = std::get_if<parse_failure>(&msg);
    ASSERT_NE(failure, nullptr);
    EXPECT_EQ(failure->text, "{not json");
    EXPECT_FALSE(request_id(msg).has_value());
}

TEST(Resolver, CustomNamespaceIsCustomMessage)
{
    cast_message envelope = cast_message::text("app-1", "sender-1", "urn:x-cast:com.example.chat",
        R"({"text":"hi","requestId":4})");
    decoded_message msg = resolve(envelope);

    auto custom = std::get_if<custom_message>(&msg);
    ASSERT_NE(custom, nullptr);
    EXPECT_EQ(custom->nspace, "urn:x-cast:com.example.chat");
    EXPECT_EQ(custom->source_id, "app-1");
    EXPECT_EQ(custom->payload, envelope.payload);
    EXPECT_EQ(custom->request_id, 4u);
}

TEST(Resolver, BinaryPayloadIsCustomMessage)
{
    decoded_message msg = resolve(cast_message::binary("a", "b", ns::receiver, std::string {"\x01\x02", 2}));
    auto custom = std::get_if<custom_message>(&msg);
    ASSERT_NE(custom, nullptr);
    EXPECT_EQ(custom->kind, cast_message::payload_kind::binary);
    EXPECT_FALSE(custom->request_id.has_value());
}

TEST(Resolver, TypeNames)
{
    EXPECT_EQ(type_name(resolve(R"({"type":"PING"})")), "PING");
    EXPECT_EQ(type_name(resolve(R"({"type":"RECEIVER_STATUS"})")), "RECEIVER_STATUS");
    EXPECT_EQ(type_name(resolve(R"({"x":1})")), "UNKNOWN");
}

TEST(EventModel, StatusResponsesBecomeEvents)
{
    cast_message envelope = cast_message::text(default_receiver_id, "*", ns::receiver, R"({"type":"RECEIVER_STATUS"})");
    std::optional<cast_event> event = to_event(resolve(envelope), envelope);
    ASSERT_TRUE(event);
    EXPECT_EQ(event->type(), cast_event_type::receiver_status);
    EXPECT_NE(event->get<receiver_status_response>(), nullptr);
    EXPECT_EQ(event->get<media_status_response>(), nullptr);
}

TEST(EventModel, EmptyMediaStatusIsNotAnEvent)
{
    cast_message envelope = cast_message::text("transport-1", "*", ns::media, R"({"type":"MEDIA_STATUS","status":[]})");
    EXPECT_FALSE(to_event(resolve(envelope), envelope).has_value());
}

TEST(EventModel, HeartbeatIsNotAnEvent)
{
    cast_message envelope = cast_message::text(default_receiver_id, "sender-1", ns::heartbeat, R"({"type":"PING"})");
    EXPECT_FALSE(to_event(resolve(envelope), envelope).has_value());
}

TEST(EventModel, CloseCarriesEnvelopeAddressing)
{
    cast_message envelope = cast_message::text("transport-9", "sender-1", ns::connection, R"({"type":"CLOSE"})");
    std::optional<cast_event> event = to_event(resolve(envelope), envelope);
    ASSERT_TRUE(event);
    EXPECT_EQ(event->type(), cast_event_type::close);

    auto close = event->get<close_message_event>();
    ASSERT_NE(close, nullptr);
    EXPECT_EQ(close->source_id, "transport-9");
    EXPECT_EQ(close->destination_id, "sender-1");
    EXPECT_EQ(close->nspace, ns::connection);
}

TEST(EventModel, UnknownEventDeepCopyIsIndependent)
{
    cast_message envelope = cast_message::text(default_receiver_id, "*", ns::receiver, R"({"type":"NEW","data":{"n":1}})");
    std::optional<cast_event> event = to_event(resolve(envelope), envelope);
    ASSERT_TRUE(event);
    ASSERT_EQ(event->type(), cast_event_type::unknown);

    cast_event copy = event->deep_copy();
    ASSERT_NE(copy.unknown_payload(), nullptr);
    (*copy.unknown_payload())["data"]["n"] = 2;

    EXPECT_EQ((*event->unknown_payload())["data"]["n"], 1);
    EXPECT_EQ((*copy.unknown_payload())["data"]["n"], 2);
}

TEST(EventModel, MalformedJsonBecomesUnknownEventWithText)
{
    cast_message envelope = cast_message::text(default_receiver_id, "*", ns::receiver, "{broken");
    std::optional<cast_event> event = to_event(resolve(envelope), envelope);
    ASSERT_TRUE(event);
    EXPECT_EQ(event->type(), cast_event_type::unknown);
    EXPECT_EQ(*event->unknown_payload(), "{broken");
}

TEST(EventModel, Names)
{
    EXPECT_EQ(to_string(cast_event_type::media_status), "MEDIA_STATUS");
    EXPECT_EQ(to_string(connection_state::connected), "connected");
}

TEST(Errors, CarryPayloadObjectsUnchanged)
{
    json payload {{"type", "INVALID_REQUEST"}, {"reason", "INVALID_COMMAND"}};

    device_error failed {"request failed", "INVALID_REQUEST", payload};
    ASSERT_TRUE(failed.payload().is_object());
    EXPECT_EQ(failed.payload(), payload);

    unexpected_response_error unexpected {"unexpected", payload};
    ASSERT_TRUE(unexpected.response().is_object());
    EXPECT_EQ(unexpected.response().at("reason"), "INVALID_COMMAND");
}
