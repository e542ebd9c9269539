#include <gtest/gtest.h>

#include <mutex>
#include <string>

#include "castlink/cast_device.hpp"
#include "fake_transport.hpp"

using namespace castlink;
using namespace std::chrono_literals;
using castlink::test::fake_receiver;

namespace
{

// Minimal receiver running the default media receiver with a single media session
class emulated_device
{
public:

    void handle(fake_receiver& self, const cast_message& msg)
    {
        json request = json::parse(msg.payload, nullptr, false);
        if(!request.is_object() || !request.contains("requestId"))
            return;

        const std::string type = request.value("type", std::string {});
        json response;
        {
            std::lock_guard<std::mutex> lock {m_mutex};
            if(msg.nspace == ns::receiver)
                response = handle_receiver(type, request);
            else if(msg.nspace == ns::media)
                response = handle_media(type, request);
            else
                response = json {{"echo", request}};
        }

        if(response.is_null())
            return;
        response["requestId"] = request["requestId"];
        self.reply(msg, response.dump());
    }

    double volume() const
    {
        std::lock_guard<std::mutex> lock {m_mutex};
        return m_volume;
    }

private:

    json receiver_status() const
    {
        json status {{"volume", {{"level", m_volume}, {"muted", m_muted}}}};
        status["applications"] = json::array();
        if(m_running)
        {
            status["applications"].push_back(json {
                {"appId", default_media_receiver_id},
                {"displayName", "Default Media Receiver"},
                {"sessionId", "session-1"},
                {"transportId", "transport-1"}
            });
        }
        return json {{"type", "RECEIVER_STATUS"}, {"status", status}};
    }

    json media_status() const
    {
        json status = json::array();
        if(m_loaded)
        {
            status.push_back(json {
                {"mediaSessionId", 1},
                {"playerState", m_player_state},
                {"currentTime", m_current_time},
                {"media", {{"contentId", m_content_id}}}
            });
        }
        return json {{"type", "MEDIA_STATUS"}, {"status", status}};
    }

    json handle_receiver(const std::string& type, const json& request)
    {
        if(type == "GET_STATUS")
            return receiver_status();

        if(type == "GET_APP_AVAILABILITY")
        {
            json availability = json::object();
            for(const auto& id : request["appId"])
                availability[id.get<std::string>()] = id == default_media_receiver_id ? "APP_AVAILABLE" : "APP_UNAVAILABLE";
            return json {{"responseType", "GET_APP_AVAILABILITY"}, {"availability", availability}};
        }

        if(type == "LAUNCH")
        {
            if(request["appId"] != default_media_receiver_id)
                return json {{"type", "LAUNCH_ERROR"}, {"reason", "NOT_FOUND"}};
            m_running = true;
            return receiver_status();
        }

        if(type == "STOP")
        {
            m_running = false;
            m_loaded = false;
            return receiver_status();
        }

        if(type == "SET_VOLUME")
        {
            const json& vol = request["volume"];
            if(vol.contains("level"))
                m_volume = vol["level"].get<double>();
            if(vol.contains("muted"))
                m_muted = vol["muted"].get<bool>();
            return receiver_status();
        }

        return json {{"type", "INVALID_REQUEST"}, {"reason", "INVALID_COMMAND"}};
    }

    json handle_media(const std::string& type, const json& request)
    {
        if(type == "GET_STATUS")
            return media_status();

        if(type == "LOAD")
        {
            if(!m_running)
                return json {{"type", "LOAD_FAILED"}};
            m_loaded = true;
            m_content_id = request["media"]["contentId"].get<std::string>();
            m_player_state = request.value("autoplay", true) ? "PLAYING" : "PAUSED";
            m_current_time = request.value("currentTime", 0.0);
            return media_status();
        }

        if(!m_loaded || request.value("mediaSessionId", int64_t {0}) != 1)
            return json {{"type", "INVALID_REQUEST"}, {"reason", "INVALID_MEDIA_SESSION_ID"}};

        if(type == "PLAY")
            m_player_state = "PLAYING";
        else if(type == "PAUSE")
            m_player_state = "PAUSED";
        else if(type == "STOP")
            m_player_state = "IDLE";
        else if(type == "SEEK")
            m_current_time = request.value("currentTime", 0.0);
        else
            return json {{"type", "INVALID_REQUEST"}, {"reason", "INVALID_COMMAND"}};

        return media_status();
    }

    mutable std::mutex m_mutex;

    bool m_running = false;

    bool m_loaded = false;

    double m_volume = 0.3;

    bool m_muted = false;

    std::string m_content_id;

    std::string m_player_state {"IDLE"};

    double m_current_time = 0.0;

};

class CastDevice : public ::testing::Test
{
protected:

    CastDevice()
        : receiver {[this](fake_receiver& self, const cast_message& msg) { emulated.handle(self, msg); }},
          device {"Living Room", "192.168.0.20", 8009, receiver.factory(), options()}
    {}

    static channel_options options()
    {
        channel_options opts;
        opts.request_timeout = 2000ms;
        return opts;
    }

    void SetUp() override
    {
        device.connect();
    }

    emulated_device emulated;

    fake_receiver receiver;

    cast_device device;
};

} // namespace

TEST_F(CastDevice, ConnectAndStatus)
{
    EXPECT_TRUE(device.connected());
    EXPECT_EQ(device.get_name(), "Living Room");
    EXPECT_EQ(device.get_port(), 8009);

    receiver_status status = device.get_status();
    EXPECT_TRUE(status.applications.empty());
    EXPECT_DOUBLE_EQ(status.vol.level.value(), 0.3);

    device.disconnect();
    EXPECT_FALSE(device.connected());
}

TEST_F(CastDevice, AppAvailability)
{
    EXPECT_TRUE(device.app_available(default_media_receiver_id));
    EXPECT_FALSE(device.app_available("00000000"));
    EXPECT_THROW(device.app_available(""), std::invalid_argument);
}

TEST_F(CastDevice, LaunchLoadAndControlMedia)
{
    application app = device.launch_app();
    EXPECT_EQ(app.app_id, default_media_receiver_id);
    EXPECT_EQ(app.transport_id, "transport-1");

    media_status loaded = device.load(app.transport_id, app.session_id,
        json {{"contentId", "http://example.com/video.mp4"}, {"contentType", "video/mp4"}, {"streamType", "BUFFERED"}});
    EXPECT_EQ(loaded.media_session_id, 1);
    EXPECT_EQ(loaded.player_state, "PLAYING");

    EXPECT_EQ(device.pause(app.transport_id, app.session_id, 1).player_state, "PAUSED");
    EXPECT_EQ(device.play(app.transport_id, app.session_id, 1).player_state, "PLAYING");
    EXPECT_DOUBLE_EQ(device.seek(app.transport_id, app.session_id, 1, 42.0).current_time, 42.0);

    std::vector<media_status> statuses = device.get_media_status(app.transport_id);
    ASSERT_EQ(statuses.size(), 1u);
    EXPECT_EQ(statuses[0].raw["media"]["contentId"], "http://example.com/video.mp4");

    EXPECT_EQ(device.stop_media(app.transport_id, app.session_id, 1).player_state, "IDLE");

    // The media namespace lives on the application's transport, which got its own virtual connection
    EXPECT_TRUE(receiver.wait_for([](const cast_message& msg)
    {
        return msg.nspace == ns::connection && msg.destination_id == "transport-1";
    }));
}

TEST_F(CastDevice, LaunchErrorIsDeviceError)
{
    try {
        device.launch_app("DEADBEEF");
        FAIL() << "Expected device_error";
    } catch(device_error& e) {
        EXPECT_EQ(e.type(), "LAUNCH_ERROR");
        ASSERT_TRUE(e.payload().is_object());
        EXPECT_EQ(e.payload().at("reason"), "NOT_FOUND");
    }
}

TEST_F(CastDevice, MediaCommandForUnknownSessionFails)
{
    application app = device.launch_app(default_media_receiver_id);
    try {
        device.play(app.transport_id, app.session_id, 99);
        FAIL() << "Expected device_error";
    } catch(device_error& e) {
        EXPECT_EQ(e.type(), "INVALID_REQUEST");
    }
}

TEST_F(CastDevice, LoadRequiresContentId)
{
    application app = device.launch_app();
    EXPECT_THROW(device.load(app.transport_id, app.session_id, json {{"contentType", "video/mp4"}}), std::invalid_argument);
}

TEST_F(CastDevice, StopApp)
{
    application app = device.launch_app();
    receiver_status status = device.stop_app(app.session_id);
    EXPECT_EQ(status.find_application(default_media_receiver_id), nullptr);
}

TEST_F(CastDevice, Volume)
{
    receiver_status status = device.set_volume(0.75);
    EXPECT_DOUBLE_EQ(status.vol.level.value(), 0.75);
    EXPECT_DOUBLE_EQ(emulated.volume(), 0.75);

    status = device.set_muted(true);
    EXPECT_TRUE(status.vol.muted.value());

    EXPECT_THROW(device.set_volume(1.5), std::invalid_argument);
    EXPECT_THROW(device.set_volume(-0.1), std::invalid_argument);
}

TEST_F(CastDevice, CustomNamespace)
{
    custom_message res = device.send_custom("transport-1", "urn:x-cast:com.example.chat", json {{"text", "hello"}});
    EXPECT_EQ(res.nspace, "urn:x-cast:com.example.chat");

    json echoed = json::parse(res.payload);
    EXPECT_EQ(echoed["echo"]["text"], "hello");

    EXPECT_THROW(device.send_custom("transport-1", ns::media, json::object()), std::invalid_argument);
}

TEST_F(CastDevice, OperationsRequireConnection)
{
    device.disconnect();
    EXPECT_THROW(device.get_status(), connection_error);
}

TEST_F(CastDevice, PostCustomDoesNotWait)
{
    device.post_custom("transport-1", "urn:x-cast:com.example.chat", json {{"text", "fire and forget"}});

    EXPECT_TRUE(receiver.wait_for([](const cast_message& msg)
    {
        return msg.nspace == "urn:x-cast:com.example.chat" && msg.payload.find("fire and forget") != std::string::npos;
    }));
    EXPECT_EQ(device.get_channel().pending_requests(), 0u);
    EXPECT_THROW(device.post_custom("transport-1", ns::receiver, json::object()), std::invalid_argument);
}
