#include <csignal>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <fmt/format.h>

#include "castlink/cast_device.hpp"
#include "castlink/cast_event.hpp"
#include "castlink/log.hpp"
#include "castlink/mdns_discovery.hpp"
#include "castlink/transport.hpp"

// Certificate and READABLE key file used for the TLS connection to the receiver
#define DEFAULT_CERT "./cert.pem"
#define DEFAULT_KEY "./key.pem"

#define CAST_PORT 8009

namespace
{

using namespace castlink;

struct config
{
    tls_keypair_path keypair;
    log::level log_level;
};

std::string env_or(const char* name, const char* fallback)
{
    const char* val = std::getenv(name);
    return (val && *val) ? val : fallback;
}

config load_config()
{
    return config {
        tls_keypair_path {env_or("CASTLINK_CERT", DEFAULT_CERT), env_or("CASTLINK_KEY", DEFAULT_KEY)},
        log::parse_level(env_or("CASTLINK_LOG_LEVEL", "warn"), log::level::warn)
    };
}

void block_signals(sigset_t* sigset)
{
    sigemptyset(sigset);
    sigaddset(sigset, SIGINT);
    sigaddset(sigset, SIGTERM);
    pthread_sigmask(SIG_BLOCK, sigset, nullptr);
}

void print_usage()
{
    fmt::print(
        "Usage: castctl <command> [args]\n"
        "  discover [seconds]                 List cast devices in the local network\n"
        "  status <host>                      Print the receiver status\n"
        "  volume <host> <level>              Set the volume (0.0 - 1.0)\n"
        "  mute <host> <on|off>               Mute or unmute the receiver\n"
        "  play <host> <url> [content-type]   Play a media url with the default media receiver\n"
        "  stop <host>                        Stop the running application\n"
        "Environment: CASTLINK_CERT, CASTLINK_KEY, CASTLINK_LOG_LEVEL\n");
}

void print_status(const receiver_status& status)
{
    fmt::print("Volume: {}{}\n", status.vol.level.value_or(0.0), status.vol.muted.value_or(false) ? " (muted)" : "");
    if(status.applications.empty())
        fmt::print("No application running\n");
    for(const auto& app : status.applications)
        fmt::print("{} | {} | session {} | transport {}\n", app.app_id, app.display_name, app.session_id, app.transport_id);
}

class printing_discovery_listener : public discovery::discovery_listener
{
public:

    void device_added(const discovery::device_info& device) override
    {
        std::lock_guard<std::mutex> lock {m_mutex};
        fmt::print("+ {} | {}:{} | {}\n", device.friendly_name, device.address, device.port, device.id());
    }

    void device_removed(const discovery::device_info& device) override
    {
        std::lock_guard<std::mutex> lock {m_mutex};
        fmt::print("- {} | {}:{}\n", device.friendly_name, device.address, device.port);
    }

private:

    std::mutex m_mutex;

};

// Prints everything the receiver reports on its own while media is playing
class printing_event_listener : public cast_event_listener
{
public:

    void on_event(const cast_event& event) override
    {
        if(auto media = event.get<media_status_response>())
        {
            for(const auto& status : media->statuses)
                fmt::print("[{}] {} at {:.1f}s\n", status.media_session_id, status.player_state, status.current_time);
        }
        else if(auto conn = event.get<connection_event>())
        {
            fmt::print("Connection {}\n", to_string(conn->current));
        }
        else if(auto err = event.get<error_response>())
        {
            fmt::print("Error: {} {}\n", err->type, err->reason.value_or(""));
        }
        else
        {
            fmt::print("Event {}\n", to_string(event.type()));
        }
    }
};

int run_discover(const std::vector<std::string>& args, sigset_t& sigset)
{
    discovery::mdns_browser::options opts;
    if(args.size() > 2)
        opts.query_interval = std::chrono::seconds {std::stoul(args[2])};

    printing_discovery_listener listener;
    discovery::mdns_browser browser {listener, opts};

    fmt::print("Scanning network for cast-enabled devices...\nPress Ctrl+C to exit.\n");
    browser.start();

    int signum = 0;
    sigwait(&sigset, &signum);
    browser.stop();
    return EXIT_SUCCESS;
}

int run_device_command(const std::vector<std::string>& args, const config& conf, sigset_t& sigset)
{
    const std::string& command = args[1];
    if(args.size() < 3)
    {
        print_usage();
        return EXIT_FAILURE;
    }

    cast_device device {args[2], args[2], CAST_PORT, make_tls_factory(conf.keypair)};
    device.connect();

    if(command == "status")
    {
        print_status(device.get_status());
    }
    else if(command == "volume" && args.size() > 3)
    {
        print_status(device.set_volume(std::stod(args[3])));
    }
    else if(command == "mute" && args.size() > 3)
    {
        print_status(device.set_muted(args[3] == "on"));
    }
    else if(command == "stop")
    {
        receiver_status status = device.get_status();
        for(const auto& app : status.applications)
        {
            if(!app.idle_screen)
                print_status(device.stop_app(app.session_id));
        }
    }
    else if(command == "play" && args.size() > 3)
    {
        auto listener = std::make_shared<printing_event_listener>();
        device.get_channel().add_event_listener(listener, {cast_event_type::media_status,
            cast_event_type::connected, cast_event_type::error_response, cast_event_type::close});

        application app = device.launch_app(default_media_receiver_id);
        json media {
            {"contentId", args[3]},
            {"contentType", args.size() > 4 ? args[4] : std::string {"video/mp4"}},
            {"streamType", "BUFFERED"}
        };
        media_status status = device.load(app.transport_id, app.session_id, media);
        fmt::print("Playing {} (media session {})\nPress Ctrl+C to stop.\n", args[3], status.media_session_id);

        int signum = 0;
        sigwait(&sigset, &signum);
        fmt::print("Shutting down...\n");

        device.stop_media(app.transport_id, app.session_id, status.media_session_id);
        device.get_channel().remove_event_listener(listener);
    }
    else
    {
        print_usage();
        return EXIT_FAILURE;
    }

    device.disconnect();
    return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char** argv)
{
    std::vector<std::string> args {argv, argv + argc};
    if(args.size() < 2)
    {
        print_usage();
        return EXIT_FAILURE;
    }

    const config conf = load_config();
    log::set_level(conf.log_level);

    // Signals are only consumed by sigwait in the command which waits for them
    sigset_t sigset;
    block_signals(&sigset);

    try {
        if(args[1] == "discover")
            return run_discover(args, sigset);
        return run_device_command(args, conf, sigset);
    } catch(std::exception& e) {
        fmt::print(stderr, "castctl: {}\n", e.what());
    }

    return EXIT_FAILURE;
}
