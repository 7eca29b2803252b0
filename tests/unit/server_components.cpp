#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "ferry/client/config.hpp"
#include "ferry/client/inputs.hpp"
#include "ferry/client/socks5.hpp"
#include "ferry/error_codes.hpp"
#include "ferry/filesystem.hpp"
#include "ferry/progress.hpp"
#include "ferry/sender.hpp"
#include "ferry/server/config.hpp"
#include "ferry/server/server.hpp"
#include "ferry/server/session_manager.hpp"
#include "ferry/tcp_stream.hpp"
#include "test_support.hpp"

using namespace ferry;
using ferry::test::BufferStream;

namespace
{

    void write_json(const std::filesystem::path &path, const nlohmann::json &json)
    {
        std::ofstream out(path);
        out << json.dump(2);
    }

    client::ClientConfig parse(std::vector<std::string> args)
    {
        args.insert(args.begin(), "ferry_client");
        std::vector<char *> argv;
        for (auto &arg : args)
        {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);
        return client::parse_arguments(static_cast<int>(args.size()), argv.data());
    }

    template <typename Fn>
    bool throws_runtime_error(Fn &&fn)
    {
        try
        {
            fn();
        }
        catch (const std::runtime_error &)
        {
            return true;
        }
        return false;
    }

    void test_server_config_file()
    {
        const auto temp_dir = test::fresh_temp_dir("ferry_server_config_test");
        const auto config_path = temp_dir / "server.json";
        write_json(config_path, {{"address", "127.0.0.1"}, {"port", 9100}, {"root", "/srv/incoming"},
                                 {"io_timeout", 30}, {"log_level", "debug"}, {"unrelated", true}});

        server::ServerConfig config;
        server::apply_config_file(config, config_path);
        assert(config.address == "127.0.0.1");
        assert(config.port == 9100);
        assert(config.root == std::filesystem::path("/srv/incoming"));
        assert(config.io_timeout == std::chrono::seconds(30));
        assert(config.log_level == "debug");
        assert(!config.log_file.has_value());

        {
            std::ofstream broken(temp_dir / "broken.json");
            broken << "{ \"port\": ";
        }
        server::ServerConfig untouched;
        assert(throws_runtime_error([&]
                                    { server::apply_config_file(untouched, temp_dir / "broken.json"); }));
        write_json(temp_dir / "wrong_type.json", {{"port", "eight thousand"}});
        assert(throws_runtime_error([&]
                                    { server::apply_config_file(untouched, temp_dir / "wrong_type.json"); }));
        assert(throws_runtime_error([&]
                                    { server::apply_config_file(untouched, temp_dir / "missing.json"); }));
        write_json(temp_dir / "out_of_range.json", {{"port", 70000}});
        assert(throws_runtime_error([&]
                                    { server::apply_config_file(untouched, temp_dir / "out_of_range.json"); }));
        write_json(temp_dir / "negative.json", {{"port", -1}});
        assert(throws_runtime_error([&]
                                    { server::apply_config_file(untouched, temp_dir / "negative.json"); }));
        assert(untouched.port == 8000);
        test::cleanup_path(temp_dir);
    }

    void test_client_arguments()
    {
        const auto defaults = parse({"abcdef.onion", "a.txt", "b.txt"});
        assert(defaults.target.host == "abcdef.onion");
        assert(defaults.target.port == 8000);
        assert(defaults.proxy.has_value());
        assert(defaults.proxy->host == "127.0.0.1");
        assert(defaults.proxy->port == 9050);
        assert((defaults.inputs == std::vector<std::string>{"a.txt", "b.txt"}));
        assert(defaults.stdin_name == "data.bin");

        const auto custom = parse({"--direct", "--port", "9001", "--io-timeout", "15", "--stdin", "--name",
                                   "dump.sql", "10.0.0.2:7000"});
        assert(!custom.proxy.has_value());
        assert(custom.target.host == "10.0.0.2");
        assert(custom.target.port == 9001);
        assert(custom.io_timeout == std::chrono::seconds(15));
        assert(custom.force_stdin);
        assert(custom.stdin_name == "dump.sql");
        assert(custom.inputs.empty());

        const auto proxied = parse({"--proxy", "tor.local", "host"});
        assert(proxied.proxy->host == "tor.local");
        assert(proxied.proxy->port == 9050);

        assert(parse({"--help"}).show_help);
        assert(throws_runtime_error([]
                                    { (void)parse({}); }));
        assert(throws_runtime_error([]
                                    { (void)parse({"--bogus", "host"}); }));
        assert(throws_runtime_error([]
                                    { (void)parse({"host", "--port"}); }));
        assert(throws_runtime_error([]
                                    { (void)parse({"host", "--port", "70000"}); }));
    }

    void test_port_validation()
    {
        assert(parse_port("1") == 1);
        assert(parse_port("8000") == 8000);
        assert(parse_port("65535") == 65535);
        for (const std::string bad : {"0", "65536", "70000", "", "-1", "80a", "123456"})
        {
            assert(throws_runtime_error([&]
                                        { (void)parse_port(bad); }));
        }
        assert(checked_port(443) == 443);
        assert(throws_runtime_error([]
                                    { (void)checked_port(70000); }));

        const auto temp_dir = test::fresh_temp_dir("ferry_client_port_test");
        write_json(temp_dir / "client.json", {{"port", 70000}});
        client::ClientConfig config;
        assert(throws_runtime_error([&]
                                    { client::apply_config_file(config, temp_dir / "client.json"); }));
        assert(config.target.port == 8000);
        test::cleanup_path(temp_dir);
    }

    void test_endpoint_parsing()
    {
        const auto plain = client::parse_endpoint("example.onion", 8000);
        assert(plain.host == "example.onion");
        assert(plain.port == 8000);

        const auto with_port = client::parse_endpoint("example.onion:1234", 8000);
        assert(with_port.host == "example.onion");
        assert(with_port.port == 1234);

        // Bare IPv6 literals carry several colons and keep the default port.
        const auto ipv6 = client::parse_endpoint("::1", 8000);
        assert(ipv6.host == "::1");
        assert(ipv6.port == 8000);

        assert(throws_runtime_error([]
                                    { (void)client::parse_endpoint(":80", 8000); }));
        assert(throws_runtime_error([]
                                    { (void)client::parse_endpoint("host:0", 8000); }));
        assert(throws_runtime_error([]
                                    { (void)client::parse_endpoint("host:12ab", 8000); }));
    }

    void test_client_config_file()
    {
        const auto temp_dir = test::fresh_temp_dir("ferry_client_config_test");
        const auto config_path = temp_dir / "client.json";
        write_json(config_path, {{"port", 8443}, {"proxy", nullptr}, {"stdin_name", "stream.bin"},
                                 {"log_file", (temp_dir / "client.log").string()}});

        client::ClientConfig config;
        client::apply_config_file(config, config_path);
        assert(config.target.port == 8443);
        assert(!config.proxy.has_value());
        assert(config.stdin_name == "stream.bin");
        assert(config.log_path == temp_dir / "client.log");

        // Command line flags override the file.
        const auto parsed = parse({"--config", config_path.string(), "--proxy", "127.0.0.1:9150", "receiver"});
        assert(parsed.target.port == 8443);
        assert(parsed.proxy.has_value());
        assert(parsed.proxy->port == 9150);

        write_json(config_path, {{"proxy", "socks.internal:1080"}});
        client::ClientConfig proxied;
        client::apply_config_file(proxied, config_path);
        assert(proxied.proxy->host == "socks.internal");
        assert(proxied.proxy->port == 1080);
        test::cleanup_path(temp_dir);
    }

    void test_input_expansion()
    {
        const auto temp_dir = test::fresh_temp_dir("ferry_inputs_test");
        test::write_file(temp_dir / "one.png", "1");
        test::write_file(temp_dir / "two.png", "2");
        test::write_file(temp_dir / "notes.txt", "n");

        assert(client::has_glob_pattern("*.png"));
        assert(client::has_glob_pattern("file?.txt"));
        assert(!client::has_glob_pattern("plain.txt"));

        const auto literal = (temp_dir / "notes.txt").string();
        const auto expanded = client::expand_inputs({(temp_dir / "*.png").string(), literal, literal,
                                                     (temp_dir / "one.png").string()});
        assert(expanded.size() == 3);
        assert(expanded[0] == temp_dir / "one.png");
        assert(expanded[1] == temp_dir / "two.png");
        assert(expanded[2] == temp_dir / "notes.txt");

        assert(throws_runtime_error([&]
                                    { (void)client::expand_inputs({(temp_dir / "*.gif").string()}); }));
        test::cleanup_path(temp_dir);
    }

    void test_socks5_encoding()
    {
        assert((client::encode_socks5_greeting() == std::vector<std::uint8_t>{0x05, 0x01, 0x00}));
        const auto request = client::encode_socks5_connect("ab.onion", 0x1F40);
        const std::vector<std::uint8_t> expected{0x05, 0x01, 0x00, 0x03, 8, 'a', 'b', '.', 'o', 'n', 'i', 'o', 'n',
                                                 0x1F, 0x40};
        assert(request == expected);

        bool rejected = false;
        try
        {
            (void)client::encode_socks5_connect(std::string(256, 'h'), 80);
        }
        catch (const std::invalid_argument &)
        {
            rejected = true;
        }
        assert(rejected);
        assert(client::socks5_reply_message(0x05) == "connection refused");
        assert(client::socks5_reply_message(0x42) == "unknown error");
    }

    void test_socks5_handshake()
    {
        const std::vector<std::uint8_t> accepted{0x05, 0x00, 0x05, 0x00, 0x00, 0x01, 127, 0, 0, 1, 0x23, 0x82};
        BufferStream proxy(accepted);
        client::socks5_handshake(proxy, "receiver.onion", 8000, StopCondition{});
        assert(proxy.read_offset() == accepted.size());
        auto written = client::encode_socks5_greeting();
        const auto connect = client::encode_socks5_connect("receiver.onion", 8000);
        written.insert(written.end(), connect.begin(), connect.end());
        assert(proxy.output() == written);

        const std::vector<std::uint8_t> domain_reply{0x05, 0x00, 0x05, 0x00, 0x00, 0x03, 3, 'a', 'b', 'c', 0, 80};
        BufferStream domain_proxy(domain_reply, 1);
        client::socks5_handshake(domain_proxy, "x", 1, StopCondition{});
        assert(domain_proxy.read_offset() == domain_reply.size());

        BufferStream refusing(std::vector<std::uint8_t>{0x05, 0x00, 0x05, 0x05, 0x00, 0x01});
        try
        {
            client::socks5_handshake(refusing, "receiver.onion", 8000, StopCondition{});
            assert(false && "expected refusal");
        }
        catch (const TransferError &ex)
        {
            assert(ex.code() == ErrorCode::IoError);
            assert(std::string(ex.what()).find("connection refused") != std::string::npos);
        }

        BufferStream auth_required(std::vector<std::uint8_t>{0x05, 0x02});
        assert(test::expect_transfer_error([&]
                                           { client::socks5_handshake(auth_required, "h", 1, StopCondition{}); }) ==
               ErrorCode::IoError);

        BufferStream silent;
        assert(test::expect_transfer_error([&]
                                           { client::socks5_handshake(silent, "h", 1, StopCondition{}); }) ==
               ErrorCode::IoError);
    }

    template <typename Predicate>
    bool wait_until(Predicate &&predicate)
    {
        const auto give_up = std::chrono::steady_clock::now() + std::chrono::seconds(10);
        while (std::chrono::steady_clock::now() < give_up)
        {
            if (predicate())
            {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        return false;
    }

    void test_loopback_transfer()
    {
        const auto base = test::fresh_temp_dir("ferry_loopback_test");
        const auto source = base / "outgoing" / "batch";
        test::write_file(source / "a.bin", test::patterned_content(100 * 1024, 7));
        test::write_file(source / "nested" / "b.txt", "nested file\n");

        server::ServerConfig config;
        config.address = "127.0.0.1";
        config.port = 0;
        config.root = base / "incoming";
        config.io_timeout = std::chrono::seconds(5);
        server::Server server(config);
        std::thread server_thread([&server]
                                  { server.run(); });

        {
            auto stream = TcpStream::connect("127.0.0.1", server.port());
            const LocalFilesystem filesystem{};
            NullProgressSink sink;
            Sender sender(*stream, filesystem, sink);
            sender.send_all({source});
            assert(sender.summary().files == 2);
            stream->close();
        }

        const auto received = config.root / "batch";
        assert(wait_until([&]
                          { return server.active_sessions() == 0 && std::filesystem::exists(received / "nested" / "b.txt"); }));
        assert(test::read_file(received / "a.bin") == test::read_file(source / "a.bin"));
        assert(test::read_file(received / "nested" / "b.txt") == "nested file\n");

        server.stop();
        server_thread.join();
        test::cleanup_path(base);
    }

    // Releases its flag only after a delay, like a session tearing down its
    // stream once its work has returned.
    struct SlowTeardown
    {
        explicit SlowTeardown(std::atomic<bool> &flag) : torn_down(flag) {}

        ~SlowTeardown()
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(150));
            torn_down = true;
        }

        std::atomic<bool> &torn_down;
    };

    void test_session_manager_joins_finished_workers()
    {
        server::SessionManager manager;
        std::atomic<bool> torn_down{false};
        auto teardown = std::make_shared<SlowTeardown>(torn_down);
        manager.launch(
            1, [teardown = std::move(teardown)] {}, {});
        assert(wait_until([&]
                          { return manager.active_count() == 0; }));
        manager.join_all();
        assert(torn_down);

        // A later launch joins workers that finished before it.
        std::atomic<bool> first_done{false};
        auto first = std::make_shared<SlowTeardown>(first_done);
        manager.launch(
            2, [first = std::move(first)] {}, {});
        assert(wait_until([&]
                          { return manager.active_count() == 0; }));
        manager.launch(
            3, [] {}, {});
        assert(first_done);
        manager.join_all();
    }

    void test_session_manager_cancels_running_work()
    {
        server::SessionManager manager;
        CancellationToken token;
        std::atomic<bool> observed{false};
        manager.launch(
            7,
            [&]
            {
                while (!token.cancelled())
                {
                    std::this_thread::sleep_for(std::chrono::milliseconds(5));
                }
                observed = true;
            },
            [&]
            { token.cancel(); });
        manager.cancel_all();
        manager.join_all();
        assert(observed);
        assert(manager.active_count() == 0);
    }

    void test_connect_honours_stop_condition()
    {
        const std::string host = "ferry-unresolvable.invalid";
        CancellationToken token;
        token.cancel();
        const StopCondition cancelled(&token, Deadline{});
        const StopCondition expired(nullptr, Deadline::after(std::chrono::milliseconds(0)));

        const auto started = std::chrono::steady_clock::now();
        assert(test::expect_transfer_error([&]
                                           { (void)TcpStream::connect(host, 80, cancelled); }) == ErrorCode::Cancelled);
        assert(test::expect_transfer_error([&]
                                           { (void)TcpStream::connect(host, 80, expired); }) == ErrorCode::Timeout);
        assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(5));
    }

    void test_connect_failure_is_io_error()
    {
        // Grab a free port, then release it so nothing is listening there.
        std::uint16_t port = 0;
        {
            server::ServerConfig config;
            config.address = "127.0.0.1";
            config.port = 0;
            config.root = test::fresh_temp_dir("ferry_closed_port_test");
            server::Server probe(config);
            port = probe.port();
        }
        assert(test::expect_transfer_error([&]
                                           { (void)TcpStream::connect("127.0.0.1", port); }) == ErrorCode::IoError);
        test::cleanup_path(std::filesystem::temp_directory_path() / "ferry_closed_port_test");
    }

} // namespace

void run_server_component_tests()
{
    test_server_config_file();
    test_client_arguments();
    test_port_validation();
    test_endpoint_parsing();
    test_client_config_file();
    test_input_expansion();
    test_socks5_encoding();
    test_socks5_handshake();
    test_loopback_transfer();
    test_session_manager_joins_finished_workers();
    test_session_manager_cancels_running_work();
    test_connect_honours_stop_condition();
    test_connect_failure_is_io_error();
}
