#include <cassert>
#include <chrono>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

#include "ferry/cancellation.hpp"
#include "ferry/crypto.hpp"
#include "ferry/error_codes.hpp"
#include "ferry/filesystem.hpp"
#include "ferry/receiver.hpp"
#include "ferry/sender.hpp"
#include "ferry/wire.hpp"
#include "test_support.hpp"

using namespace ferry;
using ferry::test::BufferStream;

namespace
{

    const LocalFilesystem kLocal{};

    std::vector<std::uint8_t> send_paths(const std::vector<std::filesystem::path> &paths)
    {
        BufferStream wire_out;
        NullProgressSink sink;
        Sender sender(wire_out, kLocal, sink);
        sender.send_all(paths);
        return wire_out.output();
    }

    ReceiveSummary receive_bytes(const std::vector<std::uint8_t> &bytes, const std::filesystem::path &root,
                                 std::size_t max_read = 0)
    {
        BufferStream wire_in(bytes, max_read);
        NullProgressSink sink;
        Receiver receiver(wire_in, kLocal, root, sink);
        auto summary = receiver.run();
        assert(receiver.state() == Receiver::State::Closed);
        return summary;
    }

    void test_directory_tree_roundtrip()
    {
        const auto base = test::fresh_temp_dir("ferry_tree_test");
        const auto source = base / "src" / "album";
        test::write_file(source / "cover.jpg", test::patterned_content(70 * 1024, 3));
        test::write_file(source / "notes.txt", "track list\n");
        test::write_file(source / "disc2" / "song.flac", test::patterned_content(1000, 9));
        std::filesystem::create_directories(source / "empty");

        const auto bytes = send_paths({source});
        const auto root = base / "received";
        const auto summary = receive_bytes(bytes, root, 1500);

        assert(summary.directories == 3);
        assert(summary.files == 3);
        assert(summary.bytes == 70 * 1024 + 11 + 1000);
        assert(std::filesystem::is_directory(root / "album" / "empty"));
        for (const auto *relative : {"cover.jpg", "notes.txt", "disc2/song.flac"})
        {
            assert(test::hash_file(root / "album" / relative) == test::hash_file(source / relative));
        }
        test::cleanup_path(base);
    }

    void test_depth_first_lexical_order()
    {
        const auto base = test::fresh_temp_dir("ferry_order_test");
        const auto source = base / "top";
        test::write_file(source / "b.txt", "b");
        test::write_file(source / "a" / "inner.txt", "inner");
        test::write_file(source / "c.txt", "c");

        BufferStream wire_out;
        NullProgressSink sink;
        Sender sender(wire_out, kLocal, sink);
        sender.send_item(source, "top");

        BufferStream wire_in(wire_out.output());
        std::vector<std::string> names;
        while (const auto descriptor = wire::decode_descriptor(wire_in))
        {
            names.push_back(descriptor->name);
            std::vector<std::uint8_t> skip(static_cast<std::size_t>(descriptor->size));
            assert(read_full(wire_in, skip, StopCondition{}) == skip.size());
        }
        const std::vector<std::string> expected{"top", "top/a", "top/a/inner.txt", "top/b.txt", "top/c.txt"};
        assert(names == expected);

        const auto &items = sender.summary().items;
        assert(items.size() == expected.size());
        assert(items[1].descriptor.is_directory);
        assert(!items[2].content_digest.empty());
        test::cleanup_path(base);
    }

    void test_sequential_frames()
    {
        const std::string content_a(100, 'A');
        std::vector<std::uint8_t> bytes = wire::encode_descriptor_bytes({.name = "fileA", .size = 100, .is_directory = false});
        bytes.insert(bytes.end(), content_a.begin(), content_a.end());
        const auto dir = wire::encode_descriptor_bytes({.name = "dirB", .size = 0, .is_directory = true});
        bytes.insert(bytes.end(), dir.begin(), dir.end());
        const auto empty = wire::encode_descriptor_bytes({.name = "fileC", .size = 0, .is_directory = false});
        bytes.insert(bytes.end(), empty.begin(), empty.end());

        const auto root = test::fresh_temp_dir("ferry_sequence_test");
        const auto summary = receive_bytes(bytes, root);

        assert(summary.items.size() == 3);
        assert(summary.items[0].descriptor.name == "fileA");
        assert(summary.items[1].descriptor.name == "dirB");
        assert(summary.items[2].descriptor.name == "fileC");
        assert(test::read_file(root / "fileA") == content_a);
        assert(std::filesystem::is_directory(root / "dirB"));
        assert(std::filesystem::exists(root / "fileC"));
        assert(std::filesystem::file_size(root / "fileC") == 0);
        test::cleanup_path(root);
    }

    void test_truncated_content_keeps_partial_file()
    {
        auto bytes = wire::encode_descriptor_bytes({.name = "big.bin", .size = 1000, .is_directory = false});
        const auto partial = test::patterned_content(400, 1);
        bytes.insert(bytes.end(), partial.begin(), partial.end());

        const auto root = test::fresh_temp_dir("ferry_truncated_test");
        BufferStream wire_in(bytes);
        NullProgressSink sink;
        Receiver receiver(wire_in, kLocal, root, sink);
        const auto code = test::expect_transfer_error([&]
                                                      { (void)receiver.run(); });
        assert(code == ErrorCode::IoError);
        assert(receiver.state() == Receiver::State::Closed);
        assert(std::filesystem::file_size(root / "big.bin") == 400);
        test::cleanup_path(root);
    }

    void test_overwrite_existing_files()
    {
        auto bytes = wire::encode_descriptor_bytes({.name = "same.txt", .size = 5, .is_directory = false});
        for (const char c : std::string("first"))
        {
            bytes.push_back(static_cast<std::uint8_t>(c));
        }
        const auto second = wire::encode_descriptor_bytes({.name = "same.txt", .size = 2, .is_directory = false});
        bytes.insert(bytes.end(), second.begin(), second.end());
        bytes.push_back('o');
        bytes.push_back('k');

        const auto root = test::fresh_temp_dir("ferry_overwrite_test");
        (void)receive_bytes(bytes, root);
        assert(test::read_file(root / "same.txt") == "ok");

        // A later connection replaces the file again.
        auto third = wire::encode_descriptor_bytes({.name = "same.txt", .size = 3, .is_directory = false});
        third.push_back('n');
        third.push_back('e');
        third.push_back('w');
        (void)receive_bytes(third, root);
        assert(test::read_file(root / "same.txt") == "new");
        test::cleanup_path(root);
    }

    void assert_monotone(const std::vector<ProgressObservation> &observations, std::uint64_t total)
    {
        assert(!observations.empty());
        std::uint64_t previous = 0;
        for (const auto &observation : observations)
        {
            assert(observation.current >= previous);
            assert(observation.current <= total);
            previous = observation.current;
        }
        assert(observations.back().final);
        assert(observations.back().current == total);
    }

    void test_progress_is_monotone_on_both_ends()
    {
        const auto base = test::fresh_temp_dir("ferry_progress_test");
        const auto source = base / "payload.bin";
        constexpr std::size_t kSize = 3 * wire::kChunkSize + 17;
        test::write_file(source, test::patterned_content(kSize, 5));

        BufferStream wire_out;
        test::RecordingProgressSink send_sink;
        Sender sender(wire_out, kLocal, send_sink);
        sender.send_all({source});
        assert(send_sink.observations.size() == 5);
        assert_monotone(send_sink.observations, kSize);
        assert(send_sink.observations.front().label == "payload.bin");

        BufferStream wire_in(wire_out.output(), 1000);
        test::RecordingProgressSink receive_sink;
        Receiver receiver(wire_in, kLocal, base / "out", receive_sink);
        (void)receiver.run();
        assert_monotone(receive_sink.observations, kSize);
        test::cleanup_path(base);
    }

    void test_stream_input()
    {
        BufferStream empty_out;
        NullProgressSink sink;
        Sender empty_sender(empty_out, kLocal, sink);
        std::istringstream nothing;
        assert(test::expect_transfer_error([&]
                                           { empty_sender.send_stream(nothing); }) == ErrorCode::EmptyInput);
        assert(empty_out.output().empty());

        BufferStream wire_out;
        Sender sender(wire_out, kLocal, sink);
        std::istringstream piped("hello from a pipe");
        sender.send_stream(piped);
        assert(sender.summary().files == 1);

        BufferStream wire_in(wire_out.output());
        const auto descriptor = wire::decode_descriptor(wire_in);
        assert(descriptor.has_value());
        assert(descriptor->name == kDefaultStreamName);
        assert(descriptor->size == 17);
        assert(!descriptor->is_directory);

        BufferStream named_out;
        Sender named_sender(named_out, kLocal, sink);
        std::istringstream named("x");
        named_sender.send_stream(named, "log.txt");
        BufferStream named_in(named_out.output());
        assert(wire::decode_descriptor(named_in)->name == "log.txt");
    }

    void test_missing_path_and_error_context()
    {
        BufferStream wire_out;
        NullProgressSink sink;
        Sender sender(wire_out, kLocal, sink);
        const auto missing = std::filesystem::temp_directory_path() / "ferry_does_not_exist";
        test::cleanup_path(missing);
        try
        {
            sender.send_all({missing});
            assert(false && "expected NotFound");
        }
        catch (const TransferError &ex)
        {
            assert(ex.code() == ErrorCode::NotFound);
            assert(std::string(ex.what()).find(missing.string()) != std::string::npos);
        }
        assert(wire_out.output().empty());
    }

    void test_receiver_rejects_hostile_frames()
    {
        const auto root = test::fresh_temp_dir("ferry_hostile_test");
        const std::vector<wire::ItemDescriptor> hostile{
            {.name = "../evil", .size = 0, .is_directory = false},
            {.name = "/etc/evil", .size = 0, .is_directory = false},
            {.name = "", .size = 0, .is_directory = true},
            {.name = "neg", .size = -5, .is_directory = false},
            {.name = "dir", .size = 4, .is_directory = true},
            {.name = std::string("report\0.txt", 11), .size = 0, .is_directory = false},
            {.name = std::string("a\0b", 3), .size = 0, .is_directory = true},
        };
        for (const auto &descriptor : hostile)
        {
            BufferStream wire_in(wire::encode_descriptor_bytes(descriptor));
            NullProgressSink sink;
            Receiver receiver(wire_in, kLocal, root, sink);
            assert(test::expect_transfer_error([&]
                                               { (void)receiver.run(); }) == ErrorCode::ProtocolError);
        }
        assert(!std::filesystem::exists(root.parent_path() / "evil"));
        assert(!std::filesystem::exists(root / "report"));
        assert(!std::filesystem::exists(root / "a"));
        test::cleanup_path(root);
    }

    void test_stalled_peer_times_out()
    {
        const auto root = test::fresh_temp_dir("ferry_stall_test");
        test::StallingStream stalled;
        NullProgressSink sink;
        TransferOptions options{.cancellation = nullptr, .io_timeout = std::chrono::milliseconds(50)};
        Receiver receiver(stalled, kLocal, root, sink, options);
        const auto started = std::chrono::steady_clock::now();
        assert(test::expect_transfer_error([&]
                                           { (void)receiver.run(); }) == ErrorCode::Timeout);
        assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(5));

        CancellationToken token;
        token.cancel();
        TransferOptions cancelled{.cancellation = &token, .io_timeout = std::chrono::milliseconds(0)};
        Receiver cancelled_receiver(stalled, kLocal, root, sink, cancelled);
        assert(test::expect_transfer_error([&]
                                           { (void)cancelled_receiver.run(); }) == ErrorCode::Cancelled);
        test::cleanup_path(root);
    }

    void test_source_changes_during_transfer()
    {
        test::FakeFilesystem fake;
        fake.add_file("shrinking.log", std::string(10, 's'), 20);
        fake.add_file("growing.log", std::string(30, 'g'), 20);
        NullProgressSink sink;

        BufferStream shrink_out;
        Sender shrink_sender(shrink_out, fake, sink);
        assert(test::expect_transfer_error([&]
                                           { shrink_sender.send_item("shrinking.log", "shrinking.log"); }) ==
               ErrorCode::IoError);

        BufferStream grow_out;
        Sender grow_sender(grow_out, fake, sink);
        grow_sender.send_item("growing.log", "growing.log");
        const auto header = wire::encode_descriptor_bytes({.name = "growing.log", .size = 20, .is_directory = false});
        assert(grow_out.output().size() == header.size() + 20);
        assert(grow_sender.summary().bytes == 20);
    }

    void test_name_length_limit_at_sender()
    {
        test::FakeFilesystem fake;
        const std::string long_name(wire::kMaxNameLength + 1, 'n');
        fake.add_file("long", "x", 1);
        BufferStream wire_out;
        NullProgressSink sink;
        Sender sender(wire_out, fake, sink);
        assert(test::expect_transfer_error([&]
                                           { sender.send_item("long", long_name); }) == ErrorCode::ProtocolError);
        assert(wire_out.output().empty());
    }

    void test_receiver_state_names()
    {
        assert(to_string(Receiver::State::AwaitingFrame) == "awaiting_frame");
        assert(to_string(Receiver::State::ReceivingContent) == "receiving_content");
        assert(to_string(Receiver::State::Closed) == "closed");
    }

} // namespace

void run_transfer_tests()
{
    test_directory_tree_roundtrip();
    test_depth_first_lexical_order();
    test_sequential_frames();
    test_truncated_content_keeps_partial_file();
    test_overwrite_existing_files();
    test_progress_is_monotone_on_both_ends();
    test_stream_input();
    test_missing_path_and_error_context();
    test_receiver_rejects_hostile_frames();
    test_stalled_peer_times_out();
    test_source_changes_during_transfer();
    test_name_length_limit_at_sender();
    test_receiver_state_names();
}
