#include "photo_restore/core/utils.hpp"
#include "photo_restore/process/line_channel.hpp"
#include "photo_restore/process/stream_multiplexer.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using photo_restore::process::LineChannel;
using photo_restore::process::LineSplitter;
using photo_restore::process::OutputLine;
using photo_restore::process::RecvStatus;
using photo_restore::process::StreamOrigin;

TEST_CASE("line_splitter_handles_partial_and_crlf_lines") {
  LineSplitter splitter;
  const std::string a = "Running Sta";
  const std::string b = "ge 1\r\nsecond\n\nthi";

  REQUIRE(splitter.feed(a.data(), a.size()).empty());
  const auto lines = splitter.feed(b.data(), b.size());
  REQUIRE(lines == std::vector<std::string>{"Running Stage 1", "second", ""});

  const auto rest = splitter.finish();
  REQUIRE(rest.has_value());
  REQUIRE(*rest == "thi");
  REQUIRE_FALSE(splitter.finish().has_value());
}

TEST_CASE("drop_invalid_utf8_keeps_valid_text") {
  std::string valid = "Größe ✓ 写真";
  REQUIRE(photo_restore::core::drop_invalid_utf8(valid) == 0);
  REQUIRE(valid == "Größe ✓ 写真");

  std::string broken = std::string("ok ") + '\xff' + "fine" + '\xc3';
  REQUIRE(photo_restore::core::drop_invalid_utf8(broken) == 2);
  REQUIRE(broken == "ok fine");
}

TEST_CASE("channel_times_out_while_senders_are_open") {
  LineChannel channel(1);
  OutputLine line;
  REQUIRE(channel.recv_for(10ms, line) == RecvStatus::Timeout);
  REQUIRE_FALSE(channel.closed());
}

TEST_CASE("channel_delivers_queued_lines_before_reporting_closed") {
  LineChannel channel(2);
  channel.send({StreamOrigin::Stdout, "a"});
  channel.send({StreamOrigin::Stderr, "b"});
  channel.close_sender();
  channel.close_sender();

  OutputLine line;
  REQUIRE(channel.recv_for(10ms, line) == RecvStatus::Line);
  REQUIRE(line.text == "a");
  REQUIRE(line.origin == StreamOrigin::Stdout);
  REQUIRE(channel.recv_for(10ms, line) == RecvStatus::Line);
  REQUIRE(line.text == "b");
  REQUIRE(line.origin == StreamOrigin::Stderr);
  REQUIRE(channel.recv_for(10ms, line) == RecvStatus::Closed);
  REQUIRE(channel.closed());
}

TEST_CASE("channel_preserves_per_sender_order_across_threads") {
  LineChannel channel(2);
  auto produce = [&channel](StreamOrigin origin) {
    for (int i = 0; i < 500; ++i) {
      channel.send({origin, std::to_string(i)});
    }
    channel.close_sender();
  };
  std::thread out(produce, StreamOrigin::Stdout);
  std::thread err(produce, StreamOrigin::Stderr);

  int next_out = 0;
  int next_err = 0;
  OutputLine line;
  while (channel.recv_for(1000ms, line) == RecvStatus::Line) {
    int &expected = line.origin == StreamOrigin::Stdout ? next_out : next_err;
    REQUIRE(line.text == std::to_string(expected));
    ++expected;
  }
  out.join();
  err.join();

  REQUIRE(next_out == 500);
  REQUIRE(next_err == 500);
}
