// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <iostream>
#include <string>
#include <thread>

#include <absl/strings/match.h>
#include <catch2/catch.hpp>

#include <ckpt/infra/test_util/log.hpp>

namespace ckpt::log {

//! Custom LogBuffer just for testing to access buffered content
template <Level level>
class LogBufferForTest : public LogBuffer<level> {
  public:
    explicit LogBufferForTest() : LogBuffer<level>() {}
    explicit LogBufferForTest(std::string_view msg, const Args& args) : LogBuffer<level>(msg, args) {}

    std::string content() const { return LogBuffer<level>::ss_.str(); }
};

//! Utility test function enforcing that log buffered content *IS* empty
template <Level level>
void check_log_empty() {
    auto log_buffer = LogBufferForTest<level>();
    log_buffer << "test";
    CHECK(log_buffer.content().empty());
}

//! Utility test function enforcing that log buffered content *IS NOT* empty
template <Level level>
void check_log_not_empty() {
    auto log_buffer = LogBufferForTest<level>();
    log_buffer << "test";
    CHECK(absl::StrContains(log_buffer.content(), "test"));
}

//! Build the prettified key-value pair using color scheme
static std::string prettified_key_value(const std::string& key, const std::string& value) {
    std::string kv_pair{kColorGreen};
    kv_pair.append(key);
    kv_pair.append(kColorReset);
    kv_pair.append("=");
    kv_pair.append(kColorReset);
    kv_pair.append(kColorWhite);
    kv_pair.append(value);
    return kv_pair;
}

TEST_CASE("LogBuffer", "[ckpt][infra][log]") {
    // After the test restore verbosity as it was before the test
    test_util::SetLogVerbosityGuard log_guard{get_verbosity()};

    // Temporarily override std::cout and std::cerr with string streams to avoid terminal output
    std::stringstream string_cout, string_cerr;
    test_util::StreamSwap cout_swap{std::cout, string_cout};
    test_util::StreamSwap cerr_swap{std::cerr, string_cerr};
    // Make sure logging facility is initialized
    Settings settings{.log_verbosity = Level::kInfo};
    init(settings);

    SECTION("LogBuffer stores nothing for verbosity higher than default") {
        check_log_empty<Level::kDebug>();
        check_log_empty<Level::kTrace>();
    }

    SECTION("LogBuffer stores content for verbosity lower than or equal to default") {
        check_log_not_empty<Level::kInfo>();
        check_log_not_empty<Level::kWarning>();
        check_log_not_empty<Level::kError>();
        check_log_not_empty<Level::kCritical>();
        check_log_not_empty<Level::kNone>();
    }

    SECTION("LogBuffer stores nothing for verbosity higher than configured one") {
        test_util::SetLogVerbosityGuard guard{Level::kWarning};
        check_log_empty<Level::kInfo>();
        check_log_empty<Level::kDebug>();
        check_log_empty<Level::kTrace>();
    }

    SECTION("Settings enable/disable thread tracing") {
        std::stringstream thread_id_stream;
        thread_id_stream << std::this_thread::get_id();
        auto log_buffer1 = LogBufferForTest<Level::kInfo>();
        log_buffer1 << "test";
        CHECK(!absl::StrContains(log_buffer1.content(), thread_id_stream.str()));

        Settings log_settings{.log_threads = true, .log_verbosity = Level::kInfo};
        init(log_settings);
        auto log_buffer2 = LogBufferForTest<Level::kInfo>();
        log_buffer2 << "test";
        CHECK(absl::StrContains(log_buffer2.content(), thread_id_stream.str()));
    }

    SECTION("Non-TTY output is not colorized") {
        if (!is_terminal_stderr()) {
            LogBufferForTest<Level::kInfo>{"test0", {"key1", "value1"}};  // temporary log object, flush on dtor
            const auto cerr_output{string_cerr.str()};
            CHECK(absl::StrContains(cerr_output, "test0"));
            CHECK(absl::StrContains(cerr_output, "key1=value1"));
        }
    }

    SECTION("Variable arguments: constructor") {
        auto log_buffer = LogBufferForTest<Level::kInfo>("test", {"key1", "value1", "key2", "value2"});
        CHECK(absl::StrContains(log_buffer.content(), "test"));
        CHECK(absl::StrContains(log_buffer.content(), prettified_key_value("key1", "value1")));
        CHECK(absl::StrContains(log_buffer.content(), prettified_key_value("key2", "value2")));
    }

    SECTION("Variable arguments: accumulators") {
        auto log_buffer = LogBufferForTest<Level::kInfo>();
        log_buffer << "test" << Args{"key1", "value1", "key2", "value2"};
        CHECK(absl::StrContains(log_buffer.content(), "test"));
        CHECK(absl::StrContains(log_buffer.content(), prettified_key_value("key1", "value1")));
    }

    init(Settings{.log_verbosity = get_verbosity()});
}

TEST_CASE("CKPT_LOGBUFFER skips filtered levels", "[ckpt][infra][log]") {
    test_util::SetLogVerbosityGuard log_guard{Level::kWarning};
    std::stringstream string_cerr;
    test_util::StreamSwap cerr_swap{std::cerr, string_cerr};

    CKPT_DEBUG << "filtered debug line";
    CKPT_WARN << "printed warning line";
    CHECK(!absl::StrContains(string_cerr.str(), "filtered debug line"));
    CHECK(absl::StrContains(string_cerr.str(), "printed warning line"));
}

}  // namespace ckpt::log
