#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <libbeans.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/ostream_sink.h>

#include <atomic>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>

using namespace libbeans;
using Catch::Matchers::ContainsSubstring;

namespace {

/// Logger writing into a string stream, for asserting on log output.
struct captured_log {
    std::ostringstream out;
    std::shared_ptr<spdlog::logger> logger;

    captured_log() {
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
        sink->set_pattern("%l %v");
        logger = std::make_shared<spdlog::logger>("libbeans-test", std::move(sink));
        logger->set_level(spdlog::level::trace);
    }

    std::string text() {
        logger->flush();
        return out.str();
    }
};

} // namespace

// ---------------------------------------------------------------
// Exception messages
// ---------------------------------------------------------------

TEST_CASE("duplicate_registration names the bean", "[diagnostics]") {
    singleton_registry reg;
    reg.register_finished("dataSource", make_bean<int>(1));

    try {
        reg.register_finished("dataSource", make_bean<int>(2));
        FAIL("Expected duplicate_registration");
    } catch (const duplicate_registration& e) {
        REQUIRE(e.bean_name() == "dataSource");
        std::string msg = e.what();
        REQUIRE_THAT(msg, ContainsSubstring("'dataSource'"));
        REQUIRE_THAT(msg, ContainsSubstring("there is already an instance bound"));
    }
}

TEST_CASE("exception messages carry the call site", "[diagnostics]") {
    singleton_registry reg;
    reg.register_finished("svc", make_bean<int>(1));

    try {
        reg.register_finished("svc", make_bean<int>(2));
        FAIL("Expected duplicate_registration");
    } catch (const duplicate_registration& e) {
        REQUIRE_THAT(std::string(e.what()), ContainsSubstring("test_diagnostics.cpp"));
        REQUIRE_THAT(std::string(e.location().file_name()),
                     ContainsSubstring("test_diagnostics.cpp"));
    }
}

TEST_CASE("duplicate_registration may carry the first registration site", "[diagnostics]") {
    singleton_registry reg;
    reg.register_finished("svc", make_bean<int>(1));

    try {
        reg.register_finished("svc", make_bean<int>(2));
        FAIL("Expected duplicate_registration");
    } catch (const duplicate_registration& e) {
        // Only present when built with stacktrace support.
        if (!e.diagnostic_detail().empty()) {
            REQUIRE_THAT(e.diagnostic_detail(),
                         ContainsSubstring("Registration stacktrace for 'svc'"));
            REQUIRE_THAT(e.full_diagnostic(), ContainsSubstring(e.what()));
            REQUIRE_THAT(e.full_diagnostic(), ContainsSubstring(e.diagnostic_detail()));
        } else {
            REQUIRE(e.full_diagnostic() == e.what());
        }
    }
}

TEST_CASE("stacktrace capture can be switched off", "[diagnostics]") {
    singleton_registry reg({.capture_stacktraces = false});
    reg.register_finished("svc", make_bean<int>(1));

    try {
        reg.register_finished("svc", make_bean<int>(2));
        FAIL("Expected duplicate_registration");
    } catch (const duplicate_registration& e) {
        REQUIRE(e.diagnostic_detail().empty());
    }
}

TEST_CASE("bean_creation_error message format", "[diagnostics]") {
    bean_creation_error e("repo", "no connection");
    REQUIRE_THAT(std::string(e.what()),
                 ContainsSubstring("Error creating bean with name 'repo': no connection"));
    REQUIRE(e.bean_name() == "repo");
    REQUIRE(e.cause() == nullptr);
}

TEST_CASE("currently_in_creation hints at a circular reference", "[diagnostics]") {
    currently_in_creation e("a");
    REQUIRE_THAT(std::string(e.what()),
                 ContainsSubstring("Requested bean is currently in creation"));
    REQUIRE_THAT(std::string(e.what()),
                 ContainsSubstring("unresolvable circular reference"));
}

TEST_CASE("full_diagnostic lists related causes", "[diagnostics]") {
    bean_creation_error e("svc", "gave up");
    e.add_related_cause(std::make_exception_ptr(std::runtime_error("port in use")));
    e.add_related_cause(std::make_exception_ptr(42));

    auto text = e.full_diagnostic();
    REQUIRE_THAT(text, ContainsSubstring("gave up"));
    REQUIRE_THAT(text, ContainsSubstring("Related causes:"));
    REQUIRE_THAT(text, ContainsSubstring("port in use"));
    REQUIRE_THAT(text, ContainsSubstring("<non-standard exception>"));
}

TEST_CASE("creation context is appended to what()", "[diagnostics]") {
    bean_creation_error e("inner", "boom");
    e.append_creation_context("middle");
    e.append_creation_context("outer");
    REQUIRE_THAT(std::string(e.what()),
                 ContainsSubstring("(while creating 'middle' -> 'outer')"));
}

TEST_CASE("bean_state names", "[diagnostics]") {
    REQUIRE(to_string(bean_state::absent) == "absent");
    REQUIRE(to_string(bean_state::pending_early) == "pending_early");
    REQUIRE(to_string(bean_state::early_exposed) == "early_exposed");
    REQUIRE(to_string(bean_state::finished) == "finished");
    REQUIRE(to_string(lock_contention_policy::block) == "block");
}

// ---------------------------------------------------------------
// Logging
// ---------------------------------------------------------------

TEST_CASE("creation is logged at debug level", "[diagnostics]") {
    captured_log log;
    singleton_registry reg({.logger = log.logger});

    reg.get_or_create("svc", [] { return make_bean<int>(1); });

    REQUIRE_THAT(log.text(),
                 ContainsSubstring("debug Creating shared instance of singleton bean 'svc'"));
}

TEST_CASE("failing disposable is logged as a warning", "[diagnostics]") {
    captured_log log;
    singleton_registry reg({.logger = log.logger});
    reg.register_finished("socket", make_bean<int>(1));
    reg.register_disposable("socket", [] { throw std::runtime_error("already closed"); });

    reg.destroy("socket");

    auto text = log.text();
    REQUIRE_THAT(text, ContainsSubstring("warning Destruction of bean with name 'socket'"));
    REQUIRE_THAT(text, ContainsSubstring("already closed"));
}

TEST_CASE("lock contention is logged when proceeding unlocked", "[diagnostics]") {
    captured_log log;
    singleton_registry reg({.logger = log.logger});
    std::atomic<bool> creating{false};
    std::atomic<bool> release{false};

    std::jthread holder([&] {
        reg.get_or_create("slow", [&] {
            creating = true;
            while (!release) std::this_thread::yield();
            return make_bean<int>(1);
        });
    });
    while (!creating) std::this_thread::yield();

    reg.get_or_create("fast", [] { return make_bean<int>(2); });
    release = true;
    holder.join();

    auto text = log.text();
    REQUIRE_THAT(text, ContainsSubstring("info Creating singleton bean 'fast'"));
    REQUIRE_THAT(text, ContainsSubstring("holds singleton lock for other beans [slow]"));
}
