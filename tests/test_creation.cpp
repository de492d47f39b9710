#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <libbeans.hpp>

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>

using namespace libbeans;

// ---------------------------------------------------------------
// get_or_create basics
// ---------------------------------------------------------------

TEST_CASE("get_or_create constructs once and caches", "[creation]") {
    singleton_registry reg;
    int calls = 0;
    auto factory = [&] {
        ++calls;
        return make_bean<int>(calls);
    };

    auto first = reg.get_or_create("svc", factory);
    auto second = reg.get_or_create("svc", factory);

    REQUIRE(calls == 1);
    REQUIRE(first == second);
    REQUIRE(reg.get("svc") == first);
    REQUIRE(reg.contains("svc"));
    REQUIRE_FALSE(reg.is_singleton_currently_in_creation("svc"));
}

TEST_CASE("get_or_create returns a pre-registered instance", "[creation]") {
    singleton_registry reg;
    auto existing = make_bean<int>(1);
    reg.register_finished("svc", existing);

    bool called = false;
    auto result = reg.get_or_create("svc", [&] {
        called = true;
        return make_bean<int>(2);
    });
    REQUIRE(result == existing);
    REQUIRE_FALSE(called);
}

TEST_CASE("bean is marked in creation while its factory runs", "[creation]") {
    singleton_registry reg;
    bool marked = false;
    bool tracked = false;
    reg.get_or_create("svc", [&] {
        marked = reg.is_singleton_currently_in_creation("svc");
        tracked = reg.is_currently_in_creation("svc");
        return make_bean<int>(1);
    });
    REQUIRE(marked);
    REQUIRE(tracked);
    REQUIRE_FALSE(reg.is_singleton_currently_in_creation("svc"));
}

TEST_CASE("failed creation leaves the name absent and can be retried", "[creation]") {
    singleton_registry reg;

    REQUIRE_THROWS_AS(reg.get_or_create("svc", []() -> bean_ptr {
                          throw std::runtime_error("first attempt fails");
                      }),
                      bean_creation_error);

    REQUIRE_FALSE(reg.contains("svc"));
    REQUIRE(reg.get("svc") == nullptr);
    REQUIRE_FALSE(reg.is_singleton_currently_in_creation("svc"));

    auto created = reg.get_or_create("svc", [] { return make_bean<std::string>("ok"); });
    REQUIRE(*bean_cast<std::string>(created) == "ok");

    bool called_again = false;
    auto cached = reg.get_or_create("svc", [&] {
        called_again = true;
        return make_bean<std::string>("other");
    });
    REQUIRE(cached == created);
    REQUIRE_FALSE(called_again);
}

TEST_CASE("foreign factory exceptions are wrapped with their cause", "[creation]") {
    singleton_registry reg;
    try {
        reg.get_or_create("svc", []() -> bean_ptr { throw std::logic_error("bad wiring"); });
        FAIL("Expected bean_creation_error");
    } catch (const bean_creation_error& e) {
        REQUIRE(e.bean_name() == "svc");
        REQUIRE_THAT(std::string(e.what()), Catch::Matchers::ContainsSubstring("bad wiring"));
        REQUIRE(e.cause() != nullptr);
        REQUIRE_THROWS_AS(std::rethrow_exception(e.cause()), std::logic_error);
    }
}

TEST_CASE("factory returning an empty handle is a creation failure", "[creation]") {
    singleton_registry reg;
    REQUIRE_THROWS_AS(reg.get_or_create("svc", [] { return bean_ptr{}; }),
                      bean_creation_error);
    REQUIRE_FALSE(reg.contains("svc"));
}

TEST_CASE("illegal_state from factory recovers an existing instance", "[creation]") {
    singleton_registry reg;
    auto registered = make_bean<int>(3);

    auto result = reg.get_or_create("svc", [&]() -> bean_ptr {
        // The factory publishes the bean itself, then signals it.
        reg.register_finished("svc", registered);
        throw illegal_state("svc already exists");
    });

    REQUIRE(result == registered);
    REQUIRE(reg.get("svc") == registered);
}

TEST_CASE("illegal_state from factory is rethrown when nothing exists", "[creation]") {
    singleton_registry reg;
    REQUIRE_THROWS_AS(reg.get_or_create("svc", []() -> bean_ptr {
                          throw illegal_state("broken");
                      }),
                      illegal_state);
    REQUIRE_FALSE(reg.contains("svc"));
    REQUIRE_FALSE(reg.is_singleton_currently_in_creation("svc"));
}

TEST_CASE("factory that publishes its own name is a consistency violation", "[creation]") {
    singleton_registry reg;
    REQUIRE_THROWS_AS(reg.get_or_create("svc", [&] {
                          reg.register_finished("svc", make_bean<int>(1));
                          return make_bean<int>(2);
                      }),
                      illegal_state);
    // The instance published by the factory wins.
    REQUIRE(*reg.get_as<int>("svc") == 1);
    REQUIRE_FALSE(reg.is_singleton_currently_in_creation("svc"));
}

// ---------------------------------------------------------------
// Circular references without early exposure
// ---------------------------------------------------------------

TEST_CASE("direct re-entry is rejected as currently_in_creation", "[creation]") {
    singleton_registry reg;
    try {
        reg.get_or_create("a", [&] {
            return reg.get_or_create("b", [&] {
                return reg.get_or_create("a", [] { return make_bean<int>(0); });
            });
        });
        FAIL("Expected currently_in_creation");
    } catch (const currently_in_creation& e) {
        REQUIRE(e.bean_name() == "a");
        REQUIRE_THAT(std::string(e.what()),
                     Catch::Matchers::ContainsSubstring("circular reference"));
        REQUIRE_THAT(std::string(e.what()),
                     Catch::Matchers::ContainsSubstring("while creating 'b'"));
    }
    REQUIRE_FALSE(reg.is_singleton_currently_in_creation("a"));
    REQUIRE_FALSE(reg.is_singleton_currently_in_creation("b"));
    REQUIRE_FALSE(reg.contains("a"));
    REQUIRE_FALSE(reg.contains("b"));
}

TEST_CASE("nested failure carries the creation chain", "[creation]") {
    singleton_registry reg;
    try {
        reg.get_or_create("outer", [&] {
            return reg.get_or_create("middle", [&] {
                return reg.get_or_create("inner", []() -> bean_ptr {
                    throw std::runtime_error("disk full");
                });
            });
        });
        FAIL("Expected bean_creation_error");
    } catch (const bean_creation_error& e) {
        REQUIRE(e.bean_name() == "inner");
        REQUIRE_THAT(std::string(e.what()),
                     Catch::Matchers::ContainsSubstring("while creating 'middle' -> 'outer'"));
    }
}

// ---------------------------------------------------------------
// Creation tracking exclusions
// ---------------------------------------------------------------

TEST_CASE("excluded names skip in-creation tracking", "[creation]") {
    singleton_registry reg;
    reg.set_currently_in_creation("free", false);

    bool marked = true;
    reg.get_or_create("free", [&] {
        marked = reg.is_singleton_currently_in_creation("free");
        return make_bean<int>(1);
    });
    REQUIRE_FALSE(marked);
    REQUIRE(reg.contains("free"));
}

TEST_CASE("is_currently_in_creation honours exclusions", "[creation]") {
    singleton_registry reg;
    bool raw = false;
    bool tracked = true;
    reg.get_or_create("svc", [&] {
        reg.set_currently_in_creation("svc", false);
        raw = reg.is_singleton_currently_in_creation("svc");
        tracked = reg.is_currently_in_creation("svc");
        reg.set_currently_in_creation("svc", true);
        return make_bean<int>(1);
    });
    REQUIRE(raw);
    REQUIRE_FALSE(tracked);
}

// ---------------------------------------------------------------
// Suppressed exceptions
// ---------------------------------------------------------------

TEST_CASE("suppressed exceptions are attached as related causes", "[creation]") {
    singleton_registry reg;
    try {
        reg.get_or_create("svc", [&]() -> bean_ptr {
            reg.on_suppressed_exception(std::make_exception_ptr(std::runtime_error("first")));
            reg.on_suppressed_exception(std::make_exception_ptr(std::runtime_error("second")));
            throw bean_creation_error("svc", "gave up");
        });
        FAIL("Expected bean_creation_error");
    } catch (const bean_creation_error& e) {
        REQUIRE(e.related_causes().size() == 2);
        REQUIRE_THAT(e.full_diagnostic(), Catch::Matchers::ContainsSubstring("first"));
        REQUIRE_THAT(e.full_diagnostic(), Catch::Matchers::ContainsSubstring("second"));
    }
}

TEST_CASE("suppressed exceptions are capped at 100", "[creation]") {
    singleton_registry reg;
    try {
        reg.get_or_create("svc", [&]() -> bean_ptr {
            for (int i = 0; i < 150; ++i) {
                reg.on_suppressed_exception(std::make_exception_ptr(
                    std::runtime_error("suppressed #" + std::to_string(i))));
            }
            throw bean_creation_error("svc", "gave up");
        });
        FAIL("Expected bean_creation_error");
    } catch (const bean_creation_error& e) {
        REQUIRE(e.related_causes().size() == 100);
    }
}

TEST_CASE("suppressed exceptions are attached to wrapped failures", "[creation]") {
    singleton_registry reg({.suppressed_exceptions_limit = 3});
    try {
        reg.get_or_create("svc", [&]() -> bean_ptr {
            for (int i = 0; i < 5; ++i) {
                reg.on_suppressed_exception(
                    std::make_exception_ptr(std::runtime_error("s" + std::to_string(i))));
            }
            throw std::runtime_error("primary");
        });
        FAIL("Expected bean_creation_error");
    } catch (const bean_creation_error& e) {
        REQUIRE(e.related_causes().size() == 3);
    }
}

TEST_CASE("suppressed exceptions are not recorded outside creation", "[creation]") {
    singleton_registry reg;
    reg.on_suppressed_exception(std::make_exception_ptr(std::runtime_error("stray")));

    try {
        reg.get_or_create("svc", []() -> bean_ptr { throw bean_creation_error("svc", "x"); });
        FAIL("Expected bean_creation_error");
    } catch (const bean_creation_error& e) {
        REQUIRE(e.related_causes().empty());
    }
}

TEST_CASE("suppressed exceptions from nested creations go to the outermost attempt",
          "[creation]") {
    singleton_registry reg;
    try {
        reg.get_or_create("outer", [&]() -> bean_ptr {
            try {
                reg.get_or_create("inner", [&]() -> bean_ptr {
                    reg.on_suppressed_exception(
                        std::make_exception_ptr(std::runtime_error("inner detail")));
                    throw std::runtime_error("inner failed");
                });
            } catch (const bean_creation_error& inner) {
                // Inner attempt does not own the recording.
                REQUIRE(inner.related_causes().empty());
                reg.on_suppressed_exception(std::current_exception());
            }
            throw bean_creation_error("outer", "could not satisfy inner");
        });
        FAIL("Expected bean_creation_error");
    } catch (const bean_creation_error& e) {
        REQUIRE(e.bean_name() == "outer");
        REQUIRE(e.related_causes().size() == 2);
    }
}
