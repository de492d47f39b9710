/// basic_usage.cpp: libbeans introductory example.
///
/// Demonstrates the singleton lifecycle:
///   1. Publish ready-made instances with register_finished().
///   2. Create beans on demand with get_or_create(); each is built once.
///   3. Break a construction cycle with an early reference.
///   4. Record dependencies and tear everything down in order.

#include <libbeans.hpp>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>

using namespace libbeans;

// -----------------------------------------------------------------------
// Domain types
// -----------------------------------------------------------------------

struct i_clock {
    virtual ~i_clock() = default;
    virtual std::string now() const = 0;
};

struct fixed_clock : i_clock {
    std::string now() const override { return "2024-01-01T00:00:00Z"; }
};

struct order_service;

/// Needs the order service to look up pending orders.  Holds it weakly so
/// that the two services do not keep each other alive.
struct billing_service {
    std::weak_ptr<order_service> orders;
    std::string name = "billing";
};

/// Needs billing to charge for new orders: billing <-> orders is a cycle.
struct order_service {
    std::shared_ptr<billing_service> billing;
    std::shared_ptr<i_clock> clock;
    std::string name = "orders";
};

// -----------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------

int main() {
    singleton_registry reg;

    // ── Ready-made instances ──────────────────────────────────────────
    reg.register_finished("clock", make_bean_as<i_clock, fixed_clock>());

    // ── On-demand creation with an early reference ────────────────────
    auto orders = reg.get_or_create_as<order_service>("orders", [&] {
        auto self = std::make_shared<order_service>();
        // Expose the half-built instance so billing can refer back to it.
        reg.register_factory("orders", [self] { return to_bean(self); });

        self->clock = reg.get_as<i_clock>("clock");
        self->billing = reg.get_or_create_as<billing_service>("billing", [&] {
            auto billing = std::make_shared<billing_service>();
            billing->orders = reg.get_as<order_service>("orders");
            return billing;
        });
        return self;
    });

    assert(orders->billing->orders.lock() == orders && "cycle must close on the same instance");
    assert(reg.get("orders") == to_bean(orders));
    std::cout << orders->name << " -> " << orders->billing->name << " -> "
              << orders->billing->orders.lock()->name << " at " << orders->clock->now() << '\n';

    // ── Teardown ──────────────────────────────────────────────────────
    reg.register_dependency("orders", "clock");
    reg.register_dependency("billing", "orders");
    reg.register_disposable("clock", [] { std::cout << "closing clock\n"; });
    reg.register_disposable("orders", [] { std::cout << "closing orders\n"; });
    reg.register_disposable("billing", [] { std::cout << "closing billing\n"; });

    // Dependents first: billing, orders, clock.
    reg.destroy_all();
    assert(reg.count() == 0);

    std::cout << "Done.\n";
    return 0;
}
