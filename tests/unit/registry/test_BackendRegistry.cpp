#include <doctest/doctest.h>
#include "EnvGuard.hpp"
#include "FakeHost.hpp"
#include "core/DispatchContext.hpp"
#include "log/TaggedLogger.hpp"
#include "registry/BackendRegistry.hpp"

#include <algorithm>
#include <atomic>
#include <functional>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using HD::BuiltinBackend;
using HDTest::EnvGuard;

namespace {

constexpr char const* kOverrideEnv = "HOSTDISPATCH_TEST_REGISTRY_BACKEND";

class ScriptedBackend final : public HD::DispatcherBackend {
public:
    ScriptedBackend(HD::BackendServices services, std::string label, bool available)
        : DispatcherBackend(services), label(std::move(label)), available(available) {}

    auto name() const -> std::string override {
        return this->label;
    }
    auto isAvailable() const noexcept -> bool override {
        return this->available;
    }
    auto runDeferred(HD::MainThreadTask task) -> std::optional<HD::Error> override {
        runDetached(task, this->label);
        return std::nullopt;
    }
    auto runSync(HD::MainThreadTask task, std::optional<std::chrono::milliseconds>) -> std::optional<HD::Error> override {
        return runInline(task);
    }

private:
    std::string label;
    bool        available;
};

class ScriptedFactory final : public HD::BackendFactory {
public:
    explicit ScriptedFactory(std::string label, bool available = true, bool throws = false)
        : label(std::move(label)), available(available), throws(throws) {}

    auto name() const -> std::string override {
        return this->label;
    }
    auto create(HD::BackendServices const& services) const -> std::unique_ptr<HD::DispatcherBackend> override {
        ++this->created;
        if (this->throws)
            throw std::runtime_error("SDK failed to load");
        return std::make_unique<ScriptedBackend>(services, this->label, this->available.load());
    }

    std::string              label;
    std::atomic<bool>        available;
    bool                     throws;
    mutable std::atomic<int> created{0};
};

auto scripted(std::string label, bool available = true, bool throws = false) -> std::shared_ptr<ScriptedFactory> {
    return std::make_shared<ScriptedFactory>(std::move(label), available, throws);
}

auto names(std::vector<HD::RegistryEntry> const& entries) -> std::vector<std::string> {
    std::vector<std::string> result;
    for (auto const& entry : entries)
        result.push_back(entry.displayName);
    return result;
}

auto resolvedName(HD::BackendRegistry& registry) -> std::string {
    auto backend = registry.resolve();
    REQUIRE(backend.has_value());
    return (*backend)->name();
}

// Runs fn with the process logger switched on and returns what it wrote.
auto captureLog(std::function<void()> const& fn) -> std::string {
    auto const wasEnabled = HD::logger().loggingEnabled();
    HD::logger().flush();
    std::ostringstream buffer;
    auto*              original = std::cerr.rdbuf(buffer.rdbuf());
    HD::set_logging_enabled(true);
    fn();
    HD::logger().flush();
    HD::set_logging_enabled(wasEnabled);
    std::cerr.rdbuf(original);
    return buffer.str();
}

struct RegistryRig {
    RegistryRig() {
        this->context.identity().designate(this->host.loopThreadId());
    }
    auto registry() -> HD::BackendRegistry& {
        return this->context.registry();
    }

    EnvGuard            noOverride{kOverrideEnv, nullptr};
    HDTest::FakeHost    host;
    HD::DispatchContext context{HD::DispatchConfig{}, kOverrideEnv};
};

} // namespace

TEST_SUITE("registry.backend_registry") {

TEST_CASE("builtins_are_seeded_lazily") {
    RegistryRig rig;
    CHECK(rig.registry().entries().empty());

    CHECK(resolvedName(rig.registry()) == "Fallback");
    CHECK(names(rig.registry().entries())
          == std::vector<std::string>{"Maya", "Houdini", "Nuke", "Blender", "Max", "Unreal", "Qt", "Fallback"});
}

TEST_CASE("selection_is_priority_monotonic") {
    RegistryRig rig;
    rig.context.installHost(rig.host.qt());
    rig.context.installHost(rig.host.blender());
    rig.context.installHost(rig.host.houdini());

    SUBCASE("highest available builtin wins") {
        CHECK(resolvedName(rig.registry()) == "Houdini");
        rig.context.uninstallHost(HD::HostKind::Houdini);
        CHECK(resolvedName(rig.registry()) == "Blender");
        rig.context.uninstallHost(HD::HostKind::Blender);
        CHECK(resolvedName(rig.registry()) == "Qt");
    }

    SUBCASE("custom backends slot into the order") {
        auto top     = scripted("StudioPipeline", true);
        auto hidden  = scripted("Offline", false);
        auto between = scripted("Middle", true);
        rig.registry().registerBackend(hidden, 500);
        CHECK(resolvedName(rig.registry()) == "Houdini");
        rig.registry().registerBackend(between, 180);
        CHECK(resolvedName(rig.registry()) == "Houdini");
        rig.registry().registerBackend(top, 300);
        CHECK(resolvedName(rig.registry()) == "StudioPipeline");

        // Whatever resolved, nothing available outranks it.
        auto listing  = rig.registry().list();
        auto selected = resolvedName(rig.registry());
        for (auto const& entry : listing) {
            if (entry.name == selected)
                break;
            CHECK_FALSE(entry.available);
        }
    }
}

TEST_CASE("reregistering_updates_in_place") {
    RegistryRig rig;
    auto        factory = scripted("Custom");
    rig.registry().registerBackend(factory, 10, "First");
    (void)rig.registry().list();
    auto const before = rig.registry().entries().size();

    rig.registry().registerBackend(factory, 250, "Renamed");
    auto entries = rig.registry().entries();
    CHECK(entries.size() == before);
    CHECK(entries.front().displayName == "Renamed");
    CHECK(entries.front().priority == 250);

    rig.registry().registerBackend(BuiltinBackend::Qt, 5);
    CHECK(rig.registry().entries().size() == before);
}

TEST_CASE("equal_priorities_keep_insertion_order") {
    RegistryRig rig;
    auto        a = scripted("Alpha");
    auto        b = scripted("Beta");
    auto        c = scripted("Gamma");
    rig.registry().registerBackend(b, 400);
    rig.registry().registerBackend(a, 400);
    rig.registry().registerBackend(c, 400);
    auto entries = names(rig.registry().entries());
    REQUIRE(entries.size() == 3);
    CHECK(entries == std::vector<std::string>{"Beta", "Alpha", "Gamma"});
    CHECK(resolvedName(rig.registry()) == "Beta");
}

TEST_CASE("seeding_resets_builtins_registered_before_first_use") {
    RegistryRig rig;
    rig.registry().registerBackend(BuiltinBackend::Qt, 900, "PreferredQt");
    rig.registry().registerBackend(scripted("Early", false), 950);
    rig.context.installHost(rig.host.qt());
    rig.context.installHost(rig.host.maya());

    CHECK(resolvedName(rig.registry()) == "Maya");
    auto entries = rig.registry().entries();
    CHECK(entries.size() == 9);
    CHECK(entries.front().displayName == "Early");
    CHECK(entries.front().priority == 950);

    auto const qt = std::find_if(entries.begin(), entries.end(), [](HD::RegistryEntry const& entry) {
        return entry.spec == HD::BackendSpec{BuiltinBackend::Qt};
    });
    REQUIRE(qt != entries.end());
    CHECK(qt->displayName == "Qt");
    CHECK(qt->priority == HD::DispatcherPriority::Qt);
    CHECK(std::count_if(entries.begin(), entries.end(), [](HD::RegistryEntry const& entry) {
              return entry.spec == HD::BackendSpec{BuiltinBackend::Qt};
          }) == 1);
}

TEST_CASE("resolution_survives_concurrent_clear") {
    RegistryRig rig;
    rig.context.installHost(rig.host.qt());

    std::atomic<bool> stop{false};
    std::thread       clearer([&] {
        while (!stop.load())
            rig.registry().clear();
    });

    int failures = 0;
    for (int i = 0; i < 2000; ++i) {
        if (!rig.registry().resolve().has_value())
            ++failures;
        if (rig.registry().list().empty())
            ++failures;
    }
    stop = true;
    clearer.join();

    CHECK(failures == 0);
    CHECK(resolvedName(rig.registry()) == "Qt");
}

TEST_CASE("unregister_removes_exact_match") {
    RegistryRig rig;
    rig.context.installHost(rig.host.nuke());
    CHECK(resolvedName(rig.registry()) == "Nuke");

    CHECK(rig.registry().unregisterBackend(BuiltinBackend::Nuke));
    CHECK_FALSE(rig.registry().unregisterBackend(BuiltinBackend::Nuke));
    CHECK_FALSE(rig.registry().unregisterBackend(scripted("Stranger")));
    CHECK(resolvedName(rig.registry()) == "Fallback");
}

TEST_CASE("clear_reproduces_a_fresh_catalogue") {
    RegistryRig rig;
    rig.context.installHost(rig.host.unreal());
    auto const freshSelection = resolvedName(rig.registry());
    auto const freshEntries   = names(rig.registry().entries());

    rig.registry().registerBackend(scripted("Temporary"), 1000);
    rig.registry().unregisterBackend(BuiltinBackend::Unreal);
    CHECK(resolvedName(rig.registry()) == "Temporary");

    rig.registry().clear();
    CHECK(rig.registry().entries().empty());
    CHECK_FALSE(rig.registry().cachedBackendName().has_value());
    CHECK(resolvedName(rig.registry()) == freshSelection);
    CHECK(names(rig.registry().entries()) == freshEntries);
}

TEST_CASE("environment_override") {
    RegistryRig rig;
    rig.context.installHost(rig.host.maya());
    rig.context.installHost(rig.host.qt());

    SUBCASE("names a lower priority backend, case-insensitively") {
        EnvGuard    env(kOverrideEnv, " qT ");
        std::string selected;
        auto        output = captureLog([&] { selected = resolvedName(rig.registry()); });
        CHECK(selected == "Qt");
        CHECK(output.find("[Info]") != std::string::npos);
        CHECK(output.find("Using dispatcher backend from environment: Qt") != std::string::npos);
    }
    SUBCASE("unknown name falls back to priority order with a warning") {
        EnvGuard    env(kOverrideEnv, "Photoshop");
        std::string selected;
        auto        output = captureLog([&] { selected = resolvedName(rig.registry()); });
        CHECK(selected == "Maya");
        CHECK(output.find("[Warning]") != std::string::npos);
        CHECK(output.find("Environment-specified backend 'photoshop' matches no registered backend") != std::string::npos);
    }
    SUBCASE("unavailable backend falls back to priority order with a warning") {
        EnvGuard    env(kOverrideEnv, "blender");
        std::string selected;
        auto        output = captureLog([&] { selected = resolvedName(rig.registry()); });
        CHECK(selected == "Maya");
        CHECK(output.find("[Warning]") != std::string::npos);
        CHECK(output.find("Environment-specified backend 'blender' is not available") != std::string::npos);
    }
    SUBCASE("matches custom display names") {
        rig.registry().registerBackend(scripted("RenderFarmDispatcherBackend"), 1);
        EnvGuard env(kOverrideEnv, "renderfarm");
        CHECK(resolvedName(rig.registry()) == "RenderFarmDispatcherBackend");
    }
    SUBCASE("only the fallback and a bogus override still resolves") {
        rig.context.uninstallHost(HD::HostKind::Maya);
        rig.context.uninstallHost(HD::HostKind::Qt);
        EnvGuard env(kOverrideEnv, "nothing-like-this");
        CHECK(resolvedName(rig.registry()) == "Fallback");
    }
}

TEST_CASE("cache_is_reused_until_invalidated") {
    RegistryRig rig;
    auto        factory = scripted("Counted");
    rig.registry().registerBackend(factory, 1000);

    auto first  = rig.registry().resolve();
    auto second = rig.registry().resolve();
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    CHECK(first->get() == second->get());
    CHECK(factory->created == 1);
    CHECK(rig.registry().cachedBackendName() == "Counted");

    auto const generation = rig.registry().generation();
    rig.registry().invalidate();
    CHECK(rig.registry().generation() > generation);
    CHECK_FALSE(rig.registry().cachedBackendName().has_value());
    auto third = rig.registry().resolve();
    REQUIRE(third.has_value());
    CHECK(third->get() != first->get());
    CHECK(factory->created == 2);
}

TEST_CASE("list_does_not_touch_the_cache") {
    RegistryRig rig;
    rig.context.installHost(rig.host.qt());
    CHECK_FALSE(rig.registry().cachedBackendName().has_value());

    auto listing = rig.registry().list();
    REQUIRE(listing.size() == 8);
    CHECK_FALSE(rig.registry().cachedBackendName().has_value());
    CHECK(listing.front().name == "Maya");
    CHECK(listing.front().priority == HD::DispatcherPriority::Maya);
    CHECK_FALSE(listing.front().available);
    CHECK(listing[6].name == "Qt");
    CHECK(listing[6].available);
    CHECK(listing.back().name == "Fallback");
    CHECK(listing.back().available);
}

TEST_CASE("host_environment_detection") {
    RegistryRig rig;
    CHECK_FALSE(rig.registry().isHostEnvironment());
    CHECK_FALSE(rig.registry().currentHostName().has_value());

    rig.context.installHost(rig.host.qt());
    CHECK_FALSE(rig.registry().isHostEnvironment());

    rig.context.installHost(rig.host.unreal());
    CHECK(rig.registry().isHostEnvironment());
    CHECK(rig.registry().currentHostName() == "Unreal");

    rig.context.installHost(rig.host.nuke());
    CHECK(rig.registry().currentHostName() == "Nuke");
    // Detection resolves nothing.
    CHECK_FALSE(rig.registry().cachedBackendName().has_value());
}

TEST_CASE("failing_factories_are_skipped") {
    RegistryRig rig;
    auto        broken = scripted("Broken", true, true);
    rig.registry().registerBackend(broken, 1000);
    CHECK(resolvedName(rig.registry()) == "Fallback");
    CHECK(broken->created == 1);

    auto listing = rig.registry().list();
    CHECK(listing.front().name == "Broken");
    CHECK_FALSE(listing.front().available);
}

TEST_CASE("empty_catalogue_reports_no_backend") {
    HD::BackendRegistry registry{HD::BackendServices{}, kOverrideEnv};
    // Seed, then remove everything, including the fallback.
    (void)registry.list();
    for (auto kind : {BuiltinBackend::Maya, BuiltinBackend::Houdini, BuiltinBackend::Nuke, BuiltinBackend::Blender,
                      BuiltinBackend::Max, BuiltinBackend::Unreal, BuiltinBackend::Qt, BuiltinBackend::Fallback})
        CHECK(registry.unregisterBackend(kind));

    auto resolved = registry.resolve();
    REQUIRE_FALSE(resolved.has_value());
    CHECK(resolved.error().code == HD::Error::Code::NoBackend);
}

TEST_CASE("display_names") {
    CHECK(HD::specDisplayName(BuiltinBackend::Houdini) == "Houdini");
    CHECK(HD::specDisplayName(BuiltinBackend::Houdini, "Hou") == "Hou");
    CHECK(HD::specDisplayName(std::shared_ptr<HD::BackendFactory const>{scripted("KatanaBackend")}) == "Katana");
    CHECK(HD::specDisplayName(std::shared_ptr<HD::BackendFactory const>{scripted("ClarisseDispatcher")}) == "Clarisse");
    CHECK(HD::specDisplayName(std::shared_ptr<HD::BackendFactory const>{scripted("MariDispatcherBackend")}) == "Mari");
    CHECK(HD::specDisplayName(std::shared_ptr<HD::BackendFactory const>{scripted("Backend")}) == "Backend");
}

} // TEST_SUITE
