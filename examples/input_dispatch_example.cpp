#include <SynthEvents.hpp>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace SE;
using namespace std::chrono_literals;

// A text field whose displayed value can drift from the value the app owns.
struct TextField {
    std::string path;
    std::string displayed;
    std::string owned;
};

static auto print_json(Expected<std::string> const& dumped) -> void {
    if (!dumped) {
        std::cerr << "export failed: " << describeError(dumped.error()) << "\n";
        return;
    }
    std::cout << *dumped << "\n";
}

int main() {
    EventRuntime runtime{LoadRuntimeOptionsFromEnv()};

    int batches = 0;
    runtime.batching().configure(
        [&](BatchingStrategy::Work const& work) {
            ++batches;
            work();
        },
        nullptr,
        [] { std::cout << "flushing interactive updates\n"; });

    TextField field{.path = "/app/form/name", .displayed = "", .owned = "Ada"};
    runtime.controlled().setRestoreImplementation([&](TargetRef const& target) {
        if (target.path == field.path && field.displayed != field.owned) {
            std::cout << "restoring " << target.path << ": '" << field.displayed << "' -> '" << field.owned << "'\n";
            field.displayed = field.owned;
        }
    });

    DispatchConfig const pointerDown{.registration_name = "onPointerDown",
                                     .bubbled_name      = "onPointerDown",
                                     .captured_name     = "onPointerDownCapture"};
    DispatchConfig const keyDown{.registration_name = "onKeyDown",
                                 .bubbled_name      = "onKeyDown",
                                 .captured_name     = "onKeyDownCapture"};

    IO::PointerEvent pointer;
    pointer.device_path = "/system/devices/in/pointer/default";
    pointer.phase       = IO::PointerPhase::Down;
    pointer.absolute    = true;
    pointer.absolute_x  = 120.0f;
    pointer.absolute_y  = 48.0f;
    pointer.timestamp   = 16ms;
    IO::PointerNativeEvent pointerNative{pointer};

    IO::TextEvent text;
    text.device_path = "/system/devices/in/text/default";
    text.codepoint   = U'x';
    text.timestamp   = 20ms;
    IO::TextNativeEvent textNative{text};

    auto const& classes = runtime.classes();

    std::vector<std::unique_ptr<SyntheticEvent>> events;
    events.push_back(classes.pointer->acquire(&pointerDown, TargetRef{field.path}, &pointerNative, TargetRef{field.path}));
    events.push_back(classes.keyboard->acquire(&keyDown, TargetRef{field.path}, &textNative, TargetRef{field.path}));

    accumulateDispatch(*events[0], TargetRef{field.path}, [](SyntheticEvent& e) {
        std::cout << "pointer down at " << e.fieldAs<double>("pageX").value_or(0.0) << ","
                  << e.fieldAs<double>("pageY").value_or(0.0) << "\n";
    });
    accumulateDispatch(*events[1], TargetRef{field.path}, [&](SyntheticEvent& e) {
        auto key = e.fieldAs<std::string>("key").value_or("");
        field.displayed += key;
        std::cout << "key '" << key << "' typed into " << field.path << "\n";
        if (auto queued = runtime.controlled().enqueueStateRestore(TargetRef{field.path}); !queued) {
            std::cerr << describeError(queued.error()) << "\n";
        }
        e.preventDefault();
        e.persist();
    });

    std::vector<std::unique_ptr<SyntheticEvent>> persisted;
    try {
        runtime.dispatchBatched(std::move(events), persisted);
    } catch (std::exception const& error) {
        std::cerr << "dispatch failed: " << error.what() << "\n";
        return EXIT_FAILURE;
    }

    std::cout << "batches run: " << batches << ", displayed value: '" << field.displayed << "'\n";
    for (auto const& event : persisted) {
        print_json(EventJsonExporter::ExportEvent(*event));
    }
    print_json(EventJsonExporter::ExportClass(*classes.pointer));

    for (auto& event : persisted) {
        auto owner = event->eventClass();
        if (!owner) {
            continue;
        }
        if (auto released = owner->release(event); !released) {
            std::cerr << describeError(released.error()) << "\n";
        }
    }
    std::cout << "native keyboard event prevented: " << std::boolalpha << textNative.defaultPrevented() << "\n";
    return EXIT_SUCCESS;
}
