#pragma once

#include <synthevents/core/Error.hpp>
#include <synthevents/event/EventClass.hpp>
#include <synthevents/event/SyntheticEvent.hpp>

#include <string>

namespace SE {

struct EventJsonOptions {
    int  indent          = 2;
    bool include_stats   = true;
    bool include_lineage = true;
};

class EventJsonExporter {
public:
    // Class name, lineage, effective descriptor table and pool state.
    static auto ExportClass(EventClass const& eventClass, EventJsonOptions const& options = EventJsonOptions{})
        -> Expected<std::string>;

    // Normalized fields and flags of a live event.
    static auto ExportEvent(SyntheticEvent const& event, EventJsonOptions const& options = EventJsonOptions{})
        -> Expected<std::string>;
};

} // namespace SE
