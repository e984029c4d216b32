#include <synthevents/tools/EventJsonExporter.hpp>

#include <nlohmann/json.hpp>

#include <cmath>
#include <type_traits>

namespace SE {

namespace {

using Json = nlohmann::json;

auto fieldToJson(FieldValue const& value) -> Json {
    return std::visit(
        [](auto const& v) -> Json {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Undefined>) {
                return Json{{"undefined", true}};
            } else if constexpr (std::is_same_v<T, std::nullptr_t>) {
                return Json(nullptr);
            } else if constexpr (std::is_same_v<T, double>) {
                // JSON has no NaN or infinity
                return std::isfinite(v) ? Json(v) : Json(nullptr);
            } else if constexpr (std::is_same_v<T, TargetRef>) {
                return Json{{"target", v.path}};
            } else {
                return Json(v);
            }
        },
        value);
}

auto dumpJson(Json const& doc, EventJsonOptions const& options) -> Expected<std::string> {
    try {
        return doc.dump(options.indent);
    } catch (Json::type_error const& error) {
        return std::unexpected(Error{Error::Code::MalformedInput, error.what()});
    }
}

} // namespace

auto EventJsonExporter::ExportClass(EventClass const& eventClass, EventJsonOptions const& options)
    -> Expected<std::string> {
    Json doc;
    doc["name"] = eventClass.name();
    if (options.include_lineage) {
        doc["lineage"] = eventClass.lineage();
    }

    Json fields = Json::array();
    for (auto const& entry : eventClass.interface().entries()) {
        fields.push_back(Json{{"name", entry.name}, {"rule", std::string{fieldRuleKindToString(ruleKind(entry))}}});
    }
    doc["fields"] = std::move(fields);

    doc["legacy_return_value_fallback"] = eventClass.options().legacy_return_value_fallback;

    if (options.include_stats) {
        auto const& pool  = eventClass.pool();
        auto const& stats = pool.stats();
        doc["pool"]       = Json{{"size", pool.size()},
                                 {"capacity", pool.capacity()},
                                 {"allocated", stats.allocated},
                                 {"reused", stats.reused},
                                 {"released", stats.released},
                                 {"dropped", stats.dropped}};
    }
    return dumpJson(doc, options);
}

auto EventJsonExporter::ExportEvent(SyntheticEvent const& event, EventJsonOptions const& options)
    -> Expected<std::string> {
    auto owner = event.eventClass();
    if (!owner) {
        return std::unexpected(Error{Error::Code::TypeMismatch, "Event is not bound to a live event class"});
    }

    Json doc;
    doc["class"] = owner->name();
    if (auto const* config = event.dispatchConfig()) {
        doc["dispatch"] = config->registration_name;
    } else {
        doc["dispatch"] = nullptr;
    }
    doc["targetInst"] = event.targetInst() ? Json(event.targetInst()->path) : Json(nullptr);

    Json fields = Json::object();
    for (auto const& entry : owner->interface().entries()) {
        fields[entry.name] = fieldToJson(event.field(entry.name));
    }
    doc["fields"] = std::move(fields);

    doc["isDefaultPrevented"]   = event.isDefaultPrevented();
    doc["isPropagationStopped"] = event.isPropagationStopped();
    doc["isPersistent"]         = event.isPersistent();
    doc["listeners"]            = event.dispatchListeners().size();
    return dumpJson(doc, options);
}

} // namespace SE
