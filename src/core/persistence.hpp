/**
 * @file   persistence.hpp
 * @brief  Defines the in-memory schedule document and its JSON persistence API.
 *
 * This header declares the ScheduleDocument struct for representing
 * `.schedule.json` files in memory, the loadFile()/saveFile() functions to
 * read/write them with schema and sanity checks, and optionsFrom() to turn
 * a document into Scheduler options.
 *
 * @author recurrent contributors
 * @date   2026-10-19
 */

#ifndef RECURRENT_PERSISTENCE_HPP
#define RECURRENT_PERSISTENCE_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "scheduler.hpp"

namespace recurrent::persistence {

/**
 * @struct ScheduleDocument
 * @brief In-memory representation of a schedule file.
 *
 * Holds the schedule name, an optional comment, the firing interval, the
 * optional throttle window, and the command the runtime executes on every
 * firing (program followed by its arguments; may be empty).
 */
struct ScheduleDocument {
    std::string              name;                                ///< Schedule name
    std::string              comment;                             ///< Optional comment
    Duration                 interval{std::chrono::seconds(1)};   ///< "interval_ms"
    std::optional<Duration>  throttle;                            ///< "throttle_ms" (null = unthrottled)
    std::vector<std::string> command;                             ///< Program + args
};

/**
 * @brief Load a schedule from a JSON file on disk.
 *
 * @param path File path to read from.
 * @param out  Document to populate upon success.
 * @param err  Optional out-param that receives an error message on failure,
 *             or a warning (throttle window longer than the interval) on a
 *             successful load.
 * @return     true if the file was read (even with a warning), false on
 *             I/O, parse or schema errors.
 */
bool loadFile(const std::string& path,
              ScheduleDocument& out,
              std::string* err = nullptr);

/**
 * @brief Save a schedule document to disk as JSON.
 *
 * @param doc    Document to serialize.
 * @param path   Output file path.
 * @param pretty Whether to pretty-print with 4-space indentation.
 * @param err    Optional out-param for error messages on failure.
 * @return       true on success; false if the file could not be written.
 */
bool saveFile(const ScheduleDocument& doc,
              const std::string& path,
              bool pretty = true,
              std::string* err = nullptr);

/**
 * @brief Scheduler options equivalent to the document's timing fields.
 *
 * The clock is left to the caller.
 */
std::vector<Option> optionsFrom(const ScheduleDocument& doc);

} // namespace recurrent::persistence

// ----------------------------------------------------------------------------
// nlohmann::json ADL serializer for the schedule document
// ----------------------------------------------------------------------------
namespace nlohmann {

template <>
struct adl_serializer<recurrent::persistence::ScheduleDocument> {
    static void to_json(ordered_json& j, recurrent::persistence::ScheduleDocument const& d) {
        j = ordered_json{
            {"name",        d.name},
            {"interval_ms", d.interval.count()}
        };
        if (!d.comment.empty()) j["comment"]     = d.comment;
        if (d.throttle)         j["throttle_ms"] = d.throttle->count();
        else                    j["throttle_ms"] = nullptr;
        if (!d.command.empty()) j["command"]     = d.command;
    }

    static void from_json(ordered_json const& j, recurrent::persistence::ScheduleDocument& d) {
        using recurrent::Duration;

        // Durations are positive integral milliseconds.
        auto millis = [&j](const char* key) {
            auto const& v = j.at(key);
            if (!v.is_number_integer())
                throw std::invalid_argument(std::string("`") + key + "` must be an integer (ms)");
            auto ms = v.get<long long>();
            if (ms <= 0)
                throw std::invalid_argument(std::string("`") + key + "` must be positive");
            return Duration(ms);
        };

        j.at("name").get_to(d.name);
        if (j.contains("comment"))     j.at("comment").get_to(d.comment);
        if (j.contains("interval_ms")) d.interval = millis("interval_ms");
        if (j.contains("throttle_ms") && !j.at("throttle_ms").is_null())
            d.throttle = millis("throttle_ms");
        if (j.contains("command"))     j.at("command").get_to(d.command);
    }
};

} // namespace nlohmann

#endif // RECURRENT_PERSISTENCE_HPP
