/**
 * @file   persistence_bridge.cpp
 * @brief  Implements loadFile(), saveFile() and optionsFrom() for schedule
 *         JSON persistence.
 *
 * Reads a JSON file into a ScheduleDocument (with schema and sanity checks),
 * and writes a ScheduleDocument back out as JSON (optionally pretty-printed).
 *
 * @author recurrent contributors
 * @date   2026-10-19
 */

#include "persistence.hpp"
#include <fstream>

namespace recurrent::persistence {

/**
 * Load a schedule from a JSON file.
 *
 * Opens `path`, parses into an ordered_json, converts it to a
 * ScheduleDocument (schema errors are fatal), then runs the sanity checks
 * that only produce warnings.
 */
bool loadFile(const std::string& path,
              ScheduleDocument& out,
              std::string* err)
{
    // 1) Open & parse JSON
    std::ifstream in(path);
    if (!in.is_open()) {
        if (err) *err = "Failed to open file: " + path;
        return false;
    }

    nlohmann::ordered_json j;
    try {
        in >> j;
    }
    catch (const std::exception& e) {
        if (err) *err = std::string("JSON parse error: ") + e.what();
        return false;
    }

    // 2) Convert JSON → ScheduleDocument (throws on schema errors)
    ScheduleDocument doc;
    try {
        doc = j.get<ScheduleDocument>();
    }
    catch (const std::exception& e) {
        if (err) *err = std::string("Schedule schema error: ") + e.what();
        return false;
    }

    // 3) Sanity checks → warnings
    std::string warning;
    if (doc.throttle && *doc.throttle > doc.interval) {
        warning = "Schedule `" + doc.name + "` throttles signals to one per " +
                  std::to_string(doc.throttle->count()) + " ms, longer than its " +
                  std::to_string(doc.interval.count()) + " ms interval; " +
                  "interval firings will be delayed to the throttle window.";
    }

    out = std::move(doc);
    if (err) *err = std::move(warning);
    return true;
}

/**
 * Save a schedule document to a JSON file.
 *
 * Serializes `doc` into ordered_json and writes it out to `path`.
 * If `pretty==true`, uses 4-space indentation.
 */
bool saveFile(const ScheduleDocument& doc,
              const std::string& path,
              bool pretty,
              std::string* err)
{
    std::ofstream out(path);
    if (!out.is_open()) {
        if (err) *err = "Failed to open file for writing: " + path;
        return false;
    }
    try {
        nlohmann::ordered_json j = doc;
        out << (pretty ? j.dump(4) : j.dump()) << '\n';
    }
    catch (const std::exception& e) {
        if (err) *err = e.what();
        return false;
    }
    if (!out) {
        if (err) *err = "Write failed: " + path;
        return false;
    }
    return true;
}

std::vector<Option> optionsFrom(const ScheduleDocument& doc) {
    std::vector<Option> opts{ withInterval(doc.interval) };
    if (doc.throttle) opts.push_back(withThrottle(*doc.throttle));
    return opts;
}

} // namespace recurrent::persistence
