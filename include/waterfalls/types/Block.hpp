#pragma once
/**
 * @file Block.hpp
 * @brief Completed timing block and its flattened report form.
 */

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace waterfalls {

/**
 * @brief One completed start -> stop measurement.
 *
 * Invariant: start_time <= stop_time.
 */
struct Block {
    int64_t start_time;                ///< Monotonic ns at start()
    int64_t stop_time;                 ///< Monotonic ns at stop()
    int64_t thread_duration;           ///< CPU ns the owning thread consumed during the block
    std::optional<std::string> text;   ///< Block label, if any
};

/**
 * @brief A Block plus the name and thread id of the Timer that produced it.
 *
 * This is the unit written to and read back from report files.
 */
struct ReportRecord {
    std::string name;
    std::optional<std::string> text;
    int64_t start_time = 0;
    int64_t stop_time = 0;
    int64_t thread_duration = 0;
    uint64_t thread_id = 0;

    int64_t duration() const { return stop_time - start_time; }

    /**
     * @brief Fraction of the wall-clock duration spent on the CPU, in [0, 1].
     *
     * Used as the per-block color hint; zero-length blocks report 0.
     */
    double cpu_ratio() const {
        const int64_t d = duration();
        if (d <= 0 || thread_duration <= 0) return 0.0;
        const double r = (double)thread_duration / (double)d;
        return r > 1.0 ? 1.0 : r;
    }

    bool operator==(const ReportRecord& o) const {
        return name == o.name && text == o.text && start_time == o.start_time &&
               stop_time == o.stop_time && thread_duration == o.thread_duration &&
               thread_id == o.thread_id;
    }
    bool operator!=(const ReportRecord& o) const { return !(*this == o); }
};

/**
 * @brief JSON encoding: `{name, text, start_time, stop_time, thread_duration, thread_id}`.
 *
 * A missing label is written as null.
 */
inline void to_json(nlohmann::json& j, const ReportRecord& r) {
    j = nlohmann::json{
        {"name", r.name},
        {"text", r.text ? nlohmann::json(*r.text) : nlohmann::json(nullptr)},
        {"start_time", r.start_time},
        {"stop_time", r.stop_time},
        {"thread_duration", r.thread_duration},
        {"thread_id", r.thread_id},
    };
}

/**
 * @brief JSON decoding.
 *
 * `name`, `start_time` and `stop_time` are required; `text` may be absent
 * or null, `thread_duration` and `thread_id` default to 0. Throws
 * nlohmann::json::exception on missing or mistyped required fields.
 */
inline void from_json(const nlohmann::json& j, ReportRecord& r) {
    j.at("name").get_to(r.name);
    j.at("start_time").get_to(r.start_time);
    j.at("stop_time").get_to(r.stop_time);

    auto text = j.find("text");
    if (text != j.end() && !text->is_null()) {
        r.text = text->get<std::string>();
    } else {
        r.text.reset();
    }
    r.thread_duration = j.value("thread_duration", (int64_t)0);
    r.thread_id = j.value("thread_id", (uint64_t)0);
}

} // namespace waterfalls
