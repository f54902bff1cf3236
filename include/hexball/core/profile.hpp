/**
 * @file profile.hpp
 * @brief Lightweight scope timer for the per-tick systems
 *
 * Each named scope accumulates call count, total, min and max wall time.
 * Nested scopes are recorded with their parent so printStats() can show
 * the per-tick breakdown as a tree.
 *
 * Example usage:
 * @code
 * void GravitySystem::update(entt::registry& registry) {
 *     PROFILE_SCOPE("GravitySystem");
 *     // ...
 * }
 *
 * Profiling::Profiler::printStats(std::cout);
 * @endcode
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace Profiling {

/**
 * @brief Process-wide timing table. Use the static methods.
 */
class Profiler {
public:
    using Clock    = std::chrono::steady_clock;
    using Duration = std::chrono::nanoseconds;

    /**
     * @brief Aggregated timing statistics for a named scope
     */
    struct SectionStats {
        Duration total{0};
        Duration min{Duration::max()};
        Duration max{0};
        uint64_t calls{0};
        std::string parent;                 ///< Enclosing scope, empty for roots
    };

    static void startSection(const std::string& name);
    static void endSection(const std::string& name);

    /**
     * @brief Returns a copy of the statistics recorded for one scope
     * @return Empty stats (calls == 0) if the scope was never entered
     */
    static SectionStats stats(const std::string& name);

    /**
     * @brief Prints every scope as an indented tree with average times
     */
    static void printStats(std::ostream& out);

    static void reset();

private:
    struct OpenScope {
        std::string name;
        Clock::time_point start;
    };

    std::map<std::string, SectionStats> sections;
    std::vector<OpenScope> open;

    Profiler() = default;
    static Profiler& getInstance();

    void printNode(std::ostream& out, const std::string& name, int depth) const;
};

/**
 * @brief RAII guard: starts timing in the constructor, stops in the destructor
 */
class ScopedProfiler {
public:
    explicit ScopedProfiler(std::string name);
    ~ScopedProfiler();

    ScopedProfiler(const ScopedProfiler&) = delete;
    ScopedProfiler& operator=(const ScopedProfiler&) = delete;

private:
    std::string section_name;
};

} // namespace Profiling

#define HEXBALL_PROFILE_CONCAT_INNER(a, b) a##b
#define HEXBALL_PROFILE_CONCAT(a, b) HEXBALL_PROFILE_CONCAT_INNER(a, b)

/**
 * @brief Times the enclosing scope under the given name
 */
#define PROFILE_SCOPE(name) \
    ::Profiling::ScopedProfiler HEXBALL_PROFILE_CONCAT(_scopedProfiler, __LINE__) { name }
