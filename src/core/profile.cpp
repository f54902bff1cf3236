/**
 * @file profile.cpp
 * @brief Implementation of the scope timer described in profile.hpp
 */

#include "hexball/core/profile.hpp"

#include <iomanip>
#include <iostream>
#include <utility>

namespace Profiling {

Profiler& Profiler::getInstance() {
    static Profiler instance;
    return instance;
}

void Profiler::startSection(const std::string& name) {
    auto& instance = getInstance();
    auto& section  = instance.sections[name];
    section.parent = instance.open.empty() ? std::string() : instance.open.back().name;
    instance.open.push_back({name, Clock::now()});
}

void Profiler::endSection(const std::string& name) {
    auto& instance = getInstance();

    if (instance.open.empty() || instance.open.back().name != name) {
        std::cerr << "[Profiler] Warning: endSection(\"" << name
                  << "\") does not match the innermost open scope.\n";
        return;
    }

    Duration const elapsed =
        std::chrono::duration_cast<Duration>(Clock::now() - instance.open.back().start);
    instance.open.pop_back();

    auto& section = instance.sections[name];
    section.total += elapsed;
    section.calls += 1;
    if (elapsed < section.min) {
        section.min = elapsed;
    }
    if (elapsed > section.max) {
        section.max = elapsed;
    }
}

Profiler::SectionStats Profiler::stats(const std::string& name) {
    const auto& sections = getInstance().sections;
    auto it = sections.find(name);
    if (it == sections.end()) {
        return SectionStats{};
    }
    return it->second;
}

void Profiler::printStats(std::ostream& out) {
    const auto& instance = getInstance();
    out << "\nProfiling Statistics:\n";
    for (const auto& [name, section] : instance.sections) {
        if (section.parent.empty()) {
            instance.printNode(out, name, 0);
        }
    }
}

void Profiler::printNode(std::ostream& out, const std::string& name, int depth) const {
    const auto& s = sections.at(name);
    double const totalMs = std::chrono::duration<double, std::milli>(s.total).count();
    double const avgUs = s.calls > 0
        ? std::chrono::duration<double, std::micro>(s.total).count() / static_cast<double>(s.calls)
        : 0.0;

    out << std::string(static_cast<std::size_t>(depth) * 2, ' ')
        << "- " << name << " [" << s.calls << " calls] "
        << std::fixed << std::setprecision(2) << totalMs << "ms total, "
        << avgUs << "us avg\n";

    for (const auto& [childName, child] : sections) {
        if (child.parent == name) {
            printNode(out, childName, depth + 1);
        }
    }
}

void Profiler::reset() {
    auto& instance = getInstance();
    instance.sections.clear();
    instance.open.clear();
}

ScopedProfiler::ScopedProfiler(std::string name)
    : section_name(std::move(name))
{
    Profiler::startSection(section_name);
}

ScopedProfiler::~ScopedProfiler() {
    Profiler::endSection(section_name);
}

} // namespace Profiling
