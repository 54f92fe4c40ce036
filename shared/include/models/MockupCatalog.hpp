/**
 * @file MockupCatalog.hpp
 * Orientation -> ordered list of mockup photographs. Built once at start-up
 * and only read afterwards; safe to share between requests.
 */
#pragma once
#include "models/Orientation.hpp"
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace mockup {

class MockupCatalog
{
public:
    using Entries = std::map<Orientation, std::vector<std::string>>;

    MockupCatalog() = default;
    explicit MockupCatalog(Entries entries) : entries_(std::move(entries)) {}

    // Candidates in authoring order; earlier entries win ratio ties.
    const std::vector<std::string>& candidates(Orientation o) const
    {
        static const std::vector<std::string> kNone;
        auto it = entries_.find(o);
        return it == entries_.end() ? kNone : it->second;
    }

    std::size_t size() const
    {
        std::size_t n = 0;
        for (const auto& entry : entries_) n += entry.second.size();
        return n;
    }

    bool empty() const { return size() == 0; }
    const Entries& entries() const { return entries_; }

private:
    Entries entries_;
};

}
