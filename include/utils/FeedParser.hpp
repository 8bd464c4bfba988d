#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <libxml/tree.h>

namespace DryDock {

// Parses the two syndication dialects the hub supports. Each parse function
// returns false when the document is not of that dialect, leaving `entries`
// untouched so callers can fall back to the other one.
class FeedParser {
public:
    struct Entry {
        std::string title;
        std::string link;
        std::string description;
        std::string guid;
        std::optional<std::int64_t> published;
    };

    static bool parseRss(const std::string& xml, std::vector<Entry>& entries);
    static bool parseAtom(const std::string& xml, std::vector<Entry>& entries);

    // RFC 3339 (Atom, dc:date) or RFC 822/2822 (RSS pubDate) to unix seconds.
    static std::optional<std::int64_t> parseTimestamp(const std::string& text);

private:
    static std::string nodeToText(xmlNodePtr node);
    static std::string attribute(xmlNodePtr node, const char* name);
    static bool inNamespace(xmlNodePtr node, const char* href);
};

}
