#include "utils/FeedParser.hpp"
#include "utils/TextUtils.hpp"
#include <libxml/parser.h>
#include <curl/curl.h>
#include <cstring>
#include <ctime>
#include <memory>
#include <regex>

namespace DryDock {

namespace {

const char* kAtomNs = "http://www.w3.org/2005/Atom";
const char* kContentNs = "http://purl.org/rss/1.0/modules/content/";
const char* kDublinCoreNs = "http://purl.org/dc/elements/1.1/";

using XmlDocPtr = std::unique_ptr<xmlDoc, decltype(&xmlFreeDoc)>;

XmlDocPtr readDocument(const std::string& xml) {
    // No XML_PARSE_RECOVER: a malformed body has to fail so the caller can try the other dialect.
    xmlDocPtr doc = xmlReadMemory(xml.c_str(), static_cast<int>(xml.size()), nullptr, nullptr,
                                  XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING | XML_PARSE_NOCDATA);
    return XmlDocPtr(doc, xmlFreeDoc);
}

bool nameIs(xmlNodePtr node, const char* name) {
    return node && node->type == XML_ELEMENT_NODE &&
           std::strcmp(reinterpret_cast<const char*>(node->name), name) == 0;
}

}

std::string FeedParser::nodeToText(xmlNodePtr node) {
    if (!node) return "";
    xmlChar* content = xmlNodeGetContent(node);
    if (!content) return "";
    std::string result(reinterpret_cast<char*>(content));
    xmlFree(content);
    return TextUtils::trim(result);
}

std::string FeedParser::attribute(xmlNodePtr node, const char* name) {
    xmlChar* value = xmlGetProp(node, reinterpret_cast<const xmlChar*>(name));
    if (!value) return "";
    std::string result(reinterpret_cast<char*>(value));
    xmlFree(value);
    return TextUtils::trim(result);
}

bool FeedParser::inNamespace(xmlNodePtr node, const char* href) {
    if (!node->ns || !node->ns->href) return href == nullptr;
    return href && std::strcmp(reinterpret_cast<const char*>(node->ns->href), href) == 0;
}

bool FeedParser::parseRss(const std::string& xml, std::vector<Entry>& entries) {
    XmlDocPtr doc = readDocument(xml);
    if (!doc) return false;
    xmlNodePtr root = xmlDocGetRootElement(doc.get());
    if (!nameIs(root, "rss")) return false;

    xmlNodePtr channel = nullptr;
    for (xmlNodePtr child = root->children; child; child = child->next) {
        if (nameIs(child, "channel")) { channel = child; break; }
    }
    if (!channel) return false;

    std::vector<Entry> parsed;
    for (xmlNodePtr itemNode = channel->children; itemNode; itemNode = itemNode->next) {
        if (!nameIs(itemNode, "item")) continue;
        Entry entry;
        std::string encoded;
        std::string pubDate;
        std::string dcDate;

        for (xmlNodePtr child = itemNode->children; child; child = child->next) {
            if (child->type != XML_ELEMENT_NODE) continue;
            if (nameIs(child, "title") && inNamespace(child, nullptr)) {
                entry.title = nodeToText(child);
            } else if (nameIs(child, "link") && inNamespace(child, nullptr)) {
                entry.link = nodeToText(child);
            } else if (nameIs(child, "description")) {
                entry.description = nodeToText(child);
            } else if (nameIs(child, "encoded") && inNamespace(child, kContentNs)) {
                encoded = nodeToText(child);
            } else if (nameIs(child, "guid")) {
                entry.guid = nodeToText(child);
            } else if (nameIs(child, "pubDate")) {
                pubDate = nodeToText(child);
            } else if (nameIs(child, "date") && inNamespace(child, kDublinCoreNs)) {
                dcDate = nodeToText(child);
            }
        }

        if (entry.description.empty()) entry.description = encoded;
        if (!pubDate.empty()) entry.published = parseTimestamp(pubDate);
        if (!entry.published && !dcDate.empty()) entry.published = parseTimestamp(dcDate);
        parsed.push_back(std::move(entry));
    }

    entries = std::move(parsed);
    return true;
}

bool FeedParser::parseAtom(const std::string& xml, std::vector<Entry>& entries) {
    XmlDocPtr doc = readDocument(xml);
    if (!doc) return false;
    xmlNodePtr root = xmlDocGetRootElement(doc.get());
    if (!nameIs(root, "feed") || !inNamespace(root, kAtomNs)) return false;

    std::vector<Entry> parsed;
    for (xmlNodePtr entryNode = root->children; entryNode; entryNode = entryNode->next) {
        if (!nameIs(entryNode, "entry") || !inNamespace(entryNode, kAtomNs)) continue;
        Entry entry;
        std::string firstLink;
        std::string alternateLink;
        std::string content;
        std::string published;
        std::string updated;

        for (xmlNodePtr child = entryNode->children; child; child = child->next) {
            if (child->type != XML_ELEMENT_NODE || !inNamespace(child, kAtomNs)) continue;
            if (nameIs(child, "title")) {
                entry.title = nodeToText(child);
            } else if (nameIs(child, "link")) {
                std::string href = attribute(child, "href");
                std::string rel = attribute(child, "rel");
                if (firstLink.empty()) firstLink = href;
                if (alternateLink.empty() && (rel.empty() || rel == "alternate")) alternateLink = href;
            } else if (nameIs(child, "summary")) {
                entry.description = nodeToText(child);
            } else if (nameIs(child, "content")) {
                content = nodeToText(child);
            } else if (nameIs(child, "id")) {
                entry.guid = nodeToText(child);
            } else if (nameIs(child, "published")) {
                published = nodeToText(child);
            } else if (nameIs(child, "updated")) {
                updated = nodeToText(child);
            }
        }

        entry.link = alternateLink.empty() ? firstLink : alternateLink;
        if (entry.description.empty()) entry.description = content;
        if (!published.empty()) entry.published = parseTimestamp(published);
        if (!entry.published && !updated.empty()) entry.published = parseTimestamp(updated);
        parsed.push_back(std::move(entry));
    }

    entries = std::move(parsed);
    return true;
}

std::optional<std::int64_t> FeedParser::parseTimestamp(const std::string& text) {
    std::string value = TextUtils::trim(text);
    if (value.empty()) return std::nullopt;

    static const std::regex rfc3339(
        R"(^(\d{4})-(\d{2})-(\d{2})(?:[Tt ](\d{2}):(\d{2})(?::(\d{2}))?(?:\.\d+)?)?\s*(Z|z|[+-]\d{2}:?\d{2})?$)");
    std::smatch m;
    if (std::regex_match(value, m, rfc3339)) {
        std::tm tm{};
        tm.tm_year = std::stoi(m[1].str()) - 1900;
        tm.tm_mon = std::stoi(m[2].str()) - 1;
        tm.tm_mday = std::stoi(m[3].str());
        tm.tm_hour = m[4].matched ? std::stoi(m[4].str()) : 0;
        tm.tm_min = m[5].matched ? std::stoi(m[5].str()) : 0;
        tm.tm_sec = m[6].matched ? std::stoi(m[6].str()) : 0;
        std::int64_t seconds = static_cast<std::int64_t>(timegm(&tm));

        if (m[7].matched) {
            std::string zone = m[7].str();
            if (zone != "Z" && zone != "z") {
                int sign = zone[0] == '-' ? -1 : 1;
                std::string digits;
                for (char c : zone.substr(1)) if (c != ':') digits += c;
                int offset = std::stoi(digits.substr(0, 2)) * 3600 + std::stoi(digits.substr(2, 2)) * 60;
                seconds -= sign * offset;
            }
        }
        return seconds;
    }

    // curl understands the RFC 822 family used by RSS pubDate
    time_t parsed = curl_getdate(value.c_str(), nullptr);
    if (parsed == static_cast<time_t>(-1)) return std::nullopt;
    return static_cast<std::int64_t>(parsed);
}

}
