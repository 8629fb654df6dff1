#pragma once

#include <libxml/HTMLparser.h>
#include <libxml/parser.h>
#include <libxml/xpath.h>

#include <optional>
#include <string>
#include <string_view>
#include <trivial_helpers/raii.hpp>

class XmlCharWrapper {
    RAII<xmlChar *>::Value<void> string;

   public:
    explicit XmlCharWrapper(xmlChar *buf) : string(buf, xmlFree) {}

    explicit operator bool() const noexcept { return string != nullptr; }
    const char *c_str() const noexcept {
        return reinterpret_cast<const char *>(string.get());
    }
    std::string str() const { return c_str() ? std::string(c_str()) : ""; }
};

// A parsed HTML page queried with XPath.
// Parsing is lenient: broken markup still yields a document.
class HtmlDocument {
    RAII<xmlDocPtr>::Value<void> doc;

   public:
    explicit HtmlDocument(std::string_view html)
        : doc(htmlReadMemory(html.data(), static_cast<int>(html.size()),
                             nullptr, "UTF-8",
                             HTML_PARSE_RECOVER | HTML_PARSE_NOERROR |
                                 HTML_PARSE_NOWARNING | HTML_PARSE_NONET),
              xmlFreeDoc) {}

    [[nodiscard]] bool valid() const noexcept { return doc != nullptr; }

    // Attribute of the first element matching the XPath expression.
    [[nodiscard]] std::optional<std::string> attribute(
        const std::string &xpath, const std::string &name) const {
        if (!doc) {
            return std::nullopt;
        }
        auto context = RAII<xmlXPathContextPtr>::create<void>(
            xmlXPathNewContext(doc.get()), xmlXPathFreeContext);
        if (!context) {
            return std::nullopt;
        }
        auto result = RAII<xmlXPathObjectPtr>::create<void>(
            xmlXPathEvalExpression(
                reinterpret_cast<const xmlChar *>(xpath.c_str()),
                context.get()),
            xmlXPathFreeObject);
        if (!result || result->nodesetval == nullptr ||
            result->nodesetval->nodeNr == 0) {
            return std::nullopt;
        }
        XmlCharWrapper value(
            xmlGetProp(result->nodesetval->nodeTab[0],
                       reinterpret_cast<const xmlChar *>(name.c_str())));
        if (!value) {
            return std::nullopt;
        }
        return value.str();
    }
};
