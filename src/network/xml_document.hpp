#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <upnp/ixml.h>

namespace cadence::network {

/**
 * Non-owning view of an element inside an XmlDocument. Names are compared
 * by local name, so "e:property" and "property" match alike.
 */
class XmlElement {
public:
    XmlElement() = default;
    explicit XmlElement(IXML_Node* node) : node_(node) {}

    bool valid() const { return node_ != nullptr; }
    explicit operator bool() const { return valid(); }

    std::string name() const;
    std::string local_name() const;

    // Concatenated text and CDATA content of direct children
    std::string text() const;
    std::optional<std::string> attribute(const std::string& name) const;

    std::vector<XmlElement> children() const;
    std::vector<XmlElement> children(const std::string& local) const;
    XmlElement child(const std::string& local) const;

    // Depth-first search for the first descendant with this local name
    XmlElement find(const std::string& local) const;

private:
    IXML_Node* node_ = nullptr;
};

class XmlDocument {
public:
    XmlDocument() = default;

    bool parse(const std::string& text, std::string& error);
    XmlElement root() const;

private:
    struct Deleter {
        void operator()(IXML_Document* doc) const {
            if (doc) {
                ixmlDocument_free(doc);
            }
        }
    };

    std::unique_ptr<IXML_Document, Deleter> doc_;
};

std::string strip_prefix(const std::string& qualified);

} // namespace cadence::network
