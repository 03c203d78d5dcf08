#include "xml_document.hpp"

namespace cadence::network {

std::string strip_prefix(const std::string& qualified) {
    auto colon = qualified.find(':');
    return colon == std::string::npos ? qualified : qualified.substr(colon + 1);
}

std::string XmlElement::name() const {
    if (!node_) {
        return std::string();
    }
    const char* value = ixmlNode_getNodeName(node_);
    return value ? std::string(value) : std::string();
}

std::string XmlElement::local_name() const {
    return strip_prefix(name());
}

std::string XmlElement::text() const {
    std::string out;
    if (!node_) {
        return out;
    }
    for (IXML_Node* child = ixmlNode_getFirstChild(node_); child; child = ixmlNode_getNextSibling(child)) {
        auto type = ixmlNode_getNodeType(child);
        if (type == eTEXT_NODE || type == eCDATA_SECTION_NODE) {
            const char* value = ixmlNode_getNodeValue(child);
            if (value) {
                out += value;
            }
        }
    }
    return out;
}

std::optional<std::string> XmlElement::attribute(const std::string& name) const {
    if (!node_ || ixmlNode_getNodeType(node_) != eELEMENT_NODE) {
        return std::nullopt;
    }
    auto* element = reinterpret_cast<IXML_Element*>(node_);
    const char* value = ixmlElement_getAttribute(element, const_cast<char*>(name.c_str()));
    if (!value) {
        return std::nullopt;
    }
    return std::string(value);
}

std::vector<XmlElement> XmlElement::children() const {
    std::vector<XmlElement> out;
    if (!node_) {
        return out;
    }
    for (IXML_Node* child = ixmlNode_getFirstChild(node_); child; child = ixmlNode_getNextSibling(child)) {
        if (ixmlNode_getNodeType(child) == eELEMENT_NODE) {
            out.emplace_back(child);
        }
    }
    return out;
}

std::vector<XmlElement> XmlElement::children(const std::string& local) const {
    std::vector<XmlElement> out;
    for (const auto& child : children()) {
        if (child.local_name() == local) {
            out.push_back(child);
        }
    }
    return out;
}

XmlElement XmlElement::child(const std::string& local) const {
    for (const auto& candidate : children()) {
        if (candidate.local_name() == local) {
            return candidate;
        }
    }
    return XmlElement();
}

XmlElement XmlElement::find(const std::string& local) const {
    for (const auto& candidate : children()) {
        if (candidate.local_name() == local) {
            return candidate;
        }
        XmlElement nested = candidate.find(local);
        if (nested) {
            return nested;
        }
    }
    return XmlElement();
}

bool XmlDocument::parse(const std::string& text, std::string& error) {
    doc_.reset();
    if (text.find('<') == std::string::npos) {
        error = "payload is not XML";
        return false;
    }

    IXML_Document* doc = nullptr;
    int rc = ixmlParseBufferEx(text.c_str(), &doc);
    if (rc != IXML_SUCCESS || !doc) {
        if (doc) {
            ixmlDocument_free(doc);
        }
        error = "malformed XML (ixml error " + std::to_string(rc) + ")";
        return false;
    }

    doc_.reset(doc);
    if (!root()) {
        error = "XML document has no root element";
        doc_.reset();
        return false;
    }
    return true;
}

XmlElement XmlDocument::root() const {
    if (!doc_) {
        return XmlElement();
    }
    for (IXML_Node* child = ixmlNode_getFirstChild(&doc_->n); child; child = ixmlNode_getNextSibling(child)) {
        if (ixmlNode_getNodeType(child) == eELEMENT_NODE) {
            return XmlElement(child);
        }
    }
    return XmlElement();
}

} // namespace cadence::network
