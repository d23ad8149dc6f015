#include "document/xml_dom.hpp"
#include "document/document_error.hpp"
#include <Poco/DOM/DOMParser.h>
#include <Poco/DOM/DOMWriter.h>
#include <Poco/DOM/NamedNodeMap.h>
#include <Poco/DOM/Attr.h>
#include <Poco/XML/XMLWriter.h>
#include <Poco/UTF8Encoding.h>
#include <Poco/Exception.h>
#include <sstream>

using Poco::AutoPtr;
using Poco::XML::Element;
using Poco::XML::Node;

AutoPtr<Poco::XML::Document> XmlDom::parse(const std::string &xml, const std::string &part_name)
{
    try
    {
        Poco::XML::DOMParser parser;
        AutoPtr<Poco::XML::Document> document = parser.parseString(xml);
        if (!document->documentElement())
        {
            throw DocumentError("XML part has no root element: " + part_name);
        }
        return document;
    }
    catch (const Poco::Exception &e)
    {
        throw DocumentError("Malformed XML in " + part_name + ": " + e.displayText());
    }
}

std::string XmlDom::serialize(const Poco::XML::Document *document)
{
    Poco::UTF8Encoding utf8;
    Poco::XML::DOMWriter writer;
    writer.setEncoding("UTF-8", utf8);
    writer.setOptions(Poco::XML::XMLWriter::WRITE_XML_DECLARATION);

    std::ostringstream out;
    writer.writeNode(out, document);
    return out.str();
}

std::string XmlDom::localName(const Node *node)
{
    const std::string &name = node->nodeName();
    auto colon = name.find(':');
    return colon == std::string::npos ? name : name.substr(colon + 1);
}

std::vector<Element *> XmlDom::childElements(const Node *parent)
{
    std::vector<Element *> out;
    if (!parent)
        return out;
    for (Node *child = parent->firstChild(); child; child = child->nextSibling())
    {
        if (child->nodeType() == Node::ELEMENT_NODE)
        {
            out.push_back(static_cast<Element *>(child));
        }
    }
    return out;
}

Element *XmlDom::firstChild(const Node *parent, const std::string &local_name)
{
    if (!parent)
        return nullptr;
    for (Node *child = parent->firstChild(); child; child = child->nextSibling())
    {
        if (child->nodeType() == Node::ELEMENT_NODE && localName(child) == local_name)
        {
            return static_cast<Element *>(child);
        }
    }
    return nullptr;
}

std::vector<Element *> XmlDom::children(const Node *parent, const std::string &local_name)
{
    std::vector<Element *> out;
    for (Element *child : childElements(parent))
    {
        if (localName(child) == local_name)
        {
            out.push_back(child);
        }
    }
    return out;
}

Element *XmlDom::path(const Node *parent, const std::vector<std::string> &local_names)
{
    const Node *current = parent;
    Element *found = nullptr;
    for (const auto &name : local_names)
    {
        found = firstChild(current, name);
        if (!found)
            return nullptr;
        current = found;
    }
    return found;
}

namespace
{
    Poco::XML::Node *findPrefixedAttribute(const Element *element, const std::string &local_name)
    {
        if (!element)
            return nullptr;
        AutoPtr<Poco::XML::NamedNodeMap> attributes = element->attributes();
        for (unsigned long i = 0; i < attributes->length(); ++i)
        {
            Node *attr = attributes->item(i);
            const std::string &qname = attr->nodeName();
            auto colon = qname.find(':');
            if (colon == std::string::npos || qname.compare(0, colon, "xmlns") == 0)
                continue;
            if (qname.compare(colon + 1, std::string::npos, local_name) == 0)
                return attr;
        }
        return nullptr;
    }
}

const std::string XmlDom::RELATIONSHIPS_NS = "http://schemas.openxmlformats.org/officeDocument/2006/relationships";
const std::string XmlDom::DRAWINGML_NS = "http://schemas.openxmlformats.org/drawingml/2006/main";
const std::string XmlDom::PRESENTATIONML_NS = "http://schemas.openxmlformats.org/presentationml/2006/main";

std::string XmlDom::prefixedAttribute(const Element *element, const std::string &local_name)
{
    Node *attr = findPrefixedAttribute(element, local_name);
    return attr ? attr->nodeValue() : std::string();
}

void XmlDom::setPrefixedAttribute(Element *element, const std::string &local_name, const std::string &value)
{
    Node *attr = findPrefixedAttribute(element, local_name);
    if (attr)
    {
        attr->setNodeValue(value);
        return;
    }
    element->setAttributeNS(RELATIONSHIPS_NS, "r:" + local_name, value);
}

Element *XmlDom::appendChild(Element *parent, const std::string &namespace_uri, const std::string &qualified_name)
{
    return insertChild(parent, nullptr, namespace_uri, qualified_name);
}

Element *XmlDom::insertChild(Element *parent, Node *before, const std::string &namespace_uri, const std::string &qualified_name)
{
    AutoPtr<Element> child = parent->ownerDocument()->createElementNS(namespace_uri, qualified_name);
    if (before)
        parent->insertBefore(child, before);
    else
        parent->appendChild(child);
    return child.get();
}
