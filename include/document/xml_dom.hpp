#pragma once

#include <Poco/AutoPtr.h>
#include <Poco/DOM/Document.h>
#include <Poco/DOM/Element.h>
#include <string>
#include <vector>

/**
 * @brief Thin helpers over the Poco DOM used by the package and slide parsers.
 *
 * Elements are matched by local name so the prefixes a producer picked
 * ("p:", "a:", ...) do not matter.
 */
class XmlDom
{
public:
    /**
     * @brief Parse an XML part
     * @throws DocumentError if the text is not well-formed
     */
    static Poco::AutoPtr<Poco::XML::Document> parse(const std::string &xml, const std::string &part_name);

    /**
     * @brief Serialize a document with a UTF-8 XML declaration
     */
    static std::string serialize(const Poco::XML::Document *document);

    static std::string localName(const Poco::XML::Node *node);

    static Poco::XML::Element *firstChild(const Poco::XML::Node *parent, const std::string &local_name);
    static std::vector<Poco::XML::Element *> children(const Poco::XML::Node *parent, const std::string &local_name);
    static std::vector<Poco::XML::Element *> childElements(const Poco::XML::Node *parent);

    /**
     * @brief Follow a chain of local names, e.g. {"cSld", "spTree"}
     */
    static Poco::XML::Element *path(const Poco::XML::Node *parent, const std::vector<std::string> &local_names);

    /**
     * @brief Value of a prefixed attribute matched by local name, e.g. "embed"
     * finds "r:embed" but never an unprefixed "embed". Empty if absent.
     */
    static std::string prefixedAttribute(const Poco::XML::Element *element, const std::string &local_name);

    /**
     * @brief Overwrite a prefixed attribute, or add it in the relationships
     * namespace if the element does not carry it yet
     */
    static void setPrefixedAttribute(Poco::XML::Element *element, const std::string &local_name, const std::string &value);

    /**
     * @brief Create an element in the given namespace and append it to parent
     * @return The new child, owned by parent
     */
    static Poco::XML::Element *appendChild(Poco::XML::Element *parent,
                                           const std::string &namespace_uri,
                                           const std::string &qualified_name);

    /**
     * @brief As appendChild() but inserted before an existing child (or appended if null)
     */
    static Poco::XML::Element *insertChild(Poco::XML::Element *parent,
                                           Poco::XML::Node *before,
                                           const std::string &namespace_uri,
                                           const std::string &qualified_name);

    static const std::string RELATIONSHIPS_NS;
    static const std::string DRAWINGML_NS;
    static const std::string PRESENTATIONML_NS;
};
