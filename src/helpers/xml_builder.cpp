#include "xml_builder.hpp"

#define X (const xmlChar*)

XmlBuilder::XmlBuilder()
{
    this->p_doc = xmlNewDoc(X"1.0");
    this->p_cur_node = xmlNewNode(nullptr, X"Envelope");
    xmlNewProp(p_cur_node, X"xmlns", X"urn:cardlab");
    xmlDocSetRootElement(p_doc, p_cur_node);
}

XmlBuilder::~XmlBuilder()
{
    xmlFreeDoc(p_doc);
}

void XmlBuilder::set_attributes(xmlNodePtr node, const attribute_map& attributes)
{
    for (const auto& [attribute, value] : attributes)
    {
        xmlNewProp(node, X attribute.c_str(), X value.c_str());
    }
}

XmlBuilder& XmlBuilder::add_string(const std::string_view& name, const std::string_view& data)
{
    return add_string(name, attribute_map{}, data);
}

XmlBuilder& XmlBuilder::add_string(const std::string_view& name, const attribute_map& attributes, const std::string_view& data)
{
    // Text children are escaped, so record lines with '&' or '<' stay intact.
    std::string tag{name};
    std::string text{data};
    auto node = xmlNewTextChild(p_cur_node, nullptr, X tag.c_str(), X text.c_str());
    set_attributes(node, attributes);
    return *this;
}

XmlBuilder& XmlBuilder::add_child(const std::string_view& name)
{
    return add_child(name, attribute_map{});
}

XmlBuilder& XmlBuilder::add_child(const std::string_view& name, const attribute_map& attributes)
{
    std::string tag{name};
    this->p_cur_node = xmlNewChild(p_cur_node, nullptr, X tag.c_str(), nullptr);
    set_attributes(p_cur_node, attributes);
    return *this;
}

XmlBuilder& XmlBuilder::step_up()
{
    if (p_cur_node->parent != nullptr && p_cur_node->parent->type == XML_ELEMENT_NODE)
        this->p_cur_node = p_cur_node->parent;
    return *this;
}

std::string XmlBuilder::serialize(bool pretty)
{
    xmlChar* str;
    int size;
    xmlDocDumpFormatMemoryEnc(p_doc, &str, &size, "UTF-8", pretty ? 1 : 0);

    std::string value((const char*)str, (size_t)size);
    xmlFree(str);

    return value;
}
