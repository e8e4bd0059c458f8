#pragma once

#include <string_view>
#include <string>
#include <vector>
#include <initializer_list>
#include <unordered_map>

#include <libxml/tree.h>

/**
 * Fluent writer for the `<Envelope>` documents the HTTP service returns.
 * `add_child` descends into the new element, `step_up` returns to its
 * parent; `add_string` stays where it is.
 */
class XmlBuilder
{
    xmlDocPtr p_doc;
    xmlNodePtr p_cur_node;
public:
    using attribute_map = std::unordered_map<std::string, std::string>;

    XmlBuilder();
    ~XmlBuilder();

    XmlBuilder(const XmlBuilder&) = delete;
    XmlBuilder& operator=(const XmlBuilder&) = delete;

    XmlBuilder& add_string(const std::string_view& name, const std::string_view& data);
    XmlBuilder& add_string(const std::string_view& name, const attribute_map& attributes, const std::string_view& data);

    XmlBuilder& add_child(const std::string_view& name);
    XmlBuilder& add_child(const std::string_view& name, const attribute_map& attributes);

    XmlBuilder& step_up();

    std::string serialize(bool pretty = false);

    template<typename T, typename Func>
    inline XmlBuilder& add_array(const std::string_view& name, const attribute_map& attributes, const std::vector<T>& elems, Func for_each)
    {
        add_child(name, attributes);
        for (const auto& elem : elems)
            for_each(*this, elem);
        return step_up();
    }

    template<typename T, typename Func>
    inline XmlBuilder& add_array(const std::string_view& name, const std::vector<T>& elems, Func for_each)
    {
        return add_array(name, attribute_map{}, elems, for_each);
    }

    template<typename T, typename Func>
    inline XmlBuilder& add_array(const std::string_view& name, const std::initializer_list<T>& elems, Func for_each)
    {
        return add_array(name, std::vector<T>{elems}, for_each);
    }

private:
    static void set_attributes(xmlNodePtr node, const attribute_map& attributes);
};
