#ifndef NBJSON_PRETTY_PRINTER_H
#define NBJSON_PRETTY_PRINTER_H

#include "nbjson_parser.hpp"

#include "minijson_writer.hpp"

#include <cstddef>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace nbjson
{

// JSON text written as is, so that numbers keep the notation they had in
// the input
struct raw_json
{
    std::string_view text;
};

} // namespace nbjson

namespace minijson
{

template<>
struct default_value_writer<nbjson::raw_json>
{
    void operator()(
        std::ostream& stream,
        const nbjson::raw_json& value,
        writer_configuration) const
    {
        stream << value.text;
    }
};

} // namespace minijson

namespace nbjson
{

// Renders the event stream of a parser as indented JSON text, one
// minijson writer per open container
class pretty_printer final
{
private:

    using writer = std::variant<minijson::object_writer, minijson::array_writer>;

    std::ostringstream m_out;
    minijson::writer_configuration m_configuration;
    std::vector<writer> m_writers;
    std::string m_field_name;

    template<typename Writer>
    Writer nested()
    {
        constexpr bool is_object =
            std::is_same_v<Writer, minijson::object_writer>;

        if (auto* object =
            std::get_if<minijson::object_writer>(&m_writers.back()))
        {
            if constexpr (is_object)
            {
                return object->nested_object(m_field_name.c_str());
            }
            else
            {
                return object->nested_array(m_field_name.c_str());
            }
        }

        auto& array = std::get<minijson::array_writer>(m_writers.back());
        if constexpr (is_object)
        {
            return array.nested_object();
        }
        else
        {
            return array.nested_array();
        }
    }

    template<typename Writer>
    void open()
    {
        if (m_writers.empty())
        {
            m_writers.emplace_back(
                std::in_place_type<Writer>,
                m_out,
                m_configuration);
            return;
        }

        m_writers.emplace_back(nested<Writer>());
    }

    void close()
    {
        std::visit([](auto& w) { w.close(); }, m_writers.back());
        m_writers.pop_back();
    }

    template<typename T>
    void write(const T& value)
    {
        if (auto* object =
            std::get_if<minijson::object_writer>(&m_writers.back()))
        {
            object->write(m_field_name.c_str(), value);
            return;
        }

        std::get<minijson::array_writer>(m_writers.back()).write(value);
    }

public:

    explicit pretty_printer(const std::size_t indent = 2)
    : m_configuration(
        minijson::writer_configuration()
            .pretty_printing(true)
            .use_tabs(false)
            .indent_spaces(indent))
    {
    }

    pretty_printer(const pretty_printer&) = delete;
    pretty_printer& operator=(const pretty_printer&) = delete;

    // The root is always a container, so scalar events always find an
    // open writer
    void on_event(const event e, const parser& parser)
    {
        switch (e)
        {
        case event::StartObject:
            open<minijson::object_writer>();
            break;
        case event::StartArray:
            open<minijson::array_writer>();
            break;
        case event::EndObject:
        case event::EndArray:
            close();
            break;
        case event::FieldName:
            m_field_name = parser.value().as<std::string>();
            break;
        case event::ValueString:
            write(parser.value().as<std::string>());
            break;
        case event::ValueTrue:
        case event::ValueFalse:
            write(parser.value().as<bool>());
            break;
        case event::ValueInt:
        case event::ValueDouble:
        case event::ValueNull:
            write(raw_json {parser.value().raw()});
            break;
        case event::Error:
            throw parser.error().value();
        case event::NeedMoreInput:
        case event::Eof:
            break;
        }
    }

    std::string result() const
    {
        return m_out.str();
    }
}; // class pretty_printer

} // namespace nbjson

#endif // NBJSON_PRETTY_PRINTER_H
