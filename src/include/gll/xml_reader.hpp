#pragma once

#include <cstddef>
#include <string_view>

namespace gll {

  enum class xml_node_type {
    start_element,
    end_element,
    characters,
  };

  // Pull-style cursor over the events of an XML document.
  class xml_reader {
  public:
    virtual ~xml_reader() = default;

    virtual bool
    read() = 0;

    virtual xml_node_type
    node_type() const = 0;

    virtual std::string_view
    name() const = 0;

    virtual std::size_t
    attribute_count() const = 0;

    virtual std::string_view
    attribute_name(std::size_t index) const = 0;

    virtual std::string_view
    attribute_value(std::size_t index) const = 0;

    // Empty when the attribute is absent.
    virtual std::string_view
    attribute_value(std::string_view name) const = 0;

    virtual bool
    has_attribute(std::string_view name) const = 0;

    virtual std::string_view
    text() const = 0;

    virtual std::size_t
    depth() const = 0;

    // Source line of the current event.
    virtual std::size_t
    line() const = 0;
  };

} // namespace gll
