#pragma once

#include <string_view>

namespace gll {

  class xml_writer {
  public:
    virtual ~xml_writer() = default;

    virtual void
    start_element(std::string_view name) = 0;

    virtual void
    end_element() = 0;

    // Only valid directly after start_element().
    virtual void
    attribute(std::string_view name, std::string_view value) = 0;

    virtual void
    characters(std::string_view text) = 0;
  };

} // namespace gll
