#include <gll/ostream_writer.hpp>
#include <gll/xml_escape.hpp>

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace gll {

  struct ostream_writer::impl {
    std::ostream& os;
    bool indent;

    // Pending tag state: start_element() buffers its name and attribute()
    // accumulates onto it; the tag is written when child content arrives or
    // end_element() is called.
    bool tag_pending = false;
    std::string pending_name;

    struct pending_attr {
      std::string name;
      std::string value;
    };

    std::vector<pending_attr> pending_attrs;

    struct element_frame {
      std::string name;
      bool has_elements = false;
      bool has_text = false;
    };

    std::vector<element_frame> stack;

    impl(std::ostream& os, bool indent) : os(os), indent(indent) {}

    void
    newline(std::size_t depth) {
      os << '\n';
      for (std::size_t i = 0; i < depth; ++i)
        os << "  ";
    }

    // Write the buffered opening tag to the stream.
    void
    flush_pending_tag() {
      if (!tag_pending) { return; }
      tag_pending = false;

      os << '<' << pending_name;
      for (const auto& attr : pending_attrs) {
        os << ' ' << attr.name << "=\"";
        escape_attribute(os, attr.value);
        os << '"';
      }
      pending_attrs.clear();
    }

    // Ensure the most recent open tag is flushed and closed with '>'.
    void
    flush_and_close_tag() {
      if (tag_pending) {
        flush_pending_tag();
        os << '>';
      }
    }
  };

  ostream_writer::ostream_writer(std::ostream& os, bool indent)
      : impl_(std::make_unique<impl>(os, indent)) {}

  ostream_writer::~ostream_writer() = default;
  ostream_writer::ostream_writer(ostream_writer&&) noexcept = default;
  ostream_writer&
  ostream_writer::operator=(ostream_writer&&) noexcept = default;

  void
  ostream_writer::start_element(std::string_view name) {
    // Flush any previously open tag (it now has child content)
    impl_->flush_and_close_tag();

    if (!impl_->stack.empty()) {
      auto& parent = impl_->stack.back();
      parent.has_elements = true;
      if (impl_->indent && !parent.has_text)
        impl_->newline(impl_->stack.size());
    }

    impl_->stack.push_back({std::string(name)});
    impl_->tag_pending = true;
    impl_->pending_name = std::string(name);
  }

  void
  ostream_writer::end_element() {
    if (impl_->stack.empty())
      throw std::logic_error("ostream_writer: end_element without open element");
    auto frame = std::move(impl_->stack.back());
    impl_->stack.pop_back();

    if (impl_->tag_pending) {
      // Self-closing: no child content was written
      impl_->flush_pending_tag();
      impl_->os << "/>";
      return;
    }
    if (impl_->indent && frame.has_elements && !frame.has_text)
      impl_->newline(impl_->stack.size());
    impl_->os << "</" << frame.name << '>';
  }

  void
  ostream_writer::attribute(std::string_view name, std::string_view value) {
    if (!impl_->tag_pending)
      throw std::logic_error("ostream_writer: attribute outside a start tag");
    impl_->pending_attrs.push_back({std::string(name), std::string(value)});
  }

  void
  ostream_writer::characters(std::string_view text) {
    impl_->flush_and_close_tag();
    if (!impl_->stack.empty()) { impl_->stack.back().has_text = true; }
    escape_text(impl_->os, text);
  }

} // namespace gll
