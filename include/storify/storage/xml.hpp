#pragma once

#include <string>
#include <vector>

// Minimal XML scanning for S3 and Azure list/error responses. Provider
// responses are flat and machine-generated, so tag scanning is enough.
namespace storify::xml {

// Value between <tag>value</tag>, or "" when absent
std::string get_element(const std::string& xml, const std::string& tag, size_t start_pos = 0);

struct ElementRange {
    size_t content_start = 0;
    size_t content_end = 0;
    size_t element_end = 0;  // position after the closing tag

    std::string content(const std::string& xml) const {
        return xml.substr(content_start, content_end - content_start);
    }
};

// Every <tag>...</tag> occurrence, in document order
std::vector<ElementRange> find_elements(const std::string& xml, const std::string& tag);

// &lt; &gt; &amp; &quot; &apos; and numeric character references
std::string decode_entities(const std::string& s);

std::string escape(const std::string& s);

} // namespace storify::xml
