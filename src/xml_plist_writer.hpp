#ifndef PLISTKIT_XML_PLIST_WRITER_HPP
#define PLISTKIT_XML_PLIST_WRITER_HPP

#include <ostream>
#include <string>
#include <string_view>

#include "plist_value.hpp"

namespace plistkit {

/**
 * @defgroup XmlWriting XML Plist Encoding
 * @{
 */

/// Everything up to and including the opening <plist> tag.
extern const char PLIST_HEAD[];

/// Closing text written after the root value.
extern const char PLIST_FOOT[];

/**
 * @class XmlPlistWriter
 * @brief Serializes a Value tree as PropertyList-1.0 XML.
 *
 * Each nesting level is indented by two spaces and the root value sits one
 * level inside <plist>. Null is written as an empty <string></string> and a
 * Uid as a single-line {CF$UID} dictionary, matching what existing
 * consumers of these files expect. Sets have no XML form.
 *
 * @code
 * std::ostringstream out;
 * plistkit::XmlPlistWriter writer(out);
 * writer.writeDocument(root);
 * @endcode
 */
class XmlPlistWriter {
   private:
    std::ostream& mOut;

    void writeDict(const Dict& dict, int level);
    void writeArray(const Array& array, int level);

   public:
    static const char* const INDENT;

    explicit XmlPlistWriter(std::ostream& os);

    /**
     * @brief Write header, root value and footer.
     * @throws UnsupportedValueError if the tree contains a Set
     */
    void writeDocument(const Value& root);

    /**
     * @brief Write one value and its children, starting at @p level.
     * @throws UnsupportedValueError if the tree contains a Set
     */
    void writeValue(const Value& value, int level);
};

/// Complete document text for @p root.
std::string toXmlString(const Value& root);

/**
 * @brief Return the nodes between <plist ...> and </plist>, trimmed.
 *
 * @return An empty string if @p xml has no plist element
 */
std::string extractPlistBody(std::string_view xml);

/** @} */

}  // namespace plistkit

#endif  // PLISTKIT_XML_PLIST_WRITER_HPP
