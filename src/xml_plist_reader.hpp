#ifndef PLISTKIT_XML_PLIST_READER_HPP
#define PLISTKIT_XML_PLIST_READER_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <pugixml.hpp>

#include "plist_options.hpp"
#include "plist_value.hpp"

namespace plistkit {

/**
 * @defgroup XmlFormat XML Plist Decoding
 * @brief Push-down automaton that rebuilds a Value from XML events.
 * @{
 */

/**
 * @enum XmlMode
 * @brief One entry of the mode stack.
 *
 * Every allowed element has a mode. Value is synthetic: it is pushed once a
 * leaf has produced its value and popped when the leaf closes.
 */
enum class XmlMode {
    Plist,
    Dict,
    Array,
    Key,
    String,
    Integer,
    Real,
    Date,
    Data,
    True,
    False,
    Value,
};

/**
 * @class XmlPlistReader
 * @brief Decodes an XML plist document into a Value tree.
 *
 * pugixml tokenizes the document; the tree is then replayed in document
 * order as start / text / end events. The events are public so the
 * automaton can be driven directly.
 *
 * Three stacks carry the parse state:
 * - the mode stack (which element is open)
 * - the value stack (containers being filled and finished leaves)
 * - the key stack (dictionary keys waiting for their value)
 *
 * @code
 * plistkit::XmlPlistReader reader;
 * plistkit::Value root = reader.parse(xml_text);
 * auto enc = reader.encoding();  // "UTF-8" if declared
 * @endcode
 */
class XmlPlistReader {
   public:
    explicit XmlPlistReader(const PlistOptions& options = {});

    /**
     * @brief Tokenize and decode a complete document.
     *
     * @return The root value; an empty Dict for an empty <plist/>
     * @throws MalformedPlistError if the XML is not well-formed or not a plist
     */
    Value parse(std::string_view xml);

    /**
     * @name Event interface
     * @throws MalformedPlistError on any transition the plist grammar forbids
     * @{
     */
    void xmlDeclaration(std::string_view encoding);
    void startElement(std::string_view name, std::string_view version = {});
    void characterData(std::string_view text);
    void endElement(std::string_view name);
    /** @} */

    /// True once </plist> has been processed.
    bool finished() const { return mFinished; }

    /// Root value of a finished document.
    const Value& root() const { return mRoot; }

    /// The encoding named in the XML declaration, as written.
    const std::optional<std::string>& encoding() const { return mEncoding; }

    /// The version attribute of <plist>.
    const std::optional<std::string>& version() const { return mVersion; }

    /// Reset all parse state so the instance can decode another document.
    void reset();

   private:
    PlistOptions mOptions;
    std::vector<XmlMode> mModes;
    std::vector<Value> mValues;
    std::vector<std::string> mKeys;
    size_t mDictDepth = 0;
    bool mFinished = false;
    Value mRoot;
    std::optional<std::string> mEncoding;
    std::optional<std::string> mVersion;

    void pushMode(XmlMode mode);
    void popMode();
    XmlMode currentMode() const;
    XmlMode parentMode() const;
    Value popValue();
    void storeValue(Value value);

    void emitNode(const pugi::xml_node& node, size_t depth);
    void finishDocument();
    Value convertText(XmlMode mode, std::string_view text) const;

    void warn(const std::string& category, const std::string& message) const;
};

/// Element name for @p mode, e.g. "dict"; "value" for the synthetic mode.
const char* modeName(XmlMode mode);

/** @} */

}  // namespace plistkit

#endif  // PLISTKIT_XML_PLIST_READER_HPP
