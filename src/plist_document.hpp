#ifndef PLISTKIT_DOCUMENT_HPP
#define PLISTKIT_DOCUMENT_HPP

#include <optional>
#include <string>

#include "binary_plist_reader.hpp"
#include "plist_options.hpp"
#include "plist_validator.hpp"
#include "plist_value.hpp"

namespace plistkit {

/**
 * @defgroup Document Document API
 * @brief Load, parse, validate and re-encode one plist.
 * @{
 */

/**
 * @class PlistDocument
 * @brief A plist buffer together with its decoded contents.
 *
 * load() only buffers the input and picks the decoder; parse() decodes,
 * validates and checks the declared text encoding. Accessors throw
 * PlistNotParsedError until a parse() has succeeded.
 *
 * Subclasses describe a particular kind of plist by overriding schema().
 *
 * @code
 * plistkit::PlistDocument doc(file_bytes);
 * doc.addValidationHook([&doc] {
 *     if (!doc["name"].isString())
 *         throw plistkit::InvalidPlistError("name must be a string");
 * });
 * doc.parse();
 * std::cout << doc.toXml();
 * @endcode
 */
class PlistDocument {
   public:
    explicit PlistDocument(PlistOptions options = {});
    explicit PlistDocument(std::string buffer, PlistOptions options = {});
    virtual ~PlistDocument() = default;

    /**
     * @brief Buffer @p buffer and choose binary or XML decoding.
     *
     * Discards any previous contents. Registered hooks are kept.
     */
    void load(std::string buffer);

    /**
     * @brief Decode the loaded buffer, then validate it.
     *
     * @throws PlistNotParsedError if nothing was loaded
     * @throws MalformedPlistError on structural errors
     * @throws BinaryPlistVersionError for an unsupported binary version
     * @throws InvalidPlistError if validation or the encoding check fails
     */
    void parse();

    bool parsed() const { return mContents.has_value(); }

    /// @throws PlistNotParsedError before a successful parse()
    const Value& contents() const;

    /**
     * @brief Replace the contents with @p root.
     *
     * The tree is written as XML and parsed again, so the document ends up
     * exactly as if that XML had been loaded.
     *
     * @throws PlistError unless @p root is an Array or a Dict
     */
    void setContents(Value root);

    /**
     * @brief Full XML document including header and footer.
     *
     * @throws PlistNotParsedError before a successful parse()
     * @throws PlistError if the root is not an Array or a Dict
     * @throws UnsupportedValueError if the tree contains a Set
     */
    std::string toXml() const;

    /// Only the nodes inside <plist>.
    std::string toXmlFragment() const;

    void addValidationHook(ValidationHook hook);

    /**
     * @brief Encoding declared by the XML, lower-cased ("utf-8").
     *
     * @return std::nullopt for binary input or a missing declaration
     * @throws PlistNotParsedError before a successful parse()
     */
    std::optional<std::string> encoding() const;

    /// Version attribute of <plist>, if any.
    std::optional<std::string> version() const;

    PlistFormat format() const { return mFormat.format; }

    /// Entry of a Dict root.
    const Value& operator[](const std::string& key) const;

   protected:
    /// Required keys for this kind of document; empty by default.
    virtual Schema schema() const;

   private:
    PlistOptions mOptions;
    std::string mBuffer;
    bool mLoaded = false;
    FormatInfo mFormat;
    std::optional<Value> mContents;
    std::optional<std::string> mEncoding;
    std::optional<std::string> mVersion;
    PlistValidator mValidator;

    void decode();
    void checkEncoding() const;
};

/**
 * @class ManifestDocument
 * @brief Client manifest; must list its catalogs.
 */
class ManifestDocument : public PlistDocument {
   public:
    using PlistDocument::PlistDocument;

   protected:
    Schema schema() const override;
};

/**
 * @class PackageInfoDocument
 * @brief Package description with catalogs and an installer location.
 */
class PackageInfoDocument : public PlistDocument {
   public:
    using PlistDocument::PlistDocument;

    /**
     * @brief Value of the "name" key.
     * @throws PlistNotParsedError before a successful parse()
     * @throws PlistError if the key is missing
     */
    std::string packageName() const;

   protected:
    Schema schema() const override;
};

/** @} */

}  // namespace plistkit

#endif  // PLISTKIT_DOCUMENT_HPP
