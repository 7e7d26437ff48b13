#include "plist_document.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

#include "plist_error.hpp"
#include "xml_plist_reader.hpp"
#include "xml_plist_writer.hpp"

namespace plistkit {

namespace {

std::string to_lower(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return str;
}

// encodings the XML tokenizer can decode
bool is_known_encoding(const std::string &name) {
  static const char *const known[] = {
      "utf-8",    "utf8",     "utf-16",     "utf-16le",   "utf-16be",
      "utf-32",   "utf-32le", "utf-32be",   "iso-8859-1", "iso_8859-1",
      "latin1",   "latin-1",  "us-ascii",   "ascii",
  };
  return std::find(std::begin(known), std::end(known), name) !=
         std::end(known);
}

bool is_content_type(const Value &value) {
  return value.isArray() || value.isDict();
}

} // anonymous namespace

PlistDocument::PlistDocument(PlistOptions options)
    : mOptions(std::move(options)) {}

PlistDocument::PlistDocument(std::string buffer, PlistOptions options)
    : mOptions(std::move(options)) {
  load(std::move(buffer));
}

void PlistDocument::load(std::string buffer) {
  mBuffer = std::move(buffer);
  mFormat = sniffFormat(mBuffer);
  mLoaded = true;
  mContents.reset();
  mEncoding.reset();
  mVersion.reset();
}

void PlistDocument::parse() {
  if (!mLoaded) {
    throw PlistNotParsedError("No plist has been loaded");
  }
  mContents.reset();
  decode();

  // hooks may read contents(), so it is set before they run
  try {
    mValidator.setSchema(schema());
    mValidator.validate(mContents ? &*mContents : nullptr);
    checkEncoding();
  } catch (...) {
    mContents.reset();
    throw;
  }
}

void PlistDocument::decode() {
  if (mFormat.format == PlistFormat::Binary) {
    BinaryPlistReader reader(mBuffer, mOptions);
    mContents = reader.parse();
    mEncoding.reset();
    mVersion.reset();
    return;
  }

  XmlPlistReader reader(mOptions);
  mContents = reader.parse(mBuffer);
  mEncoding = reader.encoding();
  mVersion = reader.version();
}

void PlistDocument::checkEncoding() const {
  if (mEncoding && !is_known_encoding(to_lower(*mEncoding))) {
    throw InvalidPlistError("Encoding not valid: " + *mEncoding);
  }
}

Schema PlistDocument::schema() const { return {}; }

const Value &PlistDocument::contents() const {
  if (!mContents) {
    throw PlistNotParsedError();
  }
  return *mContents;
}

void PlistDocument::setContents(Value root) {
  if (!is_content_type(root)) {
    throw PlistError(std::string("Plist contents type is not supported: ") +
                     typeName(root.type()));
  }
  load(toXmlString(root));
  parse();
}

std::string PlistDocument::toXml() const {
  const Value &root = contents();
  if (!is_content_type(root)) {
    throw PlistError(std::string("Plist contents type is not supported: ") +
                     typeName(root.type()));
  }
  return toXmlString(root);
}

std::string PlistDocument::toXmlFragment() const {
  return extractPlistBody(toXml());
}

void PlistDocument::addValidationHook(ValidationHook hook) {
  mValidator.addHook(std::move(hook));
}

std::optional<std::string> PlistDocument::encoding() const {
  contents();
  if (mEncoding) {
    return to_lower(*mEncoding);
  }
  return std::nullopt;
}

std::optional<std::string> PlistDocument::version() const {
  contents();
  return mVersion;
}

const Value &PlistDocument::operator[](const std::string &key) const {
  return contents().asDict().at(key);
}

// ============================================================================
// SCHEMA DOCUMENTS
// ============================================================================

Schema ManifestDocument::schema() const {
  return {{"catalogs", ValueType::Array}};
}

Schema PackageInfoDocument::schema() const {
  return {{"catalogs", ValueType::Array},
          {"installer_item_location", ValueType::String}};
}

std::string PackageInfoDocument::packageName() const {
  const Value *name = contents().asDict().find("name");
  if (name == nullptr) {
    throw PlistError("Package name not found in pkginfo plist.");
  }
  return name->asString();
}

} // namespace plistkit
