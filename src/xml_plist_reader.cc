#include "xml_plist_reader.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

#include "plist_error.hpp"
#include "plist_util.hpp"

namespace plistkit {

namespace {

bool is_whitespace_only(std::string_view str) {
  return std::all_of(str.begin(), str.end(), [](char c) {
    return std::isspace(static_cast<unsigned char>(c));
  });
}

std::string_view trim(std::string_view str) {
  while (!str.empty() && std::isspace(static_cast<unsigned char>(str.front())))
    str.remove_prefix(1);
  while (!str.empty() && std::isspace(static_cast<unsigned char>(str.back())))
    str.remove_suffix(1);
  return str;
}

// the element names a plist may contain; anything else is rejected
std::optional<XmlMode> mode_for_element(std::string_view name) {
  static const std::pair<std::string_view, XmlMode> elements[] = {
      {"plist", XmlMode::Plist},     {"array", XmlMode::Array},
      {"dict", XmlMode::Dict},       {"key", XmlMode::Key},
      {"string", XmlMode::String},   {"integer", XmlMode::Integer},
      {"real", XmlMode::Real},       {"date", XmlMode::Date},
      {"true", XmlMode::True},       {"false", XmlMode::False},
      {"data", XmlMode::Data},
  };
  for (const auto &element : elements) {
    if (element.first == name) {
      return element.second;
    }
  }
  return std::nullopt;
}

} // anonymous namespace

const char *modeName(XmlMode mode) {
  switch (mode) {
  case XmlMode::Plist:
    return "plist";
  case XmlMode::Dict:
    return "dict";
  case XmlMode::Array:
    return "array";
  case XmlMode::Key:
    return "key";
  case XmlMode::String:
    return "string";
  case XmlMode::Integer:
    return "integer";
  case XmlMode::Real:
    return "real";
  case XmlMode::Date:
    return "date";
  case XmlMode::Data:
    return "data";
  case XmlMode::True:
    return "true";
  case XmlMode::False:
    return "false";
  case XmlMode::Value:
    return "value";
  }
  return "unknown";
}

XmlPlistReader::XmlPlistReader(const PlistOptions &options)
    : mOptions(options) {}

void XmlPlistReader::reset() {
  mModes.clear();
  mValues.clear();
  mKeys.clear();
  mDictDepth = 0;
  mFinished = false;
  mRoot = Value();
  mEncoding.reset();
  mVersion.reset();
}

void XmlPlistReader::warn(const std::string &category,
                          const std::string &message) const {
  if (mOptions.warning_callback) {
    mOptions.warning_callback(category, message);
  }
}

// ============================================================================
// TOKENIZER DRIVER
// ============================================================================

Value XmlPlistReader::parse(std::string_view xml) {
  reset();

  pugi::xml_document doc;
  pugi::xml_parse_result result = doc.load_buffer(
      xml.data(), xml.size(),
      pugi::parse_default | pugi::parse_declaration | pugi::parse_ws_pcdata);
  if (!result) {
    throw MalformedPlistError("Failed to parse XML at offset " +
                              std::to_string(result.offset) + ": " +
                              std::string(result.description()));
  }

  for (const auto &child : doc.children()) {
    emitNode(child, 0);
  }

  if (!mFinished) {
    throw MalformedPlistError("Document has no <plist> element");
  }
  return mRoot;
}

void XmlPlistReader::emitNode(const pugi::xml_node &node, size_t depth) {
  if (depth > mOptions.max_depth) {
    throw MalformedPlistError("Nesting deeper than " +
                              std::to_string(mOptions.max_depth) +
                              " elements");
  }

  switch (node.type()) {
  case pugi::node_declaration: {
    pugi::xml_attribute encoding = node.attribute("encoding");
    if (encoding) {
      xmlDeclaration(encoding.value());
    }
    break;
  }

  case pugi::node_element: {
    startElement(node.name(), node.attribute("version").value());

    // adjacent text and CDATA pieces form one character-data event
    std::string text;
    bool has_text = false;
    for (const auto &child : node.children()) {
      pugi::xml_node_type type = child.type();
      if (type == pugi::node_pcdata || type == pugi::node_cdata) {
        text += child.value();
        has_text = true;
        continue;
      }
      if (has_text) {
        characterData(text);
        text.clear();
        has_text = false;
      }
      emitNode(child, depth + 1);
    }
    if (has_text) {
      characterData(text);
    }

    endElement(node.name());
    break;
  }

  case pugi::node_pcdata:
  case pugi::node_cdata:
    characterData(node.value());
    break;

  default:
    // comments, processing instructions and doctype are not loaded
    break;
  }
}

// ============================================================================
// STACK HELPERS
// ============================================================================

void XmlPlistReader::pushMode(XmlMode mode) {
  mModes.push_back(mode);
  if (mode == XmlMode::Dict) {
    ++mDictDepth;
  }
}

void XmlPlistReader::popMode() {
  if (mModes.back() == XmlMode::Dict) {
    --mDictDepth;
  }
  mModes.pop_back();
}

XmlMode XmlPlistReader::currentMode() const { return mModes.back(); }

XmlMode XmlPlistReader::parentMode() const {
  return mModes[mModes.size() - 2];
}

Value XmlPlistReader::popValue() {
  if (mValues.empty()) {
    throw MalformedPlistError("Value stack underflow");
  }
  Value value = std::move(mValues.back());
  mValues.pop_back();
  return value;
}

void XmlPlistReader::storeValue(Value value) {
  switch (currentMode()) {
  case XmlMode::Plist:
    mValues.push_back(std::move(value));
    pushMode(XmlMode::Value);
    return;

  case XmlMode::Dict: {
    if (mKeys.size() < mDictDepth) {
      throw MalformedPlistError("Dict value without a <key>");
    }
    Dict &dict = mValues.back().asDict();
    if (!dict.set(mKeys.back(), std::move(value))) {
      warn("Duplicate key", "Key '" + mKeys.back() + "' repeated in <dict>");
    }
    return;
  }

  case XmlMode::Array:
    mValues.back().asArray().push_back(std::move(value));
    return;

  default:
    throw MalformedPlistError(std::string("Value cannot be stored inside <") +
                              modeName(currentMode()) + ">");
  }
}

// ============================================================================
// EVENTS
// ============================================================================

void XmlPlistReader::xmlDeclaration(std::string_view encoding) {
  mEncoding = std::string(encoding);
}

void XmlPlistReader::startElement(std::string_view name,
                                  std::string_view version) {
  std::optional<XmlMode> mode = mode_for_element(name);
  if (!mode) {
    throw MalformedPlistError("Element " + std::string(name));
  }
  if (mFinished) {
    throw MalformedPlistError("Element <" + std::string(name) +
                              "> after </plist>");
  }

  if (*mode == XmlMode::Plist) {
    if (!mModes.empty()) {
      throw MalformedPlistError("Nested <plist> element");
    }
    pushMode(XmlMode::Plist);
    if (!version.empty()) {
      mVersion = std::string(version);
      if (version != "1.0") {
        warn("Plist version", "Unexpected plist version " + *mVersion);
      }
    }
    return;
  }

  // the document must open with <plist>
  if (mModes.empty()) {
    throw MalformedPlistError("Element <" + std::string(name) +
                              "> before <plist>");
  }

  switch (currentMode()) {
  case XmlMode::Plist:
    if (*mode == XmlMode::Key) {
      throw MalformedPlistError("<key> outside of <dict>");
    }
    break;
  case XmlMode::Array:
    if (*mode == XmlMode::Key) {
      throw MalformedPlistError("<key> inside <array>");
    }
    break;
  case XmlMode::Dict:
    if (*mode == XmlMode::Key && mKeys.size() == mDictDepth) {
      throw MalformedPlistError("Two <key> elements in a row");
    }
    if (*mode != XmlMode::Key && mKeys.size() < mDictDepth) {
      throw MalformedPlistError("<" + std::string(name) +
                                "> in <dict> without a <key>");
    }
    break;
  case XmlMode::Value:
    if (mModes.size() == 2) {
      throw MalformedPlistError("More than one root value in <plist>");
    }
    [[fallthrough]];
  default:
    throw MalformedPlistError("Element <" + std::string(name) +
                              "> not allowed inside <" +
                              modeName(currentMode()) + ">");
  }

  switch (*mode) {
  case XmlMode::Dict:
    pushMode(XmlMode::Dict);
    mValues.emplace_back(Dict());
    break;
  case XmlMode::Array:
    pushMode(XmlMode::Array);
    mValues.emplace_back(Array());
    break;
  case XmlMode::True:
  case XmlMode::False:
    // no text follows, the value is known now
    pushMode(*mode);
    pushMode(XmlMode::Value);
    mValues.emplace_back(*mode == XmlMode::True);
    break;
  default:
    pushMode(*mode);
    break;
  }
}

void XmlPlistReader::characterData(std::string_view text) {
  if (text.empty() || text == "\n") {
    return;
  }
  if (mModes.empty() || mFinished) {
    if (is_whitespace_only(text)) {
      return;
    }
    throw MalformedPlistError("Text outside of <plist>");
  }

  XmlMode mode = currentMode();
  switch (mode) {
  case XmlMode::Plist:
  case XmlMode::Dict:
  case XmlMode::Array:
    if (!is_whitespace_only(text)) {
      warn("Ignored text", "Text '" + std::string(text) + "' inside <" +
                               modeName(mode) + "> ignored");
    }
    return;

  case XmlMode::Key:
    if (mKeys.size() == mDictDepth) {
      mKeys.back() += text;
    } else {
      mKeys.emplace_back(text);
    }
    return;

  case XmlMode::Integer:
  case XmlMode::Real:
  case XmlMode::Date:
    // a blank body is the same as an empty element
    if (is_whitespace_only(text)) {
      return;
    }
    mValues.push_back(convertText(mode, text));
    pushMode(XmlMode::Value);
    return;

  case XmlMode::String:
  case XmlMode::Data:
    mValues.push_back(convertText(mode, text));
    pushMode(XmlMode::Value);
    return;

  case XmlMode::True:
  case XmlMode::False:
  case XmlMode::Value:
    return;
  }
}

void XmlPlistReader::endElement(std::string_view name) {
  std::optional<XmlMode> mode = mode_for_element(name);
  if (!mode) {
    throw MalformedPlistError("Element " + std::string(name));
  }
  if (mModes.empty() || mFinished) {
    throw MalformedPlistError("Unexpected </" + std::string(name) + ">");
  }

  if (*mode == XmlMode::Plist) {
    finishDocument();
    return;
  }

  Value value;
  if (currentMode() == XmlMode::Value) {
    popMode();
    value = popValue();
  } else if (*mode == XmlMode::Array || *mode == XmlMode::Dict) {
    value = popValue();
  } else if (*mode == XmlMode::String) {
    value = Value(std::string());
  } else if (*mode == XmlMode::Data) {
    value = Value(Data());
  }

  if (currentMode() != *mode) {
    throw MalformedPlistError("Mismatched </" + std::string(name) +
                              ">, open element is <" +
                              modeName(currentMode()) + ">");
  }

  if (*mode == XmlMode::Key) {
    // <key></key> still names an entry
    if (mKeys.size() < mDictDepth) {
      mKeys.emplace_back();
    }
    popMode();
    return;
  }

  bool release_key = parentMode() == XmlMode::Dict;
  popMode();
  storeValue(std::move(value));
  if (release_key) {
    mKeys.pop_back();
  }
}

void XmlPlistReader::finishDocument() {
  bool balanced = mModes.size() == 1 ||
                  (mModes.size() == 2 && mModes.back() == XmlMode::Value);
  if (!balanced) {
    throw MalformedPlistError(std::string("</plist> while <") +
                              modeName(currentMode()) + "> is open");
  }

  // an empty <plist/> is an empty dictionary
  mRoot = mValues.empty() ? Value(Dict()) : popValue();
  if (!mValues.empty() || !mKeys.empty()) {
    throw MalformedPlistError("Unbalanced plist: " +
                              std::to_string(mValues.size()) +
                              " values and " + std::to_string(mKeys.size()) +
                              " keys left over");
  }
  mModes.clear();
  mDictDepth = 0;
  mFinished = true;
}

Value XmlPlistReader::convertText(XmlMode mode, std::string_view text) const {
  switch (mode) {
  case XmlMode::String:
    return Value(std::string(text));

  case XmlMode::Integer: {
    std::string_view digits = trim(text);
    if (!digits.empty() && digits.front() == '+') {
      digits.remove_prefix(1);
    }
    int64_t value = 0;
    auto [end, ec] =
        std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (digits.empty() || ec != std::errc() ||
        end != digits.data() + digits.size()) {
      throw MalformedPlistError("Invalid integer '" + std::string(text) + "'");
    }
    return Value(value);
  }

  case XmlMode::Real: {
    std::string_view digits = trim(text);
    if (!digits.empty() && digits.front() == '+') {
      digits.remove_prefix(1);
    }
    double value = 0;
    auto [end, ec] =
        std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (digits.empty() || ec != std::errc() ||
        end != digits.data() + digits.size()) {
      throw MalformedPlistError("Invalid real '" + std::string(text) + "'");
    }
    return Value(value);
  }

  case XmlMode::Date:
    return Value(parse_date(trim(text)));

  case XmlMode::Data:
    return Value(base64_decode(text));

  default:
    throw MalformedPlistError(std::string("No value conversion for <") +
                              modeName(mode) + ">");
  }
}

} // namespace plistkit
