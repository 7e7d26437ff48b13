#include "xml_plist_writer.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>

#include "plist_error.hpp"
#include "plist_util.hpp"

namespace plistkit {

const char PLIST_HEAD[] =
    "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
    "<!DOCTYPE plist PUBLIC \"-//Apple Computer//DTD PLIST 1.0//EN\" "
    "\"http://www.apple.com/DTDs/PropertyList-1.0.dtd\">\n"
    "<plist version=\"1.0\">\n";

const char PLIST_FOOT[] = "\n</plist>\n";

const char *const XmlPlistWriter::INDENT = "  ";

XmlPlistWriter::XmlPlistWriter(std::ostream &os) : mOut(os) {}

void XmlPlistWriter::writeDocument(const Value &root) {
  mOut << PLIST_HEAD;
  writeValue(root, 1);
  mOut << PLIST_FOOT;
}

// lines are joined with '\n'; no newline after the last one
void XmlPlistWriter::writeValue(const Value &value, int level) {
  for (int i = 0; i < level; ++i) {
    mOut << INDENT;
  }

  switch (value.type()) {
  case ValueType::Array:
    writeArray(value.asArray(), level);
    break;
  case ValueType::Dict:
    writeDict(value.asDict(), level);
    break;
  case ValueType::String:
    mOut << "<string>" << encode_xml_entities(value.asString()) << "</string>";
    break;
  case ValueType::Integer:
    mOut << "<integer>" << value.asInteger() << "</integer>";
    break;
  case ValueType::Real: {
    std::ostringstream real;
    real << std::fixed << std::setprecision(6) << value.asReal();
    mOut << "<real>" << real.str() << "</real>";
    break;
  }
  case ValueType::Boolean:
    mOut << (value.asBool() ? "<true/>" : "<false/>");
    break;
  case ValueType::Date:
    mOut << "<date>" << format_date(value.asDate()) << "</date>";
    break;
  case ValueType::Null:
    // not what plutil does, kept for existing consumers
    mOut << "<string></string>";
    break;
  case ValueType::Uid:
    mOut << "<dict><key>CF$UID</key><integer>" << value.asUid().value
         << "</integer></dict>";
    break;
  case ValueType::Data: {
    const Data &data = value.asData();
    mOut << "<data>" << base64_encode(data.data(), data.size()) << "</data>";
    break;
  }
  default:
    throw UnsupportedValueError(std::string("Value type ") +
                                typeName(value.type()) + " not supported");
  }
}

void XmlPlistWriter::writeDict(const Dict &dict, int level) {
  mOut << "<dict>";
  for (const auto &entry : dict) {
    mOut << '\n';
    for (int i = 0; i <= level; ++i) {
      mOut << INDENT;
    }
    mOut << "<key>" << encode_xml_entities(entry.first) << "</key>\n";
    writeValue(entry.second, level + 1);
  }
  mOut << '\n';
  for (int i = 0; i < level; ++i) {
    mOut << INDENT;
  }
  mOut << "</dict>";
}

void XmlPlistWriter::writeArray(const Array &array, int level) {
  mOut << "<array>";
  for (const auto &item : array) {
    mOut << '\n';
    writeValue(item, level + 1);
  }
  mOut << '\n';
  for (int i = 0; i < level; ++i) {
    mOut << INDENT;
  }
  mOut << "</array>";
}

std::string toXmlString(const Value &root) {
  std::ostringstream out;
  XmlPlistWriter writer(out);
  writer.writeDocument(root);
  return out.str();
}

std::string extractPlistBody(std::string_view xml) {
  size_t open = xml.find("<plist");
  while (open != std::string_view::npos) {
    char next = open + 6 < xml.size() ? xml[open + 6] : '\0';
    if (next == '>' || std::isspace(static_cast<unsigned char>(next))) {
      break;
    }
    open = xml.find("<plist", open + 6);
  }
  if (open == std::string_view::npos) {
    return std::string();
  }
  size_t start = xml.find('>', open);
  size_t stop = xml.rfind("</plist>");
  if (start == std::string_view::npos || stop == std::string_view::npos ||
      stop <= start) {
    return std::string();
  }

  std::string_view body = xml.substr(start + 1, stop - start - 1);
  while (!body.empty() &&
         std::isspace(static_cast<unsigned char>(body.front()))) {
    body.remove_prefix(1);
  }
  while (!body.empty() &&
         std::isspace(static_cast<unsigned char>(body.back()))) {
    body.remove_suffix(1);
  }
  return std::string(body);
}

} // namespace plistkit
