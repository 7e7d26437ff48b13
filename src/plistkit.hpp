#ifndef PLISTKIT_HPP
#define PLISTKIT_HPP

/**
 * @namespace plistkit
 * @brief Decoder and encoder for Apple property lists.
 *
 * Reads both the binary `bplist00` format and the XML format into one value
 * tree, validates it against an optional schema plus caller hooks, and writes
 * it back as canonical XML.
 *
 * ### Binary or XML file to XML string
 * @code
 * #include <fstream>
 * #include <sstream>
 * #include "plistkit.hpp"
 *
 * std::ifstream in("Info.plist", std::ios::binary);
 * std::ostringstream bytes;
 * bytes << in.rdbuf();
 *
 * plistkit::PlistDocument doc(bytes.str());
 * doc.parse();
 * std::string xml = doc.toXml();
 * @endcode
 *
 * ### Reading values
 * @code
 * const plistkit::Dict& root = doc.contents().asDict();
 * for (const auto& [key, value] : root) {
 *     std::cout << key << ": " << plistkit::typeName(value.type()) << "\n";
 * }
 * @endcode
 *
 * ### Building a plist
 * @code
 * plistkit::Dict root;
 * root.set("catalogs", plistkit::Array{"production"});
 * root.set("installer_item_location", "apps/Foo.dmg");
 *
 * plistkit::PackageInfoDocument pkginfo;
 * pkginfo.setContents(root);
 * @endcode
 *
 * ### Warnings
 * @code
 * plistkit::PlistOptions options;
 * options.warning_callback = [](const std::string& cat, const std::string& msg) {
 *     std::cerr << "[" << cat << "] " << msg << std::endl;
 * };
 * plistkit::PlistDocument doc(bytes.str(), options);
 * @endcode
 */

#include "binary_plist_reader.hpp"
#include "plist_document.hpp"
#include "plist_error.hpp"
#include "plist_options.hpp"
#include "plist_util.hpp"
#include "plist_validator.hpp"
#include "plist_value.hpp"
#include "xml_plist_reader.hpp"
#include "xml_plist_writer.hpp"

#endif  // PLISTKIT_HPP
