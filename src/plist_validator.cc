#include "plist_validator.hpp"

#include "plist_error.hpp"

namespace plistkit {

PlistValidator::PlistValidator(Schema schema) : mSchema(std::move(schema)) {}

void PlistValidator::setSchema(Schema schema) { mSchema = std::move(schema); }

void PlistValidator::addHook(ValidationHook hook) {
  mHooks.push_back(std::move(hook));
}

void PlistValidator::validate(const Value *root) const {
  if (root == nullptr) {
    throw PlistNotParsedError();
  }
  if (root->empty()) {
    throw InvalidPlistError("empty");
  }

  if (!mSchema.empty()) {
    checkSchema(*root, mSchema);
  }

  for (const auto &hook : mHooks) {
    hook();
  }
}

void PlistValidator::checkSchema(const Value &root, const Schema &schema) {
  if (!root.isDict()) {
    throw InvalidPlistError(std::string("Root is ") + typeName(root.type()) +
                            ", expected dict");
  }
  const Dict &dict = root.asDict();
  for (const auto &[key, expected] : schema) {
    const Value *value = dict.find(key);
    if (value == nullptr) {
      throw InvalidPlistError("Missing element " + key);
    }
    if (value->type() != expected) {
      throw InvalidPlistError("Invalid type for element " + key + ". Got " +
                              typeName(value->type()) + ", expected " +
                              typeName(expected));
    }
  }
}

} // namespace plistkit
