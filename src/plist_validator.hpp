#ifndef PLISTKIT_VALIDATOR_HPP
#define PLISTKIT_VALIDATOR_HPP

#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "plist_value.hpp"

namespace plistkit {

/**
 * @typedef Schema
 * @brief Required root keys and the exact type each must have.
 *
 * @code
 * plistkit::Schema manifest = {{"catalogs", plistkit::ValueType::Array}};
 * @endcode
 */
using Schema = std::vector<std::pair<std::string, ValueType>>;

/// Post-parse check; signals failure by throwing (normally InvalidPlistError).
using ValidationHook = std::function<void()>;

/**
 * @class PlistValidator
 * @brief Runs the schema check and then each hook in registration order.
 */
class PlistValidator {
   private:
    Schema mSchema;
    std::vector<ValidationHook> mHooks;

   public:
    PlistValidator() = default;
    explicit PlistValidator(Schema schema);

    void setSchema(Schema schema);
    const Schema& schema() const { return mSchema; }

    void addHook(ValidationHook hook);
    size_t hookCount() const { return mHooks.size(); }

    /**
     * @brief Validate a decoded root.
     *
     * @param root Decoded root, or nullptr when nothing has been parsed
     * @throws PlistNotParsedError if @p root is nullptr
     * @throws InvalidPlistError if the root is empty or fails the schema
     */
    void validate(const Value* root) const;

    /**
     * @brief Check only the schema part.
     * @throws InvalidPlistError naming the key and both types
     */
    static void checkSchema(const Value& root, const Schema& schema);
};

}  // namespace plistkit

#endif  // PLISTKIT_VALIDATOR_HPP
