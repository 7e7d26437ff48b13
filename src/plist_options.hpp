#ifndef PLISTKIT_OPTIONS_HPP
#define PLISTKIT_OPTIONS_HPP

#include <cstddef>
#include <functional>
#include <string>

namespace plistkit {

/**
 * @typedef WarningCallback
 * @brief Callback for non-fatal conditions found while decoding.
 *
 * - @param category Short category, e.g. "Duplicate key"
 * - @param message Human readable description, usually naming an offset or key
 *
 * @code
 * auto handler = [](const std::string& cat, const std::string& msg) {
 *     std::cerr << "[" << cat << "] " << msg << std::endl;
 * };
 * @endcode
 */
using WarningCallback =
    std::function<void(const std::string& category, const std::string& message)>;

/**
 * @struct PlistOptions
 * @brief Decoder configuration shared by the binary and XML readers.
 */
struct PlistOptions {
    /**
     * @brief Optional callback for warnings.
     *
     * Called for fill bytes in binary input, duplicate dictionary keys,
     * unexpected plist version attributes, truncated fractional dates and
     * stray text inside containers.
     *
     * Default: nullptr (warnings are dropped)
     */
    WarningCallback warning_callback = nullptr;

    /**
     * @brief Maximum container nesting accepted by either decoder.
     *
     * Deeper documents are rejected as malformed instead of exhausting the
     * stack.
     *
     * Default: 512
     */
    std::size_t max_depth = 512;

    /**
     * @brief Budget, in bytes, for copies of shared binary objects.
     *
     * A binary plist may reference one object from many containers. An
     * object is moved into its last referrer and copied into the others;
     * each copy is charged its approximate in-memory size. Exceeding the
     * budget is a malformed document, which stops small inputs from
     * expanding into huge trees.
     *
     * Default: 256 MiB
     */
    std::size_t max_expanded_bytes = std::size_t{256} << 20;
};

}  // namespace plistkit

#endif  // PLISTKIT_OPTIONS_HPP
