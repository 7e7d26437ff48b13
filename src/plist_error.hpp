#ifndef PLISTKIT_ERROR_HPP
#define PLISTKIT_ERROR_HPP

#include <stdexcept>
#include <string>

namespace plistkit {

/**
 * @defgroup Errors Error Types
 * @brief Exceptions thrown by the decoders, the encoder and the document API.
 *
 * Structural and semantic failures derive from PlistError so that callers can
 * catch "bad document" in one place. PlistNotParsedError and ValueTypeError
 * are API-misuse errors and sit beside it, not below it.
 * @{
 */

class Error : public std::runtime_error {
   public:
    explicit Error(const std::string& msg) : std::runtime_error(msg) {}
};

/// Any failure caused by the content of a plist document.
class PlistError : public Error {
   public:
    explicit PlistError(const std::string& msg) : Error(msg) {}
};

/// Input that cannot be tokenized or whose fixed layout does not fit.
class MalformedPlistError : public PlistError {
   public:
    explicit MalformedPlistError(const std::string& msg) : PlistError(msg) {}
};

/// A well-formed document that fails validation.
class InvalidPlistError : public PlistError {
   public:
    explicit InvalidPlistError(const std::string& msg) : PlistError(msg) {}
};

/// A value with no XML mapping was handed to the encoder.
class UnsupportedValueError : public PlistError {
   public:
    explicit UnsupportedValueError(const std::string& msg) : PlistError(msg) {}
};

class BinaryPlistError : public PlistError {
   public:
    explicit BinaryPlistError(const std::string& msg) : PlistError(msg) {}
};

/// The buffer does not start with the binary plist magic.
class BinaryPlistHeaderError : public BinaryPlistError {
   public:
    explicit BinaryPlistHeaderError(const std::string& msg) : BinaryPlistError(msg) {}
};

/// The binary magic matched but the version token is not supported.
class BinaryPlistVersionError : public BinaryPlistError {
   public:
    explicit BinaryPlistVersionError(const std::string& msg) : BinaryPlistError(msg) {}
};

/// Contents, XML text or encoding were requested before a successful parse.
class PlistNotParsedError : public Error {
   public:
    PlistNotParsedError() : Error("Plist has not been parsed") {}
    explicit PlistNotParsedError(const std::string& msg) : Error(msg) {}
};

/// A Value accessor was called for the wrong variant.
class ValueTypeError : public Error {
   public:
    explicit ValueTypeError(const std::string& msg) : Error(msg) {}
};

/** @} */

}  // namespace plistkit

#endif  // PLISTKIT_ERROR_HPP
