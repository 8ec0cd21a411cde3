#ifndef UTILS_ERROR_HPP
#define UTILS_ERROR_HPP

#include <stdexcept>
#include <string>

// Exceptions raised while converting between item trees and the object model.
// Every exception carries the item path where the problem was found, which
// may be empty when the problem is not tied to a single item.
namespace Error {

class Exception : public std::runtime_error {
   public:
    Exception(const std::string &path, const std::string &message)
        : std::runtime_error(path.empty() ? message : path + ": " + message),
          m_path(path),
          m_message(message) {}

    const std::string &path() const { return m_path; }

    // The message without the path.
    const std::string &message() const { return m_message; }

   private:
    std::string m_path;
    std::string m_message;
};

// Raised while reading an item tree. The container decoder skips the entity
// being decoded when one of these is thrown.
class DecodeError : public Exception {
   public:
    using Exception::Exception;
};

// The item exists but its content can't be interpreted, for example a sample
// buffer with the wrong length.
class MalformedField : public DecodeError {
   public:
    using DecodeError::DecodeError;
};

class MissingRequiredField : public MalformedField {
   public:
    explicit MissingRequiredField(const std::string &path)
        : MalformedField(path, "missing required field") {}
    MissingRequiredField(const std::string &path, const std::string &message)
        : MalformedField(path, message) {}
};

// The item exists but is stored with a different type than requested.
class TypeMismatch : public DecodeError {
   public:
    using DecodeError::DecodeError;

    // The same error located inside the object at the given path. Getters
    // only know the item name, the readers of nested objects use this to
    // report the full path.
    TypeMismatch within(const std::string &parent) const {
        if (parent.empty()) {
            return *this;
        }
        return TypeMismatch(parent + "/" + path(), message());
    }
};

// Raised when an entity is built from inconsistent arguments.
class ValidationError : public Exception {
   public:
    using Exception::Exception;
};

class ShapeMismatch : public ValidationError {
   public:
    using ValidationError::ValidationError;
};

class EmptySelection : public ValidationError {
   public:
    explicit EmptySelection(const std::string &kind)
        : ValidationError("", "empty " + kind + " selection") {}
};

// The item store refused an operation, for example when adding an item under
// a name that is already taken, or when the file store failed.
class StoreError : public Exception {
   public:
    using Exception::Exception;
};

}  // namespace Error

#endif /* UTILS_ERROR_HPP */
