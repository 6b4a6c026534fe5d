/*
* Exception hierarchy
* (C) 2025 Keywrap Developers
*
* Keywrap is released under the Simplified BSD License (see license.txt)
*/

#ifndef KEYWRAP_EXCEPTION_H_
#define KEYWRAP_EXCEPTION_H_

#include <keywrap/types.h>
#include <exception>
#include <string>
#include <string_view>

namespace Keywrap {

/**
* Coarse classification of a failure, used by the C API to pick a
* return code
*/
enum class ErrorType {
   Unknown = 1,
   OutOfMemory,
   InternalError,
   /** The underlying crypto library reported a failure */
   OpenSSLError,

   InvalidObjectState = 100,
   KeyNotSet,
   InvalidArgument,
   InvalidKeyLength,
   InvalidDataLength,
   LookupError,
   InvalidTag,
   BufferTooSmall,
};

/**
* Root of every exception the library throws
*/
class KEYWRAP_PUBLIC_API(1, 0) Exception : public std::exception {
   public:
      const char* what() const noexcept override { return m_msg.c_str(); }

      virtual ErrorType error_type() const noexcept { return ErrorType::Unknown; }

      /**
      * A code from a lower layer (eg an OpenSSL error number), or 0
      */
      virtual int error_code() const noexcept { return 0; }

   protected:
      explicit Exception(std::string_view msg) : m_msg(msg) {}

      Exception(std::string_view prefix, std::string_view msg);

   private:
      std::string m_msg;
};

class KEYWRAP_PUBLIC_API(1, 0) Invalid_Argument : public Exception {
   public:
      explicit Invalid_Argument(std::string_view msg) : Exception(msg) {}

      ErrorType error_type() const noexcept override { return ErrorType::InvalidArgument; }
};

/**
* A KEK or cipher key of unsupported length
*/
class KEYWRAP_PUBLIC_API(1, 0) Invalid_Key_Length final : public Invalid_Argument {
   public:
      Invalid_Key_Length(std::string_view name, size_t length);

      ErrorType error_type() const noexcept override { return ErrorType::InvalidKeyLength; }
};

/**
* Wrap or unwrap input whose length the scheme does not accept
*/
class KEYWRAP_PUBLIC_API(1, 0) Invalid_Data_Length final : public Invalid_Argument {
   public:
      Invalid_Data_Length(std::string_view algo, size_t length);

      ErrorType error_type() const noexcept override { return ErrorType::InvalidDataLength; }
};

/**
* The caller's output buffer is too short. Nothing was written to it.
*/
class KEYWRAP_PUBLIC_API(1, 0) Buffer_Too_Small final : public Invalid_Argument {
   public:
      Buffer_Too_Small(std::string_view algo, size_t required, size_t provided);

      ErrorType error_type() const noexcept override { return ErrorType::BufferTooSmall; }

      size_t required_length() const noexcept { return m_required; }

   private:
      size_t m_required;
};

class KEYWRAP_PUBLIC_API(1, 0) Invalid_State : public Exception {
   public:
      explicit Invalid_State(std::string_view err) : Exception(err) {}

      ErrorType error_type() const noexcept override { return ErrorType::InvalidObjectState; }
};

/**
* A cipher was used before set_key, or after clear
*/
class KEYWRAP_PUBLIC_API(1, 0) Key_Not_Set : public Invalid_State {
   public:
      explicit Key_Not_Set(std::string_view algo);

      ErrorType error_type() const noexcept override { return ErrorType::KeyNotSet; }
};

/**
* No implementation of the requested algorithm (or provider) exists
*/
class KEYWRAP_PUBLIC_API(1, 0) Lookup_Error : public Exception {
   public:
      Lookup_Error(std::string_view type, std::string_view algo, std::string_view provider = "");

      ErrorType error_type() const noexcept override { return ErrorType::LookupError; }
};

/**
* Unwrapping found a modified wrapped key, or the wrong KEK or header
*/
class KEYWRAP_PUBLIC_API(1, 0) Invalid_Authentication_Tag final : public Exception {
   public:
      explicit Invalid_Authentication_Tag(std::string_view msg) : Exception("Invalid authentication tag:", msg) {}

      ErrorType error_type() const noexcept override { return ErrorType::InvalidTag; }
};

typedef Invalid_Authentication_Tag Integrity_Failure;

/**
* Thrown by the KEYWRAP_ASSERT family; indicates a bug in the library
*/
class KEYWRAP_PUBLIC_API(1, 0) Internal_Error : public Exception {
   public:
      explicit Internal_Error(std::string_view err) : Exception("Internal error:", err) {}

      ErrorType error_type() const noexcept override { return ErrorType::InternalError; }
};

}  // namespace Keywrap

#endif
