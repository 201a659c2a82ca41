// PROJECT:       LSAcq
// SUBSYSTEM:     LSACore
//
// DESCRIPTION:   Exception class for core errors
//
// LICENSE:       This file is distributed under the "Lesser GPL" (LGPL) license.
//                License text is included with the source distribution.
//
//                This file is distributed in the hope that it will be useful,
//                but WITHOUT ANY WARRANTY; without even the implied warranty
//                of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//
//                IN NO EVENT SHALL THE COPYRIGHT OWNER OR
//                CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT,
//                INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES.

#include "Error.h"


CLSAError::CLSAError(const std::string& msg, Code code) :
   message_(msg),
   code_(code)
{}


CLSAError::CLSAError(const char* msg, Code code) :
   message_(msg ? msg : "(null message)"),
   code_(code)
{}


CLSAError::CLSAError(const std::string& msg, Code code,
      const CLSAError& underlyingError) :
   message_(msg),
   code_(code),
   underlying_(new CLSAError(underlyingError))
{}


CLSAError::CLSAError(const std::string& msg,
      const CLSAError& underlyingError) :
   message_(msg),
   code_(LSAERR_GENERIC),
   underlying_(new CLSAError(underlyingError))
{}


CLSAError::CLSAError(const CLSAError& other) :
   std::exception(other),
   message_(other.message_),
   code_(other.code_),
   underlying_(other.underlying_ ?
         new CLSAError(*other.underlying_) : nullptr)
{}


CLSAError&
CLSAError::operator=(const CLSAError& rhs)
{
   if (this == &rhs)
      return *this;

   message_ = rhs.message_;
   code_ = rhs.code_;
   underlying_.reset(rhs.underlying_ ?
         new CLSAError(*rhs.underlying_) : nullptr);
   return *this;
}


std::string
CLSAError::getMsg() const
{
   if (!message_.empty())
      return message_;
   if (code_ != LSAERR_GENERIC && code_ != LSAERR_OK)
      return "Error (code " + std::to_string(code_) + ")";
   return "Unspecified error";
}


std::string
CLSAError::getFullMsg() const
{
   if (underlying_)
      return getMsg() + " [ " + underlying_->getFullMsg() + " ]";
   return getMsg();
}


CLSAError::Code
CLSAError::getCode() const
{
   return code_;
}


CLSAError::Code
CLSAError::getSpecificCode() const
{
   for (const CLSAError* current = this; current;
         current = current->getUnderlyingError())
   {
      if (current->getCode() != LSAERR_GENERIC)
         return current->getCode();
   }
   return LSAERR_GENERIC;
}


const CLSAError*
CLSAError::getUnderlyingError() const
{
   return underlying_.get();
}


namespace lsa {

ErrorClass
ClassifyError(CLSAError::Code code)
{
   if (code == LSAERR_OK)
      return ErrorClassNone;
   if (code >= 100 && code < 200)
      return ErrorClassConfiguration;
   if (code >= 200 && code < 300)
      return ErrorClassHardwareCommand;
   if (code >= 300 && code < 400)
      return ErrorClassSave;
   if (code >= 400 && code < 500)
      return ErrorClassUsage;
   return ErrorClassOther;
}


const char*
ErrorClassName(ErrorClass errorClass)
{
   switch (errorClass)
   {
      case ErrorClassNone: return "None";
      case ErrorClassConfiguration: return "ConfigurationError";
      case ErrorClassHardwareCommand: return "HardwareCommandError";
      case ErrorClassSave: return "SaveError";
      case ErrorClassUsage: return "UsageError";
      default: return "Error";
   }
}


bool
IsFatalError(CLSAError::Code code)
{
   return code != LSAERR_OK && code != LSAERR_SecondarySaveFailed;
}

} // namespace lsa
