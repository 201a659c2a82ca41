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

#pragma once

#include "ErrorCodes.h"

#include <exception>
#include <memory>
#include <string>


/// Core error class.
/**
 * Error objects carry a message, an error code (see ErrorCodes.h) and,
 * optionally, the error that caused them. The chain is used to attach the
 * device-level error text to the core error that the device failure caused.
 */
class CLSAError : public std::exception
{
public:
   typedef int Code;

   /// Construct with error message and code.
   CLSAError(const std::string& msg, Code code = LSAERR_GENERIC);

   /// Construct with error message and code.
   CLSAError(const char* msg, Code code = LSAERR_GENERIC);

   /// Construct with error message, code, and underlying (chained) error.
   CLSAError(const std::string& msg, Code code,
         const CLSAError& underlyingError);

   /// Construct with error message and underlying (chained) error.
   CLSAError(const std::string& msg, const CLSAError& underlyingError);

   CLSAError(const CLSAError& other);
   CLSAError& operator=(const CLSAError& rhs);

   virtual ~CLSAError() {}

   /// Implements std::exception interface.
   virtual const char* what() const noexcept { return message_.c_str(); }

   /// Get the error message for this error.
   virtual std::string getMsg() const;

   /// Get a message containing the messages from all chained errors.
   virtual std::string getFullMsg() const;

   /// Get the error code for this error.
   virtual Code getCode() const;

   /// Get the first non-generic error code in the chain.
   virtual Code getSpecificCode() const;

   /// Access the underlying error.
   /**
    * Returns nullptr if there is no underlying error.
    */
   virtual const CLSAError* getUnderlyingError() const;

private:
   std::string message_;
   Code code_;
   std::unique_ptr<CLSAError> underlying_;
};


namespace lsa {

enum ErrorClass {
   ErrorClassNone,
   ErrorClassConfiguration,
   ErrorClassHardwareCommand,
   ErrorClassSave,
   ErrorClassUsage,
   ErrorClassOther,
};

ErrorClass ClassifyError(CLSAError::Code code);
const char* ErrorClassName(ErrorClass errorClass);

// Whether an error of this code ends the run. Only secondary save failures
// are non-fatal.
bool IsFatalError(CLSAError::Code code);

} // namespace lsa
