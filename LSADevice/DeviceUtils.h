///////////////////////////////////////////////////////////////////////////////
// FILE:          DeviceUtils.h
// PROJECT:       LSAcq
// SUBSYSTEM:     LSADevice - Hardware capability kit
//-----------------------------------------------------------------------------
// DESCRIPTION:   Utility functions for hardware capability implementations
// LICENSE:       This file is distributed under the BSD license.
//                License text is included with the source distribution.
//
//                This file is distributed in the hope that it will be useful,
//                but WITHOUT ANY WARRANTY; without even the implied warranty
//                of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//
//                IN NO EVENT SHALL THE COPYRIGHT OWNER OR
//                CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT,
//                INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES.
//

#pragma once

#include "LSADeviceConstants.h"

class CDeviceUtils
{
public:
   // Copies at most LSA::MaxStrLength - 1 characters and always terminates
   // the target. Returns false if the source was truncated.
   static bool CopyLimitedString(char* pszTarget, const char* pszSource);
   static unsigned GetMaxStringLength();
   static const char* DefaultErrorText(int errorCode);
};
